/*
 Copyright (C) 2025 Quaternion Risk Management Ltd
 All rights reserved.

 This file is part of CIE, a free-software/open-source library
 for transparent calculation of interest on insolvency claims

 CIE is free software: you can redistribute it and/or modify it
 under the terms of the Modified BSD License.  You should have received a
 copy of the license along with this program.

 This program is distributed on the basis that it will form a useful
 contribution to claim review and calculation standardisation, but WITHOUT
 ANY WARRANTY; without even the implied warranty of MERCHANTABILITY or
 FITNESS FOR A PARTICULAR PURPOSE. See the license for more details.
*/

/*! \file cied/version.hpp
    \brief Version number of the claim interest engine
    \ingroup utilities
*/

#pragma once

//! Version string
#define CIE_VERSION "1.2.0"

//! Version number as hex, e.g. 1.2.0 is 0x010200f0
#define CIE_HEX_VERSION 0x010200f0
