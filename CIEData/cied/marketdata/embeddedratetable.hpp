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

/*! \file cied/marketdata/embeddedratetable.hpp
    \brief Rate table snapshot shipped with the engine
    \ingroup marketdata
*/

#pragma once

#include <cied/marketdata/ratetable.hpp>

#include <ql/shared_ptr.hpp>

namespace cie {
namespace data {

//! Version tag of the embedded loan prime rate snapshot
extern const char* const EMBEDDED_RATE_TABLE_VERSION;

//! Date of the latest publication contained in the embedded snapshot
QuantLib::Date embeddedRateTableAsOf();

//! Build the embedded loan prime rate table (1Y as ShortTerm, 5Y and above as LongTerm)
/*! The snapshot is versioned data. Calculations with an end date after the as of date are forward filled
    with the latest published rate, callers should check asOf() against their end dates.
    \ingroup marketdata
*/
QuantLib::ext::shared_ptr<RateTable> embeddedRateTable();

} // namespace data
} // namespace cie
