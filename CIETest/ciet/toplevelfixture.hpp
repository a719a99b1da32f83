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

/*! \file ciet/toplevelfixture.hpp
    \brief Fixture that can be used at top level
*/

#pragma once

#include <cied/utilities/log.hpp>

#include <boost/test/unit_test.hpp>
#include <ql/settings.hpp>

namespace cie {
namespace test {

//! Top level fixture
class TopLevelFixture {
public:
    QuantLib::SavedSettings savedSettings;

    /*! Constructor
        Add things here that you want to happen at the start of every test case
    */
    TopLevelFixture() {}

    /*! Destructor
        Add things here that you want to happen after _every_ test case
    */
    virtual ~TopLevelFixture() {
        // Loggers registered by a test case must not see messages of the next one
        if (cie::data::Log::instance().hasLogger("BufferLogger"))
            cie::data::Log::instance().removeLogger("BufferLogger");
    }
};

} // namespace test
} // namespace cie
