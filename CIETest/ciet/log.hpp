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

/*! \file ciet/log.hpp
    \brief boost test logger
*/

#pragma once

#include <cied/utilities/log.hpp>

#include <boost/algorithm/string.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/test/unit_test.hpp>

#include <string>
#include <vector>

namespace cie {
namespace test {

//! BoostTest Logger
/*!
  This logger writes each log message out to the BOOST_TEST_MESSAGE.
  To view log messages run the unit tests with the flag "--log_level=test_suite"
  \see Log
 */
class BoostTestLogger : public cie::data::Logger {
public:
    BoostTestLogger() : Logger("BoostTestLogger") {}
    void log(unsigned, const std::string& msg) override { BOOST_TEST_MESSAGE(msg); }
};

//! Gets passed the command line arguments from a unit test suite and sets up logging if it is requested
/*!
    Specifying --cie_log_mask on its own turns on logging with a default
    log mask of 255
    Optionally, you can specify the log mask using --cie_log_mask=<mask>
*/
inline void setupTestLogging(int argc, char** argv) {

    for (int i = 1; i < argc; ++i) {

        if (boost::starts_with(argv[i], "--cie_log_mask")) {

            unsigned int mask = 255;
            std::vector<std::string> strs;
            boost::split(strs, argv[i], boost::is_any_of("="));
            if (strs.size() > 1) {
                mask = boost::lexical_cast<unsigned int>(strs[1]);
            }

            QuantLib::ext::shared_ptr<BoostTestLogger> logger = QuantLib::ext::make_shared<BoostTestLogger>();
            cie::data::Log::instance().removeAllLoggers();
            cie::data::Log::instance().registerLogger(logger);
            cie::data::Log::instance().switchOn();
            cie::data::Log::instance().setMask(mask);
        }
    }
}

} // namespace test
} // namespace cie
