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

#include <iomanip>
#include <iostream>
using namespace std;

// Boost
#include <boost/timer/timer.hpp>
using namespace boost;

// Boost.Test
#define BOOST_TEST_MODULE CIEAnalyticsTestSuite
#include <boost/test/included/unit_test.hpp>
#include <boost/test/unit_test.hpp>
using boost::unit_test::test_suite;
using boost::unit_test::framework::master_test_suite;

#include <ciet/basedatapath.hpp>
#include <ciet/log.hpp>
using cie::test::getBaseDataPath;
using cie::test::setupTestLogging;

// Global base path variable
string basePath = "";

class CieaGlobalFixture {
public:
    CieaGlobalFixture() {
        int argc = master_test_suite().argc;
        char** argv = master_test_suite().argv;

        // Set up test logging
        setupTestLogging(argc, argv);

        // Set the base data path for the unit tests
        BOOST_TEST_MESSAGE("Test suite setup: base data path was: " << basePath);
        basePath = getBaseDataPath(argc, argv);
        BOOST_TEST_MESSAGE("Test suite setup: base data path is now: " << basePath);
    }

    ~CieaGlobalFixture() { stopTimer(); }

    // Method called in destructor to log time taken
    void stopTimer() {
        double seconds = t.elapsed().wall * 1.0e-9;
        int hours = int(seconds / 3600);
        seconds -= hours * 3600;
        int minutes = int(seconds / 60);
        seconds -= minutes * 60;
        cout << endl << "CIEAnalytics tests completed in ";
        if (hours > 0)
            cout << hours << " h ";
        if (hours > 0 || minutes > 0)
            cout << minutes << " m ";
        cout << fixed << setprecision(0) << seconds << " s" << endl;
    }

private:
    // Timing the test run
    boost::timer::cpu_timer t;
};

BOOST_TEST_GLOBAL_FIXTURE(CieaGlobalFixture);
