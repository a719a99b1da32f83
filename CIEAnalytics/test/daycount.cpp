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

#include <boost/test/unit_test.hpp>
#include <ciea/engine/compoundingschedule.hpp>
#include <ciea/engine/daycount.hpp>
#include <cied/utilities/errors.hpp>
#include <ciet/toplevelfixture.hpp>

using namespace QuantLib;
using namespace boost::unit_test_framework;
using namespace std;
using namespace cie::data;
using namespace cie::analytics;

namespace {

void checkDates(const vector<Date>& actual, const vector<Date>& expected) {
    BOOST_CHECK_EQUAL_COLLECTIONS(actual.begin(), actual.end(), expected.begin(), expected.end());
}

} // namespace

BOOST_FIXTURE_TEST_SUITE(CIEAnalyticsTestSuite, cie::test::TopLevelFixture)

BOOST_AUTO_TEST_SUITE(DayCountTests)

BOOST_AUTO_TEST_CASE(testInclusiveDayCount) {
    BOOST_TEST_MESSAGE("Testing inclusive day count...");

    // a single day counts once
    for (Date d(1, Jan, 2023); d <= Date(31, Dec, 2024); d += 37)
        BOOST_CHECK_EQUAL(daysBetween(d, d), 1);

    BOOST_CHECK_EQUAL(daysBetween(Date(1, Jan, 2024), Date(31, Dec, 2024)), 366);
    BOOST_CHECK_EQUAL(daysBetween(Date(1, Jan, 2023), Date(31, Dec, 2023)), 365);
    BOOST_CHECK_EQUAL(daysBetween(Date(1, Jun, 2024), Date(31, Dec, 2024)), 214);
    BOOST_CHECK_EQUAL(daysBetween(Date(28, Feb, 2024), Date(1, Mar, 2024)), 3);

    BOOST_CHECK_THROW(daysBetween(Date(2, Jan, 2024), Date(1, Jan, 2024)), QuantLib::Error);
}

BOOST_AUTO_TEST_CASE(testDailyRate) {
    BOOST_CHECK_CLOSE(dailyRate(3.6, 360), 0.0001, 1e-10);
    BOOST_CHECK_CLOSE(dailyRate(36.5, 365), 0.001, 1e-10);
    BOOST_CHECK_EQUAL(DELAYED_PERFORMANCE_DAILY_RATE, 0.000175);
}

BOOST_AUTO_TEST_CASE(testBaseDaysResolution) {
    BOOST_TEST_MESSAGE("Testing day count base resolution...");

    BOOST_CHECK_EQUAL(baseDays(DayCountContext::Lending), 360);
    BOOST_CHECK_EQUAL(baseDays(DayCountContext::Judicial), 365);

    DayCountBasis b;
    // neither given
    BOOST_CHECK_THROW(resolveBaseDays(b), ValidationError);

    b.context = DayCountContext::Judicial;
    BOOST_CHECK_EQUAL(resolveBaseDays(b), 365);

    b.baseDays = 365;
    BOOST_CHECK_EQUAL(resolveBaseDays(b), 365);

    // explicit value contradicting the context
    b.baseDays = 360;
    BOOST_CHECK_THROW(resolveBaseDays(b), InvalidParameterError);

    b.context = boost::none;
    BOOST_CHECK_EQUAL(resolveBaseDays(b), 360);

    b.baseDays = 364;
    BOOST_CHECK_THROW(resolveBaseDays(b), InvalidParameterError);
}

BOOST_AUTO_TEST_CASE(testCycleEndDates) {
    BOOST_TEST_MESSAGE("Testing compounding cycle end dates...");

    Date start(15, Jan, 2024), end(15, Jul, 2024);

    checkDates(cycleEndDates(CompoundingCycle(CompoundingCycle::Type::MonthEnd), start, end),
               {Date(31, Jan, 2024), Date(29, Feb, 2024), Date(31, Mar, 2024), Date(30, Apr, 2024),
                Date(31, May, 2024), Date(30, Jun, 2024)});
    checkDates(cycleEndDates(CompoundingCycle(CompoundingCycle::Type::QuarterEnd), start, end),
               {Date(31, Mar, 2024), Date(30, Jun, 2024)});
    checkDates(cycleEndDates(CompoundingCycle(CompoundingCycle::Type::SemiAnnualEnd), start, end),
               {Date(30, Jun, 2024)});
    checkDates(cycleEndDates(CompoundingCycle(CompoundingCycle::Type::YearEnd), start, Date(31, Dec, 2025)),
               {Date(31, Dec, 2024), Date(31, Dec, 2025)});

    // day 31 falls back to the month end in shorter months
    checkDates(cycleEndDates(CompoundingCycle(CompoundingCycle::Type::MonthlyOnDay, 31), start, Date(30, Apr, 2024)),
               {Date(31, Jan, 2024), Date(29, Feb, 2024), Date(31, Mar, 2024), Date(30, Apr, 2024)});
    checkDates(cycleEndDates(CompoundingCycle(CompoundingCycle::Type::MonthlyOnDay, 20), start, Date(20, Mar, 2024)),
               {Date(20, Jan, 2024), Date(20, Feb, 2024), Date(20, Mar, 2024)});

    checkDates(cycleEndDates(CompoundingCycle(CompoundingCycle::Type::EveryNDays, 30), start, Date(16, Mar, 2024)),
               {Date(14, Feb, 2024), Date(15, Mar, 2024)});
    checkDates(cycleEndDates(CompoundingCycle(CompoundingCycle::Type::EveryNDays, 30), start, Date(14, Mar, 2024)),
               {Date(14, Feb, 2024)});
    checkDates(cycleEndDates(CompoundingCycle(CompoundingCycle::Type::EveryNDays, 1), start, Date(18, Jan, 2024)),
               {Date(16, Jan, 2024), Date(17, Jan, 2024), Date(18, Jan, 2024)});

    // the start date is never a cycle end, the end date may be
    checkDates(cycleEndDates(CompoundingCycle(CompoundingCycle::Type::MonthEnd), Date(31, Jan, 2024),
                             Date(29, Feb, 2024)),
               {Date(29, Feb, 2024)});
    BOOST_CHECK(cycleEndDates(CompoundingCycle(CompoundingCycle::Type::YearEnd), start, end).empty());
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE_END()
