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
#include <ciea/engine/daycount.hpp>
#include <ciea/engine/modecalculator.hpp>
#include <ciea/engine/periodsegmenter.hpp>
#include <cied/utilities/errors.hpp>
#include <ciet/toplevelfixture.hpp>

#include "testrequests.hpp"

using namespace QuantLib;
using namespace boost::unit_test_framework;
using namespace std;
using namespace cie::data;
using namespace cie::analytics;
using cie::test::request;
using cie::test::testRateTable;

namespace {

vector<PeriodSegmenter::Span> segment(const CalculationRequest& r) {
    auto calculator = makeModeCalculator(r.parameters, testRateTable());
    return PeriodSegmenter().segment(r, *calculator);
}

// The spans partition [start, end]: contiguous, in order, non empty, days adding up
void checkCoverage(const CalculationRequest& r) {
    vector<PeriodSegmenter::Span> spans = segment(r);
    BOOST_REQUIRE(!spans.empty());
    BOOST_CHECK_EQUAL(spans.front().first, r.startDate);
    BOOST_CHECK_EQUAL(spans.back().second, r.endDate);
    Integer days = 0;
    for (Size i = 0; i < spans.size(); ++i) {
        BOOST_CHECK(spans[i].first <= spans[i].second);
        if (i > 0)
            BOOST_CHECK_EQUAL(spans[i].first, spans[i - 1].second + 1);
        days += daysBetween(spans[i].first, spans[i].second);
    }
    BOOST_CHECK_EQUAL(days, daysBetween(r.startDate, r.endDate));
}

} // namespace

BOOST_FIXTURE_TEST_SUITE(CIEAnalyticsTestSuite, cie::test::TopLevelFixture)

BOOST_AUTO_TEST_SUITE(PeriodSegmenterTests)

BOOST_AUTO_TEST_CASE(testRateChangeSegmentation) {
    BOOST_TEST_MESSAGE("Testing segmentation at benchmark rate changes...");

    vector<PeriodSegmenter::Span> spans = segment(cie::test::floatingAcrossRateChanges());
    // 2023-06-20 and 2023-08-21 change the 1Y rate, the republication on 2023-07-20 does not
    BOOST_REQUIRE_EQUAL(spans.size(), 3);
    BOOST_CHECK_EQUAL(spans[0].first, Date(1, Jun, 2023));
    BOOST_CHECK_EQUAL(spans[0].second, Date(19, Jun, 2023));
    BOOST_CHECK_EQUAL(spans[1].first, Date(20, Jun, 2023));
    BOOST_CHECK_EQUAL(spans[1].second, Date(20, Aug, 2023));
    BOOST_CHECK_EQUAL(spans[2].first, Date(21, Aug, 2023));
    BOOST_CHECK_EQUAL(spans[2].second, Date(21, Aug, 2023));
}

BOOST_AUTO_TEST_CASE(testBreakPoints) {
    CalculationRequest r = cie::test::floatingAcrossRateChanges();
    auto calculator = makeModeCalculator(r.parameters, testRateTable());
    vector<Date> points = PeriodSegmenter().breakPoints(r, *calculator);
    vector<Date> expected = {Date(1, Jun, 2023), Date(20, Jun, 2023), Date(21, Aug, 2023), Date(22, Aug, 2023)};
    BOOST_CHECK_EQUAL_COLLECTIONS(points.begin(), points.end(), expected.begin(), expected.end());
}

BOOST_AUTO_TEST_CASE(testCoincidingBreakPoints) {
    BOOST_TEST_MESSAGE("Testing a payment whose next day is a rate change date...");

    // the day after the 2023-06-19 payment is the 2023-06-20 rate change
    CalculationRequest r = cie::test::floatingAcrossRateChanges();
    r.payments = {{Date(19, Jun, 2023), 5000.0}};
    auto calculator = makeModeCalculator(r.parameters, testRateTable());
    vector<Date> points = PeriodSegmenter().breakPoints(r, *calculator);
    vector<Date> expected = {Date(1, Jun, 2023), Date(20, Jun, 2023), Date(21, Aug, 2023), Date(22, Aug, 2023)};
    BOOST_CHECK_EQUAL_COLLECTIONS(points.begin(), points.end(), expected.begin(), expected.end());

    vector<PeriodSegmenter::Span> spans = segment(r);
    BOOST_REQUIRE_EQUAL(spans.size(), 3);
    for (auto const& s : spans)
        BOOST_CHECK(daysBetween(s.first, s.second) > 0);
    BOOST_CHECK_EQUAL(spans[0].second, Date(19, Jun, 2023));
    BOOST_CHECK_EQUAL(spans[1].first, Date(20, Jun, 2023));
    checkCoverage(r);
}

BOOST_AUTO_TEST_CASE(testPaymentSegmentation) {
    BOOST_TEST_MESSAGE("Testing segmentation at payment dates...");

    // a payment closes its period, the next one starts the day after
    CalculationRequest r = request(100000.0, Date(1, Jan, 2024), Date(31, Mar, 2024), cie::test::simpleAnnual(4.0, 360),
                                   {{Date(10, Jan, 2024), 1000.0}, {Date(10, Jan, 2024), 500.0},
                                    {Date(31, Mar, 2024), 1000.0}});
    vector<PeriodSegmenter::Span> spans = segment(r);
    BOOST_REQUIRE_EQUAL(spans.size(), 2);
    BOOST_CHECK_EQUAL(spans[0].second, Date(10, Jan, 2024));
    BOOST_CHECK_EQUAL(spans[1].first, Date(11, Jan, 2024));
    BOOST_CHECK_EQUAL(spans[1].second, Date(31, Mar, 2024));

    // a payment on the start date gives a one day period
    r.payments = {{Date(1, Jan, 2024), 1000.0}};
    spans = segment(r);
    BOOST_REQUIRE_EQUAL(spans.size(), 2);
    BOOST_CHECK_EQUAL(spans[0].first, spans[0].second);
}

BOOST_AUTO_TEST_CASE(testPaymentOutsideRange) {
    CalculationRequest r = request(100000.0, Date(1, Jan, 2024), Date(31, Mar, 2024), cie::test::simpleAnnual(4.0, 360),
                                   {{Date(1, Apr, 2024), 1000.0}});
    BOOST_CHECK_THROW(segment(r), InvalidPaymentDateError);
    r.payments = {{Date(31, Dec, 2023), 1000.0}};
    BOOST_CHECK_THROW(segment(r), InvalidPaymentDateError);
}

BOOST_AUTO_TEST_CASE(testSegmentCoverage) {
    BOOST_TEST_MESSAGE("Testing that periods partition the calculation range...");

    checkCoverage(cie::test::floatingAcrossRateChanges());
    checkCoverage(request(100000.0, Date(1, Jan, 2024), Date(1, Jan, 2024), cie::test::simpleAnnual(4.0, 360)));
    checkCoverage(request(100000.0, Date(20, Aug, 2019), Date(21, Jul, 2025),
                          cie::test::floating(RateTerm::LongTerm, 1.0, 365),
                          {{Date(20, Aug, 2019), 10.0}, {Date(30, Jun, 2022), 10.0}, {Date(21, Jul, 2025), 10.0}}));
    checkCoverage(request(100000.0, Date(15, Jan, 2024), Date(15, Jul, 2024),
                          cie::test::compound(6.0, 360, CompoundingCycle(CompoundingCycle::Type::MonthlyOnDay, 20)),
                          {{Date(20, Mar, 2024), 100.0}, {Date(21, Mar, 2024), 100.0}}));
    checkCoverage(request(100000.0, Date(1, Jan, 2023), Date(31, Dec, 2024), cie::test::fixedPenalty(24.0, 365)));
    checkCoverage(request(100000.0, Date(1, Jun, 2024), Date(31, Dec, 2024), DelayedParameters(),
                          {{Date(15, Jul, 2024), 50000.0}}));
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE_END()
