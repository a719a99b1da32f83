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
#include <ciea/engine/claimadjustments.hpp>
#include <cied/utilities/errors.hpp>
#include <ciet/toplevelfixture.hpp>

using namespace QuantLib;
using namespace boost::unit_test_framework;
using namespace std;
using namespace cie::data;
using namespace cie::analytics;

BOOST_FIXTURE_TEST_SUITE(CIEAnalyticsTestSuite, cie::test::TopLevelFixture)

BOOST_AUTO_TEST_SUITE(ClaimAdjustmentsTests)

BOOST_AUTO_TEST_CASE(testShareOfTotal) {
    BOOST_TEST_MESSAGE("Testing share of a syndicated total...");

    AdjustmentResult r = shareOfTotal(1000000.0, 35.0, "syndicate");
    BOOST_CHECK(r.type == AdjustmentRequest::Type::ShareOfTotal);
    BOOST_CHECK_EQUAL(r.label, "syndicate");
    BOOST_CHECK_EQUAL(r.inputAmount, 1000000.0);
    BOOST_CHECK_CLOSE(r.finalAmount, 350000.0, 1e-12);
    BOOST_CHECK_EQUAL(r.formula, "1000000.00 x 35.000000% = 350000.00");
    BOOST_CHECK(!r.limitApplied);

    // rounded to cents
    BOOST_CHECK_CLOSE(shareOfTotal(100.0, 33.333).finalAmount, 33.33, 1e-12);
    BOOST_CHECK_CLOSE(shareOfTotal(100.0, 100.0).finalAmount, 100.0, 1e-12);

    BOOST_CHECK_THROW(shareOfTotal(100.0, 0.0), ValidationError);
    BOOST_CHECK_THROW(shareOfTotal(100.0, 100.5), ValidationError);
    BOOST_CHECK_THROW(shareOfTotal(-100.0, 50.0), ValidationError);
}

BOOST_AUTO_TEST_CASE(testConfirmedAmount) {
    AdjustmentResult r = confirmedAmount(12345.678, "judgment 2023-17", "principal");
    BOOST_CHECK(r.type == AdjustmentRequest::Type::ConfirmedAmount);
    BOOST_CHECK_CLOSE(r.finalAmount, 12345.68, 1e-12);
    BOOST_CHECK_EQUAL(r.source, "judgment 2023-17");
    BOOST_CHECK_EQUAL(r.formula, "confirmed 12345.68 (judgment 2023-17)");
    BOOST_CHECK_EQUAL(confirmedAmount(10.0, "").formula, "confirmed 10.00");
    BOOST_CHECK_THROW(confirmedAmount(-1.0, "x"), ValidationError);
}

BOOST_AUTO_TEST_CASE(testMaximumLimit) {
    BOOST_TEST_MESSAGE("Testing the maximum amount guarantee limit...");

    AdjustmentResult r = applyMaximumLimit(1200000.5, 1000000.0, "guarantee");
    BOOST_CHECK(r.type == AdjustmentRequest::Type::MaximumLimit);
    BOOST_CHECK(r.limitApplied);
    BOOST_CHECK_CLOSE(r.finalAmount, 1000000.0, 1e-12);
    BOOST_CHECK_CLOSE(r.excess, 200000.5, 1e-12);
    BOOST_CHECK_EQUAL(r.formula, "min(1200000.50, 1000000.00) = 1000000.00");

    AdjustmentResult below = applyMaximumLimit(800000.0, 1000000.0);
    BOOST_CHECK(!below.limitApplied);
    BOOST_CHECK_CLOSE(below.finalAmount, 800000.0, 1e-12);
    BOOST_CHECK_EQUAL(below.excess, 0.0);

    // a total equal to the limit is not reduced
    BOOST_CHECK(!applyMaximumLimit(1000.0, 1000.0).limitApplied);
    BOOST_CHECK_THROW(applyMaximumLimit(1000.0, -1.0), ValidationError);
}

BOOST_AUTO_TEST_CASE(testApplyAdjustment) {
    AdjustmentRequest request;
    request.type = AdjustmentRequest::Type::MaximumLimit;
    request.amount = 5000.0;
    request.limit = 3000.0;
    AdjustmentResult r = applyAdjustment(request);
    BOOST_CHECK_CLOSE(r.finalAmount, 3000.0, 1e-12);
    BOOST_CHECK_CLOSE(r.excess, 2000.0, 1e-12);

    request.limit = boost::none;
    try {
        applyAdjustment(request);
        BOOST_FAIL("expected a ValidationError for a missing limit");
    } catch (const ValidationError& e) {
        BOOST_CHECK_EQUAL(e.field(), "limit");
    }

    request.type = AdjustmentRequest::Type::ShareOfTotal;
    BOOST_CHECK_THROW(applyAdjustment(request), ValidationError);
    request.sharePercent = 50.0;
    BOOST_CHECK_CLOSE(applyAdjustment(request).finalAmount, 2500.0, 1e-12);

    request.type = AdjustmentRequest::Type::ConfirmedAmount;
    request.source = "settlement";
    BOOST_CHECK_EQUAL(applyAdjustment(request).source, "settlement");
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE_END()
