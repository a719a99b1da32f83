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
#include <ciea/engine/requestvalidator.hpp>
#include <cied/utilities/errors.hpp>
#include <ciet/toplevelfixture.hpp>

#include <limits>

#include "testrequests.hpp"

using namespace QuantLib;
using namespace boost::unit_test_framework;
using namespace std;
using namespace cie::data;
using namespace cie::analytics;
using cie::test::request;

namespace {

CalculationRequest valid() {
    return request(100000.0, Date(1, Jan, 2024), Date(31, Dec, 2024), cie::test::simpleAnnual(4.35, 360));
}

// Validate and check the kind and field of the error raised
void checkRejected(const CalculationRequest& r, const string& kind, const string& field) {
    BOOST_TEST_MESSAGE("expecting " << kind << " on " << field);
    bool thrown = false;
    try {
        RequestValidator().validate(r);
    } catch (const CalculationError& e) {
        thrown = true;
        BOOST_CHECK_EQUAL(e.kind(), kind);
        BOOST_CHECK_EQUAL(e.field(), field);
        BOOST_CHECK(!e.message().empty());
    }
    BOOST_CHECK_MESSAGE(thrown, "request was not rejected, expected " << kind << " on " << field);
}

} // namespace

BOOST_FIXTURE_TEST_SUITE(CIEAnalyticsTestSuite, cie::test::TopLevelFixture)

BOOST_AUTO_TEST_SUITE(RequestValidatorTests)

BOOST_AUTO_TEST_CASE(testValidRequests) {
    RequestValidator validator;
    BOOST_CHECK_NO_THROW(validator.validate(valid()));
    BOOST_CHECK_NO_THROW(validator.validate(cie::test::floatingAcrossRateChanges()));
    BOOST_CHECK_NO_THROW(
        validator.validate(request(1.0, Date(1, Jan, 2024), Date(1, Jan, 2024), DelayedParameters())));

    // payments on the start and end dates are in range, equal dates are allowed
    BOOST_CHECK_NO_THROW(validator.validate(request(
        100000.0, Date(1, Jan, 2024), Date(31, Dec, 2024), cie::test::simpleAnnual(4.35, 360),
        {{Date(1, Jan, 2024), 10.0}, {Date(1, Jan, 2024), 10.0}, {Date(31, Dec, 2024), 10.0}})));

    SimpleParameters contextOnly;
    contextOnly.annualRatePercent = 5.0;
    contextOnly.dayCount.context = DayCountContext::Judicial;
    BOOST_CHECK_NO_THROW(validator.validate(request(100.0, Date(1, Jan, 2024), Date(2, Jan, 2024), contextOnly)));
}

BOOST_AUTO_TEST_CASE(testRequestFields) {
    BOOST_TEST_MESSAGE("Testing rejection of malformed request fields...");

    CalculationRequest r = valid();
    r.principal = 0.0;
    checkRejected(r, "ValidationError", "principal");
    r.principal = -1.0;
    checkRejected(r, "ValidationError", "principal");
    r.principal = std::numeric_limits<Real>::quiet_NaN();
    checkRejected(r, "ValidationError", "principal");

    r = valid();
    r.startDate = Date();
    checkRejected(r, "ValidationError", "start_date");

    r = valid();
    r.endDate = Date(31, Dec, 2023);
    checkRejected(r, "ValidationError", "end_date");

    r = valid();
    r.outstandingCosts = -5.0;
    checkRejected(r, "ValidationError", "outstanding_costs");

    r = valid();
    r.outstandingInterest = -5.0;
    checkRejected(r, "ValidationError", "outstanding_interest");
}

BOOST_AUTO_TEST_CASE(testPayments) {
    BOOST_TEST_MESSAGE("Testing rejection of invalid payments...");

    CalculationRequest r = valid();
    r.payments = {{Date(31, Dec, 2023), 100.0}};
    checkRejected(r, "InvalidPaymentDateError", "payments[0].date");

    r.payments = {{Date(1, Mar, 2024), 100.0}, {Date(1, Jan, 2025), 100.0}};
    checkRejected(r, "InvalidPaymentDateError", "payments[1].date");

    r.payments = {{Date(1, Mar, 2024), 100.0}, {Date(1, Feb, 2024), 100.0}};
    checkRejected(r, "InvalidPaymentDateError", "payments[1].date");

    r.payments = {{Date(1, Mar, 2024), 0.0}};
    checkRejected(r, "ValidationError", "payments[0].amount");
}

BOOST_AUTO_TEST_CASE(testModeParameters) {
    BOOST_TEST_MESSAGE("Testing rejection of missing or contradictory mode parameters...");

    CalculationRequest r = valid();

    r.parameters = SimpleParameters();
    checkRejected(r, "InvalidParameterError", "annual_rate");

    SimpleParameters both = cie::test::simpleAnnual(4.35, 360);
    both.dailyRatePercent = 0.05;
    r.parameters = both;
    checkRejected(r, "InvalidParameterError", "daily_rate");

    SimpleParameters dailyWithBase;
    dailyWithBase.dailyRatePercent = 0.05;
    dailyWithBase.dayCount = cie::test::base(360);
    r.parameters = dailyWithBase;
    checkRejected(r, "InvalidParameterError", "base_days");

    r.parameters = cie::test::simpleAnnual(-1.0, 360);
    checkRejected(r, "InvalidParameterError", "annual_rate");

    // the day count base is never guessed
    SimpleParameters noBase;
    noBase.annualRatePercent = 4.35;
    r.parameters = noBase;
    checkRejected(r, "ValidationError", "base_days");

    r.parameters = cie::test::simpleAnnual(4.35, 364);
    checkRejected(r, "InvalidParameterError", "base_days");

    SimpleParameters contradiction = cie::test::simpleAnnual(4.35, 360);
    contradiction.dayCount.context = DayCountContext::Judicial;
    r.parameters = contradiction;
    checkRejected(r, "InvalidParameterError", "base_days");

    FloatingParameters noTerm;
    noTerm.dayCount = cie::test::base(360);
    r.parameters = noTerm;
    checkRejected(r, "InvalidParameterError", "term");

    r.parameters = cie::test::floating(RateTerm::ShortTerm, 0.0, 360);
    checkRejected(r, "InvalidParameterError", "multiplier");

    FloatingParameters capTermOnly = cie::test::floating(RateTerm::ShortTerm, 1.0, 360);
    capTermOnly.capTerm = RateTerm::LongTerm;
    r.parameters = capTermOnly;
    checkRejected(r, "InvalidParameterError", "cap_term");

    CompoundParameters noCycle;
    noCycle.annualRatePercent = 6.0;
    noCycle.dayCount = cie::test::base(360);
    r.parameters = noCycle;
    checkRejected(r, "MissingCycleError", "cycle");

    CompoundParameters noRate;
    noRate.cycle = CompoundingCycle(CompoundingCycle::Type::QuarterEnd);
    noRate.dayCount = cie::test::base(360);
    r.parameters = noRate;
    checkRejected(r, "InvalidParameterError", "annual_rate");

    PenaltyParameters fixedWithoutRate;
    fixedWithoutRate.dayCount = cie::test::base(365);
    r.parameters = fixedWithoutRate;
    checkRejected(r, "InvalidParameterError", "annual_rate");

    PenaltyParameters fixedWithTerm = cie::test::fixedPenalty(24.0, 365);
    fixedWithTerm.term = RateTerm::LongTerm;
    r.parameters = fixedWithTerm;
    checkRejected(r, "InvalidParameterError", "term");

    // a fixed penalty rate is applied as given, a multiplier would be dropped
    PenaltyParameters fixedWithMultiplier = cie::test::fixedPenalty(24.0, 365);
    fixedWithMultiplier.multiplier = 3.0;
    r.parameters = fixedWithMultiplier;
    checkRejected(r, "InvalidParameterError", "multiplier");

    PenaltyParameters floatingPenalty;
    floatingPenalty.basis = PenaltyBasis::Floating;
    floatingPenalty.term = RateTerm::LongTerm;
    floatingPenalty.dayCount = cie::test::base(365);
    r.parameters = floatingPenalty;
    BOOST_CHECK_NO_THROW(RequestValidator().validate(r));
    floatingPenalty.multiplier = 0.0;
    r.parameters = floatingPenalty;
    checkRejected(r, "InvalidParameterError", "multiplier");

    PenaltyParameters floatingWithRate;
    floatingWithRate.basis = PenaltyBasis::Floating;
    floatingWithRate.term = RateTerm::LongTerm;
    floatingWithRate.annualRatePercent = 24.0;
    floatingWithRate.dayCount = cie::test::base(365);
    r.parameters = floatingWithRate;
    checkRejected(r, "InvalidParameterError", "annual_rate");

    PenaltyParameters zeroCap = cie::test::fixedPenalty(24.0, 365);
    zeroCap.capMultiplier = 0.0;
    r.parameters = zeroCap;
    checkRejected(r, "InvalidParameterError", "cap_multiplier");
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE_END()
