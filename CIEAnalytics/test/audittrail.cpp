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
#include <ciea/engine/audittrail.hpp>
#include <ciea/engine/calculationengine.hpp>
#include <cied/report/inmemoryreport.hpp>
#include <ciet/datapaths.hpp>
#include <ciet/fileutilities.hpp>
#include <ciet/toplevelfixture.hpp>

#include <ql/utilities/null.hpp>

#include "testrequests.hpp"

using namespace QuantLib;
using namespace boost::unit_test_framework;
using namespace std;
using namespace cie::data;
using namespace cie::analytics;
using cie::test::testRateTable;

namespace {

string field(const InMemoryReport& report, const string& name) {
    for (Size j = 0; j < report.rows(); ++j) {
        if (boost::get<string>(report.data(0, j)) == name)
            return boost::get<string>(report.data(1, j));
    }
    BOOST_FAIL("field " << name << " not found in metadata");
    return string();
}

} // namespace

BOOST_FIXTURE_TEST_SUITE(CIEAnalyticsTestSuite, cie::test::TopLevelFixture)

BOOST_AUTO_TEST_SUITE(AuditTrailTests)

BOOST_AUTO_TEST_CASE(testAuditRows) {
    BOOST_TEST_MESSAGE("Testing audit rows of a floating calculation...");

    CalculationResult r = CalculationEngine(testRateTable()).calculate(cie::test::floatingAcrossRateChanges());
    vector<AuditRow> rows = AuditTrailGenerator().render(r);

    BOOST_REQUIRE_EQUAL(rows.size(), 4);
    for (Size i = 0; i < 3; ++i) {
        BOOST_CHECK_EQUAL(rows[i].row, i + 1);
        BOOST_CHECK_EQUAL(rows[i].type, "Period");
        BOOST_CHECK_EQUAL(rows[i].startDate, r.periods[i].period.startDate);
        BOOST_CHECK_EQUAL(rows[i].endDate, r.periods[i].period.endDate);
        BOOST_CHECK_EQUAL(rows[i].subInterest, r.periods[i].subInterest);
        BOOST_CHECK_EQUAL(rows[i].formula, r.periods[i].formula);
        BOOST_CHECK_EQUAL(rows[i].cappedSubInterest, Null<Real>());
    }
    // rows are in date order
    BOOST_CHECK(rows[0].endDate < rows[1].startDate);
    BOOST_CHECK(rows[1].endDate < rows[2].startDate);

    const AuditRow& total = rows.back();
    BOOST_CHECK_EQUAL(total.row, 4);
    BOOST_CHECK_EQUAL(total.type, "Total");
    BOOST_CHECK_EQUAL(total.days, 82);
    BOOST_CHECK_EQUAL(total.annualRate, Null<Real>());
    BOOST_CHECK_CLOSE(total.subInterest, 2440.83, 1e-12);
    BOOST_CHECK_EQUAL(total.formula, "round(sum of 3 periods = 2440.833333, 2) = 2440.83");
}

BOOST_AUTO_TEST_CASE(testAuditTotalWithCap) {
    CalculationRequest req = cie::test::floatingAcrossRateChanges();
    boost::get<FloatingParameters>(req.parameters).capMultiplier = 1.0;
    CalculationResult r = CalculationEngine(testRateTable()).calculate(req);
    vector<AuditRow> rows = AuditTrailGenerator().render(r);
    BOOST_REQUIRE_EQUAL(rows.size(), 4);
    BOOST_CHECK_CLOSE(rows[0].cappedSubInterest, r.periods[0].subInterest / 1.5, 1e-10);
    BOOST_CHECK_CLOSE(rows.back().cappedSubInterest, 1627.22, 1e-12);
    BOOST_CHECK_EQUAL(rows.back().formula, "round(sum of 3 periods = 2440.833333, 2) = 2440.83; "
                                           "cap rate total 1627.22, capped total 1627.22");
}

BOOST_AUTO_TEST_CASE(testAuditReport) {
    BOOST_TEST_MESSAGE("Testing the audit report layout...");

    CalculationResult r = CalculationEngine(testRateTable()).calculate(cie::test::floatingAcrossRateChanges());
    AuditTrailGenerator generator;
    InMemoryReport report;
    generator.write(generator.render(r), report);

    BOOST_CHECK_EQUAL(report.columns(), 13);
    BOOST_CHECK_EQUAL(report.rows(), 4);
    BOOST_CHECK_EQUAL(report.header(0), "Row");
    BOOST_CHECK_EQUAL(report.header(12), "Formula");
    BOOST_CHECK(report.hasHeader("CappedSubInterest"));
    BOOST_CHECK_EQUAL(boost::get<string>(report.data(1, 3)), "Total");
    BOOST_CHECK_EQUAL(boost::get<Date>(report.data(2, 1)), Date(20, Jun, 2023));

    InMemoryReport metadata;
    generator.writeMetadata(r, metadata);
    BOOST_CHECK_EQUAL(field(metadata, "Mode"), "Floating");
    BOOST_CHECK_EQUAL(field(metadata, "Principal"), "200000.00");
    BOOST_CHECK_EQUAL(field(metadata, "BaseDays"), "360");
    BOOST_CHECK_EQUAL(field(metadata, "TotalInterest"), "2440.83");
    BOOST_CHECK_EQUAL(field(metadata, "RateTableVersion"), EMBEDDED_RATE_TABLE_VERSION);
}

BOOST_AUTO_TEST_CASE(testAuditAllocations) {
    CalculationRequest req = cie::test::request(100000.0, Date(1, Jan, 2024), Date(31, Jan, 2024),
                                                cie::test::simpleAnnual(3.6, 360), {{Date(10, Jan, 2024), 7000.0}});
    req.outstandingInterest = 4900.0;
    CalculationResult r = CalculationEngine(testRateTable()).calculate(req);

    InMemoryReport report;
    AuditTrailGenerator().writeAllocations(r, report);
    BOOST_CHECK_EQUAL(report.rows(), 1);
    BOOST_CHECK_EQUAL(boost::get<Date>(report.data(0, 0)), Date(10, Jan, 2024));
    BOOST_CHECK_CLOSE(boost::get<Real>(report.data(4, 0)), 2000.0, 1e-10);
    BOOST_CHECK_CLOSE(boost::get<Real>(report.data(9, 0)), 98000.0, 1e-12);
}

BOOST_AUTO_TEST_CASE(testAuditIdempotence) {
    BOOST_TEST_MESSAGE("Testing that rendering the same result twice gives identical output...");

    CalculationRequest req = cie::test::floatingAcrossRateChanges();
    boost::get<FloatingParameters>(req.parameters).capMultiplier = 2.0;
    CalculationResult r = CalculationEngine(testRateTable()).calculate(req);

    AuditTrailGenerator generator;
    vector<AuditRow> first = generator.render(r);
    vector<AuditRow> second = generator.render(r);
    BOOST_CHECK(first == second);

    string file1 = TEST_OUTPUT_FILE("audit_1.csv");
    string file2 = TEST_OUTPUT_FILE("audit_2.csv");
    InMemoryReport report1, report2;
    generator.write(first, report1);
    generator.write(second, report2);
    report1.toFile(file1);
    report2.toFile(file2);
    BOOST_CHECK(cie::test::compareFiles(file1, file2));

    // a recalculation gives the same trail as well
    CalculationResult again = CalculationEngine(testRateTable()).calculate(req);
    BOOST_CHECK(generator.render(again) == first);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE_END()
