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
#include <cied/report/csvreport.hpp>
#include <cied/report/inmemoryreport.hpp>
#include <cied/report/workbookfile.hpp>
#include <ciet/datapaths.hpp>
#include <ciet/fileutilities.hpp>
#include <ciet/toplevelfixture.hpp>

#include <ql/utilities/null.hpp>

using namespace QuantLib;
using namespace boost::unit_test_framework;
using namespace std;
using namespace cie::data;
using cie::test::readFile;

namespace {

QuantLib::ext::shared_ptr<InMemoryReport> sampleTable(Real interest) {
    auto report = QuantLib::ext::make_shared<InMemoryReport>();
    report->addColumn("Row", Size())
        .addColumn("EndDate", Date())
        .addColumn("SubInterest", Real(), 2)
        .addColumn("Formula", string());
    report->next().add(Size(1)).add(Date(21, Aug, 2023)).add(interest).add(string("a x b"));
    report->next().add(Size(2)).add(Date(22, Aug, 2023)).add(Null<Real>()).add(string("n/a"));
    report->end();
    return report;
}

class F : public cie::test::TopLevelFixture {
public:
    string workbookFile;

    F() {
        workbookFile = TEST_OUTPUT_FILE("workbook.csv");
        cie::test::clearOutput(workbookFile);
    }
};

} // namespace

BOOST_FIXTURE_TEST_SUITE(CIEDataTestSuite, cie::test::TopLevelFixture)

BOOST_FIXTURE_TEST_SUITE(ReportTests, F)

BOOST_AUTO_TEST_CASE(testCsvFileReport) {
    BOOST_TEST_MESSAGE("Testing csv file report...");

    string file = TEST_OUTPUT_FILE("report.csv");
    sampleTable(1234.5678)->toFile(file);
    BOOST_CHECK_EQUAL(readFile(file), "#Row,EndDate,SubInterest,Formula\n"
                                      "1,2023-08-21,1234.57,a x b\n"
                                      "2,2023-08-22,#N/A,n/a\n");
}

BOOST_AUTO_TEST_CASE(testCsvFileReportChecks) {
    string file = TEST_OUTPUT_FILE("checks.csv");
    CSVFileReport report(file);
    report.addColumn("A", Size()).addColumn("B", string());
    report.next();
    // wrong type for the column
    BOOST_CHECK_THROW(report.add(string("x")), QuantLib::Error);
    report.add(Size(1)).add(string("x"));
    // too many entries
    BOOST_CHECK_THROW(report.add(string("y")), QuantLib::Error);
    report.end();
    // finalized
    BOOST_CHECK_THROW(report.next(), QuantLib::Error);
}

BOOST_AUTO_TEST_CASE(testInMemoryReport) {
    auto report = sampleTable(10.0);
    BOOST_CHECK_EQUAL(report->columns(), 4);
    BOOST_CHECK_EQUAL(report->rows(), 2);
    BOOST_CHECK_EQUAL(report->header(2), "SubInterest");
    BOOST_CHECK_EQUAL(boost::get<Real>(report->data(2, 0)), 10.0);
    BOOST_CHECK_EQUAL(boost::get<string>(report->data(3, 1)), "n/a");
    BOOST_CHECK(report->hasHeader("Formula"));
}

BOOST_AUTO_TEST_CASE(testWorkbookAppend) {
    BOOST_TEST_MESSAGE("Testing workbook section append...");

    WorkbookFile workbook(workbookFile);
    BOOST_CHECK(workbook.sections().empty());

    workbook.appendSection("Loan interest", {{"Audit", sampleTable(1.0)}});
    workbook.appendSection("Penalty interest", {{"Request", sampleTable(2.0)}, {"Audit", sampleTable(3.0)}});

    vector<string> sections = workbook.sections();
    BOOST_REQUIRE_EQUAL(sections.size(), 2);
    BOOST_CHECK_EQUAL(sections[0], "Loan interest");
    BOOST_CHECK_EQUAL(sections[1], "Penalty interest");
    BOOST_CHECK(workbook.hasSection("Loan interest"));
    BOOST_CHECK(!workbook.hasSection("Other"));

    BOOST_CHECK_EQUAL(workbook.section("Loan interest"), "[Section] Loan interest\n"
                                                         "[Table] Audit\n"
                                                         "#Row,EndDate,SubInterest,Formula\n"
                                                         "1,2023-08-21,1.00,a x b\n"
                                                         "2,2023-08-22,#N/A,n/a\n");
    BOOST_CHECK_THROW(workbook.section("Other"), QuantLib::Error);
}

BOOST_AUTO_TEST_CASE(testWorkbookRejectsDuplicateSection) {
    BOOST_TEST_MESSAGE("Testing workbook duplicate section names...");

    WorkbookFile workbook(workbookFile);
    workbook.appendSection("Loan interest", {{"Audit", sampleTable(1.0)}});
    string before = readFile(workbookFile);

    BOOST_CHECK_THROW(workbook.appendSection("Loan interest", {{"Audit", sampleTable(2.0)}}), QuantLib::Error);
    // a failed append leaves the workbook untouched
    BOOST_CHECK_EQUAL(readFile(workbookFile), before);
}

BOOST_AUTO_TEST_CASE(testWorkbookFailedAppendLeavesNoTrace) {
    WorkbookFile workbook(workbookFile);
    workbook.appendSection("First", {{"Audit", sampleTable(1.0)}});
    string before = readFile(workbookFile);

    // the second table is null, the append fails after the staging file was written to
    WorkbookFile::Tables tables = {{"Audit", sampleTable(2.0)}, {"Broken", nullptr}};
    BOOST_CHECK_THROW(workbook.appendSection("Second", tables), QuantLib::Error);
    BOOST_CHECK_EQUAL(readFile(workbookFile), before);
    BOOST_CHECK(!workbook.hasSection("Second"));

    // no staging files are left behind
    boost::filesystem::path dir = boost::filesystem::path(workbookFile).parent_path();
    for (boost::filesystem::directory_iterator it(dir), end; it != end; ++it)
        BOOST_CHECK(it->path().extension() != ".tmp");

    BOOST_CHECK_THROW(workbook.appendSection("", {{"Audit", sampleTable(2.0)}}), QuantLib::Error);
    BOOST_CHECK_THROW(workbook.appendSection("Two\nLines", {{"Audit", sampleTable(2.0)}}), QuantLib::Error);
    BOOST_CHECK_THROW(workbook.appendSection("Empty", WorkbookFile::Tables()), QuantLib::Error);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE_END()
