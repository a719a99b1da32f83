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
#include <cied/marketdata/embeddedratetable.hpp>
#include <cied/marketdata/ratetable.hpp>
#include <cied/marketdata/ratetableloader.hpp>
#include <cied/utilities/errors.hpp>
#include <ciet/datapaths.hpp>
#include <ciet/toplevelfixture.hpp>

#include <sstream>

using namespace QuantLib;
using namespace boost::unit_test_framework;
using namespace std;
using namespace cie::data;

namespace {

QuantLib::ext::shared_ptr<RateTable> smallTable() {
    vector<RateTableEntry> entries = {{RateTerm::ShortTerm, Date(22, May, 2023), 3.65},
                                      {RateTerm::ShortTerm, Date(20, Jun, 2023), 3.55},
                                      {RateTerm::ShortTerm, Date(20, Jul, 2023), 3.55},
                                      {RateTerm::ShortTerm, Date(21, Aug, 2023), 3.45},
                                      {RateTerm::LongTerm, Date(22, May, 2023), 4.30},
                                      {RateTerm::LongTerm, Date(20, Jun, 2023), 4.20}};
    return QuantLib::ext::make_shared<RateTable>("test", Date(21, Aug, 2023), entries);
}

} // namespace

BOOST_FIXTURE_TEST_SUITE(CIEDataTestSuite, cie::test::TopLevelFixture)

BOOST_AUTO_TEST_SUITE(RateTableTests)

BOOST_AUTO_TEST_CASE(testLookup) {
    BOOST_TEST_MESSAGE("Testing rate table lookup...");

    auto table = smallTable();
    // in force from the effective date, inclusive
    BOOST_CHECK_EQUAL(table->lookup(RateTerm::ShortTerm, Date(22, May, 2023)), 3.65);
    BOOST_CHECK_EQUAL(table->lookup(RateTerm::ShortTerm, Date(19, Jun, 2023)), 3.65);
    BOOST_CHECK_EQUAL(table->lookup(RateTerm::ShortTerm, Date(20, Jun, 2023)), 3.55);
    BOOST_CHECK_EQUAL(table->lookup(RateTerm::ShortTerm, Date(20, Aug, 2023)), 3.55);
    BOOST_CHECK_EQUAL(table->lookup(RateTerm::ShortTerm, Date(21, Aug, 2023)), 3.45);
    BOOST_CHECK_EQUAL(table->lookup(RateTerm::LongTerm, Date(1, Jul, 2023)), 4.20);

    // forward filled after the last entry
    BOOST_CHECK_EQUAL(table->lookup(RateTerm::ShortTerm, Date(1, Jan, 2030)), 3.45);
}

BOOST_AUTO_TEST_CASE(testLookupBeforeFirstEntry) {
    BOOST_TEST_MESSAGE("Testing rate table lookup before the first entry...");

    auto table = smallTable();
    BOOST_CHECK_THROW(table->lookup(RateTerm::ShortTerm, Date(21, May, 2023)), RateNotFoundError);

    try {
        table->lookup(RateTerm::LongTerm, Date(1, Jan, 2020));
        BOOST_FAIL("expected a RateNotFoundError");
    } catch (const RateNotFoundError& e) {
        BOOST_CHECK_EQUAL(e.kind(), "RateNotFoundError");
        BOOST_CHECK_EQUAL(e.term(), "LongTerm");
        BOOST_CHECK_EQUAL(e.date(), Date(1, Jan, 2020));
    }
}

BOOST_AUTO_TEST_CASE(testEffectiveAndChangeDates) {
    BOOST_TEST_MESSAGE("Testing rate table effective and change dates...");

    auto table = smallTable();
    vector<Date> effective = table->effectiveDates(RateTerm::ShortTerm, Date(1, Jun, 2023), Date(21, Aug, 2023));
    vector<Date> expectedEffective = {Date(20, Jun, 2023), Date(20, Jul, 2023), Date(21, Aug, 2023)};
    BOOST_CHECK_EQUAL_COLLECTIONS(effective.begin(), effective.end(), expectedEffective.begin(),
                                  expectedEffective.end());

    // the unchanged republication on 2023-07-20 is not a change
    vector<Date> changes = table->rateChangeDates(RateTerm::ShortTerm, Date(1, Jun, 2023), Date(21, Aug, 2023));
    vector<Date> expectedChanges = {Date(20, Jun, 2023), Date(21, Aug, 2023)};
    BOOST_CHECK_EQUAL_COLLECTIONS(changes.begin(), changes.end(), expectedChanges.begin(), expectedChanges.end());

    // the start date itself is excluded, the end date included
    BOOST_CHECK(table->rateChangeDates(RateTerm::ShortTerm, Date(20, Jun, 2023), Date(20, Aug, 2023)).empty());
    BOOST_CHECK_EQUAL(table->rateChangeDates(RateTerm::ShortTerm, Date(20, Jun, 2023), Date(21, Aug, 2023)).size(),
                      1);
}

BOOST_AUTO_TEST_CASE(testInspectors) {
    auto table = smallTable();
    BOOST_CHECK_EQUAL(table->version(), "test");
    BOOST_CHECK_EQUAL(table->asOf(), Date(21, Aug, 2023));
    BOOST_CHECK(table->hasTerm(RateTerm::LongTerm));
    BOOST_CHECK_EQUAL(table->size(RateTerm::ShortTerm), 4);
    BOOST_CHECK_EQUAL(table->earliestDate(RateTerm::LongTerm), Date(22, May, 2023));
    BOOST_CHECK_EQUAL(table->latestDate(RateTerm::ShortTerm), Date(21, Aug, 2023));
}

BOOST_AUTO_TEST_CASE(testConstructionRejectsUnorderedEntries) {
    BOOST_TEST_MESSAGE("Testing rate table construction checks...");

    vector<RateTableEntry> unordered = {{RateTerm::ShortTerm, Date(20, Jun, 2023), 3.55},
                                        {RateTerm::ShortTerm, Date(22, May, 2023), 3.65}};
    BOOST_CHECK_THROW(RateTable("bad", Date(20, Jun, 2023), unordered), QuantLib::Error);

    vector<RateTableEntry> duplicate = {{RateTerm::ShortTerm, Date(20, Jun, 2023), 3.55},
                                        {RateTerm::ShortTerm, Date(20, Jun, 2023), 3.55}};
    BOOST_CHECK_THROW(RateTable("bad", Date(20, Jun, 2023), duplicate), QuantLib::Error);

    vector<RateTableEntry> negative = {{RateTerm::LongTerm, Date(20, Jun, 2023), -1.0}};
    BOOST_CHECK_THROW(RateTable("bad", Date(20, Jun, 2023), negative), QuantLib::Error);

    BOOST_CHECK_THROW(RateTable("empty", Date(20, Jun, 2023), vector<RateTableEntry>()), QuantLib::Error);
}

BOOST_AUTO_TEST_CASE(testEmbeddedTable) {
    BOOST_TEST_MESSAGE("Testing the embedded rate table...");

    auto table = embeddedRateTable();
    BOOST_CHECK_EQUAL(table->version(), EMBEDDED_RATE_TABLE_VERSION);
    BOOST_CHECK_EQUAL(table->asOf(), embeddedRateTableAsOf());
    BOOST_CHECK_EQUAL(table->earliestDate(RateTerm::ShortTerm), Date(20, Aug, 2019));
    BOOST_CHECK_EQUAL(table->lookup(RateTerm::ShortTerm, Date(20, Aug, 2019)), 4.25);
    BOOST_CHECK_EQUAL(table->lookup(RateTerm::LongTerm, Date(20, Aug, 2019)), 4.85);
    BOOST_CHECK_EQUAL(table->lookup(RateTerm::ShortTerm, Date(1, Jun, 2023)), 3.65);
    BOOST_CHECK_EQUAL(table->lookup(RateTerm::ShortTerm, Date(20, Jun, 2023)), 3.55);
    BOOST_CHECK_EQUAL(table->lookup(RateTerm::ShortTerm, Date(21, Aug, 2023)), 3.45);
    BOOST_CHECK_EQUAL(table->lookup(RateTerm::LongTerm, Date(20, Feb, 2024)), 3.95);
    BOOST_CHECK_THROW(table->lookup(RateTerm::ShortTerm, Date(19, Aug, 2019)), RateNotFoundError);

    vector<Date> changes = table->rateChangeDates(RateTerm::ShortTerm, Date(1, Jun, 2023), Date(21, Aug, 2023));
    BOOST_CHECK_EQUAL(changes.size(), 2);
}

BOOST_AUTO_TEST_CASE(testLoadFile) {
    BOOST_TEST_MESSAGE("Testing rate table loading from csv...");

    auto table = RateTableLoader::loadFile(TEST_INPUT_FILE("lpr_test.csv"));
    // version defaults to the file name, as of to the latest date
    BOOST_CHECK_EQUAL(table->version(), "lpr_test");
    BOOST_CHECK_EQUAL(table->asOf(), Date(21, Aug, 2023));
    BOOST_CHECK_EQUAL(table->size(RateTerm::ShortTerm), 4);
    BOOST_CHECK_EQUAL(table->size(RateTerm::LongTerm), 3);
    BOOST_CHECK_EQUAL(table->lookup(RateTerm::ShortTerm, Date(21, Aug, 2023)), 3.45);
    BOOST_CHECK_EQUAL(table->lookup(RateTerm::LongTerm, Date(21, Aug, 2023)), 4.20);

    auto versioned = RateTableLoader::loadFile(TEST_INPUT_FILE("lpr_test.csv"), "v2", Date(1, Sep, 2023));
    BOOST_CHECK_EQUAL(versioned->version(), "v2");
    BOOST_CHECK_EQUAL(versioned->asOf(), Date(1, Sep, 2023));
}

BOOST_AUTO_TEST_CASE(testLoadRejectsMalformedFiles) {
    BOOST_CHECK_THROW(RateTableLoader::loadFile(TEST_INPUT_FILE("bad_header.csv")), QuantLib::Error);
    BOOST_CHECK_THROW(RateTableLoader::loadFile(TEST_INPUT_FILE("out_of_order.csv")), QuantLib::Error);
    BOOST_CHECK_THROW(RateTableLoader::loadFile(TEST_INPUT_FILE("missing.csv")), QuantLib::Error);

    std::istringstream noRates("Date,ShortTerm,LongTerm\n");
    BOOST_CHECK_THROW(RateTableLoader::loadStream(noRates, "x", Date()), QuantLib::Error);

    std::istringstream badDate("Date,ShortTerm,LongTerm\n2023-02-30,3.65,4.30\n");
    BOOST_CHECK_THROW(RateTableLoader::loadStream(badDate, "x", Date()), QuantLib::Error);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE_END()
