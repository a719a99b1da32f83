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

#include <cied/utilities/parsers.hpp>

#include <ql/errors.hpp>

#include <boost/algorithm/string.hpp>
#include <boost/lexical_cast.hpp>

#include <map>
#include <vector>

using namespace QuantLib;
using std::map;
using std::string;

namespace cie {
namespace data {

Date parseDate(const string& s) {
    // YYYY-MM-DD or YYYY/MM/DD
    QL_REQUIRE(s.size() == 10, "Cannot convert \"" << s << "\" to Date, expected YYYY-MM-DD");
    QL_REQUIRE((s[4] == '-' && s[7] == '-') || (s[4] == '/' && s[7] == '/'),
               "Cannot convert \"" << s << "\" to Date, expected YYYY-MM-DD");
    Integer y, m, d;
    try {
        y = boost::lexical_cast<Integer>(s.substr(0, 4));
        m = boost::lexical_cast<Integer>(s.substr(5, 2));
        d = boost::lexical_cast<Integer>(s.substr(8, 2));
    } catch (const boost::bad_lexical_cast&) {
        QL_FAIL("Cannot convert \"" << s << "\" to Date, non numeric year, month or day");
    }
    QL_REQUIRE(y >= 1901 && y <= 2199, "Cannot convert \"" << s << "\" to Date, year out of range");
    QL_REQUIRE(m >= 1 && m <= 12, "Cannot convert \"" << s << "\" to Date, month out of range");
    QL_REQUIRE(d >= 1 && d <= Date::endOfMonth(Date(1, Month(m), y)).dayOfMonth(),
               "Cannot convert \"" << s << "\" to Date, day out of range");
    return Date(d, Month(m), y);
}

Real parseReal(const string& s) {
    try {
        return boost::lexical_cast<Real>(boost::trim_copy(s));
    } catch (const boost::bad_lexical_cast&) {
        QL_FAIL("Failed to parseReal(\"" << s << "\")");
    }
}

Integer parseInteger(const string& s) {
    try {
        return boost::lexical_cast<Integer>(boost::trim_copy(s));
    } catch (const boost::bad_lexical_cast&) {
        QL_FAIL("Failed to parseInteger(\"" << s << "\")");
    }
}

bool parseBool(const string& s) {
    static map<string, bool> b = {{"Y", true},     {"YES", true},  {"TRUE", true},   {"True", true},
                                  {"true", true},  {"1", true},    {"N", false},     {"NO", false},
                                  {"FALSE", false}, {"False", false}, {"false", false}, {"0", false}};

    auto it = b.find(s);
    if (it != b.end()) {
        return it->second;
    } else {
        QL_FAIL("Cannot convert \"" << s << "\" to bool");
    }
}

RateTerm parseRateTerm(const string& s) {
    static map<string, RateTerm> m = {{"1y", RateTerm::ShortTerm},
                                      {"1Y", RateTerm::ShortTerm},
                                      {"ShortTerm", RateTerm::ShortTerm},
                                      {"short_term", RateTerm::ShortTerm},
                                      {"5y", RateTerm::LongTerm},
                                      {"5Y", RateTerm::LongTerm},
                                      {"LongTerm", RateTerm::LongTerm},
                                      {"long_term", RateTerm::LongTerm}};

    auto it = m.find(s);
    if (it != m.end()) {
        return it->second;
    } else {
        QL_FAIL("Cannot convert \"" << s << "\" to RateTerm");
    }
}

CalculationMode parseCalculationMode(const string& s) {
    static map<string, CalculationMode> m = {{"simple", CalculationMode::Simple},
                                             {"lpr", CalculationMode::Floating},
                                             {"floating", CalculationMode::Floating},
                                             {"delay", CalculationMode::Delayed},
                                             {"delayed", CalculationMode::Delayed},
                                             {"compound", CalculationMode::Compound},
                                             {"penalty", CalculationMode::Penalty}};

    auto it = m.find(s);
    if (it != m.end()) {
        return it->second;
    } else {
        QL_FAIL("Cannot convert \"" << s << "\" to CalculationMode");
    }
}

CompoundingCycle parseCompoundingCycle(const string& s) {
    static map<string, CompoundingCycle::Type> m = {{"month_end", CompoundingCycle::Type::MonthEnd},
                                                    {"quarter_end", CompoundingCycle::Type::QuarterEnd},
                                                    {"semiannual_end", CompoundingCycle::Type::SemiAnnualEnd},
                                                    {"year_end", CompoundingCycle::Type::YearEnd},
                                                    {"monthly_day", CompoundingCycle::Type::MonthlyOnDay},
                                                    {"every_days", CompoundingCycle::Type::EveryNDays}};

    std::vector<string> tokens;
    boost::split(tokens, s, boost::is_any_of(":"));
    QL_REQUIRE(tokens.size() == 1 || tokens.size() == 2, "Cannot convert \"" << s << "\" to CompoundingCycle");
    auto it = m.find(tokens[0]);
    QL_REQUIRE(it != m.end(), "Cannot convert \"" << s << "\" to CompoundingCycle");
    bool parametrised =
        it->second == CompoundingCycle::Type::MonthlyOnDay || it->second == CompoundingCycle::Type::EveryNDays;
    if (!parametrised) {
        QL_REQUIRE(tokens.size() == 1, "Cannot convert \"" << s << "\" to CompoundingCycle, " << tokens[0]
                                                           << " takes no argument");
        return CompoundingCycle(it->second);
    }
    QL_REQUIRE(tokens.size() == 2, "Cannot convert \"" << s << "\" to CompoundingCycle, " << tokens[0]
                                                       << " requires an argument, e.g. " << tokens[0] << ":20");
    Integer n = parseInteger(tokens[1]);
    QL_REQUIRE(n > 0, "Cannot convert \"" << s << "\" to CompoundingCycle, argument must be positive");
    return CompoundingCycle(it->second, static_cast<Size>(n));
}

PaymentOffsetPolicy parsePaymentOffsetPolicy(const string& s) {
    static map<string, PaymentOffsetPolicy> m = {{"general", PaymentOffsetPolicy::GeneralDebt},
                                                 {"general_debt", PaymentOffsetPolicy::GeneralDebt},
                                                 {"GeneralDebt", PaymentOffsetPolicy::GeneralDebt},
                                                 {"judgment", PaymentOffsetPolicy::JudgmentDebt},
                                                 {"judgment_debt", PaymentOffsetPolicy::JudgmentDebt},
                                                 {"JudgmentDebt", PaymentOffsetPolicy::JudgmentDebt}};

    auto it = m.find(s);
    if (it != m.end()) {
        return it->second;
    } else {
        QL_FAIL("Cannot convert \"" << s << "\" to PaymentOffsetPolicy");
    }
}

DayCountContext parseDayCountContext(const string& s) {
    static map<string, DayCountContext> m = {{"lending", DayCountContext::Lending},
                                             {"Lending", DayCountContext::Lending},
                                             {"judicial", DayCountContext::Judicial},
                                             {"Judicial", DayCountContext::Judicial}};

    auto it = m.find(s);
    if (it != m.end()) {
        return it->second;
    } else {
        QL_FAIL("Cannot convert \"" << s << "\" to DayCountContext");
    }
}

PenaltyBasis parsePenaltyBasis(const string& s) {
    static map<string, PenaltyBasis> m = {{"fixed", PenaltyBasis::Fixed},
                                          {"Fixed", PenaltyBasis::Fixed},
                                          {"floating", PenaltyBasis::Floating},
                                          {"lpr", PenaltyBasis::Floating},
                                          {"Floating", PenaltyBasis::Floating}};

    auto it = m.find(s);
    if (it != m.end()) {
        return it->second;
    } else {
        QL_FAIL("Cannot convert \"" << s << "\" to PenaltyBasis");
    }
}

AdjustmentRequest::Type parseAdjustmentType(const string& s) {
    static map<string, AdjustmentRequest::Type> m = {{"share_of_total", AdjustmentRequest::Type::ShareOfTotal},
                                                     {"confirmed_amount", AdjustmentRequest::Type::ConfirmedAmount},
                                                     {"maximum_limit", AdjustmentRequest::Type::MaximumLimit}};

    auto it = m.find(s);
    if (it != m.end()) {
        return it->second;
    } else {
        QL_FAIL("Cannot convert \"" << s << "\" to AdjustmentRequest::Type");
    }
}

} // namespace data
} // namespace cie
