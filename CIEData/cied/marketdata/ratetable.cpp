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

#include <cied/marketdata/ratetable.hpp>
#include <cied/utilities/errors.hpp>
#include <cied/utilities/log.hpp>
#include <cied/utilities/to_string.hpp>

#include <ql/errors.hpp>

#include <iterator>

using QuantLib::Date;
using QuantLib::Real;
using QuantLib::Size;
using std::map;
using std::string;
using std::vector;

namespace cie {
namespace data {

std::ostream& operator<<(std::ostream& out, const RateTerm& term) {
    switch (term) {
    case RateTerm::ShortTerm:
        return out << "ShortTerm";
    case RateTerm::LongTerm:
        return out << "LongTerm";
    default:
        QL_FAIL("unknown RateTerm " << static_cast<int>(term));
    }
}

RateTable::RateTable(const string& version, const Date& asOf, const vector<RateTableEntry>& entries)
    : version_(version), asOf_(asOf) {
    QL_REQUIRE(!entries.empty(), "RateTable '" << version << "' has no entries");
    // entries must arrive in increasing effective date order per term, they are not re-sorted
    map<RateTerm, Date> last;
    for (auto const& e : entries) {
        QL_REQUIRE(e.effectiveDate != Date(), "RateTable '" << version << "': empty effective date for " << e.term);
        QL_REQUIRE(e.annualRatePercent >= 0.0, "RateTable '" << version << "': negative rate "
                                                             << e.annualRatePercent << " on "
                                                             << to_string(e.effectiveDate) << " for " << e.term);
        auto l = last.find(e.term);
        if (l != last.end()) {
            QL_REQUIRE(e.effectiveDate > l->second, "RateTable '" << version << "': effective date "
                                                                  << to_string(e.effectiveDate) << " for "
                                                                  << e.term << " is not after "
                                                                  << to_string(l->second));
        }
        last[e.term] = e.effectiveDate;
        rates_[e.term][e.effectiveDate] = e.annualRatePercent;
    }
    DLOG("RateTable '" << version_ << "' as of " << to_string(asOf_) << " built with " << entries.size()
                       << " entries");
}

const map<Date, Real>& RateTable::rates(RateTerm term) const {
    auto it = rates_.find(term);
    QL_REQUIRE(it != rates_.end(), "RateTable '" << version_ << "' has no rates for term " << term);
    return it->second;
}

bool RateTable::hasTerm(RateTerm term) const { return rates_.find(term) != rates_.end(); }

Real RateTable::lookup(RateTerm term, const Date& date) const {
    auto it = rates_.find(term);
    if (it == rates_.end() || it->second.empty() || date < it->second.begin()->first) {
        std::ostringstream msg;
        msg << "no " << term << " benchmark rate in force on " << to_string(date) << ", rate table '" << version_
            << "' starts on " << (it == rates_.end() ? string("n/a") : to_string(it->second.begin()->first));
        throw RateNotFoundError(__FILE__, __LINE__, BOOST_CURRENT_FUNCTION, to_string(term), date, msg.str());
    }
    // last entry with effective date <= date, forward filled after the last entry
    auto r = it->second.upper_bound(date);
    --r;
    return r->second;
}

vector<Date> RateTable::effectiveDates(RateTerm term, const Date& start, const Date& end) const {
    vector<Date> result;
    const map<Date, Real>& r = rates(term);
    for (auto it = r.upper_bound(start); it != r.end() && it->first <= end; ++it)
        result.push_back(it->first);
    return result;
}

vector<Date> RateTable::rateChangeDates(RateTerm term, const Date& start, const Date& end) const {
    vector<Date> result;
    const map<Date, Real>& r = rates(term);
    for (auto it = r.upper_bound(start); it != r.end() && it->first <= end; ++it) {
        if (it == r.begin()) {
            // first publication, the rate changes from "not available" to a value
            result.push_back(it->first);
        } else {
            auto prev = std::prev(it);
            if (prev->second != it->second)
                result.push_back(it->first);
        }
    }
    return result;
}

const Date& RateTable::earliestDate(RateTerm term) const { return rates(term).begin()->first; }

const Date& RateTable::latestDate(RateTerm term) const { return rates(term).rbegin()->first; }

Size RateTable::size(RateTerm term) const { return hasTerm(term) ? rates(term).size() : 0; }

} // namespace data
} // namespace cie
