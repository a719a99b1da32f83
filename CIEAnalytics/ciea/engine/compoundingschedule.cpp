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

#include <ciea/engine/compoundingschedule.hpp>

#include <ql/errors.hpp>

#include <algorithm>

using cie::data::CompoundingCycle;
using QuantLib::Date;
using QuantLib::Month;
using QuantLib::Size;
using QuantLib::Year;
using std::vector;

namespace cie {
namespace analytics {

namespace {

// month ends of the given months in every year touched by [start, end]
vector<Date> monthEnds(const Date& start, const Date& end, const vector<Month>& months) {
    vector<Date> result;
    for (Year y = start.year(); y <= end.year(); ++y) {
        for (auto m : months) {
            Date d = Date::endOfMonth(Date(1, m, y));
            if (d > start && d <= end)
                result.push_back(d);
        }
    }
    return result;
}

} // namespace

vector<Date> cycleEndDates(const CompoundingCycle& cycle, const Date& start, const Date& end) {
    QL_REQUIRE(start <= end, "cycleEndDates: start is after end");
    using QuantLib::January;
    using QuantLib::February;
    using QuantLib::March;
    using QuantLib::April;
    using QuantLib::May;
    using QuantLib::June;
    using QuantLib::July;
    using QuantLib::August;
    using QuantLib::September;
    using QuantLib::October;
    using QuantLib::November;
    using QuantLib::December;

    vector<Date> result;
    switch (cycle.type()) {
    case CompoundingCycle::Type::MonthEnd:
        result = monthEnds(start, end, {January, February, March, April, May, June, July, August, September, October,
                                        November, December});
        break;
    case CompoundingCycle::Type::QuarterEnd:
        result = monthEnds(start, end, {March, June, September, December});
        break;
    case CompoundingCycle::Type::SemiAnnualEnd:
        result = monthEnds(start, end, {June, December});
        break;
    case CompoundingCycle::Type::YearEnd:
        result = monthEnds(start, end, {December});
        break;
    case CompoundingCycle::Type::MonthlyOnDay: {
        Date first(1, start.month(), start.year());
        for (Date m = first; m <= end; m = Date::endOfMonth(m) + 1) {
            QuantLib::Day last = Date::endOfMonth(m).dayOfMonth();
            Date d(std::min<QuantLib::Day>(static_cast<QuantLib::Day>(cycle.n()), last), m.month(), m.year());
            if (d > start && d <= end)
                result.push_back(d);
        }
        break;
    }
    case CompoundingCycle::Type::EveryNDays: {
        // n calendar days after start, then every n days
        QuantLib::Integer n = static_cast<QuantLib::Integer>(cycle.n());
        for (Date d = start + n; d <= end; d += n)
            result.push_back(d);
        break;
    }
    default:
        QL_FAIL("unknown CompoundingCycle type " << static_cast<int>(cycle.type()));
    }
    return result;
}

} // namespace analytics
} // namespace cie
