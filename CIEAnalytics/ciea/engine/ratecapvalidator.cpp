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

#include <ciea/engine/daycount.hpp>
#include <ciea/engine/ratecapvalidator.hpp>
#include <cied/utilities/log.hpp>

#include <ql/errors.hpp>
#include <ql/math/rounding.hpp>
#include <ql/utilities/null.hpp>

#include <algorithm>

using namespace cie::data;
using QuantLib::Real;

namespace cie {
namespace analytics {

RateCapValidator::RateCapValidator(const QuantLib::ext::shared_ptr<const RateTable>& rateTable)
    : rateTable_(rateTable) {
    QL_REQUIRE(rateTable_, "RateCapValidator: no rate table");
}

CapResult RateCapValidator::cap(const CalculationResult& result, Real capMultiplier, RateTerm term) const {
    QL_REQUIRE(capMultiplier > 0.0, "RateCapValidator: cap multiplier must be positive");
    QL_REQUIRE(result.baseDays != QuantLib::Null<QuantLib::Size>(),
               "RateCapValidator: a cap needs a result with an annual day count base");

    CapResult c;
    c.capTerm = term;
    c.capMultiplier = capMultiplier;
    c.rawTotal = result.totalInterest;

    Real sum = 0.0;
    for (auto const& r : result.periods) {
        Real capRate = rateTable_->lookup(term, r.period.startDate) * capMultiplier;
        Real interest = r.period.principalBase * dailyRate(capRate, result.baseDays) * r.period.days;
        c.capRates.push_back(capRate);
        c.capInterest.push_back(interest);
        sum += interest;
    }
    c.capRateTotal = QuantLib::ClosestRounding(2)(sum);
    c.cappedTotal = std::min(c.rawTotal, c.capRateTotal);

    DLOG("cap " << capMultiplier << " x " << term << ": raw " << c.rawTotal << ", at cap rate " << c.capRateTotal
                << ", capped " << c.cappedTotal);
    return c;
}

} // namespace analytics
} // namespace cie
