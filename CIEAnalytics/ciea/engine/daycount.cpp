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
#include <cied/utilities/errors.hpp>
#include <cied/utilities/to_string.hpp>

#include <ql/errors.hpp>

using namespace cie::data;
using QuantLib::Date;
using QuantLib::Integer;
using QuantLib::Real;
using QuantLib::Size;

namespace cie {
namespace analytics {

Integer daysBetween(const Date& start, const Date& end) {
    QL_REQUIRE(start != Date() && end != Date(), "daysBetween: empty date");
    QL_REQUIRE(start <= end, "daysBetween: start " << to_string(start) << " is after end " << to_string(end));
    return static_cast<Integer>(end - start) + 1;
}

Real dailyRate(Real annualRatePercent, Size baseDays) {
    QL_REQUIRE(baseDays > 0, "dailyRate: base days must be positive");
    return annualRatePercent / 100.0 / static_cast<Real>(baseDays);
}

Size baseDays(DayCountContext context) {
    switch (context) {
    case DayCountContext::Lending:
        return 360;
    case DayCountContext::Judicial:
        return 365;
    default:
        QL_FAIL("unknown DayCountContext " << static_cast<int>(context));
    }
}

Size resolveBaseDays(const DayCountBasis& basis) {
    if (basis.baseDays) {
        CIE_REQUIRE(*basis.baseDays == 360 || *basis.baseDays == 365, InvalidParameterError, "base_days",
                    "base days must be 360 or 365, got " << *basis.baseDays);
        if (basis.context) {
            CIE_REQUIRE(baseDays(*basis.context) == *basis.baseDays, InvalidParameterError, "base_days",
                        "base days " << *basis.baseDays << " contradict day count context " << *basis.context
                                     << " (" << baseDays(*basis.context) << ")");
        }
        return *basis.baseDays;
    }
    CIE_REQUIRE(basis.context, ValidationError, "base_days",
                "base days must be given explicitly (360 or 365) or through a day count context");
    return baseDays(*basis.context);
}

} // namespace analytics
} // namespace cie
