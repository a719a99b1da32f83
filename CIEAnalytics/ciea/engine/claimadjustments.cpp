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

#include <ciea/engine/claimadjustments.hpp>
#include <cied/utilities/errors.hpp>
#include <cied/utilities/log.hpp>
#include <cied/utilities/to_string.hpp>

#include <ql/math/rounding.hpp>

#include <algorithm>
#include <cmath>

using namespace cie::data;
using QuantLib::Real;
using std::string;

namespace cie {
namespace analytics {

AdjustmentResult shareOfTotal(Real total, Real sharePercent, const string& label) {
    CIE_REQUIRE(std::isfinite(total) && total >= 0.0, ValidationError, "amount",
                "total must not be negative, got " << total);
    CIE_REQUIRE(std::isfinite(sharePercent) && sharePercent > 0.0 && sharePercent <= 100.0, ValidationError,
                "share_percent", "share must be in (0, 100], got " << sharePercent);
    AdjustmentResult r;
    r.type = AdjustmentRequest::Type::ShareOfTotal;
    r.label = label;
    r.inputAmount = total;
    r.finalAmount = QuantLib::ClosestRounding(2)(total * sharePercent / 100.0);
    r.formula = to_string(total, 2) + " x " + to_string(sharePercent, 6) + "% = " + to_string(r.finalAmount, 2);
    DLOG("share of total '" << label << "': " << r.formula);
    return r;
}

AdjustmentResult confirmedAmount(Real amount, const string& source, const string& label) {
    CIE_REQUIRE(std::isfinite(amount) && amount >= 0.0, ValidationError, "amount",
                "confirmed amount must not be negative, got " << amount);
    AdjustmentResult r;
    r.type = AdjustmentRequest::Type::ConfirmedAmount;
    r.label = label;
    r.inputAmount = amount;
    r.finalAmount = QuantLib::ClosestRounding(2)(amount);
    r.source = source;
    r.formula = "confirmed " + to_string(r.finalAmount, 2) + (source.empty() ? string() : " (" + source + ")");
    DLOG("confirmed amount '" << label << "': " << r.formula);
    return r;
}

AdjustmentResult applyMaximumLimit(Real total, Real limit, const string& label) {
    CIE_REQUIRE(std::isfinite(total) && total >= 0.0, ValidationError, "amount",
                "total must not be negative, got " << total);
    CIE_REQUIRE(std::isfinite(limit) && limit >= 0.0, ValidationError, "limit",
                "limit must not be negative, got " << limit);
    AdjustmentResult r;
    r.type = AdjustmentRequest::Type::MaximumLimit;
    r.label = label;
    r.inputAmount = total;
    r.limitApplied = total > limit;
    r.finalAmount = QuantLib::ClosestRounding(2)(std::min(total, limit));
    r.excess = r.limitApplied ? QuantLib::ClosestRounding(2)(total - limit) : 0.0;
    r.formula = "min(" + to_string(total, 2) + ", " + to_string(limit, 2) + ") = " + to_string(r.finalAmount, 2);
    DLOG("maximum limit '" << label << "': " << r.formula);
    return r;
}

AdjustmentResult applyAdjustment(const AdjustmentRequest& request) {
    switch (request.type) {
    case AdjustmentRequest::Type::ShareOfTotal:
        CIE_REQUIRE(request.sharePercent, ValidationError, "share_percent", "share_percent is required");
        return shareOfTotal(request.amount, *request.sharePercent, request.label);
    case AdjustmentRequest::Type::ConfirmedAmount:
        return confirmedAmount(request.amount, request.source, request.label);
    case AdjustmentRequest::Type::MaximumLimit:
        CIE_REQUIRE(request.limit, ValidationError, "limit", "limit is required");
        return applyMaximumLimit(request.amount, *request.limit, request.label);
    default:
        QL_FAIL("unknown AdjustmentRequest type " << static_cast<int>(request.type));
    }
}

} // namespace analytics
} // namespace cie
