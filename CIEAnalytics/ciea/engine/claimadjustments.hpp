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

/*! \file ciea/engine/claimadjustments.hpp
    \brief Deterministic adjustments of claim amounts
    \ingroup engine
*/

#pragma once

#include <cied/request/calculationrequest.hpp>

#include <ql/types.hpp>

#include <string>

namespace cie {
namespace analytics {

//! Outcome of a claim adjustment
struct AdjustmentResult {
    cie::data::AdjustmentRequest::Type type;
    std::string label;
    QuantLib::Real inputAmount = 0.0;
    //! the adjusted amount, rounded to two decimals
    QuantLib::Real finalAmount = 0.0;
    //! maximum limit only, the part of the input above the limit
    QuantLib::Real excess = 0.0;
    //! maximum limit only, true if the limit reduced the amount
    bool limitApplied = false;
    std::string source;
    std::string formula;
};

//! A participant's share of a syndicated total, sharePercent in (0, 100]
AdjustmentResult shareOfTotal(QuantLib::Real total, QuantLib::Real sharePercent, const std::string& label = "");

//! An amount fixed by a judgment or settlement, passed through rounded and tagged with its source
AdjustmentResult confirmedAmount(QuantLib::Real amount, const std::string& source, const std::string& label = "");

//! The amount recoverable under a maximum amount guarantee, min(total, limit)
AdjustmentResult applyMaximumLimit(QuantLib::Real total, QuantLib::Real limit, const std::string& label = "");

//! Apply an adjustment request
AdjustmentResult applyAdjustment(const cie::data::AdjustmentRequest& request);

} // namespace analytics
} // namespace cie
