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

/*! \file ciea/engine/ratecapvalidator.hpp
    \brief Comparison of a result against a capped benchmark rate
    \ingroup engine
*/

#pragma once

#include <ciea/engine/calculationresult.hpp>
#include <cied/marketdata/ratetable.hpp>

#include <ql/shared_ptr.hpp>

namespace cie {
namespace analytics {

//! Re-runs the floating algorithm over the periods of a result with the cap multiplier
/*! Each period of the result accrues again on the same principal base at capMultiplier times the benchmark of the
    cap term in force at the period start. The raw total, the total at the cap rate and the lower of the two are all
    reported. The result itself is left unchanged.
    \ingroup engine
*/
class RateCapValidator {
public:
    explicit RateCapValidator(const QuantLib::ext::shared_ptr<const cie::data::RateTable>& rateTable);

    CapResult cap(const CalculationResult& result, QuantLib::Real capMultiplier, cie::data::RateTerm term) const;

private:
    QuantLib::ext::shared_ptr<const cie::data::RateTable> rateTable_;
};

} // namespace analytics
} // namespace cie
