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

/*! \file ciea/engine/periodsegmenter.hpp
    \brief Split a calculation range into accrual periods
    \ingroup engine
*/

#pragma once

#include <ciea/engine/modecalculator.hpp>
#include <cied/request/calculationrequest.hpp>

#include <ql/time/date.hpp>

#include <utility>
#include <vector>

namespace cie {
namespace analytics {

//! Splits [startDate, endDate] of a request at every date where the rate or the accrual base changes
/*! Break points are the start date, the day after each payment date, the calculator's break dates (benchmark rate
    changes, the day after each compounding cycle end) and endDate + 1 as sentinel. Coinciding break points collapse,
    so no empty period is ever created, and the periods partition the range with no gaps and no overlaps.
    \ingroup engine
*/
class PeriodSegmenter {
public:
    typedef std::pair<QuantLib::Date, QuantLib::Date> Span;

    //! sorted, unique break points including the sentinel endDate + 1
    std::vector<QuantLib::Date> breakPoints(const cie::data::CalculationRequest& request,
                                            const ModeCalculator& calculator) const;

    //! the inclusive [start, end] spans between consecutive break points
    /*! Throws an InvalidPaymentDateError if a payment falls outside the range of the request. */
    std::vector<Span> segment(const cie::data::CalculationRequest& request, const ModeCalculator& calculator) const;
};

} // namespace analytics
} // namespace cie
