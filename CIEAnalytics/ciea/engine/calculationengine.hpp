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

/*! \file ciea/engine/calculationengine.hpp
    \brief Interest calculation engine
    \ingroup engine
*/

#pragma once

#include <ciea/engine/calculationresult.hpp>
#include <ciea/engine/modecalculator.hpp>
#include <ciea/engine/periodsegmenter.hpp>
#include <ciea/engine/requestvalidator.hpp>
#include <cied/marketdata/ratetable.hpp>
#include <cied/request/calculationrequest.hpp>

#include <ql/shared_ptr.hpp>

namespace cie {
namespace analytics {

//! Computes the interest of a calculation request
/*! The engine validates the request, dispatches on its mode, segments the range and rolls the periods forward:
    for each period the accrual base is taken from the running balances, the period interest
    principalBase x dailyRate x days is accrued at full precision, the payments dated on the period's last day are
    allocated and, in compound mode, interest still outstanding at a cycle end is capitalised. The total is the sum of
    the unrounded period interest, rounded once to two decimals. Where the mode asks for it a rate cap comparison is
    attached.

    Calculations share nothing but the read-only rate table, so one engine may serve concurrent requests. Errors are
    thrown before a result is returned, a request either yields a complete result or none.
    \ingroup engine
*/
class CalculationEngine {
public:
    explicit CalculationEngine(const QuantLib::ext::shared_ptr<const cie::data::RateTable>& rateTable);

    CalculationResult calculate(const cie::data::CalculationRequest& request) const;

    const QuantLib::ext::shared_ptr<const cie::data::RateTable>& rateTable() const { return rateTable_; }

private:
    QuantLib::ext::shared_ptr<const cie::data::RateTable> rateTable_;
    RequestValidator validator_;
    PeriodSegmenter segmenter_;
};

} // namespace analytics
} // namespace cie
