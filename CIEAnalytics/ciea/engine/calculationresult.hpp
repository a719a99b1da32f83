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

/*! \file ciea/engine/calculationresult.hpp
    \brief Result of an interest calculation
    \ingroup engine
*/

#pragma once

#include <ciea/engine/interestperiod.hpp>
#include <ciea/engine/paymentallocator.hpp>
#include <cied/marketdata/ratetable.hpp>
#include <cied/request/calculationrequest.hpp>

#include <ql/time/date.hpp>
#include <ql/types.hpp>
#include <ql/utilities/null.hpp>

#include <boost/optional.hpp>

#include <ostream>
#include <string>
#include <vector>

namespace cie {
namespace analytics {

//! Non fatal finding, attached to a successful result
struct CalculationWarning {
    enum class Kind { UnappliedRemainder };

    Kind kind;
    QuantLib::Date date;
    QuantLib::Real amount;
    std::string message;
};

std::ostream& operator<<(std::ostream& out, const CalculationWarning::Kind& kind);

//! Comparison of a result against the interest at a capped benchmark rate
/*! The caller decides which figure to use, the raw total is never replaced. */
struct CapResult {
    cie::data::RateTerm capTerm;
    QuantLib::Real capMultiplier;
    //! the total interest of the calculation
    QuantLib::Real rawTotal;
    //! the total interest at capMultiplier times the capTerm benchmark over the same periods
    QuantLib::Real capRateTotal;
    //! min(rawTotal, capRateTotal)
    QuantLib::Real cappedTotal;
    //! interest at the cap rate per period, unrounded
    std::vector<QuantLib::Real> capInterest;
    //! annual cap rate in percent per period
    std::vector<QuantLib::Real> capRates;

    bool capBinding() const { return capRateTotal < rawTotal; }
};

//! Full result of one calculation request
/*! totalInterest is the sum of the unrounded period interest, rounded once to two decimals.
    \ingroup engine
*/
struct CalculationResult {
    cie::data::CalculationRequest request;
    cie::data::CalculationMode mode;

    QuantLib::Real totalInterest = 0.0;
    QuantLib::Real unroundedTotal = 0.0;
    QuantLib::Integer totalDays = 0;
    //! Null where the rate is quoted per day
    QuantLib::Size baseDays = QuantLib::Null<QuantLib::Size>();
    std::string rateBasis;

    std::vector<PeriodResult> periods;
    std::vector<PaymentAllocation> allocations;
    std::vector<CalculationWarning> warnings;
    boost::optional<CapResult> cap;

    OutstandingBalances openingBalances;
    OutstandingBalances closingBalances;
    //! compound mode only, principal plus interest outstanding at the end date
    boost::optional<QuantLib::Real> finalPrincipal;

    std::string rateTableVersion;
    QuantLib::Date rateTableAsOf;
};

} // namespace analytics
} // namespace cie
