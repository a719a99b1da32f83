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

/*! \file ciea/engine/interestperiod.hpp
    \brief Accrual periods and their results
    \ingroup engine
*/

#pragma once

#include <ql/time/date.hpp>
#include <ql/types.hpp>
#include <ql/utilities/null.hpp>

#include <string>

namespace cie {
namespace analytics {

//! A contiguous span of days with constant accrual base and rate
/*! Both end dates are included, days == endDate - startDate + 1.
    \ingroup engine
*/
struct InterestPeriod {
    QuantLib::Date startDate;
    QuantLib::Date endDate;
    //! amount on which interest accrues in this period
    QuantLib::Real principalBase = 0.0;
    //! annual rate in percent, Null for rates quoted per day
    QuantLib::Real applicableRate = QuantLib::Null<QuantLib::Real>();
    //! daily rate as a fraction
    QuantLib::Real dailyRate = 0.0;
    QuantLib::Integer days = 0;
};

//! A period together with the interest it contributes
struct PeriodResult {
    InterestPeriod period;
    //! benchmark rate in percent before the multiplier, floating rates only
    QuantLib::Real benchmarkRate = QuantLib::Null<QuantLib::Real>();
    QuantLib::Real multiplier = QuantLib::Null<QuantLib::Real>();
    //! principalBase x dailyRate x days, unrounded
    QuantLib::Real subInterest = 0.0;
    //! annual cap rate in percent and the interest at the lower of the applied and the cap rate, if a cap ran
    QuantLib::Real capRate = QuantLib::Null<QuantLib::Real>();
    QuantLib::Real cappedSubInterest = QuantLib::Null<QuantLib::Real>();
    //! interest capitalised into the principal at the end of this period, compound mode only
    QuantLib::Real capitalisedInterest = 0.0;
    std::string formula;
};

} // namespace analytics
} // namespace cie
