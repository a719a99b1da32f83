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

/*! \file ciea/engine/daycount.hpp
    \brief Inclusive day count and daily rate conversion
    \ingroup engine
*/

#pragma once

#include <cied/request/calculationrequest.hpp>

#include <ql/time/date.hpp>
#include <ql/types.hpp>

namespace cie {
namespace analytics {

//! Statutory delayed-performance interest, 1.75 per ten thousand per day
const QuantLib::Real DELAYED_PERFORMANCE_DAILY_RATE = 0.000175;

//! Number of days from start to end with both end points included, i.e. end - start + 1
/*! This is the governing legal convention and differs from the usual exclusive actual day counts.
    Requires start <= end.
    \ingroup engine
*/
QuantLib::Integer daysBetween(const QuantLib::Date& start, const QuantLib::Date& end);

//! Daily rate as a fraction, annualRatePercent / 100 / baseDays
QuantLib::Real dailyRate(QuantLib::Real annualRatePercent, QuantLib::Size baseDays);

//! Resolve the day count base of a request
/*! An explicit value must be 360 or 365. Without one the context decides, Lending gives 360 and Judicial 365.
    The base is never inferred from the calculation mode, a request giving neither fails with a ValidationError,
    a request whose explicit value contradicts its context with an InvalidParameterError.
    \ingroup engine
*/
QuantLib::Size resolveBaseDays(const cie::data::DayCountBasis& basis);

//! Day count base implied by a context
QuantLib::Size baseDays(cie::data::DayCountContext context);

} // namespace analytics
} // namespace cie
