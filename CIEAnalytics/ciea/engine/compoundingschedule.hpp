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

/*! \file ciea/engine/compoundingschedule.hpp
    \brief Cycle end dates of a compounding cycle
    \ingroup engine
*/

#pragma once

#include <cied/request/calculationrequest.hpp>

#include <ql/time/date.hpp>

#include <vector>

namespace cie {
namespace analytics {

//! Cycle end dates d of the cycle with start < d <= end, in increasing order
/*! MonthEnd, QuarterEnd, SemiAnnualEnd and YearEnd end on the last calendar day of the respective month. MonthlyOnDay(n)
    ends on day n of every month, or the last day of shorter months. EveryNDays(n) ends on start + n, start + 2n
    and so on. With both ends counted the first cycle spans n + 1 days, every later one n days.
    \ingroup engine
*/
std::vector<QuantLib::Date> cycleEndDates(const cie::data::CompoundingCycle& cycle, const QuantLib::Date& start,
                                          const QuantLib::Date& end);

} // namespace analytics
} // namespace cie
