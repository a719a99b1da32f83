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

/*! \file cied/utilities/parsers.hpp
    \brief string parsing functions
    \ingroup utilities
*/

#pragma once

#include <cied/marketdata/ratetable.hpp>
#include <cied/request/calculationrequest.hpp>

#include <ql/time/date.hpp>
#include <ql/types.hpp>

#include <string>

namespace cie {
namespace data {

//! Convert text to QuantLib::Date
/*! Accepts YYYY-MM-DD and YYYY/MM/DD, throws on anything else or on an invalid calendar date.
    \ingroup utilities
*/
QuantLib::Date parseDate(const std::string& s);

//! Convert text to Real, throws on trailing garbage
QuantLib::Real parseReal(const std::string& s);

//! Convert text to Integer
QuantLib::Integer parseInteger(const std::string& s);

//! Convert text to bool
/*! Accepts Y, YES, TRUE, true, 1 and N, NO, FALSE, false, 0
    \ingroup utilities
*/
bool parseBool(const std::string& s);

//! Convert text to RateTerm, accepts 1y / ShortTerm and 5y / LongTerm
RateTerm parseRateTerm(const std::string& s);

//! Convert text to CalculationMode, accepts simple, lpr, floating, delay, delayed, compound, penalty
CalculationMode parseCalculationMode(const std::string& s);

//! Convert text to CompoundingCycle
/*! Accepts month_end, quarter_end, semiannual_end, year_end, monthly_day:N and every_days:N
    \ingroup utilities
*/
CompoundingCycle parseCompoundingCycle(const std::string& s);

//! Convert text to PaymentOffsetPolicy, accepts general / GeneralDebt and judgment / JudgmentDebt
PaymentOffsetPolicy parsePaymentOffsetPolicy(const std::string& s);

//! Convert text to DayCountContext, accepts lending / Lending and judicial / Judicial
DayCountContext parseDayCountContext(const std::string& s);

//! Convert text to PenaltyBasis, accepts fixed / Fixed and floating / lpr / Floating
PenaltyBasis parsePenaltyBasis(const std::string& s);

//! Convert text to AdjustmentRequest::Type
AdjustmentRequest::Type parseAdjustmentType(const std::string& s);

} // namespace data
} // namespace cie
