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

/*! \file ciea/engine/requestvalidator.hpp
    \brief Structural and semantic checks of a calculation request
    \ingroup engine
*/

#pragma once

#include <cied/request/calculationrequest.hpp>

namespace cie {
namespace analytics {

//! Checks a request before dispatch, so that no calculation ever starts on a request it cannot finish
/*! Throws the CalculationError of the first violation found:
    - ValidationError: non positive principal, start after end, negative opening amounts or payments, a day count
      base that is neither explicit nor given by a context
    - InvalidPaymentDateError: a payment outside [start, end] or out of date order
    - InvalidParameterError: a mode parameter missing, out of range or contradicting another one
    - MissingCycleError: a compound request without a compounding cycle
    \ingroup engine
*/
class RequestValidator {
public:
    void validate(const cie::data::CalculationRequest& request) const;
};

} // namespace analytics
} // namespace cie
