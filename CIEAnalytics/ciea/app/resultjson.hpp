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

/*! \file ciea/app/resultjson.hpp
    \brief JSON responses of the claim interest engine
    \ingroup app
*/

#pragma once

#include <ciea/engine/calculationresult.hpp>
#include <ciea/engine/claimadjustments.hpp>
#include <cied/utilities/errors.hpp>

#include <json/json.h>

#include <string>

namespace cie {
namespace analytics {

/*! The response to a successful calculation: the request echo, the totals, the periods with their formulas, the
    payment allocations, warnings, the cap comparison if one ran and the rate table version. Amounts are written
    at full precision, fields that do not apply to the mode are null.
*/
Json::Value toJson(const CalculationResult& result);

//! The response to a failed request, { "error": { "kind", "field", "message" } }
Json::Value toJson(const cie::data::CalculationError& error);

//! An error response for a failure that is not a CalculationError
Json::Value errorToJson(const std::string& kind, const std::string& field, const std::string& message);

Json::Value toJson(const AdjustmentResult& result);

} // namespace analytics
} // namespace cie
