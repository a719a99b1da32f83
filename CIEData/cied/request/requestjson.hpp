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

/*! \file cied/request/requestjson.hpp
    \brief JSON transport of calculation requests and case files
    \ingroup request
*/

#pragma once

#include <cied/request/calculationrequest.hpp>

#include <json/json.h>

#include <string>

namespace cie {
namespace data {

//! Parse JSON text, throws a ValidationError on malformed input
Json::Value parseJson(const std::string& text);

//! Serialise JSON with two space indentation and amounts at full precision
std::string writeJson(const Json::Value& value);

/*! Build a request from its JSON form
    <pre>
    { "mode": "lpr", "principal": 200000, "start_date": "2023-06-01", "end_date": "2023-08-21",
      "term": "1y", "multiplier": 1.5, "base_days": 360,
      "payments": [ { "date": "2023-07-15", "amount": 5000 } ] }
    </pre>
    Field names are snake_case. Unknown fields and fields that do not apply to the mode are rejected with a
    ValidationError, a rate, multiplier or day count on a delayed-performance request with an InvalidParameterError.
    Semantic checks (ranges, date order, required mode fields) are left to the RequestValidator.
*/
CalculationRequest calculationRequestFromJson(const Json::Value& value);

//! JSON form of a request, the inverse of calculationRequestFromJson()
Json::Value toJson(const CalculationRequest& request);

/*! Build a claim adjustment from its JSON form
    <pre>
    { "type": "share_of_total", "label": "Syndicate share", "amount": 1000000, "share_percent": 35 }
    </pre>
*/
AdjustmentRequest adjustmentRequestFromJson(const Json::Value& value);

//! A case file, a named list of calculation and adjustment requests
/*! Requests are kept in JSON form, they are read one by one so that a malformed request fails on its own. */
struct CaseFile {
    std::string name;
    Json::Value calculations = Json::Value(Json::arrayValue);
    Json::Value adjustments = Json::Value(Json::arrayValue);
};

//! Read a case file { "case": ..., "calculations": [...], "adjustments": [...] }
CaseFile loadCaseFile(const std::string& filename);

//! Build a case file from its JSON form
CaseFile caseFileFromJson(const Json::Value& value);

} // namespace data
} // namespace cie
