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

/*! \file ciea/app/structuredcalculationerror.hpp
    \brief Structured calculation error
    \ingroup app
*/

#pragma once

#include <cied/utilities/log.hpp>

namespace cie {
namespace analytics {

class StructuredCalculationErrorMessage : public cie::data::StructuredMessage {
public:
    StructuredCalculationErrorMessage(const std::string& calculation, const std::string& errorKind,
                                      const std::string& field, const std::string& errorWhat,
                                      const std::map<std::string, std::string>& subFields = {})
        : StructuredMessage(Category::Error, Group::Calculation, errorWhat,
                            std::map<std::string, std::string>(
                                {{"errorKind", errorKind}, {"field", field}, {"calculation", calculation}})) {

        if (!subFields.empty())
            subFields_.insert(subFields.begin(), subFields.end());
    }
};

} // namespace analytics
} // namespace cie
