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

#include <cied/utilities/errors.hpp>

namespace cie {
namespace data {

CalculationError::CalculationError(const std::string& file, long line, const std::string& function,
                                   const std::string& kind, const std::string& field, const std::string& message)
    : QuantLib::Error(file, line, function, kind + " (" + field + "): " + message), kind_(kind), field_(field),
      message_(message) {}

} // namespace data
} // namespace cie
