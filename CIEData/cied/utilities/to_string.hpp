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

/*! \file cied/utilities/to_string.hpp
    \brief string conversion utilities
    \ingroup utilities
*/

#pragma once

#include <ql/time/date.hpp>
#include <ql/types.hpp>

#include <sstream>
#include <string>
#include <vector>

namespace cie {
namespace data {

//! Convert QuantLib::Date to std::string
/*!
  Returns date as a string in YYYY-MM-DD format, matches parseDate()

  If date == Date() returns 1900-01-01 so the above format is preserved.
  \ingroup utilities
*/
std::string to_string(const QuantLib::Date& date);

//! Convert bool to std::string
/*!
  Returns "true" for true and "false" for false, matches parseBool()
  \ingroup utilities
 */
std::string to_string(bool aBool);

//! Convert an amount or rate to std::string with a fixed number of decimals
/*! Negative zero is printed as zero so that equal values always render identically.
    \ingroup utilities
*/
std::string to_string(QuantLib::Real value, QuantLib::Size precision);

//! Convert type to std::string
/*!
  Utility to give a string representation of any type that supports operator<<
  \ingroup utilities
 */
template <class T> std::string to_string(const T& t) {
    std::ostringstream oss;
    oss << t;
    return oss.str();
}

//! Convert vector to std::string
/*!
  Returns a vector into a single string, with elements separated by Name
  \ingroup utilities
 */
template <class T> std::string to_string(const std::vector<T>& vec, const std::string& sep = ",") {
    std::ostringstream oss;
    for (std::size_t i = 0; i < vec.size(); ++i) {
        if (i > 0)
            oss << sep;
        oss << vec[i];
    }
    return oss.str();
}

//! Escape a string for use inside a JSON string literal
std::string jsonify(const std::string& s);

} // namespace data
} // namespace cie
