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

#include <cied/utilities/to_string.hpp>

#include <ql/errors.hpp>

#include <boost/algorithm/string/replace.hpp>

#include <cstdio>
#include <iomanip>

namespace cie {
namespace data {

std::string to_string(const QuantLib::Date& date) {
    if (date == QuantLib::Date())
        return "1900-01-01";
    char buf[11];
    int y = date.year();
    int m = static_cast<int>(date.month());
    int d = date.dayOfMonth();
    int n = std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d", y, m, d);
    QL_REQUIRE(n == 10, "Failed to convert date " << date << " to_string() n:" << n);
    return std::string(buf);
}

std::string to_string(bool aBool) { return aBool ? "true" : "false"; }

std::string to_string(QuantLib::Real value, QuantLib::Size precision) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(static_cast<int>(precision));
    oss << value;
    std::string s = oss.str();
    // avoid "-0.00"
    if (!s.empty() && s[0] == '-' && s.find_first_not_of("-0.") == std::string::npos)
        s.erase(0, 1);
    return s;
}

std::string jsonify(const std::string& s) {
    std::string str = s;
    boost::replace_all(str, "\\", "\\\\"); // do this before the below otherwise we get \\"
    boost::replace_all(str, "\"", "\\\"");
    boost::replace_all(str, "\r", "\\r");
    boost::replace_all(str, "\n", "\\n");
    boost::replace_all(str, "\t", "\\t");
    return str;
}

} // namespace data
} // namespace cie
