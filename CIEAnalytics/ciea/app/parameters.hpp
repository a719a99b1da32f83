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

/*! \file ciea/app/parameters.hpp
    \brief Claim interest engine setup
    \ingroup app
*/

#pragma once

#include <map>
#include <string>

namespace cie {
namespace analytics {

//! Provides the input data and references to input files used in CIEApp
/*! The parameter file has the layout
    <pre>
    <CIE>
      <Setup>
        <Parameter name="inputPath">Input</Parameter>
        ...
      </Setup>
      <Logging>
        <Parameter name="logMask">31</Parameter>
      </Logging>
    </CIE>
    </pre>
    Setup parameters are stored in the group "setup", logging parameters in the group "logging".
    \ingroup app
 */
class Parameters {
public:
    Parameters() {}

    void clear();
    void fromFile(const std::string& fileName);
    void fromString(const std::string& xml);

    bool hasGroup(const std::string& groupName) const;
    bool has(const std::string& groupName, const std::string& paramName) const;
    std::string get(const std::string& groupName, const std::string& paramName, bool fail = true) const;
    const std::map<std::string, std::string>& data(const std::string& groupName) const;

    void log() const;

private:
    void fromStream(std::istream& in, const std::string& source);

    std::map<std::string, std::map<std::string, std::string>> data_;
};

} // namespace analytics
} // namespace cie
