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

#include <ciea/app/parameters.hpp>

#include <cied/utilities/log.hpp>

#include <ql/errors.hpp>

#include <boost/property_tree/ptree.hpp>
#include <boost/property_tree/xml_parser.hpp>

#include <fstream>
#include <sstream>

using std::map;
using std::string;

namespace cie {
namespace analytics {

namespace {

map<string, string> readGroup(const boost::property_tree::ptree& node, const string& groupName) {
    map<string, string> result;
    for (auto const& child : node) {
        if (child.first == "<xmlattr>" || child.first == "<xmlcomment>")
            continue;
        QL_REQUIRE(child.first == "Parameter",
                   "unexpected node '" << child.first << "' in parameter group " << groupName);
        string key = child.second.get<string>("<xmlattr>.name", "");
        QL_REQUIRE(!key.empty(), "Parameter without name attribute in parameter group " << groupName);
        result[key] = child.second.get_value<string>();
    }
    return result;
}

} // namespace

bool Parameters::hasGroup(const string& groupName) const { return (data_.find(groupName) != data_.end()); }

bool Parameters::has(const string& groupName, const string& paramName) const {
    QL_REQUIRE(hasGroup(groupName), "param group '" << groupName << "' not found");
    auto it = data_.find(groupName);
    return (it->second.find(paramName) != it->second.end());
}

string Parameters::get(const string& groupName, const string& paramName, bool fail) const {
    if (fail) {
        QL_REQUIRE(has(groupName, paramName), "parameter " << paramName << " not found in param group " << groupName);
        auto it = data_.find(groupName);
        return it->second.find(paramName)->second;
    } else {
        if (!hasGroup(groupName) || !has(groupName, paramName))
            return "";
        auto it = data_.find(groupName);
        return it->second.find(paramName)->second;
    }
}

const map<string, string>& Parameters::data(const string& groupName) const {
    auto it = data_.find(groupName);
    QL_REQUIRE(it != data_.end(), "param group '" << groupName << "' not found");
    return it->second;
}

void Parameters::fromFile(const string& fileName) {
    LOG("load CIE configuration from " << fileName);
    std::ifstream in(fileName);
    QL_REQUIRE(in.is_open(), "could not open parameter file " << fileName);
    fromStream(in, fileName);
    LOG("load CIE configuration from " << fileName << " done.");
}

void Parameters::fromString(const string& xml) {
    std::istringstream in(xml);
    fromStream(in, "string");
}

void Parameters::fromStream(std::istream& in, const string& source) {
    clear();
    boost::property_tree::ptree doc;
    try {
        boost::property_tree::read_xml(in, doc, boost::property_tree::xml_parser::trim_whitespace);
    } catch (const boost::property_tree::xml_parser_error& e) {
        QL_FAIL("could not parse parameter file " << source << ": " << e.what());
    }

    auto root = doc.get_child_optional("CIE");
    QL_REQUIRE(root, "root node CIE not found in parameter file " << source);

    auto setupNode = root->get_child_optional("Setup");
    QL_REQUIRE(setupNode, "node Setup not found in parameter file");
    data_["setup"] = readGroup(*setupNode, "Setup");

    auto loggingNode = root->get_child_optional("Logging");
    if (loggingNode)
        data_["logging"] = readGroup(*loggingNode, "Logging");
}

void Parameters::clear() { data_.clear(); }

void Parameters::log() const {
    LOG("Parameters:");
    for (auto const& p : data_)
        for (auto const& pp : p.second)
            LOG("group = " << p.first << " : " << pp.first << " = " << pp.second);
}

} // namespace analytics
} // namespace cie
