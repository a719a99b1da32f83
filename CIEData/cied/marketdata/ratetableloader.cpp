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

#include <cied/marketdata/ratetableloader.hpp>
#include <cied/utilities/log.hpp>
#include <cied/utilities/parsers.hpp>
#include <cied/utilities/to_string.hpp>

#include <ql/errors.hpp>

#include <boost/algorithm/string.hpp>
#include <boost/filesystem/path.hpp>

#include <algorithm>
#include <fstream>
#include <vector>

using QuantLib::Date;
using std::string;
using std::vector;

namespace cie {
namespace data {

QuantLib::ext::shared_ptr<RateTable> RateTableLoader::loadFile(const string& filename, const string& version,
                                                               const Date& asOf) {
    LOG("RateTableLoader: loading rate table from " << filename);
    std::ifstream in(filename.c_str());
    QL_REQUIRE(in.is_open(), "RateTableLoader: error opening file " << filename);
    string v = version.empty() ? boost::filesystem::path(filename).stem().string() : version;
    return loadStream(in, v, asOf);
}

QuantLib::ext::shared_ptr<RateTable> RateTableLoader::loadStream(std::istream& in, const string& version,
                                                                 const Date& asOf) {
    vector<RateTableEntry> entries;
    Date latest;
    string line;
    QuantLib::Size lineNo = 0;
    bool header = false;
    while (std::getline(in, line)) {
        ++lineNo;
        boost::trim(line);
        if (line.empty() || line[0] == '#')
            continue;
        vector<string> tokens;
        boost::split(tokens, line, boost::is_any_of(",;\t"));
        for (auto& t : tokens)
            boost::trim(t);
        if (!header) {
            QL_REQUIRE(tokens.size() == 3 && tokens[0] == "Date" && tokens[1] == "ShortTerm" &&
                           tokens[2] == "LongTerm",
                       "RateTableLoader: line " << lineNo << ", expected header Date,ShortTerm,LongTerm, got '"
                                                << line << "'");
            header = true;
            continue;
        }
        QL_REQUIRE(tokens.size() == 3, "RateTableLoader: line " << lineNo << " has " << tokens.size()
                                                                << " fields, expected 3");
        Date d;
        try {
            d = parseDate(tokens[0]);
            if (!tokens[1].empty())
                entries.push_back({RateTerm::ShortTerm, d, parseReal(tokens[1])});
            if (!tokens[2].empty())
                entries.push_back({RateTerm::LongTerm, d, parseReal(tokens[2])});
        } catch (const std::exception& e) {
            QL_FAIL("RateTableLoader: line " << lineNo << ": " << e.what());
        }
        latest = std::max(latest, d);
    }
    QL_REQUIRE(header, "RateTableLoader: no header line found");
    QL_REQUIRE(!entries.empty(), "RateTableLoader: no rates found");

    Date tableAsOf = asOf == Date() ? latest : asOf;
    LOG("RateTableLoader: loaded " << entries.size() << " rates, version " << version << ", as of "
                                   << to_string(tableAsOf));
    return QuantLib::ext::make_shared<RateTable>(version, tableAsOf, entries);
}

} // namespace data
} // namespace cie
