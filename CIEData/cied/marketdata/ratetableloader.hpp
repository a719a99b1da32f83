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

/*! \file cied/marketdata/ratetableloader.hpp
    \brief Load a benchmark rate table from a csv file
    \ingroup marketdata
*/

#pragma once

#include <cied/marketdata/ratetable.hpp>

#include <ql/shared_ptr.hpp>

#include <istream>
#include <string>

namespace cie {
namespace data {

//! Reads benchmark rate tables from csv
/*! The expected layout is
    <pre>
    Date,ShortTerm,LongTerm
    # comment
    2019-08-20,4.25,4.85
    2019-09-20,4.20,4.85
    </pre>
    Rates are annual percentages, dates are YYYY-MM-DD or YYYY/MM/DD in increasing order. A term column may be left
    empty on a row if that term was not published on the date.
    \ingroup marketdata
*/
class RateTableLoader {
public:
    /*! \param version  version tag of the table, defaults to the file stem
        \param asOf     as of date of the table, defaults to the latest date in the file
    */
    static QuantLib::ext::shared_ptr<RateTable> loadFile(const std::string& filename, const std::string& version = "",
                                                         const QuantLib::Date& asOf = QuantLib::Date());

    static QuantLib::ext::shared_ptr<RateTable> loadStream(std::istream& in, const std::string& version,
                                                           const QuantLib::Date& asOf = QuantLib::Date());
};

} // namespace data
} // namespace cie
