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

#include <cied/marketdata/embeddedratetable.hpp>
#include <cied/utilities/log.hpp>

#include <ql/time/date.hpp>

#include <vector>

using namespace QuantLib;

namespace cie {
namespace data {

const char* const EMBEDDED_RATE_TABLE_VERSION = "LPR-2025-07-21";

namespace {

struct LprFixing {
    Date date;
    Real oneYear;
    Real fiveYear;
};

// loan prime rate publications, percent per annum
const std::vector<LprFixing>& lprFixings() {
    static const std::vector<LprFixing> fixings = {
    { Date(20, Aug, 2019), 4.25, 4.85 },
    { Date(20, Sep, 2019), 4.20, 4.85 },
    { Date(21, Oct, 2019), 4.20, 4.85 },
    { Date(20, Nov, 2019), 4.15, 4.80 },
    { Date(20, Dec, 2019), 4.15, 4.80 },
    { Date(20, Jan, 2020), 4.15, 4.80 },
    { Date(20, Feb, 2020), 4.05, 4.75 },
    { Date(20, Mar, 2020), 4.05, 4.75 },
    { Date(20, Apr, 2020), 3.85, 4.65 },
    { Date(20, May, 2020), 3.85, 4.65 },
    { Date(22, Jun, 2020), 3.85, 4.65 },
    { Date(20, Jul, 2020), 3.85, 4.65 },
    { Date(20, Aug, 2020), 3.85, 4.65 },
    { Date(21, Sep, 2020), 3.85, 4.65 },
    { Date(20, Oct, 2020), 3.85, 4.65 },
    { Date(20, Nov, 2020), 3.85, 4.65 },
    { Date(21, Dec, 2020), 3.85, 4.65 },
    { Date(20, Jan, 2021), 3.85, 4.65 },
    { Date(22, Feb, 2021), 3.85, 4.65 },
    { Date(22, Mar, 2021), 3.85, 4.65 },
    { Date(20, Apr, 2021), 3.85, 4.65 },
    { Date(20, May, 2021), 3.85, 4.65 },
    { Date(21, Jun, 2021), 3.85, 4.65 },
    { Date(20, Jul, 2021), 3.85, 4.65 },
    { Date(20, Aug, 2021), 3.85, 4.65 },
    { Date(22, Sep, 2021), 3.85, 4.65 },
    { Date(20, Oct, 2021), 3.85, 4.65 },
    { Date(22, Nov, 2021), 3.85, 4.65 },
    { Date(20, Dec, 2021), 3.80, 4.65 },
    { Date(20, Jan, 2022), 3.70, 4.60 },
    { Date(21, Feb, 2022), 3.70, 4.60 },
    { Date(21, Mar, 2022), 3.70, 4.60 },
    { Date(20, Apr, 2022), 3.70, 4.60 },
    { Date(20, May, 2022), 3.70, 4.45 },
    { Date(20, Jun, 2022), 3.70, 4.45 },
    { Date(20, Jul, 2022), 3.70, 4.45 },
    { Date(22, Aug, 2022), 3.65, 4.30 },
    { Date(20, Sep, 2022), 3.65, 4.30 },
    { Date(20, Oct, 2022), 3.65, 4.30 },
    { Date(21, Nov, 2022), 3.65, 4.30 },
    { Date(20, Dec, 2022), 3.65, 4.30 },
    { Date(20, Jan, 2023), 3.65, 4.30 },
    { Date(20, Feb, 2023), 3.65, 4.30 },
    { Date(20, Mar, 2023), 3.65, 4.30 },
    { Date(20, Apr, 2023), 3.65, 4.30 },
    { Date(22, May, 2023), 3.65, 4.30 },
    { Date(20, Jun, 2023), 3.55, 4.20 },
    { Date(20, Jul, 2023), 3.55, 4.20 },
    { Date(21, Aug, 2023), 3.45, 4.20 },
    { Date(20, Sep, 2023), 3.45, 4.20 },
    { Date(20, Oct, 2023), 3.45, 4.20 },
    { Date(20, Nov, 2023), 3.45, 4.20 },
    { Date(20, Dec, 2023), 3.45, 4.20 },
    { Date(22, Jan, 2024), 3.45, 4.20 },
    { Date(20, Feb, 2024), 3.45, 3.95 },
    { Date(20, Mar, 2024), 3.45, 3.95 },
    { Date(22, Apr, 2024), 3.45, 3.95 },
    { Date(20, May, 2024), 3.45, 3.95 },
    { Date(20, Jun, 2024), 3.45, 3.95 },
    { Date(22, Jul, 2024), 3.35, 3.85 },
    { Date(20, Aug, 2024), 3.35, 3.85 },
    { Date(20, Sep, 2024), 3.35, 3.85 },
    { Date(21, Oct, 2024), 3.10, 3.60 },
    { Date(20, Nov, 2024), 3.10, 3.60 },
    { Date(20, Dec, 2024), 3.10, 3.60 },
    { Date(20, Jan, 2025), 3.10, 3.60 },
    { Date(20, Feb, 2025), 3.10, 3.60 },
    { Date(20, Mar, 2025), 3.10, 3.60 },
    { Date(21, Apr, 2025), 3.10, 3.60 },
    { Date(20, May, 2025), 3.00, 3.50 },
    { Date(20, Jun, 2025), 3.00, 3.50 },
    { Date(21, Jul, 2025), 3.00, 3.50 },
    };
    return fixings;
}

} // namespace

Date embeddedRateTableAsOf() { return lprFixings().back().date; }

QuantLib::ext::shared_ptr<RateTable> embeddedRateTable() {
    std::vector<RateTableEntry> entries;
    entries.reserve(2 * lprFixings().size());
    for (auto const& f : lprFixings()) {
        entries.push_back({RateTerm::ShortTerm, f.date, f.oneYear});
        entries.push_back({RateTerm::LongTerm, f.date, f.fiveYear});
    }
    DLOG("building embedded rate table " << EMBEDDED_RATE_TABLE_VERSION << " from " << lprFixings().size()
                                         << " publications");
    return QuantLib::ext::make_shared<RateTable>(EMBEDDED_RATE_TABLE_VERSION, embeddedRateTableAsOf(), entries);
}

} // namespace data
} // namespace cie
