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

/*! \file cied/marketdata/ratetable.hpp
    \brief Historical benchmark rate table
    \ingroup marketdata
*/

#pragma once

#include <ql/time/date.hpp>
#include <ql/types.hpp>

#include <map>
#include <ostream>
#include <string>
#include <vector>

namespace cie {
namespace data {

//! Tenor of the published benchmark rate
/*! ShortTerm is the 1 year loan prime rate, LongTerm the 5 year and above rate.
    \ingroup marketdata
*/
enum class RateTerm { ShortTerm, LongTerm };

std::ostream& operator<<(std::ostream& out, const RateTerm& term);

//! A published benchmark rate, in force from its effective date until superseded
struct RateTableEntry {
    RateTerm term;
    QuantLib::Date effectiveDate;
    QuantLib::Real annualRatePercent;
};

//! Read-only table of historical benchmark rates
/*! The table is built once, typically from the embedded snapshot, and is then shared by all calculations.
    It has no mutable state, so concurrent lookups need no locking.

    Entries for each term must be strictly increasing in effective date. A rate is in force from its effective
    date up to, but excluding, the effective date of the next entry for the same term. Lookups after the last
    entry return the last rate, lookups before the first entry throw a RateNotFoundError.
    \ingroup marketdata
*/
class RateTable {
public:
    RateTable(const std::string& version, const QuantLib::Date& asOf, const std::vector<RateTableEntry>& entries);

    //! Annual rate in percent in force for the term on the given date
    QuantLib::Real lookup(RateTerm term, const QuantLib::Date& date) const;

    //! Every effective date of the term strictly after start and not after end
    std::vector<QuantLib::Date> effectiveDates(RateTerm term, const QuantLib::Date& start,
                                               const QuantLib::Date& end) const;

    /*! The effective dates in (start, end] on which the term's rate differs from the rate in force on the
        previous day, a republished unchanged rate does not start a new period */
    std::vector<QuantLib::Date> rateChangeDates(RateTerm term, const QuantLib::Date& start,
                                                const QuantLib::Date& end) const;

    //! \name Inspectors
    //@{
    bool hasTerm(RateTerm term) const;
    const QuantLib::Date& earliestDate(RateTerm term) const;
    const QuantLib::Date& latestDate(RateTerm term) const;
    QuantLib::Size size(RateTerm term) const;
    const std::string& version() const { return version_; }
    const QuantLib::Date& asOf() const { return asOf_; }
    //@}

private:
    const std::map<QuantLib::Date, QuantLib::Real>& rates(RateTerm term) const;

    std::string version_;
    QuantLib::Date asOf_;
    std::map<RateTerm, std::map<QuantLib::Date, QuantLib::Real>> rates_;
};

} // namespace data
} // namespace cie
