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

/*! \file cied/request/calculationrequest.hpp
    \brief Interest calculation request, a sum type over the five calculation modes
    \ingroup request
*/

#pragma once

#include <cied/marketdata/ratetable.hpp>

#include <ql/time/date.hpp>
#include <ql/types.hpp>

#include <boost/optional.hpp>
#include <boost/variant.hpp>

#include <ostream>
#include <string>
#include <vector>

namespace cie {
namespace data {

//! Calculation mode, selects the interest algorithm
enum class CalculationMode { Simple, Floating, Delayed, Compound, Penalty };

//! Order in which a payment discharges the outstanding amounts
/*! GeneralDebt: costs, interest, principal, then delayed-performance interest.
    JudgmentDebt: the judgment-determined amount as listed by the judgment (principal, interest, costs) and only
    then delayed-performance interest.
*/
enum class PaymentOffsetPolicy { GeneralDebt, JudgmentDebt };

//! Caller supplied context that resolves the day count base when it is not given explicitly
/*! Lending (financial institution loans) uses 360 days, Judicial (judgments, contractual penalties) 365 days. */
enum class DayCountContext { Lending, Judicial };

//! Rate basis of a penalty calculation
enum class PenaltyBasis { Fixed, Floating };

//! Compounding cycle, interest outstanding at each cycle end is capitalised
class CompoundingCycle {
public:
    enum class Type { MonthEnd, QuarterEnd, SemiAnnualEnd, YearEnd, MonthlyOnDay, EveryNDays };

    explicit CompoundingCycle(Type type = Type::MonthEnd, QuantLib::Size n = 0);

    Type type() const { return type_; }
    //! day of month for MonthlyOnDay, number of days for EveryNDays, zero otherwise
    QuantLib::Size n() const { return n_; }

    bool operator==(const CompoundingCycle& o) const { return type_ == o.type_ && n_ == o.n_; }

private:
    Type type_;
    QuantLib::Size n_;
};

//! A payment made by the debtor, applied at the end of its value date
struct Payment {
    QuantLib::Date date;
    QuantLib::Real amount;
};

//! Day count base, either explicit or resolved from a context
struct DayCountBasis {
    boost::optional<QuantLib::Size> baseDays;
    boost::optional<DayCountContext> context;
};

//! Fixed rate, quoted per annum or per day
struct SimpleParameters {
    boost::optional<QuantLib::Real> annualRatePercent;
    //! daily rate in percent, e.g. 0.05 for five per ten thousand per day
    boost::optional<QuantLib::Real> dailyRatePercent;
    DayCountBasis dayCount;
};

//! Benchmark rate times a multiplier, re-fixed whenever the benchmark changes
struct FloatingParameters {
    boost::optional<RateTerm> term;
    QuantLib::Real multiplier = 1.0;
    DayCountBasis dayCount;
    //! if given, a parallel calculation at capMultiplier times the capTerm benchmark is reported
    boost::optional<QuantLib::Real> capMultiplier;
    boost::optional<RateTerm> capTerm;
};

//! Statutory delayed-performance interest, takes no rate parameters
struct DelayedParameters {};

//! Fixed annual rate with cycle end capitalisation
struct CompoundParameters {
    boost::optional<QuantLib::Real> annualRatePercent;
    DayCountBasis dayCount;
    boost::optional<CompoundingCycle> cycle;
};

//! Fixed or floating penalty rate, always compared against a benchmark cap
struct PenaltyParameters {
    PenaltyBasis basis = PenaltyBasis::Fixed;
    boost::optional<QuantLib::Real> annualRatePercent;
    boost::optional<RateTerm> term;
    //! floating basis only, 1 if not given
    boost::optional<QuantLib::Real> multiplier;
    DayCountBasis dayCount;
    QuantLib::Real capMultiplier = 4.0;
    RateTerm capTerm = RateTerm::ShortTerm;
};

typedef boost::variant<SimpleParameters, FloatingParameters, DelayedParameters, CompoundParameters,
                       PenaltyParameters>
    ModeParameters;

//! The mode a parameter set belongs to
CalculationMode calculationMode(const ModeParameters& parameters);

//! A single interest calculation request
/*! Built by the JSON reader or directly by a caller, checked by the RequestValidator before any computation.
    \ingroup request
*/
struct CalculationRequest {
    //! free text identifying the calculation, used as section name in the workbook
    std::string label;
    QuantLib::Real principal = 0.0;
    QuantLib::Date startDate;
    QuantLib::Date endDate;
    std::vector<Payment> payments;
    PaymentOffsetPolicy paymentOffsetPolicy = PaymentOffsetPolicy::GeneralDebt;
    //! costs outstanding on the start date
    QuantLib::Real outstandingCosts = 0.0;
    //! interest accrued before the start date and still outstanding
    QuantLib::Real outstandingInterest = 0.0;
    std::string legalCitation;
    ModeParameters parameters;

    CalculationMode mode() const { return calculationMode(parameters); }
};

//! Claim adjustment applied next to the interest calculations of a case
struct AdjustmentRequest {
    enum class Type { ShareOfTotal, ConfirmedAmount, MaximumLimit };

    Type type = Type::ShareOfTotal;
    std::string label;
    QuantLib::Real amount = 0.0;
    //! ShareOfTotal only
    boost::optional<QuantLib::Real> sharePercent;
    //! MaximumLimit only
    boost::optional<QuantLib::Real> limit;
    //! ConfirmedAmount only, e.g. the judgment reference
    std::string source;
};

std::ostream& operator<<(std::ostream& out, const CalculationMode& mode);
std::ostream& operator<<(std::ostream& out, const PaymentOffsetPolicy& policy);
std::ostream& operator<<(std::ostream& out, const DayCountContext& context);
std::ostream& operator<<(std::ostream& out, const PenaltyBasis& basis);
std::ostream& operator<<(std::ostream& out, const CompoundingCycle& cycle);
std::ostream& operator<<(std::ostream& out, const AdjustmentRequest::Type& type);

} // namespace data
} // namespace cie
