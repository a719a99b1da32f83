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

#include <ciea/engine/compoundingschedule.hpp>
#include <ciea/engine/daycount.hpp>
#include <ciea/engine/modecalculator.hpp>
#include <cied/utilities/log.hpp>
#include <cied/utilities/to_string.hpp>

#include <ql/errors.hpp>

#include <boost/variant/static_visitor.hpp>

#include <algorithm>
#include <set>
#include <sstream>

using namespace cie::data;
using QuantLib::Date;
using QuantLib::Null;
using QuantLib::Real;
using QuantLib::Size;
using std::string;
using std::vector;

namespace cie {
namespace analytics {

namespace {

string benchmarkName(RateTerm term) { return term == RateTerm::ShortTerm ? "1Y LPR" : "5Y LPR"; }

string capDescription(const boost::optional<std::pair<RateTerm, Real>>& cap) {
    if (!cap)
        return "";
    return ", cap " + to_string(cap->second, 6) + " x " + benchmarkName(cap->first);
}

vector<Date> merge(vector<Date> a, const vector<Date>& b) {
    a.insert(a.end(), b.begin(), b.end());
    std::sort(a.begin(), a.end());
    a.erase(std::unique(a.begin(), a.end()), a.end());
    return a;
}

} // namespace

vector<Date> ModeCalculator::breakDates(const Date&, const Date&) const { return vector<Date>(); }

vector<Date> ModeCalculator::capitalisationDates(const Date&, const Date&) const { return vector<Date>(); }

Real ModeCalculator::dailyRate(const Date& periodStart) const {
    return analytics::dailyRate(annualRate(periodStart), baseDays_);
}

string ModeCalculator::formula(const PeriodResult& r) const {
    std::ostringstream f;
    f << to_string(r.period.principalBase, 2) << " x ";
    if (r.multiplier != Null<Real>())
        f << to_string(r.benchmarkRate, 6) << "% x " << to_string(r.multiplier, 6);
    else
        f << to_string(r.period.applicableRate, 6) << "%";
    f << " / " << baseDays_ << " x " << r.period.days << " = " << to_string(r.subInterest, 6);
    return f.str();
}

// Simple

SimpleCalculator::SimpleCalculator(const SimpleParameters& parameters)
    : ModeCalculator(parameters.annualRatePercent ? resolveBaseDays(parameters.dayCount) : Size(Null<Size>())),
      parameters_(parameters) {
    QL_REQUIRE(parameters_.annualRatePercent || parameters_.dailyRatePercent,
               "SimpleCalculator: neither an annual nor a daily rate given");
}

Real SimpleCalculator::annualRate(const Date&) const {
    return parameters_.annualRatePercent ? *parameters_.annualRatePercent : Null<Real>();
}

Real SimpleCalculator::dailyRate(const Date& periodStart) const {
    if (parameters_.dailyRatePercent)
        return *parameters_.dailyRatePercent / 100.0;
    return ModeCalculator::dailyRate(periodStart);
}

string SimpleCalculator::formula(const PeriodResult& r) const {
    if (!parameters_.dailyRatePercent)
        return ModeCalculator::formula(r);
    std::ostringstream f;
    f << to_string(r.period.principalBase, 2) << " x " << to_string(*parameters_.dailyRatePercent, 6) << "% x "
      << r.period.days << " = " << to_string(r.subInterest, 6);
    return f.str();
}

string SimpleCalculator::rateBasis() const {
    if (parameters_.dailyRatePercent)
        return "fixed " + to_string(*parameters_.dailyRatePercent, 6) + "% per day";
    return "fixed " + to_string(*parameters_.annualRatePercent, 6) + "% p.a., base " + to_string(baseDays_);
}

// Floating

FloatingCalculator::FloatingCalculator(const FloatingParameters& parameters,
                                       const QuantLib::ext::shared_ptr<const RateTable>& rateTable)
    : ModeCalculator(resolveBaseDays(parameters.dayCount)), multiplier_(parameters.multiplier),
      rateTable_(rateTable) {
    QL_REQUIRE(rateTable_, "FloatingCalculator: no rate table");
    QL_REQUIRE(parameters.term, "FloatingCalculator: no benchmark term");
    term_ = *parameters.term;
    if (parameters.capMultiplier)
        cap_ = std::make_pair(parameters.capTerm ? *parameters.capTerm : term_, *parameters.capMultiplier);
}

vector<Date> FloatingCalculator::breakDates(const Date& start, const Date& end) const {
    vector<Date> dates = rateTable_->rateChangeDates(term_, start, end);
    if (cap_ && cap_->first != term_)
        dates = merge(dates, rateTable_->rateChangeDates(cap_->first, start, end));
    return dates;
}

Real FloatingCalculator::benchmarkRate(const Date& periodStart) const {
    return rateTable_->lookup(term_, periodStart);
}

Real FloatingCalculator::annualRate(const Date& periodStart) const {
    return benchmarkRate(periodStart) * multiplier_;
}

boost::optional<std::pair<RateTerm, Real>> FloatingCalculator::cap() const { return cap_; }

string FloatingCalculator::rateBasis() const {
    return benchmarkName(term_) + " x " + to_string(multiplier_, 6) + ", base " + to_string(baseDays_) +
           capDescription(cap_) + ", rate table " + rateTable_->version();
}

// Delayed

DelayedCalculator::DelayedCalculator() : ModeCalculator(Size(Null<Size>())) {}

Real DelayedCalculator::dailyRate(const Date&) const { return DELAYED_PERFORMANCE_DAILY_RATE; }

Real DelayedCalculator::accrualBase(const OutstandingBalances& b) const { return b.principal + b.interest + b.costs; }

string DelayedCalculator::formula(const PeriodResult& r) const {
    std::ostringstream f;
    f << to_string(r.period.principalBase, 2) << " x " << to_string(DELAYED_PERFORMANCE_DAILY_RATE * 100.0, 4)
      << "% x " << r.period.days << " = " << to_string(r.subInterest, 6);
    return f.str();
}

string DelayedCalculator::rateBasis() const {
    return "statutory " + to_string(DELAYED_PERFORMANCE_DAILY_RATE * 100.0, 4) + "% per day";
}

// Compound

CompoundCalculator::CompoundCalculator(const CompoundParameters& parameters)
    : ModeCalculator(resolveBaseDays(parameters.dayCount)) {
    QL_REQUIRE(parameters.annualRatePercent, "CompoundCalculator: no annual rate");
    QL_REQUIRE(parameters.cycle, "CompoundCalculator: no compounding cycle");
    annualRate_ = *parameters.annualRatePercent;
    cycle_ = *parameters.cycle;
}

vector<Date> CompoundCalculator::breakDates(const Date& start, const Date& end) const {
    // a new period starts the day after each cycle end
    vector<Date> dates;
    for (auto const& d : cycleEndDates(cycle_, start, end)) {
        if (d < end)
            dates.push_back(d + 1);
    }
    return dates;
}

vector<Date> CompoundCalculator::capitalisationDates(const Date& start, const Date& end) const {
    return cycleEndDates(cycle_, start, end);
}

string CompoundCalculator::rateBasis() const {
    return "fixed " + to_string(annualRate_, 6) + "% p.a., base " + to_string(baseDays_) + ", compounded " +
           to_string(cycle_);
}

// Penalty

PenaltyCalculator::PenaltyCalculator(const PenaltyParameters& parameters,
                                     const QuantLib::ext::shared_ptr<const RateTable>& rateTable)
    : ModeCalculator(resolveBaseDays(parameters.dayCount)), parameters_(parameters), rateTable_(rateTable) {
    QL_REQUIRE(rateTable_, "PenaltyCalculator: no rate table");
    if (parameters_.basis == PenaltyBasis::Fixed) {
        QL_REQUIRE(parameters_.annualRatePercent, "PenaltyCalculator: fixed basis without annual rate");
        QL_REQUIRE(!parameters_.multiplier, "PenaltyCalculator: fixed basis with a multiplier");
    } else {
        QL_REQUIRE(parameters_.term, "PenaltyCalculator: floating basis without benchmark term");
    }
}

vector<Date> PenaltyCalculator::breakDates(const Date& start, const Date& end) const {
    vector<Date> dates = rateTable_->rateChangeDates(parameters_.capTerm, start, end);
    if (parameters_.basis == PenaltyBasis::Floating && *parameters_.term != parameters_.capTerm)
        dates = merge(dates, rateTable_->rateChangeDates(*parameters_.term, start, end));
    return dates;
}

Real PenaltyCalculator::benchmarkRate(const Date& periodStart) const {
    if (parameters_.basis == PenaltyBasis::Fixed)
        return Null<Real>();
    return rateTable_->lookup(*parameters_.term, periodStart);
}

Real PenaltyCalculator::annualRate(const Date& periodStart) const {
    if (parameters_.basis == PenaltyBasis::Fixed)
        return *parameters_.annualRatePercent;
    return benchmarkRate(periodStart) * parameters_.multiplier.get_value_or(1.0);
}

Real PenaltyCalculator::multiplier() const {
    return parameters_.basis == PenaltyBasis::Fixed ? Null<Real>() : parameters_.multiplier.get_value_or(1.0);
}

boost::optional<std::pair<RateTerm, Real>> PenaltyCalculator::cap() const {
    return std::make_pair(parameters_.capTerm, parameters_.capMultiplier);
}

string PenaltyCalculator::rateBasis() const {
    string rate = parameters_.basis == PenaltyBasis::Fixed
                      ? "fixed " + to_string(*parameters_.annualRatePercent, 6) + "% p.a."
                      : benchmarkName(*parameters_.term) + " x " + to_string(multiplier(), 6);
    return "penalty " + rate + ", base " + to_string(baseDays_) + capDescription(cap()) + ", rate table " +
           rateTable_->version();
}

// Factory

namespace {
class CalculatorBuilder : public boost::static_visitor<QuantLib::ext::shared_ptr<ModeCalculator>> {
public:
    explicit CalculatorBuilder(const QuantLib::ext::shared_ptr<const RateTable>& rateTable) : rateTable_(rateTable) {}

    QuantLib::ext::shared_ptr<ModeCalculator> operator()(const SimpleParameters& p) const {
        return QuantLib::ext::make_shared<SimpleCalculator>(p);
    }
    QuantLib::ext::shared_ptr<ModeCalculator> operator()(const FloatingParameters& p) const {
        return QuantLib::ext::make_shared<FloatingCalculator>(p, rateTable_);
    }
    QuantLib::ext::shared_ptr<ModeCalculator> operator()(const DelayedParameters&) const {
        return QuantLib::ext::make_shared<DelayedCalculator>();
    }
    QuantLib::ext::shared_ptr<ModeCalculator> operator()(const CompoundParameters& p) const {
        return QuantLib::ext::make_shared<CompoundCalculator>(p);
    }
    QuantLib::ext::shared_ptr<ModeCalculator> operator()(const PenaltyParameters& p) const {
        return QuantLib::ext::make_shared<PenaltyCalculator>(p, rateTable_);
    }

private:
    QuantLib::ext::shared_ptr<const RateTable> rateTable_;
};
} // namespace

QuantLib::ext::shared_ptr<ModeCalculator>
makeModeCalculator(const ModeParameters& parameters, const QuantLib::ext::shared_ptr<const RateTable>& rateTable) {
    QuantLib::ext::shared_ptr<ModeCalculator> calculator =
        boost::apply_visitor(CalculatorBuilder(rateTable), parameters);
    DLOG("dispatching to " << calculator->mode() << " calculator, " << calculator->rateBasis());
    return calculator;
}

} // namespace analytics
} // namespace cie
