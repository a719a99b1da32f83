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

/*! \file ciea/engine/modecalculator.hpp
    \brief Per mode interest algorithms
    \ingroup engine
*/

#pragma once

#include <ciea/engine/interestperiod.hpp>
#include <ciea/engine/paymentallocator.hpp>
#include <cied/marketdata/ratetable.hpp>
#include <cied/request/calculationrequest.hpp>

#include <ql/shared_ptr.hpp>
#include <ql/time/date.hpp>
#include <ql/types.hpp>

#include <boost/optional.hpp>

#include <string>
#include <utility>
#include <vector>

namespace cie {
namespace analytics {

//! Interest algorithm of one calculation mode
/*! The CalculationEngine rolls the periods forward and asks the calculator, period by period, for the rate and the
    accrual base. All modes share the formula principalBase x dailyRate x days, they differ in where the rate comes
    from, on which amount it accrues and what happens at period ends.
    \ingroup engine
*/
class ModeCalculator {
public:
    virtual ~ModeCalculator() {}

    virtual cie::data::CalculationMode mode() const = 0;

    //! dates in (start, end] on which a new period must start because the rate changes
    virtual std::vector<QuantLib::Date> breakDates(const QuantLib::Date& start, const QuantLib::Date& end) const;

    //! cycle ends in (start, end] after which outstanding interest is capitalised
    virtual std::vector<QuantLib::Date> capitalisationDates(const QuantLib::Date& start,
                                                            const QuantLib::Date& end) const;

    //! annual rate in percent for a period starting on the date, Null for rates quoted per day
    virtual QuantLib::Real annualRate(const QuantLib::Date& periodStart) const = 0;

    //! daily rate as a fraction for a period starting on the date
    virtual QuantLib::Real dailyRate(const QuantLib::Date& periodStart) const;

    //! benchmark rate in percent before the multiplier, Null unless the rate floats
    virtual QuantLib::Real benchmarkRate(const QuantLib::Date&) const { return QuantLib::Null<QuantLib::Real>(); }
    virtual QuantLib::Real multiplier() const { return QuantLib::Null<QuantLib::Real>(); }

    //! amount on which interest accrues given the balances at the period start
    virtual QuantLib::Real accrualBase(const OutstandingBalances& balances) const { return balances.principal; }

    //! accrued interest is booked as delayed-performance interest instead of ordinary interest
    virtual bool accruesDelayedInterest() const { return false; }

    //! benchmark term and multiplier of the cap to compare the result against, if any
    virtual boost::optional<std::pair<cie::data::RateTerm, QuantLib::Real>> cap() const { return boost::none; }

    //! day count base, Null where the rate is quoted per day
    virtual QuantLib::Size baseDays() const { return baseDays_; }

    //! the formula, with the figures of the period, that yields its interest
    virtual std::string formula(const PeriodResult& period) const;

    //! human readable description of the rate, e.g. "1Y LPR x 1.5, base 360"
    virtual std::string rateBasis() const = 0;

protected:
    explicit ModeCalculator(QuantLib::Size baseDays) : baseDays_(baseDays) {}

    QuantLib::Size baseDays_;
};

//! Fixed annual or daily rate
class SimpleCalculator : public ModeCalculator {
public:
    explicit SimpleCalculator(const cie::data::SimpleParameters& parameters);

    cie::data::CalculationMode mode() const override { return cie::data::CalculationMode::Simple; }
    QuantLib::Real annualRate(const QuantLib::Date&) const override;
    QuantLib::Real dailyRate(const QuantLib::Date&) const override;
    std::string formula(const PeriodResult& period) const override;
    std::string rateBasis() const override;

private:
    cie::data::SimpleParameters parameters_;
};

//! Benchmark rate of a term times a multiplier, re-fixed whenever the benchmark changes
class FloatingCalculator : public ModeCalculator {
public:
    FloatingCalculator(const cie::data::FloatingParameters& parameters,
                       const QuantLib::ext::shared_ptr<const cie::data::RateTable>& rateTable);

    cie::data::CalculationMode mode() const override { return cie::data::CalculationMode::Floating; }
    std::vector<QuantLib::Date> breakDates(const QuantLib::Date& start, const QuantLib::Date& end) const override;
    QuantLib::Real annualRate(const QuantLib::Date& periodStart) const override;
    QuantLib::Real benchmarkRate(const QuantLib::Date& periodStart) const override;
    QuantLib::Real multiplier() const override { return multiplier_; }
    boost::optional<std::pair<cie::data::RateTerm, QuantLib::Real>> cap() const override;
    std::string rateBasis() const override;

private:
    cie::data::RateTerm term_;
    QuantLib::Real multiplier_;
    boost::optional<std::pair<cie::data::RateTerm, QuantLib::Real>> cap_;
    QuantLib::ext::shared_ptr<const cie::data::RateTable> rateTable_;
};

//! Statutory daily rate on the full judgment-determined amount outstanding
class DelayedCalculator : public ModeCalculator {
public:
    DelayedCalculator();

    cie::data::CalculationMode mode() const override { return cie::data::CalculationMode::Delayed; }
    QuantLib::Real annualRate(const QuantLib::Date&) const override { return QuantLib::Null<QuantLib::Real>(); }
    QuantLib::Real dailyRate(const QuantLib::Date&) const override;
    QuantLib::Real accrualBase(const OutstandingBalances& balances) const override;
    bool accruesDelayedInterest() const override { return true; }
    std::string formula(const PeriodResult& period) const override;
    std::string rateBasis() const override;
};

//! Fixed annual rate, interest outstanding at each cycle end becomes principal
class CompoundCalculator : public ModeCalculator {
public:
    explicit CompoundCalculator(const cie::data::CompoundParameters& parameters);

    cie::data::CalculationMode mode() const override { return cie::data::CalculationMode::Compound; }
    std::vector<QuantLib::Date> breakDates(const QuantLib::Date& start, const QuantLib::Date& end) const override;
    std::vector<QuantLib::Date> capitalisationDates(const QuantLib::Date& start,
                                                    const QuantLib::Date& end) const override;
    QuantLib::Real annualRate(const QuantLib::Date&) const override { return annualRate_; }
    std::string rateBasis() const override;

private:
    QuantLib::Real annualRate_;
    cie::data::CompoundingCycle cycle_;
};

//! Fixed or floating penalty rate, always compared against a benchmark cap
class PenaltyCalculator : public ModeCalculator {
public:
    PenaltyCalculator(const cie::data::PenaltyParameters& parameters,
                      const QuantLib::ext::shared_ptr<const cie::data::RateTable>& rateTable);

    cie::data::CalculationMode mode() const override { return cie::data::CalculationMode::Penalty; }
    std::vector<QuantLib::Date> breakDates(const QuantLib::Date& start, const QuantLib::Date& end) const override;
    QuantLib::Real annualRate(const QuantLib::Date& periodStart) const override;
    QuantLib::Real benchmarkRate(const QuantLib::Date& periodStart) const override;
    QuantLib::Real multiplier() const override;
    boost::optional<std::pair<cie::data::RateTerm, QuantLib::Real>> cap() const override;
    std::string rateBasis() const override;

private:
    cie::data::PenaltyParameters parameters_;
    QuantLib::ext::shared_ptr<const cie::data::RateTable> rateTable_;
};

//! Build the calculator matching the request's mode parameters
/*! Expects a request that passed the RequestValidator.
    \ingroup engine
*/
QuantLib::ext::shared_ptr<ModeCalculator>
makeModeCalculator(const cie::data::ModeParameters& parameters,
                   const QuantLib::ext::shared_ptr<const cie::data::RateTable>& rateTable);

} // namespace analytics
} // namespace cie
