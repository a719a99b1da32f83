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

#include <ciea/engine/daycount.hpp>
#include <ciea/engine/requestvalidator.hpp>
#include <cied/utilities/errors.hpp>
#include <cied/utilities/log.hpp>
#include <cied/utilities/to_string.hpp>

#include <boost/variant/static_visitor.hpp>

#include <cmath>

using namespace cie::data;
using QuantLib::Date;
using QuantLib::Real;
using QuantLib::Size;

namespace cie {
namespace analytics {

namespace {

void requirePositive(Real value, const std::string& field) {
    CIE_REQUIRE(std::isfinite(value) && value > 0.0, InvalidParameterError, field,
                field << " must be positive, got " << value);
}

void requireNonNegative(Real value, const std::string& field) {
    CIE_REQUIRE(std::isfinite(value) && value >= 0.0, InvalidParameterError, field,
                field << " must not be negative, got " << value);
}

class ParameterValidator : public boost::static_visitor<> {
public:
    void operator()(const SimpleParameters& p) const {
        CIE_REQUIRE(p.annualRatePercent || p.dailyRatePercent, InvalidParameterError, "annual_rate",
                    "a simple calculation needs an annual or a daily rate");
        CIE_REQUIRE(!(p.annualRatePercent && p.dailyRatePercent), InvalidParameterError, "daily_rate",
                    "give either an annual or a daily rate, not both");
        if (p.annualRatePercent) {
            requireNonNegative(*p.annualRatePercent, "annual_rate");
            resolveBaseDays(p.dayCount);
        } else {
            requireNonNegative(*p.dailyRatePercent, "daily_rate");
            CIE_REQUIRE(!p.dayCount.baseDays && !p.dayCount.context, InvalidParameterError, "base_days",
                        "a daily rate takes no day count base");
        }
    }

    void operator()(const FloatingParameters& p) const {
        CIE_REQUIRE(p.term, InvalidParameterError, "term", "a floating calculation needs a benchmark term");
        requirePositive(p.multiplier, "multiplier");
        resolveBaseDays(p.dayCount);
        if (p.capMultiplier)
            requirePositive(*p.capMultiplier, "cap_multiplier");
        CIE_REQUIRE(!p.capTerm || p.capMultiplier, InvalidParameterError, "cap_term",
                    "cap_term requires cap_multiplier");
    }

    void operator()(const DelayedParameters&) const {}

    void operator()(const CompoundParameters& p) const {
        CIE_REQUIRE(p.cycle, MissingCycleError, "cycle",
                    "a compound calculation needs an explicit compounding cycle, it is never inferred");
        CIE_REQUIRE(p.annualRatePercent, InvalidParameterError, "annual_rate",
                    "a compound calculation needs an annual rate");
        requireNonNegative(*p.annualRatePercent, "annual_rate");
        resolveBaseDays(p.dayCount);
    }

    void operator()(const PenaltyParameters& p) const {
        if (p.basis == PenaltyBasis::Fixed) {
            CIE_REQUIRE(p.annualRatePercent, InvalidParameterError, "annual_rate",
                        "a fixed penalty needs an annual rate");
            CIE_REQUIRE(!p.term, InvalidParameterError, "term", "a fixed penalty takes no benchmark term");
            CIE_REQUIRE(!p.multiplier, InvalidParameterError, "multiplier",
                        "a fixed penalty takes no multiplier, the annual rate applies as given");
            requireNonNegative(*p.annualRatePercent, "annual_rate");
        } else {
            CIE_REQUIRE(p.term, InvalidParameterError, "term", "a floating penalty needs a benchmark term");
            CIE_REQUIRE(!p.annualRatePercent, InvalidParameterError, "annual_rate",
                        "a floating penalty takes its rate from the benchmark, not from annual_rate");
            if (p.multiplier)
                requirePositive(*p.multiplier, "multiplier");
        }
        requirePositive(p.capMultiplier, "cap_multiplier");
        resolveBaseDays(p.dayCount);
    }
};

} // namespace

void RequestValidator::validate(const CalculationRequest& r) const {
    CIE_REQUIRE(std::isfinite(r.principal) && r.principal > 0.0, ValidationError, "principal",
                "principal must be positive, got " << r.principal);
    CIE_REQUIRE(r.startDate != Date(), ValidationError, "start_date", "start date is missing");
    CIE_REQUIRE(r.endDate != Date(), ValidationError, "end_date", "end date is missing");
    CIE_REQUIRE(r.startDate <= r.endDate, ValidationError, "end_date",
                "start date " << to_string(r.startDate) << " is after end date " << to_string(r.endDate));
    CIE_REQUIRE(std::isfinite(r.outstandingCosts) && r.outstandingCosts >= 0.0, ValidationError,
                "outstanding_costs", "outstanding costs must not be negative, got " << r.outstandingCosts);
    CIE_REQUIRE(std::isfinite(r.outstandingInterest) && r.outstandingInterest >= 0.0, ValidationError,
                "outstanding_interest", "outstanding interest must not be negative, got " << r.outstandingInterest);

    for (Size i = 0; i < r.payments.size(); ++i) {
        const Payment& p = r.payments[i];
        std::string prefix = "payments[" + to_string(i) + "].";
        CIE_REQUIRE(std::isfinite(p.amount) && p.amount > 0.0, ValidationError, prefix + "amount",
                    "payment amount must be positive, got " << p.amount);
        CIE_REQUIRE(p.date >= r.startDate && p.date <= r.endDate, InvalidPaymentDateError, prefix + "date",
                    "payment date " << to_string(p.date) << " outside [" << to_string(r.startDate) << ", "
                                    << to_string(r.endDate) << "]");
        if (i > 0) {
            CIE_REQUIRE(p.date >= r.payments[i - 1].date, InvalidPaymentDateError, prefix + "date",
                        "payment date " << to_string(p.date) << " precedes the previous payment date "
                                        << to_string(r.payments[i - 1].date));
        }
    }

    boost::apply_visitor(ParameterValidator(), r.parameters);
    DLOG("request '" << r.label << "' (" << r.mode() << ") is valid");
}

} // namespace analytics
} // namespace cie
