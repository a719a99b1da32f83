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

#include <ciea/app/structuredcalculationwarning.hpp>
#include <ciea/engine/calculationengine.hpp>
#include <ciea/engine/daycount.hpp>
#include <ciea/engine/ratecapvalidator.hpp>
#include <cied/utilities/log.hpp>
#include <cied/utilities/to_string.hpp>

#include <ql/errors.hpp>
#include <ql/math/rounding.hpp>

#include <algorithm>
#include <set>
#include <sstream>

using namespace cie::data;
using QuantLib::Date;
using QuantLib::Real;
using QuantLib::Size;
using std::string;
using std::vector;

namespace cie {
namespace analytics {

std::ostream& operator<<(std::ostream& out, const CalculationWarning::Kind& kind) {
    switch (kind) {
    case CalculationWarning::Kind::UnappliedRemainder:
        return out << "UnappliedRemainder";
    default:
        QL_FAIL("unknown CalculationWarning kind " << static_cast<int>(kind));
    }
}

CalculationEngine::CalculationEngine(const QuantLib::ext::shared_ptr<const RateTable>& rateTable)
    : rateTable_(rateTable) {
    QL_REQUIRE(rateTable_, "CalculationEngine: no rate table");
}

CalculationResult CalculationEngine::calculate(const CalculationRequest& request) const {
    validator_.validate(request);

    QuantLib::ext::shared_ptr<ModeCalculator> calculator = makeModeCalculator(request.parameters, rateTable_);
    vector<PeriodSegmenter::Span> spans = segmenter_.segment(request, *calculator);
    vector<Date> cycleEnds = calculator->capitalisationDates(request.startDate, request.endDate);
    std::set<Date> capitalisation(cycleEnds.begin(), cycleEnds.end());
    PaymentOffsetAllocator allocator(request.paymentOffsetPolicy);

    CalculationResult result;
    result.request = request;
    result.mode = calculator->mode();
    result.baseDays = calculator->baseDays();
    result.rateBasis = calculator->rateBasis();
    result.rateTableVersion = rateTable_->version();
    result.rateTableAsOf = rateTable_->asOf();

    OutstandingBalances balances;
    balances.principal = request.principal;
    balances.costs = request.outstandingCosts;
    balances.interest = request.outstandingInterest;
    result.openingBalances = balances;

    Size nextPayment = 0;
    Real unrounded = 0.0;
    for (auto const& span : spans) {
        PeriodResult r;
        r.period.startDate = span.first;
        r.period.endDate = span.second;
        r.period.days = daysBetween(span.first, span.second);
        r.period.principalBase = calculator->accrualBase(balances);
        r.period.applicableRate = calculator->annualRate(span.first);
        r.period.dailyRate = calculator->dailyRate(span.first);
        r.benchmarkRate = calculator->benchmarkRate(span.first);
        r.multiplier = calculator->multiplier();
        r.subInterest = r.period.principalBase * r.period.dailyRate * r.period.days;
        unrounded += r.subInterest;

        if (calculator->accruesDelayedInterest())
            balances.delayedInterest += r.subInterest;
        else
            balances.interest += r.subInterest;

        // payments are applied at the end of their value date, which always ends a period
        while (nextPayment < request.payments.size() && request.payments[nextPayment].date <= span.second) {
            const Payment& p = request.payments[nextPayment++];
            QL_REQUIRE(p.date == span.second, "CalculationEngine: payment on " << to_string(p.date)
                                                                               << " does not end a period");
            PaymentAllocation a = allocator.allocate(balances, p);
            balances = a.after;
            if (a.unappliedRemainder > 0.0) {
                CalculationWarning w;
                w.kind = CalculationWarning::Kind::UnappliedRemainder;
                w.date = p.date;
                w.amount = a.unappliedRemainder;
                std::ostringstream msg;
                msg << "payment of " << to_string(p.amount, 2) << " on " << to_string(p.date) << " exceeds the "
                    << "outstanding amounts by " << to_string(a.unappliedRemainder, 2);
                w.message = msg.str();
                StructuredCalculationWarningMessage(request.label, to_string(w.kind), w.message,
                                                    {{"date", to_string(w.date)},
                                                     {"amount", to_string(w.amount, 2)}})
                    .log();
                result.warnings.push_back(w);
            }
            result.allocations.push_back(a);
        }

        // capitalisation follows the payments of the cycle end
        if (capitalisation.count(span.second) > 0) {
            r.capitalisedInterest = balances.interest;
            balances.principal += balances.interest;
            balances.interest = 0.0;
        }

        r.formula = calculator->formula(r);
        DLOG("period " << to_string(r.period.startDate) << " - " << to_string(r.period.endDate) << ": "
                       << r.formula);
        result.periods.push_back(r);
    }
    QL_REQUIRE(nextPayment == request.payments.size(), "CalculationEngine: " << request.payments.size() - nextPayment
                                                                             << " payments were not applied");

    result.unroundedTotal = unrounded;
    result.totalInterest = QuantLib::ClosestRounding(2)(unrounded);
    result.totalDays = daysBetween(request.startDate, request.endDate);
    result.closingBalances = balances;
    if (result.mode == CalculationMode::Compound)
        result.finalPrincipal = balances.principal + balances.interest;

    if (auto capSpec = calculator->cap()) {
        CapResult c = RateCapValidator(rateTable_).cap(result, capSpec->second, capSpec->first);
        for (Size i = 0; i < result.periods.size(); ++i) {
            result.periods[i].capRate = c.capRates[i];
            result.periods[i].cappedSubInterest = std::min(result.periods[i].subInterest, c.capInterest[i]);
        }
        result.cap = c;
    }

    LOG("calculated " << result.mode << " interest '" << request.label << "': " << to_string(result.totalInterest, 2)
                      << " over " << result.periods.size() << " periods, " << result.totalDays << " days");
    return result;
}

} // namespace analytics
} // namespace cie
