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

#include <ciea/engine/audittrail.hpp>
#include <cied/utilities/to_string.hpp>

#include <ql/utilities/null.hpp>

#include <sstream>

using namespace cie::data;
using QuantLib::Null;
using QuantLib::Real;
using QuantLib::Size;
using std::string;
using std::vector;

namespace cie {
namespace analytics {

namespace {

// amounts in the report keep enough decimals to recompute the rounding by hand
const Size amountPrecision = 6;
const Size ratePrecision = 6;
const Size dailyRatePrecision = 10;

} // namespace

bool AuditRow::operator==(const AuditRow& o) const {
    return row == o.row && type == o.type && startDate == o.startDate && endDate == o.endDate && days == o.days &&
           principalBase == o.principalBase && benchmarkRate == o.benchmarkRate && multiplier == o.multiplier &&
           annualRate == o.annualRate && dailyRate == o.dailyRate && subInterest == o.subInterest &&
           cappedSubInterest == o.cappedSubInterest && formula == o.formula;
}

vector<AuditRow> AuditTrailGenerator::render(const CalculationResult& result) const {
    vector<AuditRow> rows;
    Size n = 0;
    for (auto const& r : result.periods) {
        AuditRow a;
        a.row = ++n;
        a.type = "Period";
        a.startDate = r.period.startDate;
        a.endDate = r.period.endDate;
        a.days = static_cast<Size>(r.period.days);
        a.principalBase = r.period.principalBase;
        a.benchmarkRate = r.benchmarkRate;
        a.multiplier = r.multiplier;
        a.annualRate = r.period.applicableRate;
        a.dailyRate = r.period.dailyRate;
        a.subInterest = r.subInterest;
        a.cappedSubInterest = r.cappedSubInterest;
        a.formula = r.formula;
        rows.push_back(a);
    }

    AuditRow total;
    total.row = ++n;
    total.type = "Total";
    total.startDate = result.request.startDate;
    total.endDate = result.request.endDate;
    total.days = static_cast<Size>(result.totalDays);
    total.principalBase = result.request.principal;
    total.benchmarkRate = Null<Real>();
    total.multiplier = Null<Real>();
    total.annualRate = Null<Real>();
    total.dailyRate = Null<Real>();
    total.subInterest = result.totalInterest;
    total.cappedSubInterest = result.cap ? result.cap->cappedTotal : Null<Real>();
    std::ostringstream f;
    f << "round(sum of " << result.periods.size() << " periods = " << to_string(result.unroundedTotal, 6)
      << ", 2) = " << to_string(result.totalInterest, 2);
    if (result.cap)
        f << "; cap rate total " << to_string(result.cap->capRateTotal, 2) << ", capped total "
          << to_string(result.cap->cappedTotal, 2);
    total.formula = f.str();
    rows.push_back(total);

    return rows;
}

void AuditTrailGenerator::write(const vector<AuditRow>& rows, Report& report) const {
    report.addColumn("Row", Size())
        .addColumn("Type", string())
        .addColumn("StartDate", Date())
        .addColumn("EndDate", Date())
        .addColumn("Days", Size())
        .addColumn("PrincipalBase", Real(), amountPrecision)
        .addColumn("BenchmarkRate", Real(), ratePrecision)
        .addColumn("Multiplier", Real(), ratePrecision)
        .addColumn("AnnualRate", Real(), ratePrecision)
        .addColumn("DailyRate", Real(), dailyRatePrecision)
        .addColumn("SubInterest", Real(), amountPrecision)
        .addColumn("CappedSubInterest", Real(), amountPrecision)
        .addColumn("Formula", string());

    for (auto const& a : rows) {
        report.next()
            .add(a.row)
            .add(a.type)
            .add(a.startDate)
            .add(a.endDate)
            .add(a.days)
            .add(a.principalBase)
            .add(a.benchmarkRate)
            .add(a.multiplier)
            .add(a.annualRate)
            .add(a.dailyRate)
            .add(a.subInterest)
            .add(a.cappedSubInterest)
            .add(a.formula);
    }
    report.end();
}

void AuditTrailGenerator::writeMetadata(const CalculationResult& result, Report& report) const {
    const CalculationRequest& r = result.request;
    report.addColumn("Field", string()).addColumn("Value", string());
    auto row = [&report](const string& field, const string& value) { report.next().add(field).add(value); };

    row("Label", r.label);
    row("Mode", to_string(result.mode));
    row("Principal", to_string(r.principal, 2));
    row("StartDate", to_string(r.startDate));
    row("EndDate", to_string(r.endDate));
    row("Days", to_string(result.totalDays));
    row("RateBasis", result.rateBasis);
    row("BaseDays", result.baseDays == Null<Size>() ? string("n/a") : to_string(result.baseDays));
    row("PaymentOffsetPolicy", to_string(r.paymentOffsetPolicy));
    row("OutstandingCosts", to_string(r.outstandingCosts, 2));
    row("OutstandingInterest", to_string(r.outstandingInterest, 2));
    row("LegalCitation", r.legalCitation);
    row("RateTableVersion", result.rateTableVersion);
    row("RateTableAsOf", to_string(result.rateTableAsOf));
    row("TotalInterest", to_string(result.totalInterest, 2));
    if (result.cap) {
        row("CapBasis", to_string(result.cap->capMultiplier, 6) + " x " + to_string(result.cap->capTerm));
        row("CapRateTotal", to_string(result.cap->capRateTotal, 2));
        row("CappedTotal", to_string(result.cap->cappedTotal, 2));
    }
    if (result.finalPrincipal)
        row("FinalPrincipal", to_string(*result.finalPrincipal, 2));
    for (auto const& w : result.warnings)
        row("Warning", to_string(w.kind) + ": " + w.message);
    report.end();
}

void AuditTrailGenerator::writeAllocations(const CalculationResult& result, Report& report) const {
    report.addColumn("Date", Date())
        .addColumn("Amount", Real(), 2)
        .addColumn("ToCosts", Real(), amountPrecision)
        .addColumn("ToInterest", Real(), amountPrecision)
        .addColumn("ToPrincipal", Real(), amountPrecision)
        .addColumn("ToDelayedInterest", Real(), amountPrecision)
        .addColumn("Unapplied", Real(), amountPrecision)
        .addColumn("CostsAfter", Real(), amountPrecision)
        .addColumn("InterestAfter", Real(), amountPrecision)
        .addColumn("PrincipalAfter", Real(), amountPrecision)
        .addColumn("DelayedInterestAfter", Real(), amountPrecision);
    for (auto const& a : result.allocations) {
        report.next()
            .add(a.payment.date)
            .add(a.payment.amount)
            .add(a.toCosts)
            .add(a.toInterest)
            .add(a.toPrincipal)
            .add(a.toDelayedInterest)
            .add(a.unappliedRemainder)
            .add(a.after.costs)
            .add(a.after.interest)
            .add(a.after.principal)
            .add(a.after.delayedInterest);
    }
    report.end();
}

} // namespace analytics
} // namespace cie
