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

#include <ciea/app/resultjson.hpp>
#include <cied/request/requestjson.hpp>
#include <cied/utilities/to_string.hpp>

#include <ql/utilities/null.hpp>

using namespace cie::data;
using QuantLib::Null;
using QuantLib::Real;
using QuantLib::Size;

namespace cie {
namespace analytics {

namespace {

Json::Value real(Real x) { return x == Null<Real>() ? Json::Value(Json::nullValue) : Json::Value(x); }

Json::Value balances(const OutstandingBalances& b) {
    Json::Value v(Json::objectValue);
    v["costs"] = b.costs;
    v["interest"] = b.interest;
    v["principal"] = b.principal;
    v["delayed_interest"] = b.delayedInterest;
    return v;
}

Json::Value period(const PeriodResult& p) {
    Json::Value v(Json::objectValue);
    v["start_date"] = to_string(p.period.startDate);
    v["end_date"] = to_string(p.period.endDate);
    v["days"] = p.period.days;
    v["principal_base"] = p.period.principalBase;
    v["benchmark_rate"] = real(p.benchmarkRate);
    v["multiplier"] = real(p.multiplier);
    v["annual_rate"] = real(p.period.applicableRate);
    v["daily_rate"] = p.period.dailyRate;
    v["sub_interest"] = p.subInterest;
    if (p.cappedSubInterest != Null<Real>()) {
        v["cap_rate"] = p.capRate;
        v["capped_sub_interest"] = p.cappedSubInterest;
    }
    if (p.capitalisedInterest != 0.0)
        v["capitalised_interest"] = p.capitalisedInterest;
    v["formula"] = p.formula;
    return v;
}

Json::Value allocation(const PaymentAllocation& a) {
    Json::Value v(Json::objectValue);
    v["date"] = to_string(a.payment.date);
    v["amount"] = a.payment.amount;
    v["to_costs"] = a.toCosts;
    v["to_interest"] = a.toInterest;
    v["to_principal"] = a.toPrincipal;
    v["to_delayed_interest"] = a.toDelayedInterest;
    v["unapplied_remainder"] = a.unappliedRemainder;
    v["balances_after"] = balances(a.after);
    return v;
}

} // namespace

Json::Value toJson(const CalculationResult& r) {
    Json::Value v(Json::objectValue);
    v["request"] = cie::data::toJson(r.request);
    v["mode"] = to_string(r.mode);
    v["total_interest"] = r.totalInterest;
    v["unrounded_total"] = r.unroundedTotal;
    v["total_days"] = r.totalDays;
    v["base_days"] = r.baseDays == Null<Size>() ? Json::Value(Json::nullValue)
                                                : Json::Value(static_cast<Json::UInt>(r.baseDays));
    v["rate_basis"] = r.rateBasis;

    Json::Value periods(Json::arrayValue);
    for (auto const& p : r.periods)
        periods.append(period(p));
    v["periods"] = periods;

    Json::Value allocations(Json::arrayValue);
    for (auto const& a : r.allocations)
        allocations.append(allocation(a));
    v["allocations"] = allocations;

    Json::Value warnings(Json::arrayValue);
    for (auto const& w : r.warnings) {
        Json::Value wv(Json::objectValue);
        wv["kind"] = to_string(w.kind);
        wv["date"] = to_string(w.date);
        wv["amount"] = w.amount;
        wv["message"] = w.message;
        warnings.append(wv);
    }
    v["warnings"] = warnings;

    if (r.cap) {
        Json::Value c(Json::objectValue);
        c["cap_term"] = r.cap->capTerm == RateTerm::ShortTerm ? "1y" : "5y";
        c["cap_multiplier"] = r.cap->capMultiplier;
        c["raw_total"] = r.cap->rawTotal;
        c["cap_rate_total"] = r.cap->capRateTotal;
        c["capped_total"] = r.cap->cappedTotal;
        c["cap_binding"] = r.cap->capBinding();
        v["cap"] = c;
    }

    v["closing_balances"] = balances(r.closingBalances);
    if (r.finalPrincipal)
        v["final_principal"] = *r.finalPrincipal;

    v["rate_table_version"] = r.rateTableVersion;
    v["rate_table_as_of"] = to_string(r.rateTableAsOf);
    return v;
}

Json::Value toJson(const CalculationError& error) { return errorToJson(error.kind(), error.field(), error.message()); }

Json::Value errorToJson(const std::string& kind, const std::string& field, const std::string& message) {
    Json::Value e(Json::objectValue);
    e["kind"] = kind;
    e["field"] = field;
    e["message"] = message;
    Json::Value v(Json::objectValue);
    v["error"] = e;
    return v;
}

Json::Value toJson(const AdjustmentResult& r) {
    Json::Value v(Json::objectValue);
    v["type"] = to_string(r.type);
    if (!r.label.empty())
        v["label"] = r.label;
    v["input_amount"] = r.inputAmount;
    v["final_amount"] = r.finalAmount;
    if (r.type == AdjustmentRequest::Type::MaximumLimit) {
        v["excess"] = r.excess;
        v["limit_applied"] = r.limitApplied;
    }
    if (!r.source.empty())
        v["source"] = r.source;
    v["formula"] = r.formula;
    return v;
}

} // namespace analytics
} // namespace cie
