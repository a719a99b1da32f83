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

#include <cied/request/requestjson.hpp>
#include <cied/utilities/errors.hpp>
#include <cied/utilities/log.hpp>
#include <cied/utilities/parsers.hpp>
#include <cied/utilities/to_string.hpp>

#include <boost/variant/static_visitor.hpp>

#include <fstream>
#include <memory>
#include <set>
#include <sstream>

using QuantLib::Date;
using QuantLib::Real;
using QuantLib::Size;
using std::set;
using std::string;

namespace cie {
namespace data {

namespace {

const set<string> commonFields = {"mode",
                                  "label",
                                  "principal",
                                  "start_date",
                                  "end_date",
                                  "payments",
                                  "payment_offset_policy",
                                  "outstanding_costs",
                                  "outstanding_interest",
                                  "legal_citation"};

// rate related fields, rejected as InvalidParameterError on a delayed-performance request
const set<string> rateFields = {"annual_rate", "daily_rate", "multiplier", "base_days", "day_count_context"};

set<string> modeFields(CalculationMode mode) {
    switch (mode) {
    case CalculationMode::Simple:
        return {"annual_rate", "daily_rate", "base_days", "day_count_context"};
    case CalculationMode::Floating:
        return {"term", "multiplier", "base_days", "day_count_context", "cap_multiplier", "cap_term"};
    case CalculationMode::Delayed:
        return {};
    case CalculationMode::Compound:
        return {"annual_rate", "base_days", "day_count_context", "cycle"};
    case CalculationMode::Penalty:
        return {"basis",          "annual_rate", "term",    "multiplier", "base_days", "day_count_context",
                "cap_multiplier", "cap_term"};
    default:
        QL_FAIL("unknown CalculationMode " << static_cast<int>(mode));
    }
}

void requireObject(const Json::Value& v, const string& field) {
    CIE_REQUIRE(v.isObject(), ValidationError, field, "expected a JSON object");
}

void rejectUnknownFields(const Json::Value& v, const set<string>& allowed, const string& prefix,
                         const string& context) {
    for (auto const& name : v.getMemberNames()) {
        CIE_REQUIRE(allowed.count(name) > 0, ValidationError, prefix + name,
                    "field '" << name << "' is not recognised for " << context);
    }
}

Real realValue(const Json::Value& v, const string& field) {
    if (v.isNumeric())
        return v.asDouble();
    if (v.isString()) {
        try {
            return parseReal(v.asString());
        } catch (const std::exception& e) {
            CIE_FAIL(ValidationError, field, e.what());
        }
    }
    CIE_FAIL(ValidationError, field, "expected a number");
}

string stringValue(const Json::Value& v, const string& field) {
    CIE_REQUIRE(v.isString(), ValidationError, field, "expected a string");
    return v.asString();
}

Date dateValue(const Json::Value& v, const string& field) {
    string s = stringValue(v, field);
    try {
        return parseDate(s);
    } catch (const std::exception& e) {
        CIE_FAIL(ValidationError, field, e.what());
    }
}

Size sizeValue(const Json::Value& v, const string& field) {
    CIE_REQUIRE(v.isIntegral() && v.asInt64() >= 0, ValidationError, field, "expected a non negative integer");
    return static_cast<Size>(v.asUInt64());
}

// wraps a parser so that its failure is reported against the request field
template <class T> T parseField(T (*parser)(const string&), const Json::Value& v, const string& field) {
    string s = stringValue(v, field);
    try {
        return parser(s);
    } catch (const std::exception& e) {
        CIE_FAIL(ValidationError, field, e.what());
    }
}

boost::optional<Real> optionalReal(const Json::Value& v, const string& field) {
    if (!v.isMember(field))
        return boost::none;
    return realValue(v[field], field);
}

DayCountBasis dayCountBasis(const Json::Value& v) {
    DayCountBasis b;
    if (v.isMember("base_days"))
        b.baseDays = sizeValue(v["base_days"], "base_days");
    if (v.isMember("day_count_context"))
        b.context = parseField(&parseDayCountContext, v["day_count_context"], "day_count_context");
    return b;
}

ModeParameters modeParameters(CalculationMode mode, const Json::Value& v) {
    switch (mode) {
    case CalculationMode::Simple: {
        SimpleParameters p;
        p.annualRatePercent = optionalReal(v, "annual_rate");
        p.dailyRatePercent = optionalReal(v, "daily_rate");
        p.dayCount = dayCountBasis(v);
        return p;
    }
    case CalculationMode::Floating: {
        FloatingParameters p;
        if (v.isMember("term"))
            p.term = parseField(&parseRateTerm, v["term"], "term");
        if (v.isMember("multiplier"))
            p.multiplier = realValue(v["multiplier"], "multiplier");
        p.dayCount = dayCountBasis(v);
        p.capMultiplier = optionalReal(v, "cap_multiplier");
        if (v.isMember("cap_term"))
            p.capTerm = parseField(&parseRateTerm, v["cap_term"], "cap_term");
        return p;
    }
    case CalculationMode::Delayed:
        return DelayedParameters();
    case CalculationMode::Compound: {
        CompoundParameters p;
        p.annualRatePercent = optionalReal(v, "annual_rate");
        p.dayCount = dayCountBasis(v);
        if (v.isMember("cycle"))
            p.cycle = parseField(&parseCompoundingCycle, v["cycle"], "cycle");
        return p;
    }
    case CalculationMode::Penalty: {
        PenaltyParameters p;
        if (v.isMember("basis"))
            p.basis = parseField(&parsePenaltyBasis, v["basis"], "basis");
        p.annualRatePercent = optionalReal(v, "annual_rate");
        if (v.isMember("term"))
            p.term = parseField(&parseRateTerm, v["term"], "term");
        p.multiplier = optionalReal(v, "multiplier");
        CIE_REQUIRE(p.basis == PenaltyBasis::Floating || !p.multiplier, InvalidParameterError, "multiplier",
                    "a fixed penalty applies its annual rate as given, multiplier must not be given");
        p.dayCount = dayCountBasis(v);
        if (v.isMember("cap_multiplier"))
            p.capMultiplier = realValue(v["cap_multiplier"], "cap_multiplier");
        if (v.isMember("cap_term"))
            p.capTerm = parseField(&parseRateTerm, v["cap_term"], "cap_term");
        return p;
    }
    default:
        QL_FAIL("unknown CalculationMode " << static_cast<int>(mode));
    }
}

string modeName(CalculationMode mode) {
    switch (mode) {
    case CalculationMode::Simple:
        return "simple";
    case CalculationMode::Floating:
        return "lpr";
    case CalculationMode::Delayed:
        return "delay";
    case CalculationMode::Compound:
        return "compound";
    case CalculationMode::Penalty:
        return "penalty";
    default:
        QL_FAIL("unknown CalculationMode " << static_cast<int>(mode));
    }
}

string termName(RateTerm term) { return term == RateTerm::ShortTerm ? "1y" : "5y"; }

void dayCountToJson(const DayCountBasis& b, Json::Value& v) {
    if (b.baseDays)
        v["base_days"] = static_cast<Json::UInt64>(*b.baseDays);
    if (b.context)
        v["day_count_context"] = *b.context == DayCountContext::Lending ? "lending" : "judicial";
}

class ParametersToJson : public boost::static_visitor<> {
public:
    explicit ParametersToJson(Json::Value& v) : v_(v) {}

    void operator()(const SimpleParameters& p) const {
        if (p.annualRatePercent)
            v_["annual_rate"] = *p.annualRatePercent;
        if (p.dailyRatePercent)
            v_["daily_rate"] = *p.dailyRatePercent;
        dayCountToJson(p.dayCount, v_);
    }
    void operator()(const FloatingParameters& p) const {
        if (p.term)
            v_["term"] = termName(*p.term);
        v_["multiplier"] = p.multiplier;
        dayCountToJson(p.dayCount, v_);
        if (p.capMultiplier)
            v_["cap_multiplier"] = *p.capMultiplier;
        if (p.capTerm)
            v_["cap_term"] = termName(*p.capTerm);
    }
    void operator()(const DelayedParameters&) const {}
    void operator()(const CompoundParameters& p) const {
        if (p.annualRatePercent)
            v_["annual_rate"] = *p.annualRatePercent;
        dayCountToJson(p.dayCount, v_);
        if (p.cycle)
            v_["cycle"] = to_string(*p.cycle);
    }
    void operator()(const PenaltyParameters& p) const {
        v_["basis"] = p.basis == PenaltyBasis::Fixed ? "fixed" : "floating";
        if (p.annualRatePercent)
            v_["annual_rate"] = *p.annualRatePercent;
        if (p.term)
            v_["term"] = termName(*p.term);
        if (p.multiplier)
            v_["multiplier"] = *p.multiplier;
        dayCountToJson(p.dayCount, v_);
        v_["cap_multiplier"] = p.capMultiplier;
        v_["cap_term"] = termName(p.capTerm);
    }

private:
    Json::Value& v_;
};

} // namespace

Json::Value parseJson(const string& text) {
    Json::CharReaderBuilder builder;
    builder["collectComments"] = false;
    builder["rejectDupKeys"] = true;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    Json::Value root;
    string errors;
    bool ok = reader->parse(text.data(), text.data() + text.size(), &root, &errors);
    CIE_REQUIRE(ok, ValidationError, "json", "malformed JSON: " << errors);
    return root;
}

string writeJson(const Json::Value& value) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "  ";
    builder["precision"] = 17;
    return Json::writeString(builder, value);
}

CalculationRequest calculationRequestFromJson(const Json::Value& v) {
    requireObject(v, "request");
    CIE_REQUIRE(v.isMember("mode"), ValidationError, "mode", "mode is required");
    CalculationMode mode = parseField(&parseCalculationMode, v["mode"], "mode");

    set<string> mf = modeFields(mode);
    for (auto const& name : v.getMemberNames()) {
        if (commonFields.count(name) > 0 || mf.count(name) > 0)
            continue;
        if (mode == CalculationMode::Delayed && rateFields.count(name) > 0) {
            CIE_FAIL(InvalidParameterError, name,
                     "delayed-performance interest accrues at the statutory daily rate, " << name
                                                                                          << " must not be given");
        }
        CIE_FAIL(ValidationError, name, "field '" << name << "' does not apply to mode " << mode);
    }

    CalculationRequest r;
    if (v.isMember("label"))
        r.label = stringValue(v["label"], "label");
    CIE_REQUIRE(v.isMember("principal"), ValidationError, "principal", "principal is required");
    r.principal = realValue(v["principal"], "principal");
    CIE_REQUIRE(v.isMember("start_date"), ValidationError, "start_date", "start_date is required");
    r.startDate = dateValue(v["start_date"], "start_date");
    CIE_REQUIRE(v.isMember("end_date"), ValidationError, "end_date", "end_date is required");
    r.endDate = dateValue(v["end_date"], "end_date");
    if (v.isMember("payment_offset_policy"))
        r.paymentOffsetPolicy =
            parseField(&parsePaymentOffsetPolicy, v["payment_offset_policy"], "payment_offset_policy");
    if (v.isMember("outstanding_costs"))
        r.outstandingCosts = realValue(v["outstanding_costs"], "outstanding_costs");
    if (v.isMember("outstanding_interest"))
        r.outstandingInterest = realValue(v["outstanding_interest"], "outstanding_interest");
    if (v.isMember("legal_citation"))
        r.legalCitation = stringValue(v["legal_citation"], "legal_citation");

    if (v.isMember("payments")) {
        const Json::Value& payments = v["payments"];
        CIE_REQUIRE(payments.isArray(), ValidationError, "payments", "expected a JSON array");
        for (Json::ArrayIndex i = 0; i < payments.size(); ++i) {
            string prefix = "payments[" + std::to_string(i) + "].";
            const Json::Value& p = payments[i];
            CIE_REQUIRE(p.isObject(), ValidationError, "payments[" + std::to_string(i) + "]",
                        "expected a JSON object");
            rejectUnknownFields(p, {"date", "amount"}, prefix, "a payment");
            CIE_REQUIRE(p.isMember("date"), ValidationError, prefix + "date", "payment date is required");
            CIE_REQUIRE(p.isMember("amount"), ValidationError, prefix + "amount", "payment amount is required");
            r.payments.push_back({dateValue(p["date"], prefix + "date"), realValue(p["amount"], prefix + "amount")});
        }
    }

    r.parameters = modeParameters(mode, v);
    DLOG("read " << mode << " request '" << r.label << "' from JSON");
    return r;
}

Json::Value toJson(const CalculationRequest& r) {
    Json::Value v(Json::objectValue);
    v["mode"] = modeName(r.mode());
    if (!r.label.empty())
        v["label"] = r.label;
    v["principal"] = r.principal;
    v["start_date"] = to_string(r.startDate);
    v["end_date"] = to_string(r.endDate);
    if (!r.payments.empty()) {
        Json::Value payments(Json::arrayValue);
        for (auto const& p : r.payments) {
            Json::Value pv(Json::objectValue);
            pv["date"] = to_string(p.date);
            pv["amount"] = p.amount;
            payments.append(pv);
        }
        v["payments"] = payments;
    }
    v["payment_offset_policy"] =
        r.paymentOffsetPolicy == PaymentOffsetPolicy::GeneralDebt ? "general_debt" : "judgment_debt";
    v["outstanding_costs"] = r.outstandingCosts;
    v["outstanding_interest"] = r.outstandingInterest;
    if (!r.legalCitation.empty())
        v["legal_citation"] = r.legalCitation;
    boost::apply_visitor(ParametersToJson(v), r.parameters);
    return v;
}

AdjustmentRequest adjustmentRequestFromJson(const Json::Value& v) {
    requireObject(v, "adjustment");
    CIE_REQUIRE(v.isMember("type"), ValidationError, "type", "adjustment type is required");
    AdjustmentRequest a;
    a.type = parseField(&parseAdjustmentType, v["type"], "type");
    switch (a.type) {
    case AdjustmentRequest::Type::ShareOfTotal:
        rejectUnknownFields(v, {"type", "label", "amount", "share_percent"}, "", "a share_of_total adjustment");
        CIE_REQUIRE(v.isMember("share_percent"), ValidationError, "share_percent", "share_percent is required");
        a.sharePercent = realValue(v["share_percent"], "share_percent");
        break;
    case AdjustmentRequest::Type::ConfirmedAmount:
        rejectUnknownFields(v, {"type", "label", "amount", "source"}, "", "a confirmed_amount adjustment");
        if (v.isMember("source"))
            a.source = stringValue(v["source"], "source");
        break;
    case AdjustmentRequest::Type::MaximumLimit:
        rejectUnknownFields(v, {"type", "label", "amount", "limit"}, "", "a maximum_limit adjustment");
        CIE_REQUIRE(v.isMember("limit"), ValidationError, "limit", "limit is required");
        a.limit = realValue(v["limit"], "limit");
        break;
    default:
        QL_FAIL("unknown AdjustmentRequest type " << static_cast<int>(a.type));
    }
    if (v.isMember("label"))
        a.label = stringValue(v["label"], "label");
    CIE_REQUIRE(v.isMember("amount"), ValidationError, "amount", "amount is required");
    a.amount = realValue(v["amount"], "amount");
    return a;
}

CaseFile caseFileFromJson(const Json::Value& v) {
    requireObject(v, "case");
    rejectUnknownFields(v, {"case", "calculations", "adjustments"}, "", "a case file");
    CaseFile c;
    if (v.isMember("case"))
        c.name = stringValue(v["case"], "case");
    if (v.isMember("calculations")) {
        CIE_REQUIRE(v["calculations"].isArray(), ValidationError, "calculations", "expected a JSON array");
        c.calculations = v["calculations"];
    }
    if (v.isMember("adjustments")) {
        CIE_REQUIRE(v["adjustments"].isArray(), ValidationError, "adjustments", "expected a JSON array");
        c.adjustments = v["adjustments"];
    }
    return c;
}

CaseFile loadCaseFile(const string& filename) {
    LOG("loading case file " << filename);
    std::ifstream in(filename.c_str());
    QL_REQUIRE(in.is_open(), "error opening case file " << filename);
    std::ostringstream text;
    text << in.rdbuf();
    CaseFile c = caseFileFromJson(parseJson(text.str()));
    LOG("case '" << c.name << "' has " << c.calculations.size() << " calculations and " << c.adjustments.size()
                 << " adjustments");
    return c;
}

} // namespace data
} // namespace cie
