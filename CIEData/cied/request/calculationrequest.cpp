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

#include <cied/request/calculationrequest.hpp>

#include <ql/errors.hpp>

#include <boost/variant/static_visitor.hpp>

namespace cie {
namespace data {

CompoundingCycle::CompoundingCycle(Type type, QuantLib::Size n) : type_(type), n_(n) {
    switch (type_) {
    case Type::MonthlyOnDay:
        QL_REQUIRE(n_ >= 1 && n_ <= 31, "CompoundingCycle: day of month " << n_ << " not in [1, 31]");
        break;
    case Type::EveryNDays:
        QL_REQUIRE(n_ >= 1, "CompoundingCycle: number of days must be positive");
        break;
    default:
        n_ = 0;
    }
}

namespace {
class ModeOf : public boost::static_visitor<CalculationMode> {
public:
    CalculationMode operator()(const SimpleParameters&) const { return CalculationMode::Simple; }
    CalculationMode operator()(const FloatingParameters&) const { return CalculationMode::Floating; }
    CalculationMode operator()(const DelayedParameters&) const { return CalculationMode::Delayed; }
    CalculationMode operator()(const CompoundParameters&) const { return CalculationMode::Compound; }
    CalculationMode operator()(const PenaltyParameters&) const { return CalculationMode::Penalty; }
};
} // namespace

CalculationMode calculationMode(const ModeParameters& parameters) {
    return boost::apply_visitor(ModeOf(), parameters);
}

std::ostream& operator<<(std::ostream& out, const CalculationMode& mode) {
    switch (mode) {
    case CalculationMode::Simple:
        return out << "Simple";
    case CalculationMode::Floating:
        return out << "Floating";
    case CalculationMode::Delayed:
        return out << "Delayed";
    case CalculationMode::Compound:
        return out << "Compound";
    case CalculationMode::Penalty:
        return out << "Penalty";
    default:
        QL_FAIL("unknown CalculationMode " << static_cast<int>(mode));
    }
}

std::ostream& operator<<(std::ostream& out, const PaymentOffsetPolicy& policy) {
    switch (policy) {
    case PaymentOffsetPolicy::GeneralDebt:
        return out << "GeneralDebt";
    case PaymentOffsetPolicy::JudgmentDebt:
        return out << "JudgmentDebt";
    default:
        QL_FAIL("unknown PaymentOffsetPolicy " << static_cast<int>(policy));
    }
}

std::ostream& operator<<(std::ostream& out, const DayCountContext& context) {
    switch (context) {
    case DayCountContext::Lending:
        return out << "Lending";
    case DayCountContext::Judicial:
        return out << "Judicial";
    default:
        QL_FAIL("unknown DayCountContext " << static_cast<int>(context));
    }
}

std::ostream& operator<<(std::ostream& out, const PenaltyBasis& basis) {
    switch (basis) {
    case PenaltyBasis::Fixed:
        return out << "Fixed";
    case PenaltyBasis::Floating:
        return out << "Floating";
    default:
        QL_FAIL("unknown PenaltyBasis " << static_cast<int>(basis));
    }
}

std::ostream& operator<<(std::ostream& out, const CompoundingCycle& cycle) {
    switch (cycle.type()) {
    case CompoundingCycle::Type::MonthEnd:
        return out << "month_end";
    case CompoundingCycle::Type::QuarterEnd:
        return out << "quarter_end";
    case CompoundingCycle::Type::SemiAnnualEnd:
        return out << "semiannual_end";
    case CompoundingCycle::Type::YearEnd:
        return out << "year_end";
    case CompoundingCycle::Type::MonthlyOnDay:
        return out << "monthly_day:" << cycle.n();
    case CompoundingCycle::Type::EveryNDays:
        return out << "every_days:" << cycle.n();
    default:
        QL_FAIL("unknown CompoundingCycle type " << static_cast<int>(cycle.type()));
    }
}

std::ostream& operator<<(std::ostream& out, const AdjustmentRequest::Type& type) {
    switch (type) {
    case AdjustmentRequest::Type::ShareOfTotal:
        return out << "share_of_total";
    case AdjustmentRequest::Type::ConfirmedAmount:
        return out << "confirmed_amount";
    case AdjustmentRequest::Type::MaximumLimit:
        return out << "maximum_limit";
    default:
        QL_FAIL("unknown AdjustmentRequest type " << static_cast<int>(type));
    }
}

} // namespace data
} // namespace cie
