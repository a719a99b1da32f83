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

/*! \file ciea/engine/paymentallocator.hpp
    \brief Allocation of payments to the outstanding amounts of a claim
    \ingroup engine
*/

#pragma once

#include <cied/request/calculationrequest.hpp>

#include <ql/types.hpp>

#include <ostream>

namespace cie {
namespace analytics {

//! Amounts outstanding on a claim
struct OutstandingBalances {
    QuantLib::Real costs = 0.0;
    QuantLib::Real interest = 0.0;
    QuantLib::Real principal = 0.0;
    //! delayed-performance interest, kept apart from the judgment-determined amounts
    QuantLib::Real delayedInterest = 0.0;

    QuantLib::Real total() const { return costs + interest + principal + delayedInterest; }
};

//! How one payment was applied
struct PaymentAllocation {
    cie::data::Payment payment;
    QuantLib::Real toCosts = 0.0;
    QuantLib::Real toInterest = 0.0;
    QuantLib::Real toPrincipal = 0.0;
    QuantLib::Real toDelayedInterest = 0.0;
    //! part of the payment exceeding everything outstanding
    QuantLib::Real unappliedRemainder = 0.0;
    OutstandingBalances before;
    OutstandingBalances after;
};

//! Applies payments to the outstanding amounts in the order of a PaymentOffsetPolicy
/*! Each amount is discharged in full before the next one is touched, and no amount is reduced below zero. The part
    of a payment exceeding all outstanding amounts is reported as unapplied remainder, never dropped.

    GeneralDebt: costs, interest, principal, delayed-performance interest.
    JudgmentDebt: principal, interest and costs (the judgment-determined amount in the order the judgment lists
    them), then delayed-performance interest.
    \ingroup engine
*/
class PaymentOffsetAllocator {
public:
    explicit PaymentOffsetAllocator(cie::data::PaymentOffsetPolicy policy) : policy_(policy) {}

    //! the allocation of the payment against the balances, the balances after it are in the result
    PaymentAllocation allocate(const OutstandingBalances& balances, const cie::data::Payment& payment) const;

    cie::data::PaymentOffsetPolicy policy() const { return policy_; }

private:
    cie::data::PaymentOffsetPolicy policy_;
};

std::ostream& operator<<(std::ostream& out, const OutstandingBalances& b);

} // namespace analytics
} // namespace cie
