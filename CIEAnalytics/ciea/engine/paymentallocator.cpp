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

#include <ciea/engine/paymentallocator.hpp>
#include <cied/utilities/log.hpp>
#include <cied/utilities/to_string.hpp>

#include <ql/errors.hpp>

#include <algorithm>
#include <utility>
#include <vector>

using namespace cie::data;
using QuantLib::Real;

namespace cie {
namespace analytics {

PaymentAllocation PaymentOffsetAllocator::allocate(const OutstandingBalances& balances, const Payment& payment) const {
    QL_REQUIRE(payment.amount >= 0.0, "PaymentOffsetAllocator: negative payment " << payment.amount);

    PaymentAllocation a;
    a.payment = payment;
    a.before = balances;
    a.after = balances;

    // bucket to discharge, and the field recording the amount applied to it
    typedef std::pair<Real*, Real*> Bucket;
    std::vector<Bucket> order;
    switch (policy_) {
    case PaymentOffsetPolicy::GeneralDebt:
        order = {{&a.after.costs, &a.toCosts},
                 {&a.after.interest, &a.toInterest},
                 {&a.after.principal, &a.toPrincipal},
                 {&a.after.delayedInterest, &a.toDelayedInterest}};
        break;
    case PaymentOffsetPolicy::JudgmentDebt:
        order = {{&a.after.principal, &a.toPrincipal},
                 {&a.after.interest, &a.toInterest},
                 {&a.after.costs, &a.toCosts},
                 {&a.after.delayedInterest, &a.toDelayedInterest}};
        break;
    default:
        QL_FAIL("unknown PaymentOffsetPolicy " << static_cast<int>(policy_));
    }

    Real remaining = payment.amount;
    for (auto& b : order) {
        if (remaining <= 0.0)
            break;
        Real applied = std::min(remaining, std::max(*b.first, 0.0));
        *b.first -= applied;
        *b.second = applied;
        remaining -= applied;
    }
    a.unappliedRemainder = remaining;

    DLOG("payment " << payment.amount << " on " << to_string(payment.date) << " (" << policy_ << "): costs "
                    << a.toCosts << ", interest " << a.toInterest << ", principal " << a.toPrincipal
                    << ", delayed interest " << a.toDelayedInterest << ", unapplied " << a.unappliedRemainder);
    return a;
}

std::ostream& operator<<(std::ostream& out, const OutstandingBalances& b) {
    return out << "costs " << b.costs << ", interest " << b.interest << ", principal " << b.principal
               << ", delayed interest " << b.delayedInterest;
}

} // namespace analytics
} // namespace cie
