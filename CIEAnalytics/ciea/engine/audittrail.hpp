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

/*! \file ciea/engine/audittrail.hpp
    \brief Human reviewable record of a calculation
    \ingroup engine
*/

#pragma once

#include <ciea/engine/calculationresult.hpp>
#include <cied/report/report.hpp>

#include <ql/time/date.hpp>
#include <ql/types.hpp>

#include <string>
#include <vector>

namespace cie {
namespace analytics {

//! One line of the audit trail, a period or the final total
/*! Carries every figure needed to recompute the period interest by hand. Fields that do not apply to the mode are
    Null and are printed as #N/A.
*/
struct AuditRow {
    QuantLib::Size row;
    //! "Period" or "Total"
    std::string type;
    QuantLib::Date startDate;
    QuantLib::Date endDate;
    QuantLib::Size days;
    QuantLib::Real principalBase;
    QuantLib::Real benchmarkRate;
    QuantLib::Real multiplier;
    QuantLib::Real annualRate;
    QuantLib::Real dailyRate;
    QuantLib::Real subInterest;
    QuantLib::Real cappedSubInterest;
    std::string formula;

    bool operator==(const AuditRow& o) const;
};

//! Renders a result into audit rows
/*! One row per period in date order followed by one total row. Rendering depends on the result only, rendering the
    same result twice gives identical rows and identical report output.
    \ingroup engine
*/
class AuditTrailGenerator {
public:
    std::vector<AuditRow> render(const CalculationResult& result) const;

    //! write the rows to a report with the columns Row, Type, StartDate, ..., Formula
    void write(const std::vector<AuditRow>& rows, cie::data::Report& report) const;

    //! write the request metadata as a Field, Value table
    void writeMetadata(const CalculationResult& result, cie::data::Report& report) const;

    //! write the payment allocations, if any, as a table
    void writeAllocations(const CalculationResult& result, cie::data::Report& report) const;
};

} // namespace analytics
} // namespace cie
