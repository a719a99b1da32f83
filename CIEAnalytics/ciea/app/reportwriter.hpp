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

/*! \file ciea/app/reportwriter.hpp
  \brief A Class to write calculation outputs to reports
  \ingroup app
 */

#pragma once

#include <ciea/engine/audittrail.hpp>
#include <ciea/engine/calculationresult.hpp>
#include <ciea/engine/claimadjustments.hpp>
#include <cied/report/report.hpp>
#include <cied/report/workbookfile.hpp>

#include <ql/types.hpp>

#include <boost/optional.hpp>

#include <string>
#include <vector>

namespace cie {
namespace analytics {

//! One line of the case summary, a calculation that either succeeded or failed
struct CalculationSummary {
    std::string section;
    std::string label;
    std::string mode;
    bool succeeded = false;
    QuantLib::Real totalInterest = 0.0;
    boost::optional<QuantLib::Real> cappedTotal;
    std::string errorKind;
    std::string errorField;
    std::string errorMessage;
};

//! Write calculation outputs to reports
/*! \ingroup app
 */
class ReportWriter {
public:
    /*! Constructor.
        \param nullString used to represent string values that are not applicable.
    */
    ReportWriter(const std::string& nullString = "#N/A") : nullString_(nullString) {}

    virtual ~ReportWriter() {}

    //! Append a section with the Request, Audit and, if there are payments, Allocations tables
    virtual void writeCalculation(cie::data::WorkbookFile& workbook, const std::string& section,
                                  const CalculationResult& result);

    //! Append the Summary section listing all calculations and adjustments of a case
    virtual void writeSummary(cie::data::WorkbookFile& workbook, const std::string& section,
                              const std::vector<CalculationSummary>& calculations,
                              const std::vector<AdjustmentResult>& adjustments);

    virtual void writeCalculationSummary(cie::data::Report& report,
                                         const std::vector<CalculationSummary>& calculations);

    virtual void writeAdjustments(cie::data::Report& report, const std::vector<AdjustmentResult>& adjustments);

    const std::string& nullString() const { return nullString_; }

protected:
    std::string nullString_;
    AuditTrailGenerator auditTrail_;
};

} // namespace analytics
} // namespace cie
