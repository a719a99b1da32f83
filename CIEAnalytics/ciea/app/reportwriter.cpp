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

#include <ciea/app/reportwriter.hpp>
#include <cied/report/inmemoryreport.hpp>
#include <cied/utilities/log.hpp>
#include <cied/utilities/to_string.hpp>

#include <ql/utilities/null.hpp>

using namespace cie::data;
using QuantLib::Null;
using QuantLib::Real;
using QuantLib::Size;
using std::string;
using std::vector;

namespace cie {
namespace analytics {

void ReportWriter::writeCalculation(WorkbookFile& workbook, const string& section, const CalculationResult& result) {
    LOG("write workbook section '" << section << "'");
    WorkbookFile::Tables tables;

    auto request = QuantLib::ext::make_shared<InMemoryReport>();
    auditTrail_.writeMetadata(result, *request);
    tables.emplace_back("Request", request);

    auto audit = QuantLib::ext::make_shared<InMemoryReport>();
    auditTrail_.write(auditTrail_.render(result), *audit);
    tables.emplace_back("Audit", audit);

    if (!result.allocations.empty()) {
        auto allocations = QuantLib::ext::make_shared<InMemoryReport>();
        auditTrail_.writeAllocations(result, *allocations);
        tables.emplace_back("Allocations", allocations);
    }

    workbook.appendSection(section, tables);
}

void ReportWriter::writeSummary(WorkbookFile& workbook, const string& section,
                                const vector<CalculationSummary>& calculations,
                                const vector<AdjustmentResult>& adjustments) {
    LOG("write workbook summary '" << section << "'");
    WorkbookFile::Tables tables;

    auto calcs = QuantLib::ext::make_shared<InMemoryReport>();
    writeCalculationSummary(*calcs, calculations);
    tables.emplace_back("Calculations", calcs);

    if (!adjustments.empty()) {
        auto adj = QuantLib::ext::make_shared<InMemoryReport>();
        writeAdjustments(*adj, adjustments);
        tables.emplace_back("Adjustments", adj);
    }

    workbook.appendSection(section, tables);
}

void ReportWriter::writeCalculationSummary(Report& report, const vector<CalculationSummary>& calculations) {
    report.addColumn("Section", string())
        .addColumn("Label", string())
        .addColumn("Mode", string())
        .addColumn("Status", string())
        .addColumn("TotalInterest", Real(), 2)
        .addColumn("CappedTotal", Real(), 2)
        .addColumn("ErrorKind", string())
        .addColumn("ErrorField", string())
        .addColumn("ErrorMessage", string());
    for (auto const& c : calculations) {
        report.next()
            .add(c.section)
            .add(c.label)
            .add(c.mode.empty() ? nullString_ : c.mode)
            .add(string(c.succeeded ? "OK" : "Error"))
            .add(c.succeeded ? c.totalInterest : Null<Real>())
            .add(c.cappedTotal ? *c.cappedTotal : Null<Real>())
            .add(c.errorKind.empty() ? nullString_ : c.errorKind)
            .add(c.errorField.empty() ? nullString_ : c.errorField)
            .add(c.errorMessage.empty() ? nullString_ : c.errorMessage);
    }
    report.end();
}

void ReportWriter::writeAdjustments(Report& report, const vector<AdjustmentResult>& adjustments) {
    report.addColumn("Type", string())
        .addColumn("Label", string())
        .addColumn("InputAmount", Real(), 2)
        .addColumn("FinalAmount", Real(), 2)
        .addColumn("Excess", Real(), 2)
        .addColumn("LimitApplied", string())
        .addColumn("Source", string())
        .addColumn("Formula", string());
    for (auto const& a : adjustments) {
        bool limit = a.type == AdjustmentRequest::Type::MaximumLimit;
        report.next()
            .add(to_string(a.type))
            .add(a.label)
            .add(a.inputAmount)
            .add(a.finalAmount)
            .add(limit ? a.excess : Null<Real>())
            .add(limit ? to_string(a.limitApplied) : nullString_)
            .add(a.source.empty() ? nullString_ : a.source)
            .add(a.formula);
    }
    report.end();
}

} // namespace analytics
} // namespace cie
