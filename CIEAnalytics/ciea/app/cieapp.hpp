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

/*! \file ciea/app/cieapp.hpp
  \brief Claim Interest Engine App
  \ingroup app
 */

#pragma once

#include <ciea/app/parameters.hpp>
#include <ciea/app/reportwriter.hpp>
#include <ciea/engine/calculationengine.hpp>
#include <cied/marketdata/ratetable.hpp>
#include <cied/request/requestjson.hpp>

#include <ql/shared_ptr.hpp>
#include <ql/types.hpp>

#include <boost/timer/timer.hpp>

#include <json/json.h>

#include <set>
#include <string>
#include <vector>

namespace cie {
namespace analytics {

//! Orchestrates a case run: rate table loading, the calculations and adjustments of a case, and reporting
/*! Each request of the case is processed on its own. A request that fails yields an error object in the response
    and a line in the summary, the remaining requests are still processed. Failures outside a single request, an
    unreadable case file or rate table for example, abort the run.

    Outputs are the JSON response (resultFile) and the workbook (workbookFile) holding one section per successful
    calculation and a Summary section.
    \ingroup app
 */
class CIEApp {
public:
    CIEApp(const QuantLib::ext::shared_ptr<Parameters>& params, bool console = false)
        : params_(params), logMask_(15), console_(console) {}

    virtual ~CIEApp();

    //! Process the case, throws if the run cannot be completed
    virtual void run();

    //! the response of the last run
    const Json::Value& response() const { return response_; }
    const std::vector<CalculationSummary>& summary() const { return summary_; }
    const std::vector<AdjustmentResult>& adjustments() const { return adjustments_; }
    //! number of failed requests in the last run
    QuantLib::Size errorCount() const;
    //! time for executing run() in seconds
    QuantLib::Real getRunTime();

    static std::string version();

protected:
    void initFromParams();
    //! set up logging
    void setupLog(const std::string& path, const std::string& file, QuantLib::Size mask, bool logToConsole);
    //! remove logs
    void closeLog();

    QuantLib::ext::shared_ptr<cie::data::RateTable> loadRateTable() const;
    //! sections are named uniquely against \p taken, which holds the workbook's existing sections
    void processCalculations(const cie::data::CaseFile& caseFile, const CalculationEngine& engine,
                             cie::data::WorkbookFile& workbook, std::set<std::string>& taken);
    void processAdjustments(const cie::data::CaseFile& caseFile);
    void writeResponse() const;

    void console(const std::string& msg) const;

    QuantLib::ext::shared_ptr<Parameters> params_;
    ReportWriter reportWriter_;
    boost::timer::cpu_timer runTimer_;

    //! Logging
    std::string logFile_;
    QuantLib::Size logMask_;
    bool logToConsole_ = false;
    bool console_;

    std::string inputPath_;
    std::string outputPath_;
    std::string caseFile_;
    std::string resultFile_;
    std::string workbookFile_;
    std::string rateTableFile_;
    std::string caseName_;
    bool appendWorkbook_ = false;

    Json::Value response_;
    std::vector<CalculationSummary> summary_;
    std::vector<AdjustmentResult> adjustments_;
    QuantLib::Size adjustmentErrors_ = 0;
};

} // namespace analytics
} // namespace cie
