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

#include <ciea/app/cieapp.hpp>
#include <ciea/app/resultjson.hpp>
#include <ciea/app/structuredcalculationerror.hpp>
#include <ciea/engine/claimadjustments.hpp>
#include <cied/marketdata/embeddedratetable.hpp>
#include <cied/marketdata/ratetableloader.hpp>
#include <cied/report/workbookfile.hpp>
#include <cied/utilities/errors.hpp>
#include <cied/utilities/log.hpp>
#include <cied/utilities/parsers.hpp>
#include <cied/utilities/to_string.hpp>
#include <cied/version.hpp>

#include <ql/errors.hpp>

#include <boost/chrono/duration.hpp>
#include <boost/filesystem.hpp>

#include <fstream>
#include <iostream>
#include <mutex>
#include <set>
#include <sstream>

using namespace cie::data;
using QuantLib::Real;
using QuantLib::Size;
using std::string;

namespace cie {
namespace analytics {

namespace {

string resolve(const string& dir, const string& file) {
    boost::filesystem::path p(file);
    if (p.is_absolute() || dir.empty())
        return p.string();
    return (boost::filesystem::path(dir) / p).string();
}

// base, or base #2, base #3, ... if it is taken already
string uniqueName(const string& base, std::set<string>& taken) {
    string name = base;
    for (Size n = 2; taken.count(name) > 0; ++n)
        name = base + " #" + std::to_string(n);
    taken.insert(name);
    return name;
}

// the label if the request carries one, else a positional name, made unique against the taken names
string sectionName(const Json::Value& request, Size index, std::set<string>& taken) {
    string base = "Calculation " + std::to_string(index + 1);
    if (request.isObject() && request.isMember("label") && request["label"].isString() &&
        !request["label"].asString().empty())
        base = request["label"].asString();
    string name = base;
    for (Size n = 2; taken.count(name) > 0 || name == "Summary"; ++n)
        name = base + " #" + std::to_string(n);
    taken.insert(name);
    return name;
}

} // namespace

CIEApp::~CIEApp() {
    // Close logs
    closeLog();
}

void CIEApp::initFromParams() {
    inputPath_ = params_->get("setup", "inputPath", false);
    outputPath_ = params_->get("setup", "outputPath");
    caseFile_ = resolve(inputPath_, params_->get("setup", "caseFile"));
    resultFile_ = resolve(outputPath_, params_->get("setup", "resultFile"));
    workbookFile_ = resolve(outputPath_, params_->get("setup", "workbookFile"));

    string tmp = params_->get("setup", "rateTableFile", false);
    rateTableFile_ = tmp.empty() ? string() : resolve(inputPath_, tmp);
    caseName_ = params_->get("setup", "caseName", false);
    tmp = params_->get("setup", "appendWorkbook", false);
    appendWorkbook_ = !tmp.empty() && parseBool(tmp);

    logFile_ = resolve(outputPath_, "log.txt");
    logMask_ = 15;
    logToConsole_ = false;
    if (params_->hasGroup("logging")) {
        tmp = params_->get("logging", "logFile", false);
        if (!tmp.empty())
            logFile_ = resolve(outputPath_, tmp);
        tmp = params_->get("logging", "logMask", false);
        if (!tmp.empty())
            logMask_ = static_cast<Size>(parseInteger(tmp));
        tmp = params_->get("logging", "logToConsole", false);
        if (!tmp.empty())
            logToConsole_ = parseBool(tmp);
    }

    setupLog(outputPath_, logFile_, logMask_, logToConsole_);

    // Log the input parameters
    params_->log();
}

void CIEApp::run() {

    // Only one thread at a time should call run
    static std::mutex _s_mutex;
    std::lock_guard<std::mutex> lock(_s_mutex);

    response_ = Json::Value(Json::objectValue);
    summary_.clear();
    adjustments_.clear();
    adjustmentErrors_ = 0;

    runTimer_.start();

    try {
        initFromParams();

        console("Loading rate table");
        auto rateTable = loadRateTable();
        CalculationEngine engine(rateTable);

        console("Loading case " + caseFile_);
        CaseFile caseFile = loadCaseFile(caseFile_);
        if (!caseName_.empty())
            caseFile.name = caseName_;
        LOG("case '" << caseFile.name << "' with " << caseFile.calculations.size() << " calculations and "
                     << caseFile.adjustments.size() << " adjustments");

        if (!appendWorkbook_ && boost::filesystem::exists(workbookFile_)) {
            DLOG("remove existing workbook " << workbookFile_);
            boost::filesystem::remove(workbookFile_);
        }
        WorkbookFile workbook(workbookFile_);

        response_["case"] = caseFile.name;
        response_["engine_version"] = version();
        response_["rate_table_version"] = rateTable->version();
        response_["rate_table_as_of"] = to_string(rateTable->asOf());

        // an appended case keeps the sections already written
        std::set<string> taken;
        for (auto const& s : workbook.sections())
            taken.insert(s);
        processCalculations(caseFile, engine, workbook, taken);
        processAdjustments(caseFile);

        string summarySection =
            uniqueName(caseFile.name.empty() ? string("Summary") : "Summary " + caseFile.name, taken);
        reportWriter_.writeSummary(workbook, summarySection, summary_, adjustments_);
        writeResponse();
    } catch (std::exception& e) {
        std::ostringstream oss;
        oss << "Error in CIE run: " << e.what();
        ALOG(oss.str());
        console(oss.str());
        runTimer_.stop();
        QL_FAIL(oss.str());
    }

    runTimer_.stop();
    console("run time: " + runTimer_.format(boost::timer::default_places, "%w") + " sec, " +
            std::to_string(errorCount()) + " failed requests");
    LOG("CIE done.");
}

QuantLib::ext::shared_ptr<RateTable> CIEApp::loadRateTable() const {
    if (rateTableFile_.empty()) {
        LOG("using embedded rate table " << EMBEDDED_RATE_TABLE_VERSION);
        return embeddedRateTable();
    }
    LOG("loading rate table from " << rateTableFile_);
    return RateTableLoader::loadFile(rateTableFile_);
}

void CIEApp::processCalculations(const CaseFile& caseFile, const CalculationEngine& engine, WorkbookFile& workbook,
                                 std::set<string>& taken) {
    Json::Value responses(Json::arrayValue);
    for (Json::ArrayIndex i = 0; i < caseFile.calculations.size(); ++i) {
        const Json::Value& json = caseFile.calculations[i];
        CalculationSummary s;
        s.section = sectionName(json, i, taken);
        s.label = s.section;
        try {
            CalculationRequest request = calculationRequestFromJson(json);
            s.mode = to_string(request.mode());
            CalculationResult result = engine.calculate(request);
            reportWriter_.writeCalculation(workbook, s.section, result);
            s.succeeded = true;
            s.totalInterest = result.totalInterest;
            if (result.cap)
                s.cappedTotal = result.cap->cappedTotal;
            responses.append(toJson(result));
            LOG("calculation '" << s.section << "': total interest " << to_string(result.totalInterest, 2));
        } catch (const CalculationError& e) {
            s.errorKind = e.kind();
            s.errorField = e.field();
            s.errorMessage = e.message();
            StructuredCalculationErrorMessage(s.section, e.kind(), e.field(), e.message()).log();
            responses.append(toJson(e));
        } catch (const std::exception& e) {
            // internal invariant violations
            s.errorKind = "InternalError";
            s.errorMessage = e.what();
            StructuredCalculationErrorMessage(s.section, s.errorKind, "", e.what()).log();
            responses.append(errorToJson(s.errorKind, "", e.what()));
        }
        summary_.push_back(s);
    }
    response_["calculations"] = responses;
}

void CIEApp::processAdjustments(const CaseFile& caseFile) {
    Json::Value responses(Json::arrayValue);
    for (Json::ArrayIndex i = 0; i < caseFile.adjustments.size(); ++i) {
        string name = "Adjustment " + std::to_string(i + 1);
        try {
            AdjustmentResult result = applyAdjustment(adjustmentRequestFromJson(caseFile.adjustments[i]));
            adjustments_.push_back(result);
            responses.append(toJson(result));
        } catch (const CalculationError& e) {
            ++adjustmentErrors_;
            StructuredCalculationErrorMessage(name, e.kind(), e.field(), e.message()).log();
            responses.append(toJson(e));
        }
    }
    response_["adjustments"] = responses;
}

void CIEApp::writeResponse() const {
    LOG("write response to " << resultFile_);
    std::ofstream out(resultFile_);
    QL_REQUIRE(out.is_open(), "could not open result file " << resultFile_);
    out << writeJson(response_) << std::endl;
    QL_REQUIRE(out.good(), "error writing result file " << resultFile_);
}

Size CIEApp::errorCount() const {
    Size n = adjustmentErrors_;
    for (auto const& s : summary_)
        if (!s.succeeded)
            ++n;
    return n;
}

Real CIEApp::getRunTime() {
    boost::chrono::duration<double> seconds = boost::chrono::nanoseconds(runTimer_.elapsed().wall);
    return seconds.count();
}

void CIEApp::setupLog(const string& path, const string& file, Size mask, bool logToConsole) {
    closeLog();

    boost::filesystem::path p{path};
    if (!boost::filesystem::exists(p)) {
        boost::filesystem::create_directories(p);
    }
    QL_REQUIRE(boost::filesystem::is_directory(p), "output path '" << path << "' is not a directory.");

    Log::instance().registerLogger(QuantLib::ext::make_shared<FileLogger>(file));
    if (logToConsole)
        Log::instance().registerLogger(QuantLib::ext::make_shared<StderrLogger>());
    Log::instance().setMask(static_cast<unsigned>(mask));
    Log::instance().switchOn();
}

void CIEApp::closeLog() { Log::instance().removeAllLoggers(); }

void CIEApp::console(const string& msg) const {
    if (console_)
        std::cout << msg << std::endl;
}

string CIEApp::version() { return string(CIE_VERSION); }

} // namespace analytics
} // namespace cie
