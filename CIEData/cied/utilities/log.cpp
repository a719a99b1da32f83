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

#include <cied/utilities/log.hpp>
#include <cied/utilities/to_string.hpp>

#include <ql/errors.hpp>

#include <boost/filesystem/path.hpp>

#include <ctime>

using namespace std;

namespace cie {
namespace data {

const string StderrLogger::name = "StderrLogger";
const string FileLogger::name = "FileLogger";
const string BufferLogger::name = "BufferLogger";

FileLogger::FileLogger(const string& filename) : Logger(name), filename_(filename) {
    fout_.open(filename.c_str(), ios_base::out);
    QL_REQUIRE(fout_.is_open(), "Error opening file " << filename);
    fout_.setf(ios::fixed, ios::floatfield);
    fout_.setf(ios::showpoint);
}

FileLogger::~FileLogger() {
    if (fout_.is_open())
        fout_.close();
}

void FileLogger::log(unsigned, const string& msg) {
    if (fout_.is_open())
        fout_ << msg << endl;
}

void BufferLogger::log(unsigned level, const string& msg) {
    if (level <= minLevel_)
        buffer_.push_back(msg);
}

bool BufferLogger::hasNext() { return position_ < buffer_.size(); }

string BufferLogger::next() {
    QL_REQUIRE(hasNext(), "BufferLogger has no more messages");
    string msg = buffer_[position_++];
    if (position_ == buffer_.size()) {
        buffer_.clear();
        position_ = 0;
    }
    return msg;
}

Log::Log() : loggers_(), enabled_(false), mask_(255), ls_() {
    ls_.setf(ios::fixed, ios::floatfield);
    ls_.setf(ios::showpoint);
}

void Log::registerLogger(const QuantLib::ext::shared_ptr<Logger>& logger) {
    boost::unique_lock<boost::shared_mutex> lock(mutex_);
    loggers_[logger->name()] = logger;
}

bool Log::hasLogger(const string& name) const {
    boost::shared_lock<boost::shared_mutex> lock(mutex_);
    return loggers_.find(name) != loggers_.end();
}

QuantLib::ext::shared_ptr<Logger>& Log::logger(const string& name) {
    boost::shared_lock<boost::shared_mutex> lock(mutex_);
    auto it = loggers_.find(name);
    QL_REQUIRE(it != loggers_.end(), "No logger found with name " << name);
    return it->second;
}

void Log::removeLogger(const string& name) {
    boost::unique_lock<boost::shared_mutex> lock(mutex_);
    auto it = loggers_.find(name);
    if (it != loggers_.end()) {
        loggers_.erase(it);
    } else {
        QL_FAIL("No logger found with name " << name);
    }
}

void Log::removeAllLoggers() {
    boost::unique_lock<boost::shared_mutex> lock(mutex_);
    loggers_.clear();
}

void Log::header(unsigned m, const char* filename, int lineNo) {
    // 1. Time stamp
    time_t now = time(nullptr);
    char buf[32];
    strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", localtime(&now));
    ls_ << buf << " ";

    // 2. Level
    switch (m) {
    case CIE_ALERT:
        ls_ << "ALERT    ";
        break;
    case CIE_CRITICAL:
        ls_ << "CRITICAL ";
        break;
    case CIE_ERROR:
        ls_ << "ERROR    ";
        break;
    case CIE_WARNING:
        ls_ << "WARNING  ";
        break;
    case CIE_NOTICE:
        ls_ << "NOTICE   ";
        break;
    case CIE_DEBUG:
        ls_ << "DEBUG    ";
        break;
    case CIE_DATA:
        ls_ << "DATA     ";
        break;
    }

    // 3. source file:line, only the file name is kept
    ls_ << "(" << boost::filesystem::path(filename).filename().string() << ":" << lineNo << ") : ";
}

void Log::log(unsigned m) {
    string msg = ls_.str();
    for (auto& l : loggers_)
        l.second->log(m, msg);
    // clear the stream
    ls_.str(string());
    ls_.clear();
}

StructuredMessage::StructuredMessage(const Category& category, const Group& group, const string& message,
                                     const map<string, string>& subFields)
    : category_(category), group_(group), message_(message), subFields_(subFields) {}

void StructuredMessage::log() const {
    if (category_ == Category::Error) {
        ELOG(msg());
    } else if (category_ == Category::Warning) {
        WLOG(msg());
    } else {
        LOG(msg());
    }
}

string StructuredMessage::json() const {
    std::ostringstream out;
    out << "{ \"category\":\"" << category_ << "\", \"group\":\"" << group_ << "\", \"message\":\""
        << jsonify(message_) << "\"";
    for (const auto& p : subFields_)
        out << ", \"" << p.first << "\":\"" << jsonify(p.second) << "\"";
    out << " }";
    return out.str();
}

ostream& operator<<(ostream& out, const StructuredMessage::Category& category) {
    switch (category) {
    case StructuredMessage::Category::Error:
        return out << "Error";
    case StructuredMessage::Category::Warning:
        return out << "Warning";
    case StructuredMessage::Category::Unknown:
        return out << "UnknownType";
    default:
        return out << "Unknown StructuredMessage category";
    }
}

ostream& operator<<(ostream& out, const StructuredMessage::Group& group) {
    switch (group) {
    case StructuredMessage::Group::Request:
        return out << "Request";
    case StructuredMessage::Group::RateTable:
        return out << "Rate Table";
    case StructuredMessage::Group::Calculation:
        return out << "Calculation";
    case StructuredMessage::Group::Allocation:
        return out << "Allocation";
    case StructuredMessage::Group::Report:
        return out << "Report";
    case StructuredMessage::Group::Configuration:
        return out << "Configuration";
    case StructuredMessage::Group::Unknown:
        return out << "UnknownType";
    default:
        return out << "Unknown StructuredMessage group";
    }
}

ostream& operator<<(ostream& out, const StructuredMessage& sm) { return out << sm.msg(); }

} // namespace data
} // namespace cie
