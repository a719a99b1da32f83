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

#include <cied/report/workbookfile.hpp>
#include <cied/utilities/log.hpp>

#include <ql/errors.hpp>

#include <boost/algorithm/string.hpp>
#include <boost/filesystem.hpp>
#include <boost/interprocess/sync/file_lock.hpp>
#include <boost/interprocess/sync/scoped_lock.hpp>
#include <boost/thread/lock_guard.hpp>
#include <boost/thread/mutex.hpp>

#include <algorithm>
#include <fstream>
#include <sstream>

using std::string;
using std::vector;

namespace cie {
namespace data {

const string WorkbookFile::sectionTag = "[Section] ";
const string WorkbookFile::tableTag = "[Table] ";

namespace {

// serialises appends within the process, the file lock does so across processes
boost::mutex& workbookMutex() {
    static boost::mutex m;
    return m;
}

// Removes the temporary file on every path unless it was committed over the target
class StagedFile {
public:
    StagedFile(const boost::filesystem::path& target)
        : target_(target), committed_(false) {
        boost::filesystem::path dir = target.parent_path();
        path_ = dir / boost::filesystem::unique_path(target.filename().string() + ".%%%%-%%%%-%%%%.tmp");
        if (boost::filesystem::exists(target))
            boost::filesystem::copy_file(target, path_);
        else
            std::ofstream(path_.string().c_str(), std::ios::out | std::ios::trunc);
        QL_REQUIRE(boost::filesystem::exists(path_), "could not create staging file " << path_.string());
    }

    ~StagedFile() {
        if (!committed_) {
            boost::system::error_code ec;
            boost::filesystem::remove(path_, ec);
            if (ec) {
                ALOG("could not remove staging file " << path_.string() << ": " << ec.message());
            }
        }
    }

    const boost::filesystem::path& path() const { return path_; }

    void commit() {
        boost::filesystem::rename(path_, target_);
        committed_ = true;
    }

private:
    boost::filesystem::path target_, path_;
    bool committed_;
};

void appendLine(const boost::filesystem::path& p, const string& line) {
    std::ofstream out(p.string().c_str(), std::ios::out | std::ios::app);
    QL_REQUIRE(out.is_open(), "could not open " << p.string() << " for appending");
    out << line << "\n";
    out.close();
    QL_REQUIRE(!out.fail(), "could not write to " << p.string());
}

} // namespace

WorkbookFile::WorkbookFile(const string& filename) : filename_(filename) {
    QL_REQUIRE(!filename_.empty(), "WorkbookFile: empty file name");
}

void WorkbookFile::appendSection(const string& name, const Tables& tables) {
    QL_REQUIRE(!name.empty(), "WorkbookFile: empty section name");
    QL_REQUIRE(name.find_first_of("\r\n") == string::npos, "WorkbookFile: section name '" << name
                                                                                         << "' spans lines");
    QL_REQUIRE(!tables.empty(), "WorkbookFile: section '" << name << "' has no tables");

    boost::filesystem::path target(filename_);
    string lockName = filename_ + ".lock";

    boost::lock_guard<boost::mutex> lock(workbookMutex());
    // file_lock requires an existing file
    std::ofstream(lockName.c_str(), std::ios::out | std::ios::app);
    boost::interprocess::file_lock fileLock(lockName.c_str());
    boost::interprocess::scoped_lock<boost::interprocess::file_lock> processLock(fileLock);

    QL_REQUIRE(!hasSection(name), "WorkbookFile '" << filename_ << "' already has a section '" << name << "'");

    StagedFile staged(target);
    appendLine(staged.path(), sectionTag + name);
    for (auto const& t : tables) {
        QL_REQUIRE(t.second, "WorkbookFile: table '" << t.first << "' in section '" << name << "' is null");
        appendLine(staged.path(), tableTag + t.first);
        t.second->toFile(staged.path().string(), ',', true, '\0', "#N/A", true);
    }
    staged.commit();

    LOG("WorkbookFile '" << filename_ << "': appended section '" << name << "' with " << tables.size()
                         << " tables");
}

vector<string> WorkbookFile::lines() const {
    vector<string> result;
    std::ifstream in(filename_.c_str());
    if (!in.is_open())
        return result;
    string line;
    while (std::getline(in, line))
        result.push_back(line);
    return result;
}

vector<string> WorkbookFile::sections() const {
    vector<string> result;
    for (auto const& l : lines()) {
        if (boost::starts_with(l, sectionTag))
            result.push_back(l.substr(sectionTag.size()));
    }
    return result;
}

bool WorkbookFile::hasSection(const string& name) const {
    vector<string> s = sections();
    return std::find(s.begin(), s.end(), name) != s.end();
}

string WorkbookFile::section(const string& name) const {
    std::ostringstream out;
    bool inSection = false, found = false;
    for (auto const& l : lines()) {
        if (boost::starts_with(l, sectionTag)) {
            inSection = l.substr(sectionTag.size()) == name;
            found = found || inSection;
        }
        if (inSection)
            out << l << "\n";
    }
    QL_REQUIRE(found, "WorkbookFile '" << filename_ << "' has no section '" << name << "'");
    return out.str();
}

} // namespace data
} // namespace cie
