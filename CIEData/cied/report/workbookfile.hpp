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

/*! \file cied/report/workbookfile.hpp
    \brief Text workbook holding one named section per calculation
    \ingroup report
*/

#pragma once

#include <cied/report/inmemoryreport.hpp>

#include <ql/shared_ptr.hpp>

#include <string>
#include <utility>
#include <vector>

namespace cie {
namespace data {

/*! A workbook is a single text file made of named sections, each section holding one or more titled csv tables:
    <pre>
    [Section] Loan interest
    [Table] Request
    #Field,Value
    ...
    [Table] Audit
    #Row,Type,StartDate,...
    </pre>

    Sections are only ever appended. An append builds the new content in a temporary file next to the workbook
    and renames it over the workbook, holding an in-process mutex and a cross-process file lock meanwhile. A reader
    therefore sees either the workbook before or after the append, never a partial section, and a failing append
    leaves the workbook untouched.

    Section names are unique within a workbook.
    \ingroup report
*/
class WorkbookFile {
public:
    typedef std::vector<std::pair<std::string, QuantLib::ext::shared_ptr<InMemoryReport>>> Tables;

    static const std::string sectionTag;
    static const std::string tableTag;

    explicit WorkbookFile(const std::string& filename);

    //! Append a complete section, throws if the name is empty, multi line or already taken
    void appendSection(const std::string& name, const Tables& tables);

    //! Section names in file order, empty if the workbook does not exist yet
    std::vector<std::string> sections() const;
    bool hasSection(const std::string& name) const;
    //! The full text of a section, tag line included
    std::string section(const std::string& name) const;

    const std::string& filename() const { return filename_; }

private:
    std::vector<std::string> lines() const;

    std::string filename_;
};

} // namespace data
} // namespace cie
