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

/*! \file ciet/fileutilities.hpp
    \brief File utilities for use in unit tests
*/

#pragma once

#include <boost/filesystem.hpp>
#include <boost/test/unit_test.hpp>

#include <algorithm>
#include <fstream>
#include <iterator>
#include <sstream>
#include <string>

namespace cie {
namespace test {

// Remove a test output file or directory, returns false if the removal failed
inline bool clearOutput(const boost::filesystem::path& outputPath) {

    if (!boost::filesystem::exists(outputPath))
        return true;

    try {
        boost::filesystem::remove_all(outputPath);
        return true;
    } catch (boost::filesystem::filesystem_error& err) {
        BOOST_TEST_MESSAGE("The attempt to remove the output path, " << outputPath << ", failed with error "
                                                                     << err.what());
        return false;
    }
}

// Byte by byte comparison of two files
inline bool compareFiles(const std::string& p1, const std::string& p2) {

    std::ifstream f1(p1, std::ifstream::binary | std::ifstream::ate);
    std::ifstream f2(p2, std::ifstream::binary | std::ifstream::ate);

    if (f1.fail() || f2.fail()) {
        BOOST_TEST_MESSAGE("Attempt to compare file, " << p1 << ", with file, " << p2 << " failed.");
        return false;
    }

    if (f1.tellg() != f2.tellg()) {
        BOOST_TEST_MESSAGE("File size of " << p1 << " is not equal to file size of " << p2 << ".");
        return false;
    }

    f1.seekg(0, std::ifstream::beg);
    f2.seekg(0, std::ifstream::beg);
    return std::equal(std::istreambuf_iterator<char>(f1.rdbuf()), std::istreambuf_iterator<char>(),
                      std::istreambuf_iterator<char>(f2.rdbuf()));
}

// Whole file content, empty if the file cannot be read
inline std::string readFile(const std::string& p) {
    std::ifstream f(p, std::ifstream::binary);
    std::ostringstream oss;
    oss << f.rdbuf();
    return oss.str();
}

} // namespace test
} // namespace cie
