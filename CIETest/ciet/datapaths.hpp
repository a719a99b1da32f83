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

/*! \file ciet/datapaths.hpp
    \brief Utility to retrieve the path for a unit test's input and output files
*/

#pragma once

#include <boost/filesystem.hpp>

#include <string>

// This is set during test suite setup in the global fixture
extern std::string basePath;

// Expands to give the Boost path for the input directory for the test cpp file in which it is called
#define TEST_INPUT_PATH boost::filesystem::path(basePath) / "input" / boost::filesystem::path(__FILE__).stem()

// Expands to give the Boost path for an input file, with name 'filename', for the test cpp file in which it is called
#define TEST_INPUT_FILE_PATH(filename) TEST_INPUT_PATH / filename

// Expands to give the Boost path for the output directory for the test cpp file in which it is called
// If the path does not exist, then it is created
#define TEST_OUTPUT_PATH                                                                                               \
    []() {                                                                                                             \
        boost::filesystem::path outputPath =                                                                           \
            boost::filesystem::path(basePath) / "output" / boost::filesystem::path(__FILE__).stem();                   \
        if (!boost::filesystem::exists(outputPath))                                                                    \
            boost::filesystem::create_directories(outputPath);                                                         \
        return outputPath;                                                                                             \
    }()

// Expands to give the Boost path for an output file, with name 'filename', for the test cpp file in which it is called
#define TEST_OUTPUT_FILE_PATH(filename) TEST_OUTPUT_PATH / filename

// Gives the string representation of the input path
#define TEST_INPUT (TEST_INPUT_PATH).string()

// Gives the string representation of the input file
#define TEST_INPUT_FILE(filename) (TEST_INPUT_FILE_PATH(filename)).string()

// Gives the string representation of the output path
#define TEST_OUTPUT (TEST_OUTPUT_PATH).string()

// Gives the string representation of the output file
#define TEST_OUTPUT_FILE(filename) (TEST_OUTPUT_FILE_PATH(filename)).string()
