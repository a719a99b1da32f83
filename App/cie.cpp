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
#include <ciea/app/parameters.hpp>

#include <cied/version.hpp>

#include <iostream>

using namespace std;
using namespace cie::data;
using namespace cie::analytics;

int main(int argc, char** argv) {

    if (argc == 2 && (string(argv[1]) == "-v" || string(argv[1]) == "--version")) {
        cout << "CIE version " << CIE_VERSION << endl;
        exit(0);
    }

    if (argc != 2) {
        std::cout << endl << "usage: cie path/to/cie.xml" << endl << endl;
        return -1;
    }

    string inputFile(argv[1]);

    try {
        auto params = QuantLib::ext::make_shared<Parameters>();
        params->fromFile(inputFile);
        CIEApp cie(params, true);
        cie.run();
        // a run with failed requests still completes, the exit code tells the caller to look at the response
        return cie.errorCount() == 0 ? 0 : 1;
    } catch (const exception& e) {
        cout << endl << "an error occurred: " << e.what() << endl;
        return -1;
    }
}
