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

#include <ciea/engine/periodsegmenter.hpp>
#include <cied/utilities/errors.hpp>
#include <cied/utilities/log.hpp>
#include <cied/utilities/to_string.hpp>

#include <ql/errors.hpp>

#include <algorithm>

using namespace cie::data;
using QuantLib::Date;
using QuantLib::Size;
using std::vector;

namespace cie {
namespace analytics {

vector<Date> PeriodSegmenter::breakPoints(const CalculationRequest& request, const ModeCalculator& calculator) const {
    const Date& start = request.startDate;
    const Date& end = request.endDate;
    QL_REQUIRE(start <= end, "PeriodSegmenter: start date " << to_string(start) << " after end date "
                                                            << to_string(end));

    vector<Date> points;
    points.push_back(start);
    for (Size i = 0; i < request.payments.size(); ++i) {
        const Date& d = request.payments[i].date;
        CIE_REQUIRE(d >= start && d <= end, InvalidPaymentDateError, "payments[" + to_string(i) + "].date",
                    "payment date " << to_string(d) << " outside [" << to_string(start) << ", " << to_string(end)
                                    << "]");
        points.push_back(d + 1);
    }
    for (auto const& d : calculator.breakDates(start, end)) {
        QL_REQUIRE(d > start && d <= end + 1, "PeriodSegmenter: break date " << to_string(d) << " outside ("
                                                                             << to_string(start) << ", "
                                                                             << to_string(end) << "]");
        points.push_back(d);
    }
    points.push_back(end + 1);

    std::sort(points.begin(), points.end());
    points.erase(std::unique(points.begin(), points.end()), points.end());
    return points;
}

vector<PeriodSegmenter::Span> PeriodSegmenter::segment(const CalculationRequest& request,
                                                       const ModeCalculator& calculator) const {
    vector<Date> points = breakPoints(request, calculator);
    vector<Span> spans;
    for (Size i = 1; i < points.size(); ++i)
        spans.push_back(std::make_pair(points[i - 1], points[i] - 1));
    DLOG("segmented [" << to_string(request.startDate) << ", " << to_string(request.endDate) << "] into "
                       << spans.size() << " periods");
    return spans;
}

} // namespace analytics
} // namespace cie
