//    *************************** ParkVisionKit ****************************
//    Copyright (C) 2026  The ParkVisionKit Authors
//
//    This program is free software: you can redistribute it and/or modify
//    it under the terms of the GNU General Public License as published by
//    the Free Software Foundation, either version 3 of the License, or
//    (at your option) any later version.
//
//    This program is distributed in the hope that it will be useful,
//    but WITHOUT ANY WARRANTY; without even the implied warranty of
//    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
//    GNU General Public License for more details.
//
//    You should have received a copy of the GNU General Public License
//    along with this program.  If not, see <https://www.gnu.org/licenses/>.
// 	  **********************************************************************

#pragma once

#include <vector>
#include <opencv2/core.hpp>

namespace pvk
{

    // Band i spans [thresholds[i], thresholds[i + 1]], the last band spans [thresholds.back(), sentinel].
    // Both ends are inclusive, so a point exactly on a shared boundary occupies both bands. The band
    // states are returned in reverse order, the last band is reported first.
    std::vector<bool> check_occupancy(
        const std::vector<cv::Point>& warped_points,
        const std::vector<int>& thresholds,
        const int sentinel
    );

    // Counts the contiguous run of points, ordered by y, which are either closer than the
    // near threshold or within the gap threshold of the previously accepted point. The run
    // ends at the first point which fails both tests.
    int count_queue(
        const std::vector<cv::Point>& warped_points,
        const int near_threshold,
        const int gap_threshold
    );

    bool is_strictly_increasing(const std::vector<int>& thresholds);

}
