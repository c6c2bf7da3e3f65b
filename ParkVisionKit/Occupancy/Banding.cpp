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

#include "Banding.hpp"

#include <algorithm>

#include "Math/Math.hpp"
#include "Directives.hpp"

namespace pvk
{

//---------------------------------------------------------------------------------------------------------------------

    std::vector<bool> check_occupancy(
        const std::vector<cv::Point>& warped_points,
        const std::vector<int>& thresholds,
        const int sentinel
    )
    {
        PVK_ASSERT(is_strictly_increasing(thresholds));
        PVK_ASSERT_IF(!thresholds.empty(), thresholds.back() <= sentinel);

        std::vector<bool> bands;
        bands.reserve(thresholds.size());

        for(size_t i = 0; i < thresholds.size(); i++)
        {
            const int lower = thresholds[i];
            const int upper = (i + 1 < thresholds.size()) ? thresholds[i + 1] : sentinel;

            const bool occupied = std::any_of(
                warped_points.begin(),
                warped_points.end(),
                [&](const cv::Point& point){ return between(point.y, lower, upper); }
            );

            PVK_LOG_TRACE("Band %zu [%d, %d] is %s", i, lower, upper, occupied ? "occupied" : "free");
            bands.push_back(occupied);
        }

        std::reverse(bands.begin(), bands.end());
        return bands;
    }

//---------------------------------------------------------------------------------------------------------------------

    int count_queue(
        const std::vector<cv::Point>& warped_points,
        const int near_threshold,
        const int gap_threshold
    )
    {
        std::vector<cv::Point> ordered_points(warped_points);
        std::stable_sort(
            ordered_points.begin(),
            ordered_points.end(),
            [](const cv::Point& a, const cv::Point& b){ return a.y < b.y; }
        );

        // The queue is anchored at its head, the y = 0 edge of the frame.
        int count = 0;
        cv::Point last_accepted(0, 0);
        for(const auto& point : ordered_points)
        {
            if(point.y >= near_threshold && point.y - last_accepted.y >= gap_threshold)
            {
                PVK_LOG_TRACE(
                    "Queue ends before (%d, %d), gap of %d from the last vehicle",
                    point.x, point.y, point.y - last_accepted.y
                );
                break;
            }

            last_accepted = point;
            count++;
        }

        return count;
    }

//---------------------------------------------------------------------------------------------------------------------

    bool is_strictly_increasing(const std::vector<int>& thresholds)
    {
        return std::adjacent_find(
            thresholds.begin(),
            thresholds.end(),
            [](const int a, const int b){ return a >= b; }
        ) == thresholds.end();
    }

//---------------------------------------------------------------------------------------------------------------------

}
