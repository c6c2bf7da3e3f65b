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

#include "VehicleDetector.hpp"

namespace pvk
{

//---------------------------------------------------------------------------------------------------------------------

    std::vector<cv::Point> centers_of(const std::vector<cv::Rect>& boxes)
    {
        std::vector<cv::Point> centers;
        centers.reserve(boxes.size());

        for(const auto& box : boxes)
            centers.emplace_back(box.x + box.width / 2, box.y + box.height / 2);

        return centers;
    }

//---------------------------------------------------------------------------------------------------------------------

}
