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
#include <optional>
#include <opencv2/core.hpp>

#include "Diagnostics/Error.hpp"

namespace pvk
{

    class VehicleDetector
    {
    public:

        virtual ~VehicleDetector() = default;

        // Outputs the bounding box of every vehicle found, the output is left untouched on error.
        virtual std::optional<Error> detect(const cv::Mat& frame, std::vector<cv::Rect>& vehicles) = 0;

    };

    std::vector<cv::Point> centers_of(const std::vector<cv::Rect>& boxes);

}
