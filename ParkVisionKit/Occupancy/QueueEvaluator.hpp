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

#include "Calibration.hpp"
#include "RegionExtractor.hpp"
#include "Diagnostics/Error.hpp"

namespace pvk
{

    class QueueEvaluator
    {
    public:

        explicit QueueEvaluator(const Calibration& calibration, const bool warp_image = false);

        std::optional<Error> evaluate(
            const cv::Mat& image,
            const std::vector<cv::Point>& car_points,
            int& count
        );

        const WarpedRegion& region() const;

        const Calibration& calibration() const;

    private:
        const Calibration m_Calibration;
        RegionExtractor m_Extractor;
        WarpedRegion m_Region;
    };

}
