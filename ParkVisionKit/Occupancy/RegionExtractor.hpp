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

#include "Math/Homography.hpp"
#include "Math/Quadrilateral.hpp"
#include "Diagnostics/Error.hpp"
#include "Utility/Properties/Configurable.hpp"

namespace pvk
{

    struct RegionExtractorSettings
    {
        int canonical_size = 1000;

        // Resample the source image into the canonical frame.
        bool warp_image = true;

        // Copy out the region's bounding box, the region must then lie within the image.
        bool crop_source = false;
    };


    struct WarpedRegion
    {
        cv::Mat image;
        cv::Mat crop;
        std::vector<cv::Point> points;
        Homography warp;
    };


    class RegionExtractor final : public Configurable<RegionExtractorSettings>
    {
    public:

        explicit RegionExtractor(const RegionExtractorSettings& settings = {});

        void configure(const RegionExtractorSettings& settings) override;

        // Keeps the points enclosed by the region, ordered by y, and maps them along with
        // the image into the canonical frame. The output is untouched if an error occurs.
        std::optional<Error> extract(
            const cv::Mat& image,
            const Quadrilateral& region,
            const std::vector<cv::Point>& points,
            WarpedRegion& output
        ) const;

    };

}
