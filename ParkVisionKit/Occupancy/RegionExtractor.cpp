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

#include "RegionExtractor.hpp"

#include <algorithm>

#include "Directives.hpp"

namespace pvk
{

//---------------------------------------------------------------------------------------------------------------------

    RegionExtractor::RegionExtractor(const RegionExtractorSettings& settings)
    {
        this->configure(settings);
    }

//---------------------------------------------------------------------------------------------------------------------

    void RegionExtractor::configure(const RegionExtractorSettings& settings)
    {
        PVK_ASSERT(settings.canonical_size > 0);

        m_Settings = settings;
    }

//---------------------------------------------------------------------------------------------------------------------

    std::optional<Error> RegionExtractor::extract(
        const cv::Mat& image,
        const Quadrilateral& region,
        const std::vector<cv::Point>& points,
        WarpedRegion& output
    ) const
    {
        PVK_LOG_TRACE("Extracting region with %zu candidate points", points.size());

        if(image.empty() && (m_Settings.warp_image || m_Settings.crop_source))
            return Error{ErrorKind::InvalidArgument, "Cannot extract a region from an empty image"};

        cv::Rect crop_rect;
        if(m_Settings.crop_source)
        {
            crop_rect = region.bounding_rect();
            const cv::Rect image_rect(0, 0, image.cols, image.rows);

            if((crop_rect & image_rect) != crop_rect)
            {
                return Error{
                    ErrorKind::OutOfBounds,
                    cv::format(
                        "Region bounds (%d, %d, %dx%d) exceed the %dx%d image",
                        crop_rect.x, crop_rect.y, crop_rect.width, crop_rect.height,
                        image.cols, image.rows
                    )
                };
            }
        }

        // The region's bottom edge becomes the y = 0 edge of the canonical frame.
        Homography warp;
        if(auto error = Homography::Between(region, Quadrilateral::Canonical(m_Settings.canonical_size), warp); error.has_value())
        {
            PVK_LOG_ERROR("Failed to build the region warp, %s", error->describe().c_str());
            return error;
        }

        std::vector<cv::Point> ordered_points(points);
        std::stable_sort(
            ordered_points.begin(),
            ordered_points.end(),
            [](const cv::Point& a, const cv::Point& b){ return a.y < b.y; }
        );

        WarpedRegion result;
        result.points = warp.warp_points(region.enclosed(ordered_points));

        if(m_Settings.warp_image)
        {
            PVK_LOG_TRACE("Applying perspective transformation to the image");
            warp.warp(image, result.image, {m_Settings.canonical_size, m_Settings.canonical_size});
        }

        if(m_Settings.crop_source)
            result.crop = image(crop_rect).clone();

        result.warp = std::move(warp);
        output = std::move(result);

        PVK_LOG_DEBUG("Region holds %zu of %zu points", output.points.size(), points.size());
        return std::nullopt;
    }

//---------------------------------------------------------------------------------------------------------------------

}
