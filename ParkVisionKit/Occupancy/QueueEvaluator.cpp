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

#include "QueueEvaluator.hpp"

#include "Directives.hpp"
#include "Banding.hpp"

namespace pvk
{

//---------------------------------------------------------------------------------------------------------------------

    QueueEvaluator::QueueEvaluator(const Calibration& calibration, const bool warp_image)
        : m_Calibration(calibration),
          m_Extractor({calibration.canonical_size, warp_image, false})
    {
        PVK_ASSERT(!calibration.validate().has_value());
    }

//---------------------------------------------------------------------------------------------------------------------

    std::optional<Error> QueueEvaluator::evaluate(
        const cv::Mat& image,
        const std::vector<cv::Point>& car_points,
        int& count
    )
    {
        WarpedRegion region;
        if(auto error = m_Extractor.extract(image, m_Calibration.queue_region, car_points, region); error.has_value())
            return error;

        count = count_queue(region.points, m_Calibration.queue_near_threshold, m_Calibration.queue_gap_threshold);
        m_Region = std::move(region);

        PVK_LOG_DEBUG("Queue holds %d vehicles", count);
        return std::nullopt;
    }

//---------------------------------------------------------------------------------------------------------------------

    const WarpedRegion& QueueEvaluator::region() const
    {
        return m_Region;
    }

//---------------------------------------------------------------------------------------------------------------------

    const Calibration& QueueEvaluator::calibration() const
    {
        return m_Calibration;
    }

//---------------------------------------------------------------------------------------------------------------------

}
