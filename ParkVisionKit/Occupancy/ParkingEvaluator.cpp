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

#include "ParkingEvaluator.hpp"

#include "Directives.hpp"
#include "Banding.hpp"

namespace pvk
{

//---------------------------------------------------------------------------------------------------------------------

    ParkingEvaluator::ParkingEvaluator(const Calibration& calibration, const bool warp_image)
        : m_Calibration(calibration),
          m_Extractor({calibration.canonical_size, warp_image, false})
    {
        PVK_ASSERT(!calibration.validate().has_value());
    }

//---------------------------------------------------------------------------------------------------------------------

    std::optional<Error> ParkingEvaluator::evaluate(
        const cv::Mat& image,
        const std::vector<cv::Point>& car_points,
        std::vector<bool>& slots
    )
    {
        PVK_LOG_TRACE("Starting parking space availability check");

        WarpedRegion region;
        if(auto error = m_Extractor.extract(image, m_Calibration.parking_region, car_points, region); error.has_value())
            return error;

        PVK_LOG_TRACE("Checking parking spaces against %zu warped car points", region.points.size());
        slots = check_occupancy(region.points, m_Calibration.parking_bands, m_Calibration.canonical_size);
        m_Region = std::move(region);

        return std::nullopt;
    }

//---------------------------------------------------------------------------------------------------------------------

    const WarpedRegion& ParkingEvaluator::region() const
    {
        return m_Region;
    }

//---------------------------------------------------------------------------------------------------------------------

    const Calibration& ParkingEvaluator::calibration() const
    {
        return m_Calibration;
    }

//---------------------------------------------------------------------------------------------------------------------

    size_t ParkingEvaluator::slot_count() const
    {
        return m_Calibration.parking_bands.size();
    }

//---------------------------------------------------------------------------------------------------------------------

}
