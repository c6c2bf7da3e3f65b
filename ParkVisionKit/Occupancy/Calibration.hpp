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

#include <string>
#include <vector>
#include <optional>

#include "Math/Quadrilateral.hpp"
#include "Diagnostics/Error.hpp"

namespace pvk
{

    // Immutable camera calibration, all thresholds are in canonical frame pixels.
    struct Calibration
    {
        static Calibration Default();

        int working_width = 1000;
        int canonical_size = 1000;

        Quadrilateral parking_region;
        std::vector<int> parking_bands;

        Quadrilateral queue_region;
        int queue_near_threshold = 120;
        int queue_gap_threshold = 150;

        std::optional<Error> validate() const;
    };

    // The format is deduced from the file extension (.yml, .yaml, .json, .xml).
    std::optional<Error> load_calibration(const std::string& path, Calibration& calibration);

    std::optional<Error> save_calibration(const std::string& path, const Calibration& calibration);

}
