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

#include <opencv2/core.hpp>

#include "Directives.hpp"

#include "Diagnostics/Error.hpp"
#include "Diagnostics/Logging/Logger.hpp"
#include "Diagnostics/Logging/CSVLogger.hpp"

#include "Math/Math.hpp"
#include "Math/Homography.hpp"
#include "Math/Quadrilateral.hpp"

#include "Occupancy/Banding.hpp"
#include "Occupancy/Calibration.hpp"
#include "Occupancy/RegionExtractor.hpp"
#include "Occupancy/QueueEvaluator.hpp"
#include "Occupancy/ParkingEvaluator.hpp"

#include "Data/ImageSource.hpp"

#include "Vision/YoloDetector.hpp"
#include "Vision/VehicleDetector.hpp"

#include "Utility/Timing/Time.hpp"
#include "Utility/Timing/Stopwatch.hpp"
#include "Utility/Properties/Configurable.hpp"
