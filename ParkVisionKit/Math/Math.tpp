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

#include "Directives.hpp"

namespace pvk
{

//---------------------------------------------------------------------------------------------------------------------

    template<typename T>
    inline T cross_2d(const cv::Point_<T>& point, const cv::Point_<T>& l1, const cv::Point_<T>& l2)
    {
        // Twice the signed area of the triangle (l1, l2, point), zero when collinear.
        return (l1.x - l2.x) * (point.y - l2.y) - (l1.y - l2.y) * (point.x - l2.x);
    }

//---------------------------------------------------------------------------------------------------------------------

	template<typename T>
    inline bool between(const T& value, const T& min, const T& max)
	{
		PVK_ASSERT(min <= max);

		return (value >= min) && (value <= max);
	}

//---------------------------------------------------------------------------------------------------------------------

}
