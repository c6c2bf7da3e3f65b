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

#include <array>
#include <vector>
#include <optional>
#include <opencv2/core.hpp>

#include "Diagnostics/Error.hpp"

namespace pvk
{

    struct Line
    {
        cv::Point start, end;

        bool is_horizontal() const;
    };


    // A calibrated four-cornered region in image space. The corners are named rather than
    // ordered, they need not form a convex region or a metrically sensible rectangle.
	class Quadrilateral
	{
	public:

        // The canonical top-down frame of the given side length. The region's bottom edge
        // maps onto y = 0 and its top edge onto y = size, left to right along x.
        static Quadrilateral Canonical(const int size);

        // Vertices are expected in edge order: top-left, top-right, bottom-right, bottom-left.
        static std::optional<Error> FromVertices(const std::vector<cv::Point>& vertices, Quadrilateral& quad);


        Quadrilateral();

		Quadrilateral(
            const cv::Point& top_left,
            const cv::Point& top_right,
            const cv::Point& bottom_right,
            const cv::Point& bottom_left
        );


        const cv::Point& top_left() const;

        const cv::Point& top_right() const;

        const cv::Point& bottom_right() const;

        const cv::Point& bottom_left() const;


        std::array<cv::Point, 4> vertices() const;

        std::array<Line, 4> edges() const;

        cv::Rect bounding_rect() const;

        cv::Point2d centroid() const;


		bool encloses(const cv::Point& point) const;

        std::vector<cv::Point> enclosed(const std::vector<cv::Point>& points) const;


        bool operator==(const Quadrilateral& other) const;

        bool operator!=(const Quadrilateral& other) const;

	private:
		cv::Point m_TopLeft, m_TopRight, m_BottomRight, m_BottomLeft;
	};

}
