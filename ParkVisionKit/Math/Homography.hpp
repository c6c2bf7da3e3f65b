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

#include "Quadrilateral.hpp"
#include "Diagnostics/Error.hpp"

namespace pvk
{

	class Homography
	{
	public:

        // Maps each named corner of the source onto the equally named corner of the destination.
        static std::optional<Error> Between(
            const Quadrilateral& source,
            const Quadrilateral& destination,
            Homography& homography
        );

        // Positional correspondence, source[i] maps onto destination[i].
        static std::optional<Error> Between(
            const std::vector<cv::Point2d>& source,
            const std::vector<cv::Point2d>& destination,
            Homography& homography
        );

        // Maps the source points onto the canonical square corners (0,0), (S,0), (S,S), (0,S).
        static std::optional<Error> Between(
            const std::vector<cv::Point2d>& source,
            Homography& homography,
            const int canonical_size = 1000
        );

        static std::vector<cv::Point2d> CanonicalCorners(const int canonical_size);

		Homography();

		explicit Homography(const cv::Mat& matrix);

        Homography(Homography&& other) noexcept;

        Homography(const Homography& other);


		cv::Point2d transform(const cv::Point2d& point) const;


        // Integer pixel mapping, the projected coordinates are truncated towards zero.
        cv::Point warp_point(const cv::Point& point) const;

        std::vector<cv::Point> warp_points(const std::vector<cv::Point>& points) const;

		void warp(const cv::Mat& src, cv::Mat& dst, const cv::Size& output_size) const;


        Homography invert() const;

        bool is_identity() const;

		bool is_affine() const;


        Homography& operator=(const Homography& other);

        Homography& operator=(Homography&& other) noexcept;

	private:
		cv::Mat m_Matrix;
	};

}
