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

#include "Homography.hpp"

#include <cmath>
#include <algorithm>
#include <opencv2/imgproc.hpp>

#include "Math/Math.hpp"
#include "Directives.hpp"

namespace pvk
{

//---------------------------------------------------------------------------------------------------------------------

    // Relative tolerance used to classify corners as collinear and matrices as singular.
    constexpr double DEGENERACY_TOLERANCE = 1e-9;

//---------------------------------------------------------------------------------------------------------------------

    static bool has_collinear_triplet(const std::vector<cv::Point2d>& points)
    {
        PVK_ASSERT(points.size() == 4);

        double extent = 1.0;
        for(const auto& point : points)
            extent = std::max({extent, std::abs(point.x), std::abs(point.y)});

        const double tolerance = DEGENERACY_TOLERANCE * extent * extent;

        // Every triplet is the set of four corners with one left out.
        for(size_t skip = 0; skip < points.size(); skip++)
        {
            std::vector<cv::Point2d> triplet;
            for(size_t i = 0; i < points.size(); i++)
                if(i != skip) triplet.push_back(points[i]);

            if(std::abs(cross_2d(triplet[2], triplet[0], triplet[1])) <= tolerance)
                return true;
        }
        return false;
    }

//---------------------------------------------------------------------------------------------------------------------

    std::optional<Error> Homography::Between(
        const Quadrilateral& source,
        const Quadrilateral& destination,
        Homography& homography
    )
    {
        const auto src_corners = source.vertices();
        const auto dst_corners = destination.vertices();

        // vertices() has a fixed naming order, so equal positions are equal names.
        return Between(
            std::vector<cv::Point2d>(src_corners.begin(), src_corners.end()),
            std::vector<cv::Point2d>(dst_corners.begin(), dst_corners.end()),
            homography
        );
    }

//---------------------------------------------------------------------------------------------------------------------

    std::optional<Error> Homography::Between(
        const std::vector<cv::Point2d>& source,
        const std::vector<cv::Point2d>& destination,
        Homography& homography
    )
    {
        if(source.size() != 4 || destination.size() != 4)
        {
            return Error{
                ErrorKind::InvalidArgument,
                cv::format(
                    "A perspective warp needs exactly 4 source and 4 destination points, got %zu and %zu",
                    source.size(),
                    destination.size()
                )
            };
        }

        if(has_collinear_triplet(source))
            return Error{ErrorKind::DegenerateConfiguration, "Three of the source corners are collinear"};

        if(has_collinear_triplet(destination))
            return Error{ErrorKind::DegenerateConfiguration, "Three of the destination corners are collinear"};

        cv::Point2f src_points[4], dst_points[4];
        for(size_t i = 0; i < 4; i++)
        {
            src_points[i] = cv::Point2f(source[i]);
            dst_points[i] = cv::Point2f(destination[i]);
        }

        cv::Mat matrix = cv::getPerspectiveTransform(src_points, dst_points);

        if(matrix.empty() || !cv::checkRange(matrix) || std::abs(cv::determinant(matrix)) <= DEGENERACY_TOLERANCE)
            return Error{ErrorKind::DegenerateConfiguration, "The perspective warp is singular"};

        homography = Homography(matrix);
        return std::nullopt;
    }

//---------------------------------------------------------------------------------------------------------------------

    std::optional<Error> Homography::Between(
        const std::vector<cv::Point2d>& source,
        Homography& homography,
        const int canonical_size
    )
    {
        if(canonical_size <= 0)
        {
            return Error{
                ErrorKind::InvalidArgument,
                cv::format("The canonical size must be positive, got %d", canonical_size)
            };
        }

        return Between(source, CanonicalCorners(canonical_size), homography);
    }

//---------------------------------------------------------------------------------------------------------------------

    std::vector<cv::Point2d> Homography::CanonicalCorners(const int canonical_size)
    {
        const auto size = static_cast<double>(canonical_size);
        return {{0.0, 0.0}, {size, 0.0}, {size, size}, {0.0, size}};
    }

//---------------------------------------------------------------------------------------------------------------------

	Homography::Homography()
		: m_Matrix(cv::Mat::eye(3, 3, CV_64FC1))
	{}

//---------------------------------------------------------------------------------------------------------------------

	Homography::Homography(const cv::Mat& matrix)
		: m_Matrix(matrix.clone())
	{
		PVK_ASSERT(matrix.cols == 3);
		PVK_ASSERT(matrix.rows == 3);
		PVK_ASSERT(matrix.type() == CV_64FC1);
	}

//---------------------------------------------------------------------------------------------------------------------

	Homography::Homography(const Homography& other)
		: Homography(other.m_Matrix)
	{}

//---------------------------------------------------------------------------------------------------------------------

	Homography::Homography(Homography&& other) noexcept
		: m_Matrix(std::move(other.m_Matrix))
	{}

//---------------------------------------------------------------------------------------------------------------------

	cv::Point2d Homography::transform(const cv::Point2d& point) const
	{
		std::vector<cv::Point2d> out, in = {point};
		cv::perspectiveTransform(in, out, m_Matrix);
		return out[0];
	}

//---------------------------------------------------------------------------------------------------------------------

    cv::Point Homography::warp_point(const cv::Point& point) const
    {
        const cv::Point2d warped = transform(cv::Point2d(point));
        return cv::Point(static_cast<int>(warped.x), static_cast<int>(warped.y));
    }

//---------------------------------------------------------------------------------------------------------------------

    std::vector<cv::Point> Homography::warp_points(const std::vector<cv::Point>& points) const
    {
        std::vector<cv::Point> warped_points;
        warped_points.reserve(points.size());

        for(const auto& point : points)
            warped_points.push_back(warp_point(point));

        return warped_points;
    }

//---------------------------------------------------------------------------------------------------------------------

	void Homography::warp(const cv::Mat& src, cv::Mat& dst, const cv::Size& output_size) const
	{
        PVK_ASSERT(!src.empty());
        PVK_ASSERT(output_size.width > 0 && output_size.height > 0);

		if(is_affine())
			cv::warpAffine(src, dst, m_Matrix.rowRange(0, 2), output_size);
		else
			cv::warpPerspective(src, dst, m_Matrix, output_size);
	}

//---------------------------------------------------------------------------------------------------------------------

    Homography Homography::invert() const
    {
        return Homography(cv::Mat(m_Matrix.inv()));
    }

//---------------------------------------------------------------------------------------------------------------------

    bool Homography::is_identity() const
    {
        return m_Matrix.at<cv::Vec3d>(0,0) == cv::Vec3d(1.0, 0.0, 0.0)
            && m_Matrix.at<cv::Vec3d>(1,0) == cv::Vec3d(0.0, 1.0, 0.0)
            && m_Matrix.at<cv::Vec3d>(2,0) == cv::Vec3d(0.0, 0.0, 1.0);
    }

//---------------------------------------------------------------------------------------------------------------------

	bool Homography::is_affine() const
	{
		// We consider the homography affine if the bottom row is unchanged from identity
		return m_Matrix.at<cv::Vec3d>(2, 0) == cv::Vec3d(0.0, 0.0, 1.0);
	}

//---------------------------------------------------------------------------------------------------------------------

    Homography& Homography::operator=(const Homography& other)
	{
		m_Matrix = other.m_Matrix.clone();
        return *this;
	}

//---------------------------------------------------------------------------------------------------------------------

    Homography& Homography::operator=(Homography&& other) noexcept
	{
		m_Matrix = std::move(other.m_Matrix);
        return *this;
    }

//---------------------------------------------------------------------------------------------------------------------

}
