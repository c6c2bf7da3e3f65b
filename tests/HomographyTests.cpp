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

#include <gtest/gtest.h>
#include <ParkVisionKit.hpp>

using namespace pvk;

namespace
{
    const Quadrilateral parking_region({410, 230}, {455, 210}, {915, 500}, {915, 600});

    void expect_near(const cv::Point2d& actual, const cv::Point2d& expected, const double tolerance = 1e-3)
    {
        EXPECT_NEAR(actual.x, expected.x, tolerance);
        EXPECT_NEAR(actual.y, expected.y, tolerance);
    }
}

//---------------------------------------------------------------------------------------------------------------------

TEST(Homography, DefaultIsIdentity)
{
    const Homography homography;

    EXPECT_TRUE(homography.is_identity());
    EXPECT_TRUE(homography.is_affine());
    expect_near(homography.transform({12.5, -3.0}), {12.5, -3.0}, 1e-12);
}

//---------------------------------------------------------------------------------------------------------------------

TEST(Homography, MapsNamedCornersOntoCanonicalFrame)
{
    Homography warp;
    ASSERT_FALSE(Homography::Between(parking_region, Quadrilateral::Canonical(1000), warp).has_value());

    expect_near(warp.transform(cv::Point2d(parking_region.bottom_left())), {0, 0});
    expect_near(warp.transform(cv::Point2d(parking_region.bottom_right())), {1000, 0});
    expect_near(warp.transform(cv::Point2d(parking_region.top_right())), {1000, 1000});
    expect_near(warp.transform(cv::Point2d(parking_region.top_left())), {0, 1000});
}

//---------------------------------------------------------------------------------------------------------------------

TEST(Homography, PositionalMappingUsesCanonicalCorners)
{
    const std::vector<cv::Point2d> source = {
        cv::Point2d(parking_region.bottom_left()),
        cv::Point2d(parking_region.bottom_right()),
        cv::Point2d(parking_region.top_right()),
        cv::Point2d(parking_region.top_left())
    };

    Homography positional, named;
    ASSERT_FALSE(Homography::Between(source, positional, 1000).has_value());
    ASSERT_FALSE(Homography::Between(parking_region, Quadrilateral::Canonical(1000), named).has_value());

    const cv::Point2d inside(700, 420);
    expect_near(positional.transform(inside), named.transform(inside), 1e-6);
}

//---------------------------------------------------------------------------------------------------------------------

TEST(Homography, InverseRoundTrip)
{
    Homography warp;
    ASSERT_FALSE(Homography::Between(parking_region, Quadrilateral::Canonical(1000), warp).has_value());

    const auto inverse = warp.invert();
    for(const cv::Point2d point : {cv::Point2d(600, 400), cv::Point2d(450, 260), cv::Point2d(900, 550)})
        expect_near(inverse.transform(warp.transform(point)), point, 1e-6);
}

//---------------------------------------------------------------------------------------------------------------------

TEST(Homography, WarpPointTruncates)
{
    const Homography scale(cv::Mat((cv::Mat_<double>(3, 3) << 0.5, 0, 0, 0, 0.5, 0, 0, 0, 1)));

    EXPECT_EQ(scale.warp_point({7, 9}), cv::Point(3, 4));
    EXPECT_EQ(scale.warp_point({-7, -9}), cv::Point(-3, -4));

    const std::vector<cv::Point> expected = {{1, 2}, {5, 0}};
    EXPECT_EQ(scale.warp_points({{2, 5}, {11, 1}}), expected);
    EXPECT_TRUE(scale.warp_points({}).empty());
}

//---------------------------------------------------------------------------------------------------------------------

TEST(Homography, RejectsWrongPointCounts)
{
    Homography warp;

    const std::vector<cv::Point2d> three = {{0, 0}, {1, 0}, {1, 1}};
    const std::vector<cv::Point2d> four = {{0, 0}, {1, 0}, {1, 1}, {0, 1}};
    const std::vector<cv::Point2d> five = {{0, 0}, {1, 0}, {1, 1}, {0, 1}, {2, 2}};

    for(const auto& [src, dst] : {std::pair(three, four), std::pair(four, five), std::pair(five, five)})
    {
        const auto error = Homography::Between(src, dst, warp);
        ASSERT_TRUE(error.has_value());
        EXPECT_EQ(error->kind, ErrorKind::InvalidArgument);
    }
    EXPECT_TRUE(warp.is_identity());

    const auto error = Homography::Between(four, warp, 0);
    ASSERT_TRUE(error.has_value());
    EXPECT_EQ(error->kind, ErrorKind::InvalidArgument);
}

//---------------------------------------------------------------------------------------------------------------------

TEST(Homography, RejectsCollinearCorners)
{
    Homography warp;

    const std::vector<cv::Point2d> collinear = {{0, 0}, {5, 5}, {10, 10}, {0, 10}};
    auto error = Homography::Between(collinear, warp, 1000);
    ASSERT_TRUE(error.has_value());
    EXPECT_EQ(error->kind, ErrorKind::DegenerateConfiguration);

    const std::vector<cv::Point2d> collapsed = {{3, 3}, {3, 3}, {3, 3}, {3, 3}};
    error = Homography::Between(collapsed, warp, 1000);
    ASSERT_TRUE(error.has_value());
    EXPECT_EQ(error->kind, ErrorKind::DegenerateConfiguration);

    const Quadrilateral flat({0, 0}, {10, 0}, {20, 0}, {30, 0});
    error = Homography::Between(flat, Quadrilateral::Canonical(100), warp);
    ASSERT_TRUE(error.has_value());
    EXPECT_EQ(error->kind, ErrorKind::DegenerateConfiguration);

    EXPECT_TRUE(warp.is_identity());
}

//---------------------------------------------------------------------------------------------------------------------

TEST(Homography, WarpsImages)
{
    cv::Mat source(100, 100, CV_8UC1, cv::Scalar(0));
    source(cv::Rect(0, 0, 50, 50)).setTo(255);

    const Homography scale(cv::Mat((cv::Mat_<double>(3, 3) << 0.5, 0, 0, 0, 0.5, 0, 0, 0, 1)));

    cv::Mat warped;
    scale.warp(source, warped, {50, 50});

    ASSERT_EQ(warped.size(), cv::Size(50, 50));
    EXPECT_EQ(warped.at<uchar>(5, 5), 255);
    EXPECT_EQ(warped.at<uchar>(45, 45), 0);
}

//---------------------------------------------------------------------------------------------------------------------
