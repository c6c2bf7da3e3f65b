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
    // Maps onto the canonical frame as x' = x - 100 and y' = 300 - y for a size of 200.
    const Quadrilateral region({100, 100}, {300, 100}, {300, 300}, {100, 300});

    void expect_near(const cv::Point& actual, const cv::Point& expected)
    {
        EXPECT_NEAR(actual.x, expected.x, 1);
        EXPECT_NEAR(actual.y, expected.y, 1);
    }
}

//---------------------------------------------------------------------------------------------------------------------

TEST(RegionExtractor, KeepsEnclosedPointsOrderedByHeight)
{
    const RegionExtractor extractor({200, true, false});
    const cv::Mat image(400, 400, CV_8UC3, cv::Scalar(0, 0, 0));

    WarpedRegion output;
    ASSERT_FALSE(extractor.extract(image, region, {{200, 250}, {500, 500}, {200, 150}}, output).has_value());

    ASSERT_EQ(output.points.size(), 2u);
    expect_near(output.points[0], {100, 150});
    expect_near(output.points[1], {100, 50});

    EXPECT_EQ(output.image.size(), cv::Size(200, 200));
    EXPECT_TRUE(output.crop.empty());
    EXPECT_FALSE(output.warp.is_identity());
}

//---------------------------------------------------------------------------------------------------------------------

TEST(RegionExtractor, WarpsImageIntoCanonicalFrame)
{
    const RegionExtractor extractor({200, true, false});

    // Only the region's bottom row is bright, it must land at the top of the canonical image.
    cv::Mat image(400, 400, CV_8UC1, cv::Scalar(0));
    image(cv::Rect(100, 250, 201, 51)).setTo(255);

    WarpedRegion output;
    ASSERT_FALSE(extractor.extract(image, region, {}, output).has_value());

    ASSERT_EQ(output.image.size(), cv::Size(200, 200));
    EXPECT_EQ(output.image.at<uchar>(10, 100), 255);
    EXPECT_EQ(output.image.at<uchar>(190, 100), 0);
    EXPECT_TRUE(output.points.empty());
}

//---------------------------------------------------------------------------------------------------------------------

TEST(RegionExtractor, PointsOnlyWithoutImage)
{
    const RegionExtractor extractor({200, false, false});

    WarpedRegion output;
    ASSERT_FALSE(extractor.extract(cv::Mat(), region, {{200, 150}}, output).has_value());

    ASSERT_EQ(output.points.size(), 1u);
    expect_near(output.points[0], {100, 150});
    EXPECT_TRUE(output.image.empty());
}

//---------------------------------------------------------------------------------------------------------------------

TEST(RegionExtractor, CropsSourceRegion)
{
    const RegionExtractor extractor({200, false, true});
    const cv::Mat image(400, 400, CV_8UC3, cv::Scalar(10, 20, 30));

    WarpedRegion output;
    ASSERT_FALSE(extractor.extract(image, region, {}, output).has_value());

    EXPECT_EQ(output.crop.size(), cv::Size(201, 201));
    EXPECT_EQ(output.crop.at<cv::Vec3b>(0, 0), cv::Vec3b(10, 20, 30));
}

//---------------------------------------------------------------------------------------------------------------------

TEST(RegionExtractor, ErrorsLeaveOutputUntouched)
{
    WarpedRegion output;
    output.points = {{1, 2}};

    const RegionExtractor cropper({200, false, true});
    auto error = cropper.extract(cv::Mat(250, 250, CV_8UC1, cv::Scalar(0)), region, {{200, 150}}, output);
    ASSERT_TRUE(error.has_value());
    EXPECT_EQ(error->kind, ErrorKind::OutOfBounds);

    const RegionExtractor warper({200, true, false});
    error = warper.extract(cv::Mat(), region, {{200, 150}}, output);
    ASSERT_TRUE(error.has_value());
    EXPECT_EQ(error->kind, ErrorKind::InvalidArgument);

    const Quadrilateral flat({0, 0}, {10, 0}, {20, 0}, {30, 0});
    error = warper.extract(cv::Mat(400, 400, CV_8UC1, cv::Scalar(0)), flat, {}, output);
    ASSERT_TRUE(error.has_value());
    EXPECT_EQ(error->kind, ErrorKind::DegenerateConfiguration);

    EXPECT_EQ(output.points, std::vector<cv::Point>({{1, 2}}));
    EXPECT_TRUE(output.image.empty());
}

//---------------------------------------------------------------------------------------------------------------------

TEST(RegionExtractor, RejectsNonPositiveCanonicalSize)
{
    EXPECT_THROW(RegionExtractor({0, true, false}), std::logic_error);

    RegionExtractor extractor;
    EXPECT_EQ(extractor.settings().canonical_size, 1000);
    EXPECT_THROW(extractor.reconfigure([](RegionExtractorSettings& settings){ settings.canonical_size = -5; }), std::logic_error);
}

//---------------------------------------------------------------------------------------------------------------------
