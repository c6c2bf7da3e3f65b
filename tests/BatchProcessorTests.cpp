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
#include <opencv2/imgcodecs.hpp>

#include "BatchProcessor.hpp"
#include "TestUtilities.hpp"

using namespace clt;

namespace
{
    class FixedDetector final : public pvk::VehicleDetector
    {
    public:

        explicit FixedDetector(std::vector<cv::Rect> boxes)
            : m_Boxes(std::move(boxes))
        {}

        std::optional<pvk::Error> detect(const cv::Mat& frame, std::vector<cv::Rect>& vehicles) override
        {
            EXPECT_EQ(frame.cols, 1000);
            m_Calls++;
            vehicles = m_Boxes;
            return std::nullopt;
        }

        int calls() const
        {
            return m_Calls;
        }

    private:
        std::vector<cv::Rect> m_Boxes;
        int m_Calls = 0;
    };


    // Fails on a chosen call, either by reporting an error or by throwing like cv::dnn does.
    class FaultyDetector final : public pvk::VehicleDetector
    {
    public:

        FaultyDetector(const int failing_call, const bool throws)
            : m_FailingCall(failing_call),
              m_Throws(throws)
        {}

        std::optional<pvk::Error> detect(const cv::Mat&, std::vector<cv::Rect>& vehicles) override
        {
            if(++m_Calls == m_FailingCall)
            {
                if(m_Throws)
                    CV_Error(cv::Error::StsAssert, "input size does not match the network");

                return pvk::Error{pvk::ErrorKind::DecodeError, "network output is malformed"};
            }

            vehicles = {{490, 190, 20, 20}};
            return std::nullopt;
        }

        int calls() const
        {
            return m_Calls;
        }

    private:
        const int m_FailingCall;
        const bool m_Throws;
        int m_Calls = 0;
    };


    // Regions spanning the whole working frame, flipped vertically into canonical space.
    std::filesystem::path write_calibration(const pvk::test::TemporaryFolder& folder)
    {
        auto calibration = pvk::Calibration::Default();
        calibration.parking_region = pvk::Quadrilateral({0, 0}, {1000, 0}, {1000, 1000}, {0, 1000});
        calibration.parking_bands = {100, 300, 500};
        calibration.queue_region = calibration.parking_region;

        const auto path = folder / "calibration.yml";
        EXPECT_FALSE(pvk::save_calibration(path.string(), calibration).has_value());
        return path;
    }


    TaskSettings make_configuration(const std::vector<std::string>& arguments)
    {
        std::vector<const char*> argv = {"pvk"};
        for(const auto& argument : arguments)
            argv.push_back(argument.c_str());

        TaskConfiguration configuration;
        const auto error = configuration.from_command_line(static_cast<int>(argv.size()), argv.data());
        EXPECT_FALSE(error.has_value()) << error.value_or("");
        return configuration.settings();
    }
}

//---------------------------------------------------------------------------------------------------------------------

TEST(BatchProcessor, AnswersParkingQueries)
{
    const pvk::test::TemporaryFolder dataset, settings;
    const auto calibration = write_calibration(settings);

    ASSERT_TRUE(cv::imwrite((dataset / "01.jpg").string(), cv::Mat(100, 100, CV_8UC3, cv::Scalar(0, 0, 0))));
    dataset.write("01_query.txt", "4\n1\n2\n3\n9\n");

    // Car centres at (500, 200) and (500, 800) fill the far and near bands.
    auto detector = std::make_shared<FixedDetector>(std::vector<cv::Rect>{{490, 190, 20, 20}, {490, 790, 20, 20}});

    const auto log_path = settings / "log.csv";
    BatchProcessor processor(
        make_configuration({dataset.path().string(), "-c", calibration.string(), "-L", log_path.string()}),
        detector
    );
    ASSERT_FALSE(processor.run().has_value());

    EXPECT_EQ(processor.failure_count(), 0u);
    ASSERT_EQ(processor.reports().size(), 1u);
    EXPECT_EQ(processor.reports()[0].name, "01");
    EXPECT_EQ(processor.reports()[0].result, "101");
    EXPECT_EQ(detector->calls(), 1);

    EXPECT_EQ(pvk::test::read_file(dataset / "results" / "01_results.txt"), "4\n1 1\n2 0\n3 1\n9 0\n");

    const auto log = pvk::test::read_file(log_path);
    EXPECT_EQ(log.rfind("Item,Status,Result,Time (ms)\n01,OK,101,", 0), 0u);
}

//---------------------------------------------------------------------------------------------------------------------

TEST(BatchProcessor, SkipsFailedItems)
{
    const pvk::test::TemporaryFolder dataset, output;

    ASSERT_TRUE(cv::imwrite((dataset / "01.jpg").string(), cv::Mat(100, 100, CV_8UC3, cv::Scalar(0, 0, 0))));
    dataset.write("01_query.txt", "1\n1\n");
    dataset.write("02.jpg", "corrupt");
    dataset.write("02_query.txt", "1\n1\n");
    ASSERT_TRUE(cv::imwrite((dataset / "03.jpg").string(), cv::Mat(100, 100, CV_8UC3, cv::Scalar(0, 0, 0))));

    output.write("old_results.txt", "stale");
    output.write("keep.txt", "kept");

    BatchProcessor processor(
        make_configuration({dataset.path().string(), "-o", output.path().string(), "-x"}),
        std::make_shared<FixedDetector>(std::vector<cv::Rect>{})
    );
    ASSERT_FALSE(processor.run().has_value());

    ASSERT_EQ(processor.reports().size(), 3u);
    EXPECT_EQ(processor.failure_count(), 2u);

    EXPECT_FALSE(processor.reports()[0].error.has_value());
    ASSERT_TRUE(processor.reports()[1].error.has_value());
    EXPECT_EQ(processor.reports()[1].error->kind, pvk::ErrorKind::DecodeError);
    ASSERT_TRUE(processor.reports()[2].error.has_value());
    EXPECT_EQ(processor.reports()[2].error->kind, pvk::ErrorKind::NotFound);

    EXPECT_EQ(pvk::test::read_file(output / "01_results.txt"), "1\n1 0\n");
    EXPECT_FALSE(std::filesystem::exists(output / "02_results.txt"));
    EXPECT_FALSE(std::filesystem::exists(output / "old_results.txt"));
    EXPECT_TRUE(std::filesystem::exists(output / "keep.txt"));
}

//---------------------------------------------------------------------------------------------------------------------

TEST(BatchProcessor, EvaluatesSingleImageQueue)
{
    const pvk::test::TemporaryFolder dataset, settings;
    const auto calibration = write_calibration(settings);

    const auto image = dataset / "queue.png";
    ASSERT_TRUE(cv::imwrite(image.string(), cv::Mat(500, 500, CV_8UC3, cv::Scalar(0, 0, 0))));

    // Warped heights of 30, 100, 140 and 400.
    auto detector = std::make_shared<FixedDetector>(std::vector<cv::Rect>{
        {390, 960, 20, 20}, {390, 890, 20, 20}, {390, 850, 20, 20}, {390, 590, 20, 20}
    });

    BatchProcessor processor(make_configuration({"-t", "queue", image.string(), "-c", calibration.string()}), detector);

    testing::internal::CaptureStdout();
    const auto error = processor.run();
    const auto printed = testing::internal::GetCapturedStdout();
    ASSERT_FALSE(error.has_value());

    ASSERT_EQ(processor.reports().size(), 1u);
    EXPECT_FALSE(processor.reports()[0].error.has_value());
    EXPECT_EQ(processor.reports()[0].result, "3");

    // Single files report on standard output and write no result files.
    EXPECT_EQ(printed, "Queue length: 3\n");
    EXPECT_FALSE(std::filesystem::exists(dataset / "results"));
}

//---------------------------------------------------------------------------------------------------------------------

TEST(BatchProcessor, ConfigurationFailures)
{
    const pvk::test::TemporaryFolder dataset;
    const auto broken = dataset.write("calibration.yml", "%YAML:1.0\n---\nparking_bands: [300, 100]\n");

    BatchProcessor bad_calibration(
        make_configuration({dataset.path().string(), "-c", broken.string()}),
        std::make_shared<FixedDetector>(std::vector<cv::Rect>{})
    );
    EXPECT_TRUE(bad_calibration.run().has_value());

    BatchProcessor missing_model(
        make_configuration({dataset.path().string(), "-m", (dataset / "missing.onnx").string()})
    );
    EXPECT_TRUE(missing_model.run().has_value());
}

//---------------------------------------------------------------------------------------------------------------------

TEST(BatchProcessor, DetectorFailuresSkipOnlyTheirItem)
{
    for(const bool throws : {false, true})
    {
        const pvk::test::TemporaryFolder dataset, settings;
        const auto calibration = write_calibration(settings);

        for(const std::string name : {"01", "02", "03"})
        {
            ASSERT_TRUE(cv::imwrite((dataset / (name + ".jpg")).string(), cv::Mat(100, 100, CV_8UC3, cv::Scalar(0, 0, 0))));
            dataset.write(name + "_query.txt", "1\n1\n");
        }

        auto detector = std::make_shared<FaultyDetector>(2, throws);
        BatchProcessor processor(make_configuration({dataset.path().string(), "-c", calibration.string()}), detector);
        ASSERT_FALSE(processor.run().has_value());

        EXPECT_EQ(detector->calls(), 3);
        ASSERT_EQ(processor.reports().size(), 3u);
        EXPECT_EQ(processor.failure_count(), 1u);

        EXPECT_FALSE(processor.reports()[0].error.has_value());
        ASSERT_TRUE(processor.reports()[1].error.has_value());
        EXPECT_EQ(processor.reports()[1].error->kind, pvk::ErrorKind::DecodeError);
        EXPECT_FALSE(processor.reports()[2].error.has_value());

        EXPECT_TRUE(std::filesystem::exists(dataset / "results" / "01_results.txt"));
        EXPECT_FALSE(std::filesystem::exists(dataset / "results" / "02_results.txt"));
        EXPECT_TRUE(std::filesystem::exists(dataset / "results" / "03_results.txt"));
    }
}

//---------------------------------------------------------------------------------------------------------------------

TEST(BatchProcessor, RejectsUnsupportedSingleFile)
{
    const pvk::test::TemporaryFolder dataset, settings;
    const auto calibration = write_calibration(settings);
    const auto notes = dataset.write("notes.txt", "not an image");

    auto detector = std::make_shared<FixedDetector>(std::vector<cv::Rect>{});
    BatchProcessor processor(make_configuration({notes.string(), "-c", calibration.string()}), detector);
    ASSERT_FALSE(processor.run().has_value());

    ASSERT_EQ(processor.reports().size(), 1u);
    ASSERT_TRUE(processor.reports()[0].error.has_value());
    EXPECT_EQ(processor.reports()[0].error->kind, pvk::ErrorKind::InvalidArgument);
    EXPECT_EQ(detector->calls(), 0);
}

//---------------------------------------------------------------------------------------------------------------------
