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

#include <memory>
#include <vector>
#include <fstream>
#include <optional>
#include <filesystem>
#include <ParkVisionKit.hpp>

#include "TaskConfiguration.hpp"

namespace clt
{

    struct ItemReport
    {
        std::string name;
        std::optional<pvk::Error> error;
        std::string result;
        pvk::Time duration;
    };


    class BatchProcessor
    {
    public:

        // The YOLO detector of the configuration is loaded if no detector is given.
        explicit BatchProcessor(
            TaskSettings settings,
            std::shared_ptr<pvk::VehicleDetector> detector = nullptr
        );

        // Returns an error only if the run could not be set up, failed items are
        // logged and skipped, see failure_count().
        std::optional<std::string> run();

        const std::vector<ItemReport>& reports() const;

        size_t failure_count() const;

    private:

        std::optional<std::string> initialize();

        std::optional<std::string> prepare_output_folder();

        void process_folder();

        void process_file(const std::filesystem::path& path);

        std::optional<pvk::Error> process_parking_item(
            const std::filesystem::path& image_path,
            const std::filesystem::path& query_path,
            const std::filesystem::path& results_path,
            std::string& summary
        );

        std::optional<pvk::Error> process_queue_item(
            const std::filesystem::path& video_path,
            const std::filesystem::path& results_path,
            std::string& summary
        );

        std::optional<pvk::Error> load_frame(const std::filesystem::path& path, cv::Mat& frame) const;

        std::optional<pvk::Error> detect_vehicles(const cv::Mat& frame, std::vector<cv::Point>& car_points);

        void record(ItemReport report);

        void compare_ground_truth() const;

        static std::string describe_slots(const std::vector<bool>& slots);

    private:
        TaskSettings m_Settings;
        pvk::Calibration m_Calibration;
        std::filesystem::path m_OutputFolder;

        std::shared_ptr<pvk::VehicleDetector> m_Detector;
        std::optional<pvk::ParkingEvaluator> m_ParkingEvaluator;
        std::optional<pvk::QueueEvaluator> m_QueueEvaluator;

        std::ofstream m_DataLogStream;
        std::optional<pvk::CSVLogger> m_DataLogger;

        pvk::Stopwatch m_ItemTimer;
        std::vector<ItemReport> m_Reports;
    };

}
