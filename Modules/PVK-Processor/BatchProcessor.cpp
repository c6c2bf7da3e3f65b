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

#include "BatchProcessor.hpp"

#include <iostream>
#include <algorithm>

#include "QueryFile.hpp"
#include "GroundTruth.hpp"

namespace clt
{

//---------------------------------------------------------------------------------------------------------------------

    BatchProcessor::BatchProcessor(TaskSettings settings, std::shared_ptr<pvk::VehicleDetector> detector)
        : m_Settings(std::move(settings)),
          m_Calibration(pvk::Calibration::Default()),
          m_Detector(std::move(detector))
    {}

//---------------------------------------------------------------------------------------------------------------------

    std::optional<std::string> BatchProcessor::run()
    {
        if(auto error = initialize(); error.has_value())
            return error;

        if(m_Settings.has_folder_input())
            process_folder();
        else
            process_file(m_Settings.input_path);

        if(m_DataLogger.has_value())
            m_DataLogger->flush();

        if(m_Settings.ground_truth_folder.has_value() && m_Settings.has_folder_input())
            compare_ground_truth();

        PVK_LOG_INFO(
            "Processed %zu items with %zu failures in %.2f seconds",
            m_Reports.size(),
            failure_count(),
            m_ItemTimer.total().seconds()
        );

        return std::nullopt;
    }

//---------------------------------------------------------------------------------------------------------------------

    std::optional<std::string> BatchProcessor::initialize()
    {
        m_Reports.clear();

        if(m_Settings.calibration_path.has_value())
        {
            const auto path = m_Settings.calibration_path->string();
            if(auto error = pvk::load_calibration(path, m_Calibration); error.has_value())
                return error->describe();
        }

        if(m_Settings.task == Task::ParkingOccupancy)
            m_ParkingEvaluator.emplace(m_Calibration);
        else
            m_QueueEvaluator.emplace(m_Calibration);

        if(m_Detector == nullptr)
        {
            auto detector = std::make_shared<pvk::YoloDetector>(m_Settings.detector);
            if(auto error = detector->load(); error.has_value())
                return error->describe();

            m_Detector = std::move(detector);
        }

        if(m_Settings.has_folder_input())
        {
            if(auto error = prepare_output_folder(); error.has_value())
                return error;
        }

        if(m_Settings.log_target.has_value())
        {
            m_DataLogStream.open(*m_Settings.log_target, std::ios::trunc);
            if(!m_DataLogStream.good())
            {
                return cv::format(
                    "Failed to open data log \'%s\'",
                    m_Settings.log_target->string().c_str()
                );
            }

            m_DataLogger.emplace(m_DataLogStream);
            *m_DataLogger << "Item" << "Status" << "Result" << "Time (ms)" << pvk::Logger::Next;
        }

        return std::nullopt;
    }

//---------------------------------------------------------------------------------------------------------------------

    std::optional<std::string> BatchProcessor::prepare_output_folder()
    {
        m_OutputFolder = m_Settings.resolve_output_folder();

        std::error_code error;
        std::filesystem::create_directories(m_OutputFolder, error);
        if(error)
        {
            return cv::format(
                "Failed to create output folder \'%s\', %s",
                m_OutputFolder.string().c_str(),
                error.message().c_str()
            );
        }

        if(m_Settings.remove_old_results)
        {
            for(const auto& entry : std::filesystem::directory_iterator(m_OutputFolder))
            {
                if(entry.is_regular_file() && entry.path().filename().string().ends_with("_results.txt"))
                {
                    PVK_LOG_DEBUG("Removing old result '%s'", entry.path().string().c_str());
                    std::filesystem::remove(entry.path(), error);
                    if(error)
                        PVK_LOG_WARNING("Failed to remove '%s'", entry.path().string().c_str());
                }
            }
        }

        return std::nullopt;
    }

//---------------------------------------------------------------------------------------------------------------------

    void BatchProcessor::process_folder()
    {
        const auto& folder = m_Settings.input_path;

        std::vector<std::filesystem::path> items;
        for(const auto& entry : std::filesystem::directory_iterator(folder))
        {
            if(!entry.is_regular_file())
                continue;

            const auto path = entry.path();
            if(m_Settings.task == Task::ParkingOccupancy && path.extension() == ".jpg")
                items.push_back(path);
            else if(m_Settings.task == Task::QueueLength && pvk::is_video_file(path.string()))
                items.push_back(path);
        }
        std::sort(items.begin(), items.end());

        if(items.empty())
            PVK_LOG_WARNING("No %s items found in '%s'", to_string(m_Settings.task), folder.string().c_str());

        for(const auto& item : items)
        {
            const auto name = item.stem().string();
            const auto results_path = m_OutputFolder / (name + "_results.txt");

            ItemReport report{name};
            m_ItemTimer.start();

            if(m_Settings.task == Task::ParkingOccupancy)
            {
                const auto query_path = item.parent_path() / (name + "_query.txt");
                report.error = process_parking_item(item, query_path, results_path, report.result);
            }
            else report.error = process_queue_item(item, results_path, report.result);

            report.duration = m_ItemTimer.stop();
            record(std::move(report));
        }
    }

//---------------------------------------------------------------------------------------------------------------------

    void BatchProcessor::process_file(const std::filesystem::path& path)
    {
        ItemReport report{path.stem().string()};
        m_ItemTimer.start();

        cv::Mat frame;
        report.error = load_frame(path, frame);

        std::vector<cv::Point> car_points;
        if(!report.error.has_value())
            report.error = detect_vehicles(frame, car_points);

        if(!report.error.has_value())
        {
            if(m_Settings.task == Task::ParkingOccupancy)
            {
                std::vector<bool> slots;
                report.error = m_ParkingEvaluator->evaluate(frame, car_points, slots);
                if(!report.error.has_value())
                {
                    report.result = describe_slots(slots);
                    for(size_t i = slots.size(); i > 0; i--)
                        std::cout << "Parking space " << i << ": " << (slots[i - 1] ? "Occupied" : "Free") << "\n";
                }
            }
            else
            {
                int count = 0;
                report.error = m_QueueEvaluator->evaluate(frame, car_points, count);
                if(!report.error.has_value())
                {
                    report.result = std::to_string(count);
                    std::cout << "Queue length: " << count << "\n";
                }
            }
        }

        report.duration = m_ItemTimer.stop();
        record(std::move(report));
    }

//---------------------------------------------------------------------------------------------------------------------

    std::optional<pvk::Error> BatchProcessor::process_parking_item(
        const std::filesystem::path& image_path,
        const std::filesystem::path& query_path,
        const std::filesystem::path& results_path,
        std::string& summary
    )
    {
        std::vector<std::string> queries;
        if(auto error = read_lines(query_path.string(), queries); error.has_value())
            return error;

        cv::Mat frame;
        if(auto error = load_frame(image_path, frame); error.has_value())
            return error;

        std::vector<cv::Point> car_points;
        if(auto error = detect_vehicles(frame, car_points); error.has_value())
            return error;

        std::vector<bool> slots;
        if(auto error = m_ParkingEvaluator->evaluate(frame, car_points, slots); error.has_value())
            return error;

        if(auto error = write_lines(results_path.string(), answer_queries(queries, slots)); error.has_value())
            return error;

        summary = describe_slots(slots);
        return std::nullopt;
    }

//---------------------------------------------------------------------------------------------------------------------

    std::optional<pvk::Error> BatchProcessor::process_queue_item(
        const std::filesystem::path& video_path,
        const std::filesystem::path& results_path,
        std::string& summary
    )
    {
        cv::Mat frame;
        if(auto error = load_frame(video_path, frame); error.has_value())
            return error;

        std::vector<cv::Point> car_points;
        if(auto error = detect_vehicles(frame, car_points); error.has_value())
            return error;

        int count = 0;
        if(auto error = m_QueueEvaluator->evaluate(frame, car_points, count); error.has_value())
            return error;

        if(auto error = write_lines(results_path.string(), {std::to_string(count)}); error.has_value())
            return error;

        summary = std::to_string(count);
        return std::nullopt;
    }

//---------------------------------------------------------------------------------------------------------------------

    std::optional<pvk::Error> BatchProcessor::load_frame(const std::filesystem::path& path, cv::Mat& frame) const
    {
        cv::Mat source;
        if(pvk::is_video_file(path.string()))
        {
            if(auto error = pvk::load_last_frame(path.string(), source); error.has_value())
                return error;
        }
        else if(pvk::is_image_file(path.string()))
        {
            if(auto error = pvk::load_image(path.string(), source); error.has_value())
                return error;
        }
        else
        {
            return pvk::Error{
                pvk::ErrorKind::InvalidArgument,
                cv::format("Unsupported input '%s', expected an image or video file", path.string().c_str())
            };
        }

        // Calibrations are made at a fixed working resolution.
        frame = pvk::resize_to_width(source, m_Calibration.working_width);
        return std::nullopt;
    }

//---------------------------------------------------------------------------------------------------------------------

    std::optional<pvk::Error> BatchProcessor::detect_vehicles(const cv::Mat& frame, std::vector<cv::Point>& car_points)
    {
        std::vector<cv::Rect> boxes;
        try
        {
            if(auto error = m_Detector->detect(frame, boxes); error.has_value())
                return error;
        }
        catch(const cv::Exception& exception)
        {
            // Injected detectors may still throw.
            return pvk::Error{pvk::ErrorKind::DecodeError, cv::format("Vehicle detection failed, %s", exception.what())};
        }
        PVK_LOG_DEBUG("Found %zu vehicles", boxes.size());

        car_points = pvk::centers_of(boxes);
        return std::nullopt;
    }

//---------------------------------------------------------------------------------------------------------------------

    void BatchProcessor::record(ItemReport report)
    {
        if(report.error.has_value())
        {
            PVK_LOG_ERROR("Skipping '%s', %s", report.name.c_str(), report.error->describe().c_str());
        }
        else
        {
            PVK_LOG_INFO("Processed '%s' in %.1fms", report.name.c_str(), report.duration.milliseconds());
        }

        if(m_DataLogger.has_value())
        {
            *m_DataLogger << report.name
                          << (report.error.has_value() ? pvk::to_string(report.error->kind) : "OK")
                          << report.result
                          << report.duration.milliseconds()
                          << pvk::Logger::Next;
        }

        m_Reports.push_back(std::move(report));
    }

//---------------------------------------------------------------------------------------------------------------------

    void BatchProcessor::compare_ground_truth() const
    {
        std::vector<GroundTruthMatch> matches;
        if(auto error = compare_to_ground_truth(m_OutputFolder, *m_Settings.ground_truth_folder, matches); error.has_value())
        {
            PVK_LOG_ERROR("Ground truth comparison failed, %s", error->describe().c_str());
            return;
        }

        size_t matched = 0;
        for(const auto& [name, matches_truth] : matches)
        {
            std::cout << "Results for " << name << (matches_truth ? " match" : " do not match") << " the ground truth.\n";
            if(matches_truth) matched++;
        }

        std::cout << matched << " of " << matches.size() << " results match the ground truth.\n";
    }

//---------------------------------------------------------------------------------------------------------------------

    const std::vector<ItemReport>& BatchProcessor::reports() const
    {
        return m_Reports;
    }

//---------------------------------------------------------------------------------------------------------------------

    size_t BatchProcessor::failure_count() const
    {
        return std::count_if(m_Reports.begin(), m_Reports.end(), [](const ItemReport& report){
            return report.error.has_value();
        });
    }

//---------------------------------------------------------------------------------------------------------------------

    std::string BatchProcessor::describe_slots(const std::vector<bool>& slots)
    {
        std::string description;
        for(const bool occupied : slots)
            description += occupied ? '1' : '0';
        return description;
    }

//---------------------------------------------------------------------------------------------------------------------

}
