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

#include "YoloDetector.hpp"

#include <fstream>
#include <algorithm>
#include <filesystem>
#include <opencv2/core/cuda.hpp>

#include "Directives.hpp"
#include "Math/Math.hpp"

namespace pvk
{

//---------------------------------------------------------------------------------------------------------------------

    YoloDetector::YoloDetector(const YoloDetectorSettings& settings)
    {
        this->configure(settings);
    }

//---------------------------------------------------------------------------------------------------------------------

    void YoloDetector::configure(const YoloDetectorSettings& settings)
    {
        PVK_ASSERT(settings.input_size > 0);
        PVK_ASSERT(between(settings.score_threshold, 0.0f, 1.0f));
        PVK_ASSERT(between(settings.nms_threshold, 0.0f, 1.0f));

        // A new model or class list needs to be loaded again.
        if(settings.model_path != m_Settings.model_path || settings.classes_path != m_Settings.classes_path)
        {
            m_Network = cv::dnn::Net();
            m_ClassNames.clear();
        }

        m_Settings = settings;

        m_AcceptedClassIDs.assign(m_ClassNames.size(), false);
        for(size_t id = 0; id < m_ClassNames.size(); id++)
        {
            const auto& accepted = m_Settings.accepted_classes;
            m_AcceptedClassIDs[id] = std::find(accepted.begin(), accepted.end(), m_ClassNames[id]) != accepted.end();
        }
    }

//---------------------------------------------------------------------------------------------------------------------

    std::optional<Error> YoloDetector::load()
    {
        const auto& model_path = m_Settings.model_path;
        const auto& classes_path = m_Settings.classes_path;

        if(!std::filesystem::exists(classes_path))
            return Error{ErrorKind::NotFound, cv::format("Class list '%s' does not exist", classes_path.c_str())};

        if(!std::filesystem::exists(model_path))
            return Error{ErrorKind::NotFound, cv::format("Detector model '%s' does not exist", model_path.c_str())};

        std::vector<std::string> class_names;
        std::ifstream class_file(classes_path);
        for(std::string name; std::getline(class_file, name);)
        {
            if(!name.empty() && name.back() == '\r')
                name.pop_back();

            if(!name.empty())
                class_names.push_back(name);
        }

        if(class_names.empty())
            return Error{ErrorKind::DecodeError, cv::format("Class list '%s' is empty", classes_path.c_str())};

        cv::dnn::Net network;
        try
        {
            network = cv::dnn::readNet(model_path);
        }
        catch(const cv::Exception& exception)
        {
            return Error{
                ErrorKind::DecodeError,
                cv::format("Failed to read detector model '%s', %s", model_path.c_str(), exception.what())
            };
        }

        if(network.empty())
            return Error{ErrorKind::DecodeError, cv::format("Detector model '%s' is empty", model_path.c_str())};

        if(cv::cuda::getCudaEnabledDeviceCount() > 0)
        {
            PVK_LOG_INFO("Running vehicle detection on the CUDA backend");
            network.setPreferableBackend(cv::dnn::DNN_BACKEND_CUDA);
            network.setPreferableTarget(cv::dnn::DNN_TARGET_CUDA);
        }
        else
        {
            PVK_LOG_INFO("Running vehicle detection on the CPU backend");
            network.setPreferableBackend(cv::dnn::DNN_BACKEND_OPENCV);
            network.setPreferableTarget(cv::dnn::DNN_TARGET_CPU);
        }

        m_Network = std::move(network);
        m_ClassNames = std::move(class_names);

        // Rebuild the accepted class lookup for the new class list.
        configure(m_Settings);

        return std::nullopt;
    }

//---------------------------------------------------------------------------------------------------------------------

    bool YoloDetector::is_loaded() const
    {
        return !m_Network.empty() && !m_ClassNames.empty();
    }

//---------------------------------------------------------------------------------------------------------------------

    std::optional<Error> YoloDetector::detect(const cv::Mat& frame, std::vector<cv::Rect>& vehicles)
    {
        PVK_ASSERT(is_loaded());
        PVK_ASSERT(!frame.empty());

        PVK_LOG_TRACE("Running vehicle detection on a %dx%d frame", frame.cols, frame.rows);

        const cv::Size input_size(m_Settings.input_size, m_Settings.input_size);

        std::vector<cv::Mat> outputs;
        try
        {
            cv::Mat blob;
            cv::dnn::blobFromImage(frame, blob, 1.0 / 255.0, input_size, cv::Scalar(), true, false);
            m_Network.setInput(blob);
            m_Network.forward(outputs, m_Network.getUnconnectedOutLayersNames());
        }
        catch(const cv::Exception& exception)
        {
            return Error{ErrorKind::DecodeError, cv::format("Vehicle detection failed, %s", exception.what())};
        }

        // YOLOv8 outputs a (1, 4 + classes, candidates) tensor, one column per candidate.
        if(outputs.empty() || outputs[0].dims != 3 || outputs[0].size[1] <= 4 || outputs[0].type() != CV_32F)
            return Error{ErrorKind::DecodeError, "Detector output is not a YOLOv8 detection tensor"};

        const int dimensions = outputs[0].size[1];
        const int candidates = outputs[0].size[2];
        const int class_count = std::min(dimensions - 4, static_cast<int>(m_ClassNames.size()));

        cv::Mat detections = outputs[0].reshape(1, dimensions).t();

        const float x_factor = static_cast<float>(frame.cols) / static_cast<float>(input_size.width);
        const float y_factor = static_cast<float>(frame.rows) / static_cast<float>(input_size.height);

        std::vector<cv::Rect> boxes;
        std::vector<float> confidences;
        for(int i = 0; i < candidates; i++)
        {
            const float* row = detections.ptr<float>(i);

            const cv::Mat scores(1, class_count, CV_32FC1, const_cast<float*>(row + 4));
            cv::Point class_id;
            double max_score = 0.0;
            cv::minMaxLoc(scores, nullptr, &max_score, nullptr, &class_id);

            if(max_score < m_Settings.score_threshold || !m_AcceptedClassIDs[class_id.x])
                continue;

            const float x = row[0], y = row[1], w = row[2], h = row[3];
            boxes.emplace_back(
                static_cast<int>((x - 0.5f * w) * x_factor),
                static_cast<int>((y - 0.5f * h) * y_factor),
                static_cast<int>(w * x_factor),
                static_cast<int>(h * y_factor)
            );
            confidences.push_back(static_cast<float>(max_score));
        }

        std::vector<int> indices;
        cv::dnn::NMSBoxes(boxes, confidences, m_Settings.score_threshold, m_Settings.nms_threshold, indices);

        std::vector<cv::Rect> accepted;
        accepted.reserve(indices.size());
        for(const int index : indices)
            accepted.push_back(boxes[index]);

        PVK_LOG_DEBUG("Detected %zu vehicles from %zu candidates", accepted.size(), boxes.size());

        vehicles = std::move(accepted);
        return std::nullopt;
    }

//---------------------------------------------------------------------------------------------------------------------

}
