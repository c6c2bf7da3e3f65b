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

#include <string>
#include <vector>
#include <optional>
#include <opencv2/dnn.hpp>

#include "VehicleDetector.hpp"
#include "Diagnostics/Error.hpp"
#include "Utility/Properties/Configurable.hpp"

namespace pvk
{

    struct YoloDetectorSettings
    {
        std::string model_path = "yolov8m.onnx";
        std::string classes_path = "coco.names";

        int input_size = 640;
        float score_threshold = 0.10f;
        float nms_threshold = 0.35f;

        std::vector<std::string> accepted_classes = {"car", "truck", "bus", "motorcycle"};
    };


    // YOLOv8 detector running an exported ONNX model through the OpenCV DNN module.
    class YoloDetector final : public VehicleDetector, public Configurable<YoloDetectorSettings>
    {
    public:

        explicit YoloDetector(const YoloDetectorSettings& settings = {});

        void configure(const YoloDetectorSettings& settings) override;

        // Must succeed before any detection is run.
        std::optional<Error> load();

        bool is_loaded() const;

        std::optional<Error> detect(const cv::Mat& frame, std::vector<cv::Rect>& vehicles) override;

    private:
        cv::dnn::Net m_Network;
        std::vector<std::string> m_ClassNames;
        std::vector<bool> m_AcceptedClassIDs;
    };

}
