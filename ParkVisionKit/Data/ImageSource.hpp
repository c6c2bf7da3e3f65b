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
#include <optional>
#include <opencv2/core.hpp>

#include "Diagnostics/Error.hpp"

namespace pvk
{

    std::optional<Error> load_image(const std::string& path, cv::Mat& image);

    // Resizes the image to the given width, the height follows the aspect ratio.
    cv::Mat resize_to_width(const cv::Mat& image, const int width);

    // Decodes the whole video and keeps the last frame which could be read.
    std::optional<Error> load_last_frame(const std::string& path, cv::Mat& frame);

    bool is_video_file(const std::string& path);

    bool is_image_file(const std::string& path);

}
