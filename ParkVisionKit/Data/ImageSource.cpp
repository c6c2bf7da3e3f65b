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

#include "ImageSource.hpp"

#include <array>
#include <cctype>
#include <algorithm>
#include <filesystem>
#include <opencv2/imgproc.hpp>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/videoio.hpp>

#include "Directives.hpp"

namespace pvk
{

//---------------------------------------------------------------------------------------------------------------------

    static std::string extension_of(const std::string& path)
    {
        std::string extension = std::filesystem::path(path).extension().string();
        std::transform(extension.begin(), extension.end(), extension.begin(), [](unsigned char c){
            return static_cast<char>(std::tolower(c));
        });
        return extension;
    }

//---------------------------------------------------------------------------------------------------------------------

    std::optional<Error> load_image(const std::string& path, cv::Mat& image)
    {
        if(!std::filesystem::is_regular_file(path))
            return Error{ErrorKind::NotFound, cv::format("Image '%s' does not exist", path.c_str())};

        cv::Mat loaded = cv::imread(path, cv::IMREAD_COLOR);
        if(loaded.empty())
            return Error{ErrorKind::DecodeError, cv::format("Could not read image from '%s'", path.c_str())};

        PVK_LOG_DEBUG("Loaded %dx%d image from '%s'", loaded.cols, loaded.rows, path.c_str());

        image = std::move(loaded);
        return std::nullopt;
    }

//---------------------------------------------------------------------------------------------------------------------

    cv::Mat resize_to_width(const cv::Mat& image, const int width)
    {
        PVK_ASSERT(!image.empty());
        PVK_ASSERT(width > 0);

        const double ratio = static_cast<double>(width) / static_cast<double>(image.cols);
        const int height = std::max(static_cast<int>(image.rows * ratio), 1);

        cv::Mat resized;
        cv::resize(image, resized, cv::Size(width, height), 0, 0, cv::INTER_AREA);
        return resized;
    }

//---------------------------------------------------------------------------------------------------------------------

    std::optional<Error> load_last_frame(const std::string& path, cv::Mat& frame)
    {
        if(!std::filesystem::is_regular_file(path))
            return Error{ErrorKind::NotFound, cv::format("Video '%s' does not exist", path.c_str())};

        cv::VideoCapture capture(path);
        if(!capture.isOpened())
            return Error{ErrorKind::DecodeError, cv::format("Could not open video file '%s'", path.c_str())};

        PVK_LOG_DEBUG(
            "Video '%s' opened with %d reported frames",
            path.c_str(),
            static_cast<int>(capture.get(cv::CAP_PROP_FRAME_COUNT))
        );

        // Frame counts reported by containers are unreliable, so read until decoding stops.
        cv::Mat current, last;
        int frames = 0;
        while(capture.read(current) && !current.empty())
        {
            current.copyTo(last);
            frames++;
        }
        capture.release();

        if(last.empty())
            return Error{ErrorKind::DecodeError, cv::format("Video '%s' holds no readable frames", path.c_str())};

        PVK_LOG_TRACE("Read %d frames from '%s'", frames, path.c_str());

        frame = std::move(last);
        return std::nullopt;
    }

//---------------------------------------------------------------------------------------------------------------------

    bool is_video_file(const std::string& path)
    {
        constexpr std::array<const char*, 4> extensions = {".mp4", ".avi", ".mov", ".mkv"};

        const auto extension = extension_of(path);
        return std::find(extensions.begin(), extensions.end(), extension) != extensions.end();
    }

//---------------------------------------------------------------------------------------------------------------------

    bool is_image_file(const std::string& path)
    {
        constexpr std::array<const char*, 4> extensions = {".jpg", ".jpeg", ".png", ".bmp"};

        const auto extension = extension_of(path);
        return std::find(extensions.begin(), extensions.end(), extension) != extensions.end();
    }

//---------------------------------------------------------------------------------------------------------------------

}
