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

#include "Calibration.hpp"

#include <filesystem>

#include "Directives.hpp"
#include "Banding.hpp"

namespace pvk
{

//---------------------------------------------------------------------------------------------------------------------

    Calibration Calibration::Default()
    {
        Calibration calibration;

        calibration.parking_region = Quadrilateral({410, 230}, {455, 210}, {915, 500}, {915, 600});
        calibration.parking_bands = {10, 100, 192, 290, 385, 480, 580, 680, 785, 890};
        calibration.queue_region = calibration.parking_region;

        return calibration;
    }

//---------------------------------------------------------------------------------------------------------------------

    std::optional<Error> Calibration::validate() const
    {
        if(working_width <= 0)
            return Error{ErrorKind::InvalidArgument, cv::format("Working width must be positive, got %d", working_width)};

        if(canonical_size <= 0)
            return Error{ErrorKind::InvalidArgument, cv::format("Canonical size must be positive, got %d", canonical_size)};

        if(parking_bands.empty())
            return Error{ErrorKind::InvalidArgument, "Parking bands are empty"};

        if(!is_strictly_increasing(parking_bands))
            return Error{ErrorKind::InvalidArgument, "Parking bands must be strictly increasing"};

        if(parking_bands.front() < 0 || parking_bands.back() > canonical_size)
        {
            return Error{
                ErrorKind::InvalidArgument,
                cv::format("Parking bands must lie within [0, %d]", canonical_size)
            };
        }

        if(queue_near_threshold <= 0 || queue_gap_threshold <= 0)
            return Error{ErrorKind::InvalidArgument, "Queue thresholds must be positive"};

        return std::nullopt;
    }

//---------------------------------------------------------------------------------------------------------------------

    static void write_region(cv::FileStorage& storage, const std::string& name, const Quadrilateral& region)
    {
        storage << name << "{";
        storage << "top_left" << region.top_left();
        storage << "top_right" << region.top_right();
        storage << "bottom_right" << region.bottom_right();
        storage << "bottom_left" << region.bottom_left();
        storage << "}";
    }

//---------------------------------------------------------------------------------------------------------------------

    static std::optional<Error> read_region(const cv::FileNode& node, Quadrilateral& region)
    {
        if(node.empty() || !node.isMap())
            return Error{ErrorKind::InvalidArgument, cv::format("Region '%s' is missing", node.name().c_str())};

        std::vector<cv::Point> vertices;
        for(const char* corner : {"top_left", "top_right", "bottom_right", "bottom_left"})
        {
            const cv::FileNode corner_node = node[corner];
            if(corner_node.empty() || !corner_node.isSeq() || corner_node.size() != 2)
            {
                return Error{
                    ErrorKind::InvalidArgument,
                    cv::format("Region '%s' has a missing or malformed %s corner", node.name().c_str(), corner)
                };
            }

            cv::Point vertex;
            corner_node >> vertex;
            vertices.push_back(vertex);
        }

        return Quadrilateral::FromVertices(vertices, region);
    }

//---------------------------------------------------------------------------------------------------------------------

    std::optional<Error> load_calibration(const std::string& path, Calibration& calibration)
    {
        if(!std::filesystem::exists(path))
            return Error{ErrorKind::NotFound, cv::format("Calibration file '%s' does not exist", path.c_str())};

        cv::FileStorage storage;
        try
        {
            if(!storage.open(path, cv::FileStorage::READ))
                return Error{ErrorKind::DecodeError, cv::format("Failed to open calibration file '%s'", path.c_str())};
        }
        catch(const cv::Exception& exception)
        {
            return Error{
                ErrorKind::DecodeError,
                cv::format("Failed to parse calibration file '%s', %s", path.c_str(), exception.what())
            };
        }

        // Absent entries keep their default values.
        Calibration loaded = Calibration::Default();
        const cv::FileNode root = storage.root();

        if(!root["working_width"].empty())
            root["working_width"] >> loaded.working_width;

        if(!root["canonical_size"].empty())
            root["canonical_size"] >> loaded.canonical_size;

        if(!root["parking_region"].empty())
        {
            if(auto error = read_region(root["parking_region"], loaded.parking_region); error.has_value())
                return error;
        }

        if(!root["parking_bands"].empty())
        {
            if(!root["parking_bands"].isSeq())
                return Error{ErrorKind::InvalidArgument, "Parking bands must be a sequence"};

            loaded.parking_bands.clear();
            root["parking_bands"] >> loaded.parking_bands;
        }

        if(!root["queue_region"].empty())
        {
            if(auto error = read_region(root["queue_region"], loaded.queue_region); error.has_value())
                return error;
        }

        if(!root["queue_near_threshold"].empty())
            root["queue_near_threshold"] >> loaded.queue_near_threshold;

        if(!root["queue_gap_threshold"].empty())
            root["queue_gap_threshold"] >> loaded.queue_gap_threshold;

        if(auto error = loaded.validate(); error.has_value())
        {
            error->message = cv::format("Calibration file '%s' is invalid, %s", path.c_str(), error->message.c_str());
            return error;
        }

        PVK_LOG_DEBUG("Loaded calibration from '%s'", path.c_str());

        calibration = std::move(loaded);
        return std::nullopt;
    }

//---------------------------------------------------------------------------------------------------------------------

    std::optional<Error> save_calibration(const std::string& path, const Calibration& calibration)
    {
        if(auto error = calibration.validate(); error.has_value())
            return error;

        cv::FileStorage storage;
        try
        {
            if(!storage.open(path, cv::FileStorage::WRITE))
                return Error{ErrorKind::NotFound, cv::format("Cannot write calibration file '%s'", path.c_str())};
        }
        catch(const cv::Exception& exception)
        {
            return Error{
                ErrorKind::InvalidArgument,
                cv::format("Cannot write calibration file '%s', %s", path.c_str(), exception.what())
            };
        }

        storage << "working_width" << calibration.working_width;
        storage << "canonical_size" << calibration.canonical_size;
        write_region(storage, "parking_region", calibration.parking_region);
        storage << "parking_bands" << calibration.parking_bands;
        write_region(storage, "queue_region", calibration.queue_region);
        storage << "queue_near_threshold" << calibration.queue_near_threshold;
        storage << "queue_gap_threshold" << calibration.queue_gap_threshold;
        storage.release();

        return std::nullopt;
    }

//---------------------------------------------------------------------------------------------------------------------

}
