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

#include "Task.hpp"

#include <cctype>
#include <algorithm>

namespace clt
{

//---------------------------------------------------------------------------------------------------------------------

    static std::string lowercase(std::string text)
    {
        std::transform(text.begin(), text.end(), text.begin(), [](unsigned char c){
            return static_cast<char>(std::tolower(c));
        });
        return text;
    }

//---------------------------------------------------------------------------------------------------------------------

    std::optional<Task> parse_task(const std::string& name)
    {
        const auto key = lowercase(name);

        if(key == "parking" || key == "occupancy" || key == "1")
            return Task::ParkingOccupancy;

        if(key == "queue" || key == "2")
            return Task::QueueLength;

        return std::nullopt;
    }

//---------------------------------------------------------------------------------------------------------------------

    const char* to_string(const Task task)
    {
        switch(task)
        {
            case Task::ParkingOccupancy: return "parking";
            case Task::QueueLength:      return "queue";
        }
        return "unknown";
    }

//---------------------------------------------------------------------------------------------------------------------

    std::optional<pvk::LogLevel> parse_log_level(const std::string& name)
    {
        const auto key = lowercase(name);

        if(key == "trace")   return pvk::LogLevel::Trace;
        if(key == "debug")   return pvk::LogLevel::Debug;
        if(key == "info")    return pvk::LogLevel::Info;
        if(key == "warning" || key == "warn") return pvk::LogLevel::Warning;
        if(key == "error")   return pvk::LogLevel::Error;
        if(key == "silent" || key == "off")   return pvk::LogLevel::Silent;

        return std::nullopt;
    }

//---------------------------------------------------------------------------------------------------------------------

}
