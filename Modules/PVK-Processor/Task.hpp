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
#include <ParkVisionKit.hpp>

namespace clt
{

    enum class Task
    {
        ParkingOccupancy,
        QueueLength
    };

    // Accepts 'parking', 'occupancy' or '1' and 'queue' or '2', ignoring case.
    std::optional<Task> parse_task(const std::string& name);

    const char* to_string(const Task task);

    std::optional<pvk::LogLevel> parse_log_level(const std::string& name);

}
