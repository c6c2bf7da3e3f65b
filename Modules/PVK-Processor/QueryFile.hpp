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
#include <ParkVisionKit.hpp>

namespace clt
{

    // Reads all non-blank lines, trimmed of surrounding whitespace.
    std::optional<pvk::Error> read_lines(const std::string& path, std::vector<std::string>& lines);

    std::optional<pvk::Error> write_lines(const std::string& path, const std::vector<std::string>& lines);

    // The first line holds the query count and is echoed unchanged. Every other line names a
    // 1-based slot and is answered with ' 1' if the slot is occupied, ' 0' if it is free, unknown
    // or not a slot number at all.
    std::vector<std::string> answer_queries(const std::vector<std::string>& queries, const std::vector<bool>& slots);

    std::string trim(const std::string& text);

}
