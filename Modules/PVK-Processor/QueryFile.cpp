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

#include "QueryFile.hpp"

#include <fstream>
#include <cctype>
#include <charconv>
#include <algorithm>
#include <filesystem>

namespace clt
{

//---------------------------------------------------------------------------------------------------------------------

    std::string trim(const std::string& text)
    {
        constexpr const char* whitespace = " \t\r\n\f\v";

        const auto begin = text.find_first_not_of(whitespace);
        if(begin == std::string::npos)
            return "";

        const auto end = text.find_last_not_of(whitespace);
        return text.substr(begin, end - begin + 1);
    }

//---------------------------------------------------------------------------------------------------------------------

    std::optional<pvk::Error> read_lines(const std::string& path, std::vector<std::string>& lines)
    {
        if(!std::filesystem::is_regular_file(path))
            return pvk::Error{pvk::ErrorKind::NotFound, cv::format("File '%s' does not exist", path.c_str())};

        std::ifstream file(path);
        if(!file.good())
            return pvk::Error{pvk::ErrorKind::DecodeError, cv::format("Failed to open '%s'", path.c_str())};

        std::vector<std::string> contents;
        for(std::string line; std::getline(file, line);)
        {
            if(auto trimmed = trim(line); !trimmed.empty())
                contents.push_back(std::move(trimmed));
        }

        if(file.bad())
            return pvk::Error{pvk::ErrorKind::DecodeError, cv::format("Failed to read '%s'", path.c_str())};

        lines = std::move(contents);
        return std::nullopt;
    }

//---------------------------------------------------------------------------------------------------------------------

    std::optional<pvk::Error> write_lines(const std::string& path, const std::vector<std::string>& lines)
    {
        std::ofstream file(path, std::ios::trunc);
        if(!file.good())
            return pvk::Error{pvk::ErrorKind::NotFound, cv::format("Cannot write to '%s'", path.c_str())};

        for(const auto& line : lines)
            file << line << '\n';

        file.flush();
        if(file.fail())
            return pvk::Error{pvk::ErrorKind::DecodeError, cv::format("Failed writing to '%s'", path.c_str())};

        return std::nullopt;
    }

//---------------------------------------------------------------------------------------------------------------------

    static bool is_slot_occupied(const std::string& query, const std::vector<bool>& slots)
    {
        if(query.empty() || !std::all_of(query.begin(), query.end(), [](unsigned char c){ return std::isdigit(c); }))
            return false;

        size_t slot = 0;
        const auto [end, error] = std::from_chars(query.data(), query.data() + query.size(), slot);
        if(error != std::errc() || end != query.data() + query.size())
            return false;

        return slot >= 1 && slot <= slots.size() && slots[slot - 1];
    }

//---------------------------------------------------------------------------------------------------------------------

    std::vector<std::string> answer_queries(const std::vector<std::string>& queries, const std::vector<bool>& slots)
    {
        std::vector<std::string> answers;
        answers.reserve(queries.size());

        for(size_t i = 0; i < queries.size(); i++)
        {
            if(i == 0)
            {
                answers.push_back(queries[i]);
                continue;
            }

            const bool occupied = is_slot_occupied(queries[i], slots);
            answers.push_back(queries[i] + (occupied ? " 1" : " 0"));
        }

        return answers;
    }

//---------------------------------------------------------------------------------------------------------------------

}
