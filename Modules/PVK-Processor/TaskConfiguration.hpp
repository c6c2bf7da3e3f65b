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
#include <filesystem>
#include <ParkVisionKit.hpp>

#include "Task.hpp"
#include "OptionParser.hpp"

namespace clt
{

    struct TaskSettings
    {
        // Input / Task Settings
        Task task = Task::ParkingOccupancy;
        std::filesystem::path input_path;
        std::optional<std::filesystem::path> calibration_path;
        pvk::YoloDetectorSettings detector;

        // Output Settings
        std::optional<std::filesystem::path> output_folder;
        bool remove_old_results = false;
        std::optional<std::filesystem::path> ground_truth_folder;

        // Runtime Settings
        pvk::LogLevel log_level = pvk::LogLevel::Error;
        std::optional<std::filesystem::path> log_target;
        bool print_manual_only = false;

        // Dataset folders default to writing into their 'results' sub-folder.
        std::filesystem::path resolve_output_folder() const;

        bool has_folder_input() const;
    };


    // Fills in the task settings from the command line. The registered options refer
    // back into the configuration, so it cannot be copied, pass on its settings instead.
    struct TaskConfiguration : public TaskSettings
    {
    public:

        TaskConfiguration();

        TaskConfiguration(const TaskConfiguration&) = delete;

        TaskConfiguration& operator=(const TaskConfiguration&) = delete;

        std::optional<std::string> from_command_line(const int argc, const char* const argv[]);

        const TaskSettings& settings() const;

        void print_manual() const;

    private:

        void register_options();

        std::optional<std::string> parse_input(ArgQueue& arguments);

        std::optional<std::string> parse_profile(ArgQueue& arguments);

    private:
        OptionsParser m_OptionParser;
        std::optional<std::string> m_ParserError;
    };

}
