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

#include "TaskConfiguration.hpp"

#include <fstream>
#include <sstream>
#include <iostream>

namespace clt
{

//---------------------------------------------------------------------------------------------------------------------

    TaskConfiguration::TaskConfiguration()
    {
        register_options();

        m_OptionParser.set_error_handler([this](auto& option, auto& argument)
        {
            if(argument.empty())
                m_ParserError = cv::format("Missing argument for option \'%s\'", option.c_str());
            else
                m_ParserError = cv::format(
                    "Failed to parse argument \'%s\' for option \'%s\'",
                    argument.c_str(),
                    option.c_str()
                );
        });
    }

//---------------------------------------------------------------------------------------------------------------------

    std::optional<std::string> TaskConfiguration::from_command_line(const int argc, const char* const argv[])
    {
        ArgQueue arguments;
        for(int i = 1; i < argc; i++)
            arguments.emplace_back(argv[i]);

        // The mandatory input is sandwiched between two sets of optional arguments.

        while(m_OptionParser.try_parse(arguments));
        if(m_ParserError.has_value())
            return m_ParserError;

        // The manual may be requested on its own.
        if(print_manual_only && arguments.empty())
            return std::nullopt;

        if(auto error = parse_input(arguments); error.has_value())
            return error;

        while(m_OptionParser.try_parse(arguments));
        if(m_ParserError.has_value())
            return m_ParserError;

        // Arguments are only left over if they didn't match any known option.
        if(!arguments.empty())
        {
            return cv::format(
                "Unknown argument \'%s\', use -h to see available options",
                arguments.front().c_str()
            );
        }

        return std::nullopt;
    }

//---------------------------------------------------------------------------------------------------------------------

    std::optional<std::string> TaskConfiguration::parse_input(ArgQueue& arguments)
    {
        if(arguments.empty())
            return "No input was specified";

        const std::filesystem::path input = arguments.front();
        if(m_OptionParser.has_option(input.string()))
            return cv::format("Expected an input path, got option \'%s\'", input.string().c_str());

        if(!std::filesystem::exists(input))
            return cv::format("Input \'%s\' does not exist", input.string().c_str());

        input_path = input;
        arguments.pop_front();

        return std::nullopt;
    }

//---------------------------------------------------------------------------------------------------------------------

    std::optional<std::string> TaskConfiguration::parse_profile(ArgQueue& arguments)
    {
        if(arguments.empty())
            return "No profile specified, expected path after -p";

        const std::filesystem::path path = arguments.front();
        if(!std::filesystem::is_regular_file(path))
            return cv::format("Profile \'%s\' does not exist", path.string().c_str());

        std::ifstream file(path);
        if(!file.good())
            return cv::format("Failed to open profile at \'%s\'", path.string().c_str());
        arguments.pop_front();

        // Profiles hold whitespace separated arguments, lines starting with '#' are ignored.
        std::vector<std::string> profile_args;
        for(std::string line; std::getline(file, line);)
        {
            if(line.empty() || line.front() == '#')
                continue;

            std::istringstream line_buffer(line);
            for(std::string arg; line_buffer >> arg;)
                profile_args.push_back(arg);
        }

        arguments.insert(arguments.begin(), profile_args.begin(), profile_args.end());
        return std::nullopt;
    }

//---------------------------------------------------------------------------------------------------------------------

    std::filesystem::path TaskSettings::resolve_output_folder() const
    {
        if(output_folder.has_value())
            return *output_folder;

        if(has_folder_input())
            return input_path / "results";

        return input_path.parent_path() / "results";
    }

//---------------------------------------------------------------------------------------------------------------------

    bool TaskSettings::has_folder_input() const
    {
        return std::filesystem::is_directory(input_path);
    }

//---------------------------------------------------------------------------------------------------------------------

    const TaskSettings& TaskConfiguration::settings() const
    {
        return *this;
    }

//---------------------------------------------------------------------------------------------------------------------

    void TaskConfiguration::print_manual() const
    {
        std::cout << "\nFormat: pvk [Options...] Input [Options...]"
                  << "\n\n";

        std::cout << "Where...\n"
                  << "\t * Input is either a single image or video file, or a dataset folder.\n"
                  << "\t * Parking datasets hold '<name>.jpg' images, each paired with a '<name>_query.txt' file "
                     "listing the queried slot numbers.\n"
                  << "\t * Queue datasets hold videos, of which the last frame is evaluated.\n"
                  << "\t * Results of a dataset are written to '<output>/<name>_results.txt', single file results "
                     "are printed to the console."
                  << "\n\n";

        std::cout << "Options: \n"
                  << m_OptionParser.manual()
                  << "\n";
    }

//---------------------------------------------------------------------------------------------------------------------

    void TaskConfiguration::register_options()
    {
        // Help / Meta Options

        m_OptionParser.add_switch(
            "-h",
            "Displays the complete configuration manual.",
            &print_manual_only
        );

        m_OptionParser.add_parser(
            "-p",
            "Loads a set of arguments from the specified file, allowing for saved profiles.",
            [this](ArgQueue& arguments)
            {
                // Pop '-p' from the arguments queue
                arguments.pop_front();

                if(auto error = parse_profile(arguments); error.has_value())
                {
                    m_ParserError = error;
                    return false;
                }
                return true;
            }
        );

        // Task Options

        m_OptionParser.add_variable<std::string>(
            "-t",
            "Selects the task to run, either 'parking' (1) for slot occupancy or 'queue' (2) for queue length.",
            [this](const std::string& name)
            {
                if(auto parsed = parse_task(name); parsed.has_value())
                    task = *parsed;
                else
                    m_ParserError = cv::format(
                        "Unknown task \'%s\', expected \'parking\' or \'queue\'",
                        name.c_str()
                    );
            }
        );

        m_OptionParser.add_variable<std::string>(
            "-c",
            "Loads the camera calibration from the given YAML, JSON or XML file.",
            [this](const std::string& path)
            {
                calibration_path = path;
            }
        );

        m_OptionParser.add_variable<std::string>(
            "-m",
            "Used to specify the ONNX model of the vehicle detector.",
            &detector.model_path
        );

        m_OptionParser.add_variable<std::string>(
            "-n",
            "Used to specify the class names file of the vehicle detector, one name per line.",
            &detector.classes_path
        );

        // Output Options

        m_OptionParser.add_variable<std::string>(
            "-o",
            "Used to specify the folder to write results into, created if missing.",
            [this](const std::string& path)
            {
                output_folder = path;
            }
        );

        m_OptionParser.add_switch(
            "-x",
            "Removes all old result files from the output folder before processing.",
            &remove_old_results
        );

        m_OptionParser.add_variable<std::string>(
            "-g",
            "Compares the results to the '<name>_gt.txt' ground truth files of the given folder.",
            [this](const std::string& path)
            {
                if(!std::filesystem::is_directory(path))
                {
                    m_ParserError = cv::format("Ground truth folder \'%s\' does not exist", path.c_str());
                    return;
                }
                ground_truth_folder = path;
            }
        );

        // Logging Options

        m_OptionParser.add_variable<std::string>(
            "-l",
            "Sets the minimum console log level: trace, debug, info, warning, error or silent.",
            [this](const std::string& name)
            {
                if(auto level = parse_log_level(name); level.has_value())
                    log_level = *level;
                else
                    m_ParserError = cv::format("Unknown log level \'%s\'", name.c_str());
            }
        );

        m_OptionParser.add_variable<std::string>(
            "-L",
            "Turns on per-item result and timing logging to the specified CSV filepath.",
            [this](const std::string& path_arg)
            {
                const std::filesystem::path path = path_arg;
                if(path.extension() != ".csv")
                {
                    m_ParserError = cv::format(
                        "Invalid data logging target, got file type \'%s\', expected \'.csv\'",
                        path.extension().string().c_str()
                    );
                    return;
                }
                log_target = path;
            }
        );
    }

//---------------------------------------------------------------------------------------------------------------------

}
