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

#include <type_traits>
#include <gtest/gtest.h>
#include <ParkVisionKit.hpp>

#include "OptionParser.hpp"
#include "TaskConfiguration.hpp"
#include "TestUtilities.hpp"

using namespace clt;

namespace
{
    std::optional<std::string> parse(TaskConfiguration& configuration, const std::vector<std::string>& arguments)
    {
        std::vector<const char*> argv = {"pvk"};
        for(const auto& argument : arguments)
            argv.push_back(argument.c_str());

        return configuration.from_command_line(static_cast<int>(argv.size()), argv.data());
    }
}

//---------------------------------------------------------------------------------------------------------------------

TEST(OptionsParser, ParsesSwitchesAndVariables)
{
    OptionsParser parser;
    EXPECT_TRUE(parser.is_empty());

    bool verbose = false;
    int width = 0;
    std::string name;

    parser.add_switch({"-v", "--verbose"}, "Verbose output.", &verbose);
    parser.add_variable("-w", "Working width.", &width);
    parser.add_variable<std::string>("-n", "Name.", [&](const std::string& value){ name = value; });

    ArgQueue arguments = {"--verbose", "-w", "640", "-n", "lot one", "rest"};
    while(parser.try_parse(arguments));

    EXPECT_TRUE(verbose);
    EXPECT_EQ(width, 640);
    EXPECT_EQ(name, "lot one");
    ASSERT_EQ(arguments.size(), 1u);
    EXPECT_EQ(arguments.front(), "rest");

    EXPECT_TRUE(parser.has_switch("-v"));
    EXPECT_TRUE(parser.has_variable("-w"));
    EXPECT_FALSE(parser.has_option("-q"));
    EXPECT_NE(parser.manual().find("-v, --verbose"), std::string::npos);
    EXPECT_NE(parser.manual("-w").find("Working width."), std::string::npos);
}

//---------------------------------------------------------------------------------------------------------------------

TEST(OptionsParser, ReportsBadArguments)
{
    OptionsParser parser;

    std::string failed_option, failed_argument;
    parser.set_error_handler([&](const std::string& option, const std::string& argument){
        failed_option = option;
        failed_argument = argument;
    });

    int width = 7;
    parser.add_variable("-w", "Working width.", &width);

    ArgQueue arguments = {"-w", "12abc"};
    EXPECT_FALSE(parser.try_parse(arguments));
    EXPECT_EQ(width, 7);
    EXPECT_EQ(failed_option, "-w");
    EXPECT_EQ(failed_argument, "12abc");
    EXPECT_EQ(arguments.size(), 2u);

    ArgQueue missing = {"-w"};
    EXPECT_FALSE(parser.try_parse(missing));
    EXPECT_EQ(failed_argument, "");
}

//---------------------------------------------------------------------------------------------------------------------

TEST(Task, Parsing)
{
    EXPECT_EQ(parse_task("parking"), Task::ParkingOccupancy);
    EXPECT_EQ(parse_task("Occupancy"), Task::ParkingOccupancy);
    EXPECT_EQ(parse_task("1"), Task::ParkingOccupancy);
    EXPECT_EQ(parse_task("QUEUE"), Task::QueueLength);
    EXPECT_EQ(parse_task("2"), Task::QueueLength);
    EXPECT_FALSE(parse_task("3").has_value());
    EXPECT_FALSE(parse_task("").has_value());

    EXPECT_STREQ(to_string(Task::QueueLength), "queue");

    EXPECT_EQ(parse_log_level("debug"), pvk::LogLevel::Debug);
    EXPECT_EQ(parse_log_level("TRACE"), pvk::LogLevel::Trace);
    EXPECT_FALSE(parse_log_level("loud").has_value());
}

//---------------------------------------------------------------------------------------------------------------------

TEST(TaskConfiguration, FromCommandLine)
{
    const pvk::test::TemporaryFolder folder;
    const auto input = folder.path().string();

    TaskConfiguration configuration;
    const auto error = parse(configuration, {
        "-t", "queue", "-l", "info", input, "-x", "-o", (folder / "out").string(), "-L", "log.csv", "-m", "model.onnx"
    });
    ASSERT_FALSE(error.has_value()) << *error;

    EXPECT_EQ(configuration.task, Task::QueueLength);
    EXPECT_EQ(configuration.log_level, pvk::LogLevel::Info);
    EXPECT_EQ(configuration.input_path, folder.path());
    EXPECT_TRUE(configuration.remove_old_results);
    EXPECT_EQ(configuration.resolve_output_folder(), folder / "out");
    EXPECT_EQ(configuration.log_target, std::filesystem::path("log.csv"));
    EXPECT_EQ(configuration.detector.model_path, "model.onnx");
    EXPECT_TRUE(configuration.has_folder_input());
}

//---------------------------------------------------------------------------------------------------------------------

TEST(TaskConfiguration, DefaultOutputFolder)
{
    const pvk::test::TemporaryFolder folder;

    TaskConfiguration configuration;
    ASSERT_FALSE(parse(configuration, {folder.path().string()}).has_value());

    EXPECT_EQ(configuration.task, Task::ParkingOccupancy);
    EXPECT_EQ(configuration.log_level, pvk::LogLevel::Error);
    EXPECT_EQ(configuration.resolve_output_folder(), folder / "results");
}

//---------------------------------------------------------------------------------------------------------------------

TEST(TaskConfiguration, LoadsProfiles)
{
    const pvk::test::TemporaryFolder folder;
    const auto profile = folder.write("queue.profile", "# Queue run\n-t 2\n-n classes.txt -x\n");

    TaskConfiguration configuration;
    ASSERT_FALSE(parse(configuration, {"-p", profile.string(), folder.path().string()}).has_value());

    EXPECT_EQ(configuration.task, Task::QueueLength);
    EXPECT_EQ(configuration.detector.classes_path, "classes.txt");
    EXPECT_TRUE(configuration.remove_old_results);
}

//---------------------------------------------------------------------------------------------------------------------

TEST(TaskConfiguration, Errors)
{
    const pvk::test::TemporaryFolder folder;
    const auto input = folder.path().string();

    const auto expect_error = [&](const std::vector<std::string>& arguments)
    {
        TaskConfiguration configuration;
        EXPECT_TRUE(parse(configuration, arguments).has_value());
    };

    expect_error({});
    expect_error({"-t", "bikes", input});
    expect_error({"-l", "loud", input});
    expect_error({input, "-L", "log.txt"});
    expect_error({input, "--unknown"});
    expect_error({(folder / "missing").string()});
    expect_error({"-p", (folder / "missing.profile").string(), input});
    expect_error({"-g", (folder / "missing").string(), input});
    expect_error({input, "-o"});
}

//---------------------------------------------------------------------------------------------------------------------

TEST(TaskConfiguration, SettingsOutliveTheParser)
{
    static_assert(!std::is_copy_constructible_v<TaskConfiguration>);
    static_assert(std::is_copy_constructible_v<TaskSettings>);

    const pvk::test::TemporaryFolder folder;

    TaskSettings settings;
    {
        TaskConfiguration configuration;
        ASSERT_FALSE(parse(configuration, {"-t", "queue", folder.path().string(), "-x"}).has_value());
        settings = configuration.settings();
    }

    EXPECT_EQ(settings.task, Task::QueueLength);
    EXPECT_EQ(settings.input_path, folder.path());
    EXPECT_TRUE(settings.remove_old_results);
    EXPECT_EQ(settings.resolve_output_folder(), folder / "results");
}

//---------------------------------------------------------------------------------------------------------------------
