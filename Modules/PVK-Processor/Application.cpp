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

#include <iostream>
#include <ParkVisionKit.hpp>

#include "TaskConfiguration.hpp"
#include "BatchProcessor.hpp"
#include "ConsoleLogger.hpp"

int main(int argc, char* argv[])
{
    clt::TaskConfiguration configuration;

    // If no arguments were provided, print the manual
    if(argc == 1)
    {
        configuration.print_manual();
        return 0;
    }

    if(auto error = configuration.from_command_line(argc, argv); error.has_value())
    {
        std::cerr << error.value() << "\n";
        return 1;
    }

    if(configuration.print_manual_only)
    {
        configuration.print_manual();
        if(configuration.input_path.empty())
            return 0;
    }

    // Route library diagnostics through the console
    clt::ConsoleLogger console(std::cerr, configuration.log_level);
    pvk::context::log_level = configuration.log_level;
    pvk::context::log_handler = [&](auto level, auto file, auto function, auto message){
        console.log(level, file, function, message);
    };

    pvk::context::assert_handler = [](auto file, auto function, const std::string& assertion){
        std::cerr << cv::format(
            "ParkVisionKit failed condition: %s (%s - %s)\n",
            assertion.c_str(),
            file.c_str(),
            function.c_str()
        );
        std::abort();
    };

    clt::BatchProcessor processor(configuration.settings());
    if(auto error = processor.run(); error.has_value())
    {
        std::cerr << error.value() << "\n";
        return 1;
    }

    if(const auto failures = processor.failure_count(); failures > 0)
    {
        std::cerr << failures << " of " << processor.reports().size() << " items failed\n";
        return 1;
    }

    return 0;
}
