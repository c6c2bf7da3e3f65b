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

#include "Directives.hpp"

#include <iostream>
#include <cstdlib>

namespace pvk::context
{

//---------------------------------------------------------------------------------------------------------------------

    std::function<void(std::string, std::string, std::string)> assert_handler =
        [](const std::string& file, const std::string& function, const std::string& assertion)
    {
        std::cerr << "ParkVisionKit " << file << "@" << function << "(..) failed condition: " << assertion << "\n";
        std::abort();
    };

//---------------------------------------------------------------------------------------------------------------------

    // NOTE: No logging takes place until an application installs a handler.
    std::function<void(LogLevel, std::string, std::string, std::string)> log_handler;

    LogLevel log_level = LogLevel::Error;

//---------------------------------------------------------------------------------------------------------------------

}
