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
#include <ostream>

namespace pvk
{

    enum class ErrorKind
    {
        InvalidArgument,
        DegenerateConfiguration,
        OutOfBounds,
        NotFound,
        DecodeError
    };

    // NOTE: Operations which can fail return std::optional<Error>,
    // with any results written to their output parameters on success.
    struct Error
    {
        ErrorKind kind;
        std::string message;

        std::string describe() const;
    };

    const char* to_string(const ErrorKind kind);

    std::ostream& operator<<(std::ostream& stream, const Error& error);

}
