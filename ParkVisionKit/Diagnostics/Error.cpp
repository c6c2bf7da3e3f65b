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

#include "Error.hpp"

namespace pvk
{

//---------------------------------------------------------------------------------------------------------------------

    const char* to_string(const ErrorKind kind)
    {
        switch(kind)
        {
            case ErrorKind::InvalidArgument:         return "InvalidArgument";
            case ErrorKind::DegenerateConfiguration: return "DegenerateConfiguration";
            case ErrorKind::OutOfBounds:             return "OutOfBounds";
            case ErrorKind::NotFound:                return "NotFound";
            case ErrorKind::DecodeError:             return "DecodeError";
        }
        return "Unknown";
    }

//---------------------------------------------------------------------------------------------------------------------

    std::string Error::describe() const
    {
        return std::string(to_string(kind)) + ": " + message;
    }

//---------------------------------------------------------------------------------------------------------------------

    std::ostream& operator<<(std::ostream& stream, const Error& error)
    {
        return stream << error.describe();
    }

//---------------------------------------------------------------------------------------------------------------------

}
