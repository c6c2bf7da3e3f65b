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

#include "CSVLogger.hpp"

namespace pvk
{

//---------------------------------------------------------------------------------------------------------------------

    CSVLogger::CSVLogger(std::ostream& target)
        : Logger(target)
    {}

//---------------------------------------------------------------------------------------------------------------------

    void CSVLogger::end_record(std::ostream& stream)
    {
        stream << "\n";
    }

//---------------------------------------------------------------------------------------------------------------------

    void CSVLogger::begin_object(std::ostream& stream)
    {
        if(!is_new_record())
            stream << ",";
    }

//---------------------------------------------------------------------------------------------------------------------

    void CSVLogger::write_object(std::ostream& stream, const std::string& text)
    {
        // Fields containing separators, quotes or line breaks must be quoted (RFC 4180).
        if(text.find_first_of(",\"\r\n") == std::string::npos)
        {
            stream << text;
            return;
        }

        stream << '"';
        for(const char c : text)
        {
            if(c == '"') stream << '"';
            stream << c;
        }
        stream << '"';
    }

//---------------------------------------------------------------------------------------------------------------------

}
