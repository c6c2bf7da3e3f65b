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

#include "ConsoleLogger.hpp"

#ifdef WIN32
#define NOMINMAX
#define WIN32_LEAN_AND_MEAN
#include <Windows.h>
#endif

namespace clt
{

//---------------------------------------------------------------------------------------------------------------------

    ConsoleLogger::ConsoleLogger(std::ostream& target, const pvk::LogLevel level)
        : pvk::Logger(target),
          m_Level(level)
    {
#ifdef WIN32
        // Windows consoles need virtual terminal mode to understand ANSI codes.
        auto handle = GetStdHandle(STD_OUTPUT_HANDLE);
        DWORD mode = 0;
        if(GetConsoleMode(handle, &mode))
            SetConsoleMode(handle, mode | ENABLE_VIRTUAL_TERMINAL_PROCESSING);
#endif
    }

//---------------------------------------------------------------------------------------------------------------------

    ConsoleLogger::~ConsoleLogger()
    {
        flush();
    }

//---------------------------------------------------------------------------------------------------------------------

    void ConsoleLogger::log(
        const pvk::LogLevel level,
        const std::string& file,
        const std::string& function,
        const std::string& message
    )
    {
        if(!accepts(level))
            return;

        m_RecordLevel = level;
        write(cv::format("[%s] %s - %s : %s", label_of(level), file.c_str(), function.c_str(), message.c_str()));
        next();
    }

//---------------------------------------------------------------------------------------------------------------------

    bool ConsoleLogger::accepts(const pvk::LogLevel level) const
    {
        return level != pvk::LogLevel::Silent && level >= m_Level;
    }

//---------------------------------------------------------------------------------------------------------------------

    void ConsoleLogger::set_level(const pvk::LogLevel level)
    {
        m_Level = level;
    }

//---------------------------------------------------------------------------------------------------------------------

    pvk::LogLevel ConsoleLogger::level() const
    {
        return m_Level;
    }

//---------------------------------------------------------------------------------------------------------------------

    void ConsoleLogger::set_colours(const bool enabled)
    {
        m_Colours = enabled;
    }

//---------------------------------------------------------------------------------------------------------------------

    const char* ConsoleLogger::label_of(const pvk::LogLevel level)
    {
        switch(level)
        {
            case pvk::LogLevel::Trace:   return "TRACE";
            case pvk::LogLevel::Debug:   return "DEBUG";
            case pvk::LogLevel::Info:    return "INFO";
            case pvk::LogLevel::Warning: return "WARNING";
            case pvk::LogLevel::Error:   return "ERROR";
            case pvk::LogLevel::Silent:  return "SILENT";
        }
        return "UNKNOWN";
    }

//---------------------------------------------------------------------------------------------------------------------

    void ConsoleLogger::begin_record(std::ostream& stream)
    {
        if(!m_Colours)
            return;

        switch(m_RecordLevel)
        {
            case pvk::LogLevel::Trace:   stream << "\033[90m"; break; // Grey
            case pvk::LogLevel::Debug:   stream << "\033[36m"; break; // Cyan
            case pvk::LogLevel::Info:    stream << "\033[32m"; break; // Green
            case pvk::LogLevel::Warning: stream << "\033[33m"; break; // Yellow
            case pvk::LogLevel::Error:   stream << "\033[31m"; break; // Red
            case pvk::LogLevel::Silent:  break;
        }
    }

//---------------------------------------------------------------------------------------------------------------------

    void ConsoleLogger::end_record(std::ostream& stream)
    {
        if(m_Colours)
            stream << "\033[0m";

        stream << "\n";
    }

//---------------------------------------------------------------------------------------------------------------------

}
