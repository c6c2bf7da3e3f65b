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
#include <iostream>
#include <ParkVisionKit.hpp>

namespace clt
{

    // Writes leveled records as '[LEVEL] file - function : message', coloured by level.
    class ConsoleLogger final : public pvk::Logger
    {
    public:

        explicit ConsoleLogger(std::ostream& target = std::cout, const pvk::LogLevel level = pvk::LogLevel::Error);

        ~ConsoleLogger() override;

        void log(
            const pvk::LogLevel level,
            const std::string& file,
            const std::string& function,
            const std::string& message
        );

        bool accepts(const pvk::LogLevel level) const;

        void set_level(const pvk::LogLevel level);

        pvk::LogLevel level() const;

        void set_colours(const bool enabled);

        static const char* label_of(const pvk::LogLevel level);

    protected:

        void begin_record(std::ostream& stream) override;

        void end_record(std::ostream& stream) override;

    private:
        pvk::LogLevel m_Level;
        pvk::LogLevel m_RecordLevel = pvk::LogLevel::Info;
        bool m_Colours = true;
    };

}
