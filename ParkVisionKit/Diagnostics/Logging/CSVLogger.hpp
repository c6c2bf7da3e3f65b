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

#include <ostream>

#include "Logger.hpp"

namespace pvk
{

	class CSVLogger : public Logger
	{
	public:

		explicit CSVLogger(std::ostream& target);

		~CSVLogger() override = default;

	protected:

		void end_record(std::ostream& stream) override;

		void begin_object(std::ostream& stream) override;

        void write_object(std::ostream& stream, const std::string& text) override;

	};

}
