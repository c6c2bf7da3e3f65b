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

#include <chrono>

namespace pvk
{
	class Time
	{
	public:
		using Clock = std::chrono::high_resolution_clock;

		static Time Now();

		Time() = default;

		explicit Time(const std::chrono::nanoseconds duration);

		double seconds() const;

		double milliseconds() const;

		void operator+=(const Time& other);

		Time operator-(const Time& other) const;

	private:
		std::chrono::nanoseconds m_Time{0};
	};

}
