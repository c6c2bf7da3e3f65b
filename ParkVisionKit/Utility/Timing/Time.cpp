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

#include "Time.hpp"

namespace pvk
{

//---------------------------------------------------------------------------------------------------------------------

	Time Time::Now()
	{
		return Time(std::chrono::duration_cast<std::chrono::nanoseconds>(Clock::now().time_since_epoch()));
	}

//---------------------------------------------------------------------------------------------------------------------

	Time::Time(const std::chrono::nanoseconds duration)
		: m_Time(duration)
	{}

//---------------------------------------------------------------------------------------------------------------------

	double Time::seconds() const
	{
		return std::chrono::duration<double>(m_Time).count();
	}

//---------------------------------------------------------------------------------------------------------------------

	double Time::milliseconds() const
	{
		return std::chrono::duration<double, std::milli>(m_Time).count();
	}

//---------------------------------------------------------------------------------------------------------------------

	void Time::operator+=(const Time& other)
	{
		m_Time += other.m_Time;
	}

//---------------------------------------------------------------------------------------------------------------------

	Time Time::operator-(const Time& other) const
	{
		return Time(m_Time - other.m_Time);
	}

//---------------------------------------------------------------------------------------------------------------------

}
