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

#include <sstream>

#include "Directives.hpp"

namespace pvk
{

//---------------------------------------------------------------------------------------------------------------------

    inline const Logger::NextSignal Logger::Next{};

//---------------------------------------------------------------------------------------------------------------------

	// NOTE: the target stream must outlive the logger.
	inline Logger::Logger(std::ostream& target)
		: m_Stream(target)
	{
		PVK_ASSERT(target.good());
	}

//---------------------------------------------------------------------------------------------------------------------

	template<typename T>
	inline Logger& Logger::write(const T& object)
	{
        if(m_NewRecord)
            begin_record(m_Stream);

        // Objects are formatted separately so that derived
        // loggers can escape or decorate the full text.
        std::ostringstream text;
        text.copyfmt(m_Stream);
        text << object;

        begin_object(m_Stream);
        write_object(m_Stream, text.str());
        end_object(m_Stream);

        // NOTE: we update this here so that is_new_record() is
        // accurate through-out the begin/end object functions.
        m_NewRecord = false;
        m_Started = true;

		return *this;
	}

//---------------------------------------------------------------------------------------------------------------------

	template<typename T>
	inline Logger& Logger::operator<<(const T& object)
	{
		return write(object);
	}

//---------------------------------------------------------------------------------------------------------------------

    inline Logger& Logger::operator<<(const NextSignal&)
    {
        next();
        return *this;
    }

//---------------------------------------------------------------------------------------------------------------------

	template<typename T>
	inline Logger& Logger::append(const T& object)
	{
        m_Stream << object;
		return *this;
	}

//---------------------------------------------------------------------------------------------------------------------

	inline std::ostream& Logger::raw()
	{
		return m_Stream;
	}

//---------------------------------------------------------------------------------------------------------------------

	inline void Logger::next()
	{
        end_record(m_Stream);
        m_NewRecord = true;
        m_RecordCount++;
	}

//---------------------------------------------------------------------------------------------------------------------

	inline void Logger::flush()
	{
		m_Stream.flush();
	}

//---------------------------------------------------------------------------------------------------------------------

	inline bool Logger::is_new_record() const
	{
		return m_NewRecord;
	}

//---------------------------------------------------------------------------------------------------------------------

	inline bool Logger::has_error() const
	{
		return m_Stream.fail();
	}

//---------------------------------------------------------------------------------------------------------------------

    inline bool Logger::has_started() const
    {
        return m_Started;
    }

//---------------------------------------------------------------------------------------------------------------------

    inline size_t Logger::record_count() const
    {
        return m_RecordCount;
    }

//---------------------------------------------------------------------------------------------------------------------

	inline void Logger::begin_object(std::ostream&) {}

//---------------------------------------------------------------------------------------------------------------------

	inline void Logger::end_object(std::ostream&) {}

//---------------------------------------------------------------------------------------------------------------------

	inline void Logger::begin_record(std::ostream&) {}

//---------------------------------------------------------------------------------------------------------------------

	inline void Logger::end_record(std::ostream& stream)
	{
		stream << "\n";
	}

//---------------------------------------------------------------------------------------------------------------------

    inline void Logger::write_object(std::ostream& stream, const std::string& text)
    {
        stream << text;
    }

//---------------------------------------------------------------------------------------------------------------------
}
