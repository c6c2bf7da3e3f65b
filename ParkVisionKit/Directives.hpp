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
#include <cstring>
#include <functional>
#include <opencv2/core.hpp>

// UTILITY

// taken from https://stackoverflow.com/a/8488201
#ifdef _WIN32
#define PVK_FILE (strrchr(__FILE__, '\\') ? strrchr(__FILE__, '\\') + 1 : __FILE__)
#else
#define PVK_FILE (strrchr(__FILE__, '/') ? strrchr(__FILE__, '/') + 1 : __FILE__)
#endif

namespace pvk
{
    enum class LogLevel
    {
        Trace,
        Debug,
        Info,
        Warning,
        Error,
        Silent
    };
}

namespace pvk::context
{
    extern std::function<void(
        std::string file,
        std::string function,
        std::string assertion
    )> assert_handler;

    extern std::function<void(
        LogLevel level,
        std::string file,
        std::string function,
        std::string message
    )> log_handler;

    // Messages below this level are never formatted nor passed to the log handler.
    extern LogLevel log_level;
}


// ASSERTS

#ifndef PVK_DISABLE_CHECKS

#define PVK_ASSERT(assertion)																						   \
	if(!(assertion))																								   \
	{                                                                                                                  \
        pvk::context::assert_handler(PVK_FILE, __func__, #assertion);                                                  \
	}

#define PVK_ASSERT_IF(condition, assertion)                                                                            \
	if((condition) && !(assertion))                                                                                    \
	{                                                                                                                  \
        pvk::context::assert_handler(PVK_FILE, __func__, #assertion);                                                  \
	}

#else

#define PVK_ASSERT(assertion)
#define PVK_ASSERT_IF(condition, assertion)

#endif


// LOGGING

// NOTE: Arguments follow the cv::format(..) conventions.
#define PVK_LOG(level, ...)                                                                                            \
    if(pvk::context::log_handler && (level) >= pvk::context::log_level)                                               \
    {                                                                                                                  \
        pvk::context::log_handler(level, PVK_FILE, __func__, cv::format(__VA_ARGS__));                                 \
    }

#define PVK_LOG_TRACE(...)   PVK_LOG(pvk::LogLevel::Trace, __VA_ARGS__)
#define PVK_LOG_DEBUG(...)   PVK_LOG(pvk::LogLevel::Debug, __VA_ARGS__)
#define PVK_LOG_INFO(...)    PVK_LOG(pvk::LogLevel::Info, __VA_ARGS__)
#define PVK_LOG_WARNING(...) PVK_LOG(pvk::LogLevel::Warning, __VA_ARGS__)
#define PVK_LOG_ERROR(...)   PVK_LOG(pvk::LogLevel::Error, __VA_ARGS__)
