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
#include <gtest/gtest.h>
#include <ParkVisionKit.hpp>

#include "ConsoleLogger.hpp"

using namespace pvk;

//---------------------------------------------------------------------------------------------------------------------

TEST(CSVLogger, WritesRecords)
{
    std::ostringstream stream;
    CSVLogger logger(stream);

    EXPECT_FALSE(logger.has_started());

    logger << "Item" << "Status" << Logger::Next;
    logger << "lot_01" << 3 << Logger::Next;

    EXPECT_EQ(stream.str(), "Item,Status\nlot_01,3\n");
    EXPECT_EQ(logger.record_count(), 2u);
    EXPECT_TRUE(logger.has_started());
    EXPECT_FALSE(logger.has_error());
}

//---------------------------------------------------------------------------------------------------------------------

TEST(CSVLogger, QuotesSpecialFields)
{
    std::ostringstream stream;
    CSVLogger logger(stream);

    logger << "a,b" << "say \"hi\"" << "plain" << Logger::Next;

    EXPECT_EQ(stream.str(), "\"a,b\",\"say \"\"hi\"\"\",plain\n");
}

//---------------------------------------------------------------------------------------------------------------------

TEST(ConsoleLogger, FiltersByLevel)
{
    std::ostringstream stream;
    clt::ConsoleLogger logger(stream, LogLevel::Warning);
    logger.set_colours(false);

    logger.log(LogLevel::Info, "File.cpp", "function", "hidden");
    logger.log(LogLevel::Warning, "File.cpp", "function", "shown");
    logger.log(LogLevel::Error, "Other.cpp", "run", "failed");

    EXPECT_EQ(
        stream.str(),
        "[WARNING] File.cpp - function : shown\n"
        "[ERROR] Other.cpp - run : failed\n"
    );

    logger.set_level(LogLevel::Silent);
    EXPECT_FALSE(logger.accepts(LogLevel::Error));
}

//---------------------------------------------------------------------------------------------------------------------

TEST(ConsoleLogger, ColoursByLevel)
{
    std::ostringstream stream;
    clt::ConsoleLogger logger(stream, LogLevel::Trace);

    logger.log(LogLevel::Error, "File.cpp", "function", "message");

    EXPECT_EQ(stream.str(), "\033[31m[ERROR] File.cpp - function : message\033[0m\n");
}

//---------------------------------------------------------------------------------------------------------------------

TEST(LogHandler, ReceivesLibraryMessages)
{
    std::vector<std::string> messages;

    context::log_level = LogLevel::Debug;
    context::log_handler = [&](LogLevel level, std::string, std::string, std::string message){
        if(level >= LogLevel::Debug)
            messages.push_back(message);
    };

    const Quadrilateral square({0, 0}, {10, 0}, {10, 10}, {0, 10});
    square.enclosed({{5, 5}, {20, 20}});

    context::log_handler = nullptr;
    context::log_level = LogLevel::Error;

    ASSERT_EQ(messages.size(), 2u);
    EXPECT_EQ(messages[0], "(5, 5) is inside the region");
    EXPECT_EQ(messages[1], "(20, 20) is outside the region, removing it");
}

//---------------------------------------------------------------------------------------------------------------------

TEST(Error, Describe)
{
    const Error error{ErrorKind::OutOfBounds, "Region exceeds image"};

    EXPECT_EQ(error.describe(), "OutOfBounds: Region exceeds image");
    EXPECT_STREQ(to_string(ErrorKind::DegenerateConfiguration), "DegenerateConfiguration");

    std::ostringstream stream;
    stream << error;
    EXPECT_EQ(stream.str(), error.describe());
}

//---------------------------------------------------------------------------------------------------------------------
