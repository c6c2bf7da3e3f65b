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

#include <gtest/gtest.h>
#include <ParkVisionKit.hpp>

#include "GroundTruth.hpp"
#include "TestUtilities.hpp"

using namespace clt;

//---------------------------------------------------------------------------------------------------------------------

TEST(GroundTruth, ItemNames)
{
    EXPECT_EQ(item_name_of("results/lot_01_results.txt"), "lot_01");
    EXPECT_EQ(item_name_of("gt/03_gt.txt"), "03");
    EXPECT_EQ(item_name_of("plain.txt"), "plain");
}

//---------------------------------------------------------------------------------------------------------------------

TEST(GroundTruth, LinesMatchIgnoringWhitespace)
{
    EXPECT_TRUE(lines_match({"3", "1 1 "}, {"3", " 1 1\r"}));
    EXPECT_FALSE(lines_match({"3", "1 1"}, {"3", "1 0"}));
    EXPECT_FALSE(lines_match({"3"}, {"3", "1 0"}));
    EXPECT_TRUE(lines_match({}, {}));
}

//---------------------------------------------------------------------------------------------------------------------

TEST(GroundTruth, ComparesFolders)
{
    const pvk::test::TemporaryFolder results, truth;

    results.write("01_results.txt", "2\n1 1\n2 0\n");
    results.write("02_results.txt", "1\n4 1\n");
    results.write("03_results.txt", "5\n");
    results.write("notes.txt", "ignored");

    truth.write("01_gt.txt", "2\n1 1\n2 0\n");
    truth.write("02_gt.txt", "1\n4 0\n");

    std::vector<GroundTruthMatch> matches;
    ASSERT_FALSE(compare_to_ground_truth(results.path(), truth.path(), matches).has_value());

    ASSERT_EQ(matches.size(), 2u);
    EXPECT_EQ(matches[0].name, "01");
    EXPECT_TRUE(matches[0].matches);
    EXPECT_EQ(matches[1].name, "02");
    EXPECT_FALSE(matches[1].matches);

    const auto error = compare_to_ground_truth(results / "missing", truth.path(), matches);
    ASSERT_TRUE(error.has_value());
    EXPECT_EQ(error->kind, pvk::ErrorKind::NotFound);
}

//---------------------------------------------------------------------------------------------------------------------
