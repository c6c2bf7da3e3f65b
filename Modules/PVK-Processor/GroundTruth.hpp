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
#include <vector>
#include <optional>
#include <filesystem>
#include <ParkVisionKit.hpp>

namespace clt
{

    struct GroundTruthMatch
    {
        std::string name;
        bool matches;
    };

    // Pairs every '<name>_results.txt' with the '<name>_gt.txt' of the ground truth folder.
    // Results without a ground truth counterpart are skipped.
    std::optional<pvk::Error> compare_to_ground_truth(
        const std::filesystem::path& results_folder,
        const std::filesystem::path& ground_truth_folder,
        std::vector<GroundTruthMatch>& matches
    );

    // Equal line counts and equal lines once surrounding whitespace is trimmed.
    bool lines_match(const std::vector<std::string>& results, const std::vector<std::string>& ground_truth);

    // Strips the last '_' separated part of the file stem, 'lot_01_results.txt' becomes 'lot_01'.
    std::string item_name_of(const std::filesystem::path& path);

}
