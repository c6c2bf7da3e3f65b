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

#include "GroundTruth.hpp"

#include <map>
#include <fstream>

#include "QueryFile.hpp"

namespace clt
{

//---------------------------------------------------------------------------------------------------------------------

    std::string item_name_of(const std::filesystem::path& path)
    {
        const auto stem = path.stem().string();
        const auto separator = stem.rfind('_');

        return separator == std::string::npos ? stem : stem.substr(0, separator);
    }

//---------------------------------------------------------------------------------------------------------------------

    bool lines_match(const std::vector<std::string>& results, const std::vector<std::string>& ground_truth)
    {
        if(results.size() != ground_truth.size())
            return false;

        for(size_t i = 0; i < results.size(); i++)
        {
            if(trim(results[i]) != trim(ground_truth[i]))
                return false;
        }
        return true;
    }

//---------------------------------------------------------------------------------------------------------------------

    static std::map<std::string, std::filesystem::path> list_files(
        const std::filesystem::path& folder,
        const std::string& suffix
    )
    {
        std::map<std::string, std::filesystem::path> files;
        for(const auto& entry : std::filesystem::directory_iterator(folder))
        {
            const auto filename = entry.path().filename().string();
            if(entry.is_regular_file() && filename.size() > suffix.size() && filename.ends_with(suffix))
                files.emplace(item_name_of(entry.path()), entry.path());
        }
        return files;
    }

//---------------------------------------------------------------------------------------------------------------------

    static std::vector<std::string> read_raw_lines(const std::filesystem::path& path)
    {
        std::vector<std::string> lines;

        std::ifstream file(path);
        for(std::string line; std::getline(file, line);)
            lines.push_back(line);

        return lines;
    }

//---------------------------------------------------------------------------------------------------------------------

    std::optional<pvk::Error> compare_to_ground_truth(
        const std::filesystem::path& results_folder,
        const std::filesystem::path& ground_truth_folder,
        std::vector<GroundTruthMatch>& matches
    )
    {
        if(!std::filesystem::is_directory(results_folder))
        {
            return pvk::Error{
                pvk::ErrorKind::NotFound,
                cv::format("Results folder '%s' does not exist", results_folder.string().c_str())
            };
        }

        if(!std::filesystem::is_directory(ground_truth_folder))
        {
            return pvk::Error{
                pvk::ErrorKind::NotFound,
                cv::format("Ground truth folder '%s' does not exist", ground_truth_folder.string().c_str())
            };
        }

        const auto results = list_files(results_folder, "_results.txt");
        const auto ground_truths = list_files(ground_truth_folder, "_gt.txt");

        std::vector<GroundTruthMatch> comparison;
        for(const auto& [name, result_path] : results)
        {
            const auto gt = ground_truths.find(name);
            if(gt == ground_truths.end())
            {
                PVK_LOG_WARNING("No ground truth found for '%s'", name.c_str());
                continue;
            }

            comparison.push_back({name, lines_match(read_raw_lines(result_path), read_raw_lines(gt->second))});
        }

        matches = std::move(comparison);
        return std::nullopt;
    }

//---------------------------------------------------------------------------------------------------------------------

}
