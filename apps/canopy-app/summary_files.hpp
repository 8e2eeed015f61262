// Copyright (c) 2018-2024 TU Delft 3D geoinformation group, Ravi Peters (3DGI),
// and Balazs Dukai (3DGI)

// This file is part of canopy, which is based on roofer
// (https://github.com/3DBAG/roofer)

// canopy is free software: you can redistribute it and/or modify it under the
// terms of the GNU General Public License as published by the Free Software
// Foundation, either version 3 of the License, or (at your option) any later
// version. canopy is distributed in the hope that it will be useful, but
// WITHOUT ANY WARRANTY; without even the implied warranty of MERCHANTABILITY or
// FITNESS FOR A PARTICULAR PURPOSE. See the GNU General Public License for more
// details. You should have received a copy of the GNU General Public License
// along with canopy. If not, see <https://www.gnu.org/licenses/>.

#pragma once
#include <canopy/planting/Summary.hpp>

#include <cctype>
#include <format>
#include <set>
#include <string>
#include <vector>

// Location name reduced to [A-Za-z0-9._-], without leading dots
inline std::string sanitise_file_stem(const std::string& name) {
  std::string stem;
  for (unsigned char c : name) {
    if (std::isalnum(c) || c == '-' || c == '_' || c == '.') {
      stem.push_back(char(c));
    } else {
      stem.push_back('_');
    }
  }
  stem.erase(0, stem.find_first_not_of('.'));
  if (stem.empty()) stem = "location";
  return stem;
}

// File names of the per location output, unique within a batch and never
// equal to the index file
inline std::vector<std::string> summary_file_names(
    const std::vector<canopy::planting::LocationSummary>& summaries,
    const std::string& index_name = "index.json") {
  std::vector<std::string> names;
  std::set<std::string> used = {index_name};
  for (auto& summary : summaries) {
    const std::string stem = sanitise_file_stem(summary.location.name);
    std::string name = stem + ".json";
    for (size_t n = 1; used.contains(name); ++n) {
      name = std::format("{}_{}.json", stem, n);
    }
    used.insert(name);
    names.push_back(name);
  }
  return names;
}
