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

#include <catch2/catch_test_macros.hpp>

#include <set>

#include "summary_files.hpp"

using canopy::planting::LocationSummary;

namespace {
  std::vector<LocationSummary> summaries_named(
      std::initializer_list<std::string> names) {
    std::vector<LocationSummary> summaries;
    for (auto& name : names) {
      LocationSummary s;
      s.location.name = name;
      summaries.push_back(s);
    }
    return summaries;
  }
}  // namespace

TEST_CASE("summary file names are unique") {
  auto names = summary_file_names(summaries_named({"a", "a", "a_1"}));
  REQUIRE(names.size() == 3);
  CHECK(names[0] == "a.json");
  CHECK(names[1] == "a_1.json");
  CHECK(names[2] == "a_1_1.json");
  CHECK(std::set<std::string>(names.begin(), names.end()).size() == 3);
}

TEST_CASE("summary file names do not collide with the index") {
  auto names = summary_file_names(summaries_named({"index"}));
  REQUIRE(names.size() == 1);
  CHECK(names[0] == "index_1.json");
}

TEST_CASE("summary file names stay in the output directory") {
  auto names = summary_file_names(
      summaries_named({"../x/y", "/etc/passwd", "..", "", "Park Lane"}));
  REQUIRE(names.size() == 5);
  for (auto& name : names) {
    CHECK(name.find('/') == std::string::npos);
    CHECK(name.find('\\') == std::string::npos);
    CHECK(name.front() != '.');
  }
  CHECK(names[0] == "_x_y.json");
  CHECK(names[1] == "_etc_passwd.json");
  CHECK(names[2] == "location.json");
  CHECK(names[3] == "location_1.json");
  CHECK(names[4] == "Park_Lane.json");
}
