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

#include <canopy/io/VectorReader.hpp>

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include <cmath>
#include <filesystem>
#include <fstream>

using namespace canopy;
using Catch::Matchers::WithinAbs;

namespace fs = std::filesystem;

namespace {
  const char* STREET_GEOJSON = R"({
  "type": "FeatureCollection",
  "features": [
    {"type": "Feature",
     "properties": {"building": "yes", "amenity": "school"},
     "geometry": {"type": "Polygon", "coordinates": [[[4.0, 52.0], [4.002, 52.0], [4.002, 52.002], [4.0, 52.002], [4.0, 52.0]]]}},
    {"type": "Feature",
     "properties": {"highway": "footway"},
     "geometry": {"type": "LineString", "coordinates": [[4.0, 52.003], [4.004, 52.003]]}},
    {"type": "Feature",
     "properties": {"amenity": "cafe"},
     "geometry": {"type": "Point", "coordinates": [4.003, 52.001]}},
    {"type": "Feature",
     "properties": {"building": "no"},
     "geometry": {"type": "Polygon", "coordinates": [[[4.005, 52.0], [4.006, 52.0], [4.006, 52.001], [4.005, 52.0]]]}}
  ]
})";

  fs::path write_temp_geojson(const std::string& name, const char* content) {
    auto path = fs::temp_directory_path() / name;
    std::ofstream ofs(path);
    ofs << content;
    return path;
  }

  size_t count_type(const GeometryCollection& features, FeatureType type) {
    size_t n = 0;
    for (auto& f : features) {
      if (f.type == type) ++n;
    }
    return n;
  }
}  // namespace

TEST_CASE("read buildings, streets and amenities from GeoJSON") {
  auto path = write_temp_geojson("canopy_test_features.geojson", STREET_GEOJSON);

  auto reader = io::createVectorReaderOGR();
  reader->open(path.string());
  CHECK(reader->get_feature_count() == 4);
  auto features = reader->read_features();
  fs::remove(path);

  CHECK(features.size() == 4);
  CHECK(count_type(features, FeatureType::building) == 1);
  CHECK(count_type(features, FeatureType::street) == 1);

  SECTION("a building tagged as amenity is read as both") {
    REQUIRE(count_type(features, FeatureType::amenity) == 2);
    bool found_school = false;
    for (auto& f : features) {
      if (f.type != FeatureType::amenity) continue;
      REQUIRE(f.coordinates.size() == 1);
      if (std::abs(f.coordinates[0][0] - 4.001) < 1e-6) {
        found_school = true;
        CHECK_THAT(f.coordinates[0][1], WithinAbs(52.001, 1e-7));
      } else {
        CHECK_THAT(f.coordinates[0][0], WithinAbs(4.003, 1e-7));
        CHECK_THAT(f.coordinates[0][1], WithinAbs(52.001, 1e-7));
      }
    }
    CHECK(found_school);
  }

  SECTION("street class comes from the street attribute") {
    for (auto& f : features) {
      if (f.type != FeatureType::street) continue;
      CHECK(f.street_class == "footway");
      CHECK(f.coordinates.size() == 2);
    }
  }
}

TEST_CASE("vector reader needs an opened source") {
  auto reader = io::createVectorReaderOGR();
  CHECK_THROWS(reader->read_features());
  CHECK_THROWS(reader->open("/nonexistent/canopy/features.geojson"));
}
