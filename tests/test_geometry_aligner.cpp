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

#include <canopy/misc/projHelper.hpp>
#include <canopy/planting/GeometryAligner.hpp>

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include <cmath>
#include <limits>

#include "test_data.hpp"

using namespace canopy;
using namespace canopy::planting;
using Catch::Matchers::WithinAbs;

namespace {
  GeoFeature polygon(std::initializer_list<arr2d> metric) {
    GeoFeature f;
    f.type = FeatureType::building;
    for (auto& p : metric) f.coordinates.push_back(test::metric_to_geo(p[0], p[1]));
    return f;
  }

  GeoFeature street(std::string street_class,
                    std::initializer_list<arr2d> metric) {
    GeoFeature f;
    f.type = FeatureType::street;
    f.street_class = street_class;
    for (auto& p : metric) f.coordinates.push_back(test::metric_to_geo(p[0], p[1]));
    return f;
  }

  GeoFeature amenity(double x, double y) {
    GeoFeature f;
    f.type = FeatureType::amenity;
    f.coordinates.push_back(test::metric_to_geo(x, y));
    return f;
  }

  AlignmentConfig no_correction() {
    AlignmentConfig cfg;
    cfg.scale = 1;
    cfg.offset_east_m = 0;
    cfg.offset_north_m = 0;
    return cfg;
  }
}  // namespace

TEST_CASE("street class to traffic tier") {
  CHECK(classify_street("footway") == TrafficTier::pedestrian);
  CHECK(classify_street("pedestrian") == TrafficTier::pedestrian);
  CHECK(classify_street("cycleway") == TrafficTier::pedestrian);
  CHECK(classify_street("residential") == TrafficTier::low);
  CHECK(classify_street("service") == TrafficTier::low);
  CHECK(classify_street("tertiary") == TrafficTier::medium);
  CHECK(classify_street("secondary") == TrafficTier::medium);
  CHECK(classify_street("primary") == TrafficTier::high);
  CHECK(classify_street("motorway_link") == TrafficTier::high);
  // unknown and missing classes
  CHECK(classify_street("bus_guideway") == TrafficTier::low);
  CHECK(classify_street("") == TrafficTier::low);
}

TEST_CASE("empty geometry gives empty tiers") {
  auto pjh = misc::createProjHelper();
  auto aligner = createGeometryAligner(*pjh);
  BufferConfig buffers;
  aligner->compute(test::equator_box(100, 100, 1), {}, AlignmentConfig(),
                   buffers);

  auto& aligned = aligner->aligned;
  CHECK(aligned.buildings.empty());
  CHECK(aligned.amenities.empty());
  CHECK(aligned.street_count() == 0);
  CHECK(aligned.dropped_features == 0);
  for (size_t i = 0; i < TRAFFIC_TIER_COUNT; ++i) {
    CHECK(aligned.street_tiers[i].tier == TrafficTier(i));
    CHECK(aligned.street_tiers[i].lines.empty());
  }
  CHECK(aligned.tier(TrafficTier::pedestrian).buffer_m == buffers.pedestrian_m);
  CHECK(aligned.tier(TrafficTier::high).buffer_m == buffers.high_m);
}

TEST_CASE("alignment scales around the raster centre and shifts") {
  auto pjh = misc::createProjHelper();
  auto aligner = createGeometryAligner(*pjh);
  // the centre of the box is at (50, 50)
  auto box = test::equator_box(100, 100, 1);
  GeometryCollection geometry = {amenity(60, 50), amenity(50, 30)};

  SECTION("identity") {
    aligner->compute(box, geometry, no_correction());
    auto& pts = aligner->aligned.amenities;
    REQUIRE(pts.size() == 2);
    CHECK_THAT(pts[0][0], WithinAbs(10, 1e-3));
    CHECK_THAT(pts[0][1], WithinAbs(0, 1e-3));
    CHECK_THAT(pts[1][0], WithinAbs(0, 1e-3));
    CHECK_THAT(pts[1][1], WithinAbs(-20, 1e-3));
  }
  SECTION("scale and offset") {
    AlignmentConfig cfg;
    cfg.scale = 2;
    cfg.offset_east_m = -10;
    cfg.offset_north_m = -5;
    aligner->compute(box, geometry, cfg);
    auto& pts = aligner->aligned.amenities;
    REQUIRE(pts.size() == 2);
    CHECK_THAT(pts[0][0], WithinAbs(10, 1e-3));
    CHECK_THAT(pts[0][1], WithinAbs(-5, 1e-3));
    CHECK_THAT(pts[1][0], WithinAbs(-10, 1e-3));
    CHECK_THAT(pts[1][1], WithinAbs(-45, 1e-3));
  }
}

TEST_CASE("streets are sorted into tiers") {
  auto pjh = misc::createProjHelper();
  auto aligner = createGeometryAligner(*pjh);
  GeometryCollection geometry = {
      street("footway", {{0, 0}, {10, 0}}),
      street("residential", {{0, 10}, {10, 10}}),
      street("living_street", {{0, 20}, {10, 20}}),
      street("primary", {{0, 30}, {10, 30}, {20, 40}}),
  };
  aligner->compute(test::equator_box(100, 100, 1), geometry, no_correction());
  auto& aligned = aligner->aligned;
  CHECK(aligned.tier(TrafficTier::pedestrian).lines.size() == 1);
  CHECK(aligned.tier(TrafficTier::low).lines.size() == 2);
  CHECK(aligned.tier(TrafficTier::medium).lines.empty());
  REQUIRE(aligned.tier(TrafficTier::high).lines.size() == 1);
  CHECK(aligned.tier(TrafficTier::high).lines[0].size() == 3);
  CHECK(aligned.dropped_features == 0);
}

TEST_CASE("degenerate features are dropped") {
  const double nan = std::numeric_limits<double>::quiet_NaN();
  auto pjh = misc::createProjHelper();
  auto aligner = createGeometryAligner(*pjh);

  auto with_nan = polygon({{10, 10}, {20, 10}, {20, 20}});
  with_nan.coordinates[1][0] = nan;
  auto with_bad_hole = polygon({{0, 0}, {40, 0}, {40, 40}, {0, 40}});
  with_bad_hole.holes.push_back(
      {test::metric_to_geo(10, 10), test::metric_to_geo(20, 20)});
  GeoFeature no_location;
  no_location.type = FeatureType::amenity;

  GeometryCollection geometry = {
      // valid, closed ring
      polygon({{10, 10}, {20, 10}, {20, 20}, {10, 20}, {10, 10}}),
      // two vertices
      polygon({{10, 10}, {20, 10}}),
      // collinear, zero area
      polygon({{10, 10}, {20, 10}, {30, 10}}),
      // self-intersecting
      polygon({{0, 0}, {10, 10}, {10, 0}, {0, 20}}),
      // duplicate vertices leave only two distinct ones
      polygon({{10, 10}, {10, 10}, {20, 10}, {20, 10}}),
      with_nan,
      with_bad_hole,
      // a line that is a single point
      street("residential", {{5, 5}, {5, 5}}),
      no_location,
  };
  aligner->compute(test::equator_box(100, 100, 1), geometry, no_correction());

  auto& aligned = aligner->aligned;
  REQUIRE(aligned.buildings.size() == 1);
  // the closing vertex is removed
  CHECK(aligned.buildings[0].size() == 4);
  CHECK_THAT(std::fabs(aligned.buildings[0].signed_area()),
             WithinAbs(100, 1e-2));
  CHECK(aligned.street_count() == 0);
  CHECK(aligned.amenities.empty());
  CHECK(aligned.dropped_features == 8);
}

TEST_CASE("building rings are oriented") {
  auto pjh = misc::createProjHelper();
  auto aligner = createGeometryAligner(*pjh);

  // clockwise exterior with a counter-clockwise hole
  auto building = polygon({{20, 20}, {20, 40}, {40, 40}, {40, 20}});
  building.holes.push_back(
      {test::metric_to_geo(25, 25), test::metric_to_geo(35, 25),
       test::metric_to_geo(35, 35), test::metric_to_geo(25, 35)});
  aligner->compute(test::equator_box(100, 100, 1), {building}, no_correction());

  auto& aligned = aligner->aligned;
  REQUIRE(aligned.buildings.size() == 1);
  auto& ring = aligned.buildings[0];
  REQUIRE(ring.interior_rings().size() == 1);
  CHECK_THAT(ring.signed_area(), WithinAbs(300, 1e-1));

  LinearRing exterior;
  exterior.insert(exterior.end(), ring.begin(), ring.end());
  CHECK(exterior.signed_area() > 0);
  LinearRing hole;
  hole.insert(hole.end(), ring.interior_rings()[0].begin(),
              ring.interior_rings()[0].end());
  CHECK(hole.signed_area() < 0);
}
