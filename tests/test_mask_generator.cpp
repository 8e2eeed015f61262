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

#include <canopy/misc/DistanceTransform.hpp>
#include <canopy/misc/PixelTransform.hpp>
#include <canopy/misc/Vector2DOps.hpp>
#include <canopy/misc/projHelper.hpp>
#include <canopy/planting/GeometryAligner.hpp>
#include <canopy/planting/MaskGenerator.hpp>

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include <cmath>

#include "test_data.hpp"

using namespace canopy;
using namespace canopy::planting;
using Catch::Matchers::WithinAbs;

TEST_CASE("distance transform of a single pixel") {
  MaskGrid mask(5, 5, 0);
  mask(2, 2) = 1;
  auto d = misc::distance_transform(mask, 2);
  CHECK(d(2, 2) == 0);
  CHECK_THAT(d(4, 2), WithinAbs(4, 1e-5));
  CHECK_THAT(d(2, 0), WithinAbs(4, 1e-5));
  CHECK_THAT(d(3, 3), WithinAbs(2 * std::sqrt(2.), 1e-5));
  CHECK_THAT(d(0, 0), WithinAbs(2 * std::sqrt(8.), 1e-5));
  CHECK_THAT(d(4, 3), WithinAbs(2 * std::sqrt(5.), 1e-5));
}

TEST_CASE("distance transform takes the nearest pixel") {
  MaskGrid mask(10, 3, 0);
  mask(0, 1) = 1;
  mask(9, 1) = 1;
  auto d = misc::distance_transform(mask, 1);
  CHECK_THAT(d(3, 1), WithinAbs(3, 1e-5));
  CHECK_THAT(d(6, 1), WithinAbs(3, 1e-5));
  CHECK_THAT(d(4, 0), WithinAbs(std::sqrt(17.), 1e-5));
}

TEST_CASE("distance transform of empty and full masks") {
  auto empty = misc::distance_transform(MaskGrid(4, 3, 0), 1);
  for (auto v : empty.array) CHECK(std::isinf(v));

  auto full = misc::distance_transform(MaskGrid(4, 3, 1), 1);
  for (auto v : full.array) CHECK(v == 0);
}

TEST_CASE("union of polygons keeps holes") {
  LinearRing with_hole;
  with_hole.insert(with_hole.end(), {{0, 0, 0}, {10, 0, 0}, {10, 10, 0}, {0, 10, 0}});
  with_hole.interior_rings().push_back(
      {{4, 4, 0}, {4, 6, 0}, {6, 6, 0}, {6, 4, 0}});
  LinearRing overlapping;
  overlapping.insert(overlapping.end(),
                     {{8, 0, 0}, {18, 0, 0}, {18, 10, 0}, {8, 10, 0}});
  LinearRing separate;
  separate.insert(separate.end(),
                  {{30, 0, 0}, {32, 0, 0}, {32, 2, 0}, {30, 2, 0}});

  auto ops = misc::createVector2DOpsGEOS();
  auto result = ops->union_polygons({with_hole, overlapping, separate});
  REQUIRE(result.size() == 2);
  size_t n_holes = 0;
  double area = 0;
  for (auto& polygon : result) {
    n_holes += polygon.interior_rings().size();
    orient_polygon(polygon);
    area += polygon.signed_area();
  }
  CHECK(n_holes == 1);
  CHECK_THAT(area, WithinAbs(180 - 4 + 4, 1e-3));

  CHECK(ops->union_polygons({}).empty());
}

namespace {
  GeoFeature feature(FeatureType type, std::initializer_list<arr2d> metric,
                     std::string street_class = "") {
    GeoFeature f;
    f.type = type;
    f.street_class = street_class;
    for (auto& p : metric)
      f.coordinates.push_back(test::metric_to_geo(p[0], p[1]));
    return f;
  }

  // Runs the aligner without correction and the mask generator on a raster
  // of 100 x 100 pixels of 1 m.
  struct MaskFixture {
    std::unique_ptr<misc::projHelperInterface> pjh =
        misc::createProjHelper();
    TBox<double> box = test::equator_box(100, 100, 1);
    misc::PixelTransform transform{box, 100, 100};
    std::unique_ptr<MaskGeneratorInterface> generator;

    void run(const GeometryCollection& geometry,
             const MaskGrid& vegetation = MaskGrid(100, 100, 0)) {
      AlignmentConfig cfg;
      cfg.scale = 1;
      cfg.offset_east_m = 0;
      cfg.offset_north_m = 0;
      auto aligner = createGeometryAligner(*pjh);
      aligner->compute(box, geometry, cfg);
      generator = createMaskGenerator(*pjh);
      generator->compute(aligner->aligned, transform, 1., vegetation);
    }
  };
}  // namespace

TEST_CASE("masks of empty geometry") {
  MaskFixture f;
  f.run({});
  auto& g = *f.generator;
  CHECK(count_true(g.building) == 0);
  CHECK(count_true(g.street) == 0);
  CHECK(count_true(g.sidewalk) == 0);
  CHECK(count_true(g.plantable) == 100 * 100);
  CHECK(g.amenity_pixels.empty());
  for (auto v : g.sidewalk_distance.array) CHECK(std::isinf(v));
  for (auto v : g.building_distance.array) CHECK(std::isinf(v));
}

TEST_CASE("building rasterisation and distance") {
  MaskFixture f;
  // 20 x 20 m square, columns 20-39 and rows 60-79
  f.run({feature(FeatureType::building, {{20, 20}, {40, 20}, {40, 40}, {20, 40}})});
  auto& g = *f.generator;
  CHECK(count_true(g.building) == 400);
  CHECK(g.building(20, 60));
  CHECK(g.building(39, 79));
  CHECK_FALSE(g.building(19, 70));
  CHECK_FALSE(g.building(25, 59));
  CHECK(g.building_distance(25, 70) == 0);
  CHECK_THAT(g.building_distance(10, 70), WithinAbs(10, 1e-4));
  CHECK_THAT(g.building_distance(30, 90), WithinAbs(11, 1e-4));
  CHECK_FALSE(g.plantable(25, 70));
  CHECK(g.plantable(10, 70));
}

TEST_CASE("street buffers and sidewalks") {
  MaskFixture f;
  // horizontal low traffic street through the middle of the raster
  f.run({feature(FeatureType::street, {{-10, 50}, {110, 50}}, "residential")});
  auto& g = *f.generator;

  // buffered by 10 m: rows 40-59
  CHECK(count_true(g.street) == 20 * 100);
  CHECK(g.street(0, 40));
  CHECK(g.street(99, 59));
  CHECK_FALSE(g.street(50, 39));
  CHECK_FALSE(g.street(50, 60));

  // buffered by 5 m: rows 45-54
  CHECK(count_true(g.sidewalk) == 10 * 100);
  CHECK_THAT(g.sidewalk_distance(50, 30), WithinAbs(15, 1e-4));
  CHECK_THAT(g.sidewalk_distance(50, 70), WithinAbs(16, 1e-4));
  CHECK(g.sidewalk_distance(50, 50) == 0);

  CHECK(count_true(g.plantable) == 80 * 100);
}

TEST_CASE("high traffic streets do not have sidewalks") {
  MaskFixture f;
  f.run({feature(FeatureType::street, {{-10, 50}, {110, 50}}, "primary")});
  auto& g = *f.generator;
  // buffered by 25 m: rows 25-74
  CHECK(count_true(g.street) == 50 * 100);
  CHECK(count_true(g.sidewalk) == 0);
}

TEST_CASE("vegetation is not plantable") {
  MaskFixture f;
  MaskGrid vegetation(100, 100, 0);
  vegetation(5, 5) = 1;
  f.run({}, vegetation);
  CHECK_FALSE(f.generator->plantable(5, 5));
  CHECK(count_true(f.generator->plantable) == 100 * 100 - 1);
}

TEST_CASE("amenities are mapped to pixel coordinates") {
  MaskFixture f;
  f.run({feature(FeatureType::amenity, {{75, 25}})});
  REQUIRE(f.generator->amenity_pixels.size() == 1);
  CHECK_THAT(f.generator->amenity_pixels[0][0], WithinAbs(75, 1e-2));
  CHECK_THAT(f.generator->amenity_pixels[0][1], WithinAbs(75, 1e-2));
}

TEST_CASE("mask generator rejects a vegetation mask of the wrong shape") {
  MaskFixture f;
  CHECK_THROWS_AS(f.run({}, MaskGrid(99, 100, 0)), PreconditionError);
}
