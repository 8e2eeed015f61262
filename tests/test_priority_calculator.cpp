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
#include <canopy/planting/PriorityCalculator.hpp>

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "test_data.hpp"

using namespace canopy;
using namespace canopy::planting;
using Catch::Matchers::WithinAbs;

namespace {
  // masks where every pixel has a different combination of distances and
  // shadow intensity
  FeatureMasks varied_masks() {
    auto masks = test::empty_masks(30, 20, 0.5);
    for (size_t y = 0; y < 20; ++y) {
      for (size_t x = 0; x < 30; ++x) {
        masks.sidewalk_distance(x, y) = 0.7f * x;
        masks.building_distance(x, y) = 2.1f * y;
        masks.shadow_intensity(x, y) = float((x * 7 + y * 3) % 11) / 10.f;
      }
    }
    masks.building(2, 2) = 1;
    masks.street(10, 15) = 1;
    masks.vegetation(20, 5) = 1;
    for (size_t i = 0; i < masks.plantable.size(); ++i) {
      masks.plantable[i] =
          !(masks.building[i] || masks.street[i] || masks.vegetation[i]);
    }
    masks.amenity_pixels = {{5.5, 5.5}, {25, 12}};
    return masks;
  }
}  // namespace

TEST_CASE("priority tiers") {
  ClassificationConfig cfg;
  CHECK(classify_score(90, cfg) == PriorityTier::critical);
  CHECK(classify_score(80, cfg) == PriorityTier::critical);
  CHECK(classify_score(79.9f, cfg) == PriorityTier::high);
  CHECK(classify_score(60, cfg) == PriorityTier::high);
  CHECK(classify_score(40, cfg) == PriorityTier::medium);
  CHECK(classify_score(39.9f, cfg) == PriorityTier::low);
  CHECK(classify_score(0, cfg) == PriorityTier::low);
}

TEST_CASE("only the sun component scores without geometry") {
  auto masks = test::empty_masks(8, 6);
  auto calculator = createPriorityCalculator();
  calculator->compute(masks);
  auto& scores = calculator->scores;
  for (size_t i = 0; i < scores.score.size(); ++i) {
    CHECK(scores.sidewalk_component[i] == 0);
    CHECK(scores.building_component[i] == 0);
    CHECK(scores.amenity_component[i] == 0);
    CHECK(scores.sun_component[i] == 20);
    CHECK(scores.score[i] == 20);
    CHECK(scores.tiers[i] == PriorityTier::low);
  }
  CHECK(scores.zeroed_count == 0);
}

TEST_CASE("raw score stays within its bounds") {
  auto masks = varied_masks();
  ScoringConfig cfg;
  auto calculator = createPriorityCalculator();
  calculator->compute(masks, cfg);
  auto& scores = calculator->scores;

  for (size_t i = 0; i < scores.raw.size(); ++i) {
    CHECK(scores.raw[i] >= 0);
    CHECK(scores.raw[i] <= cfg.max_total());
    CHECK(scores.sidewalk_component[i] <= cfg.sidewalk_max_points);
    CHECK(scores.building_component[i] <= cfg.building_max_points);
    CHECK(scores.sun_component[i] <= cfg.sun_max_points);
    CHECK(scores.amenity_component[i] >= 0);
    CHECK(scores.amenity_component[i] <= cfg.amenity_max_points);
  }
}

TEST_CASE("masked pixels score zero, others keep the raw score") {
  auto masks = varied_masks();
  auto calculator = createPriorityCalculator();
  calculator->compute(masks);
  auto& scores = calculator->scores;

  size_t masked = 0;
  for (size_t i = 0; i < scores.score.size(); ++i) {
    if (masks.building[i] || masks.street[i] || masks.vegetation[i]) {
      ++masked;
      CHECK(scores.score[i] == 0);
      CHECK(scores.tiers[i] == PriorityTier::low);
    } else {
      CHECK(scores.score[i] == scores.raw[i]);
    }
  }
  CHECK(masked == 3);
  CHECK(scores.zeroed_count == masked);
}

TEST_CASE("priority calculation is deterministic") {
  auto masks = varied_masks();
  auto a = createPriorityCalculator();
  auto b = createPriorityCalculator();
  a->compute(masks);
  b->compute(masks);
  CHECK(a->scores.raw == b->scores.raw);
  CHECK(a->scores.score == b->scores.score);
  CHECK(a->scores.tiers == b->scores.tiers);
}

TEST_CASE("vegetation forces the score to zero") {
  // every component scores its maximum at the vegetation square
  auto masks = test::empty_masks(10, 10);
  for (auto& d : masks.sidewalk_distance.array) d = 1;
  for (auto& d : masks.building_distance.array) d = 10;
  masks.amenity_pixels = {{5, 5}};
  for (size_t y = 3; y < 7; ++y) {
    for (size_t x = 3; x < 7; ++x) {
      masks.vegetation(x, y) = 1;
      masks.plantable(x, y) = 0;
    }
  }

  auto calculator = createPriorityCalculator();
  calculator->compute(masks);
  auto& scores = calculator->scores;
  for (size_t y = 3; y < 7; ++y) {
    for (size_t x = 3; x < 7; ++x) {
      CHECK(scores.raw(x, y) > 80);
      CHECK(scores.score(x, y) == 0);
    }
  }
  CHECK(scores.zeroed_count == 16);
  CHECK(scores.score(0, 0) > 80);
  CHECK(scores.tiers(0, 0) == PriorityTier::critical);
}

TEST_CASE("sidewalk proximity bands in meters") {
  // 2 pixel wide sidewalk at columns 10 and 11, 0.5 m per pixel
  const double res = 0.5;
  auto masks = test::empty_masks(40, 5, res);
  for (size_t y = 0; y < 5; ++y) {
    masks.sidewalk(10, y) = 1;
    masks.sidewalk(11, y) = 1;
  }
  masks.sidewalk_distance = misc::distance_transform(masks.sidewalk, res);

  auto calculator = createPriorityCalculator();
  calculator->compute(masks);
  auto& c = calculator->scores.sidewalk_component;

  // <= 3 m is 6 pixels
  CHECK(c(11, 2) == 35);
  CHECK(c(17, 2) == 35);
  CHECK(c(4, 2) == 35);
  // <= 6 m is 12 pixels
  CHECK(c(18, 2) == 28);
  CHECK(c(23, 2) == 28);
  CHECK(c(0, 2) == 28);
  // <= 10 m is 20 pixels
  CHECK(c(24, 2) == 20);
  CHECK(c(31, 2) == 20);
  // <= 20 m is 40 pixels
  CHECK(c(32, 2) == 10);
  CHECK(c(39, 2) == 10);
}

TEST_CASE("amenity density") {
  auto masks = test::empty_masks(30, 30, 1);
  masks.amenity_pixels = {{10.5, 10.5}};
  ScoringConfig cfg;
  cfg.amenity_radius_m = 5;

  auto calculator = createPriorityCalculator();
  calculator->compute(masks, cfg);
  auto& a = calculator->scores.amenity_component;
  CHECK_THAT(a(10, 10), WithinAbs(cfg.amenity_max_points, 1e-5));
  CHECK(a(11, 10) < a(10, 10));
  CHECK(a(11, 10) > 0);
  CHECK_THAT(a(9, 10), WithinAbs(a(11, 10), 1e-5));
  // outside the radius
  CHECK(a(16, 10) == 0);
  CHECK(a(20, 20) == 0);
}

TEST_CASE("priority calculator rejects masks of different shapes") {
  auto masks = test::empty_masks(10, 10);
  masks.shadow_intensity = FloatGrid(10, 9, 0);
  auto calculator = createPriorityCalculator();
  CHECK_THROWS_AS(calculator->compute(masks), PreconditionError);
}
