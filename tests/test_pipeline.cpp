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

#include <canopy/BatchProcessor.hpp>
#include <canopy/canopy.h>
#include <canopy/io/SummaryWriter.hpp>
#include <canopy/planting/SpotEvaluator.hpp>
#include <canopy/planting/Summary.hpp>

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include <atomic>
#include <chrono>
#include <sstream>
#include <stdexcept>

#include <nlohmann/json.hpp>

#include "test_data.hpp"

using namespace canopy;
using namespace canopy::planting;
using Catch::Matchers::WithinAbs;

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

  PlantingConfig uncorrected_config() {
    PlantingConfig cfg;
    cfg.alignment.scale = 1;
    cfg.alignment.offset_east_m = 0;
    cfg.alignment.offset_north_m = 0;
    return cfg;
  }

  // A footway along row 50 with a building to the north and a cafe in
  // between, on a 100 x 100 m raster of 1 m pixels.
  LocationInput street_scene() {
    LocationInput input;
    input.raster = test::uniform_raster(100, 100, 150, 155, 160);
    input.geometry = {
        feature(FeatureType::street, {{-10, 50}, {110, 50}}, "footway"),
        feature(FeatureType::building, {{40, 62}, {60, 62}, {60, 80}, {40, 80}}),
        feature(FeatureType::amenity, {{50, 43}}),
    };
    return input;
  }

  struct FailingEvaluator : public SpotEvaluatorInterface {
    size_t calls = 0;
    StrMap evaluate_spot(const GeoCoordinate& coordinate) override {
      if (calls++ == 1) throw std::runtime_error("service unavailable");
      return {{"visible_trees", "none"},
              {"latitude", std::to_string(coordinate.latitude)}};
    }
  };
}  // namespace

TEST_CASE("uniform raster without geometry") {
  auto raster = test::uniform_raster(40, 30, 150, 155, 160);
  auto analysis = analyse(raster, {});

  CHECK(analysis.spots.empty());
  CHECK(count_true(analysis.masks.vegetation) == 0);
  CHECK(count_true(analysis.masks.shadow) == 0);
  CHECK(count_true(analysis.masks.building) == 0);
  CHECK(count_true(analysis.masks.street) == 0);
  CHECK(count_true(analysis.masks.plantable) == 40 * 30);
  for (auto v : analysis.masks.shadow_intensity.array) CHECK(v < 0.4);
  for (auto v : analysis.scores.score.array) CHECK(v == 20);

  auto summary = build_summary({"uniform", 0, 0}, analysis, PlantingConfig());
  CHECK(summary.is_success());
  CHECK(summary.spots.empty());
  REQUIRE(summary.coverage.size() == 5);
  CHECK(summary.coverage[4].name == "plantable");
  CHECK(summary.coverage[4].percentage == 100);
  CHECK(summary.max_priority_score == 20);
  CHECK(summary.zeroed_pixel_count == 0);
  // averages over plantable pixels
  REQUIRE(summary.components.size() == 4);
  CHECK(summary.components[0].average == 0);
  CHECK(summary.components[2].name == "sun_exposure");
  CHECK(summary.components[2].average == 20);
  // highest tier first
  REQUIRE(summary.tiers.size() == 4);
  CHECK(summary.tiers[0].name == "critical");
  CHECK(summary.tiers[0].pixel_count == 0);
  CHECK(summary.tiers[3].name == "low");
  CHECK(summary.tiers[3].pixel_count == 40 * 30);
  CHECK(summary.metadata.width == 40);
  CHECK(summary.metadata.height == 30);
  CHECK_THAT(summary.metadata.total_area_m2, WithinAbs(1200, 1e-9));
}

TEST_CASE("vegetation pixels score zero but keep their raw score") {
  auto raster = test::uniform_raster(20, 20, 150, 155, 160);
  for (size_t y = 8; y < 12; ++y)
    for (size_t x = 8; x < 12; ++x) test::set_pixel(raster, x, y, 50, 120, 50);

  auto analysis = analyse(raster, {}, uncorrected_config());

  CHECK(count_true(analysis.masks.vegetation) == 16);
  CHECK(analysis.masks.vegetation(9, 9));
  CHECK_FALSE(analysis.masks.plantable(9, 9));
  CHECK(analysis.scores.score(9, 9) == 0);
  CHECK(analysis.scores.raw(9, 9) > 0);
  CHECK(analysis.scores.tiers(9, 9) == PriorityTier::low);
  CHECK(analysis.scores.zeroed_count == 16);
  // grey pixels away from the block are untouched
  CHECK(analysis.scores.score(0, 0) == 20);
  CHECK(analysis.spots.empty());
}

TEST_CASE("street scene has critical spots next to the footway") {
  auto input = street_scene();
  auto cfg = uncorrected_config();
  auto analysis = analyse(input.raster, input.geometry, cfg);

  CHECK(analysis.aligned.tier(TrafficTier::pedestrian).lines.size() == 1);
  CHECK(analysis.aligned.buildings.size() == 1);
  CHECK(analysis.aligned.amenities.size() == 1);
  CHECK(count_true(analysis.masks.street) > 0);
  CHECK(count_true(analysis.masks.building) > 0);

  REQUIRE_FALSE(analysis.spots.empty());
  for (size_t i = 1; i < analysis.spots.size(); ++i) {
    CHECK(analysis.spots[i - 1].mean_score >= analysis.spots[i].mean_score);
  }
  for (auto& spot : analysis.spots) {
    CHECK(spot.pixel_count >= size_t(cfg.extraction.min_cluster_px));
    CHECK(spot.mean_score >= cfg.classification.critical_cutoff);
    CHECK_THAT(spot.area_m2, WithinAbs(double(spot.pixel_count), 1e-9));
    CHECK(input.raster.bounds.contains(
        {spot.centroid.longitude, spot.centroid.latitude}));
  }
  // critical pixels never lie under a mask
  auto& scores = analysis.scores;
  for (size_t i = 0; i < scores.tiers.size(); ++i) {
    if (scores.tiers[i] == PriorityTier::critical) {
      CHECK_FALSE(analysis.masks.street[i]);
      CHECK_FALSE(analysis.masks.building[i]);
      CHECK_FALSE(analysis.masks.vegetation[i]);
    }
  }
}

TEST_CASE("analysis is deterministic") {
  auto input = street_scene();
  auto cfg = uncorrected_config();
  auto a = analyse(input.raster, input.geometry, cfg);
  auto b = analyse(input.raster, input.geometry, cfg);
  CHECK(a.scores.score == b.scores.score);
  CHECK(a.scores.tiers == b.scores.tiers);
  REQUIRE(a.spots.size() == b.spots.size());
  for (size_t i = 0; i < a.spots.size(); ++i) {
    CHECK(a.spots[i].id == b.spots[i].id);
    CHECK(a.spots[i].mean_score == b.spots[i].mean_score);
    CHECK(a.spots[i].pixel_count == b.spots[i].pixel_count);
  }
}

TEST_CASE("invalid input is rejected") {
  auto raster = test::uniform_raster(10, 10, 150, 155, 160);

  SECTION("inverted bounding box") {
    raster.bounds = TBox<double>{1., 1., 0., 0.};
    CHECK_THROWS_AS(analyse(raster, {}), PreconditionError);
  }
  SECTION("buffer of the wrong size") {
    raster.rgb.resize(3 * 10 * 9);
    CHECK_THROWS_AS(analyse(raster, {}), PreconditionError);
  }
  SECTION("no ground resolution") {
    raster.ground_resolution = 0;
    CHECK_THROWS_AS(analyse(raster, {}), PreconditionError);
  }
  SECTION("invalid configuration") {
    PlantingConfig cfg;
    cfg.classification.medium_cutoff = 70;
    CHECK_THROWS_AS(analyse(raster, {}, cfg), canopyException);
  }
}

TEST_CASE("expired deadline aborts the analysis") {
  auto input = street_scene();
  Deadline deadline(std::chrono::milliseconds(0));
  CHECK_THROWS_AS(analyse(input.raster, input.geometry, PlantingConfig(),
                          deadline),
                  TimeoutAbort);
  // no limit
  CHECK_FALSE(Deadline().expired());
}

TEST_CASE("stages stop at an expired deadline") {
  const Deadline expired(std::chrono::milliseconds(0));
  auto input = street_scene();
  auto pj = misc::createProjHelper();

  SECTION("geometry alignment") {
    auto aligner = createGeometryAligner(*pj);
    CHECK_THROWS_AS(aligner->compute(input.raster.bounds, input.geometry,
                                     AlignmentConfig(), BufferConfig(),
                                     expired),
                    TimeoutAbort);
  }
  SECTION("mask generation") {
    auto aligner = createGeometryAligner(*pj);
    aligner->compute(input.raster.bounds, input.geometry);
    misc::PixelTransform transform(input.raster.bounds, 100, 100);
    auto generator = createMaskGenerator(*pj);
    CHECK_THROWS_AS(
        generator->compute(aligner->aligned, transform, 1.,
                           MaskGrid(100, 100, 0), BufferConfig(), expired),
        TimeoutAbort);
  }
  SECTION("priority calculation") {
    auto masks = test::empty_masks(100, 100);
    auto calculator = createPriorityCalculator();
    CHECK_THROWS_AS(calculator->compute(masks, ScoringConfig(),
                                        ClassificationConfig(), expired),
                    TimeoutAbort);
  }
  SECTION("spot extraction") {
    auto calculator = createPriorityCalculator();
    calculator->compute(test::empty_masks(100, 100));
    misc::PixelTransform transform(input.raster.bounds, 100, 100);
    auto extractor = createSpotExtractor();
    CHECK_THROWS_AS(extractor->compute(calculator->scores, transform, 1.,
                                       ExtractionConfig(), expired),
                    TimeoutAbort);
  }
}

TEST_CASE("a failing location does not affect the others") {
  std::vector<LocationTask> tasks;
  tasks.push_back({{"street", 0, 0}, [] { return street_scene(); }});
  tasks.push_back(
      {{"unreachable", 1, 1},
       []() -> LocationInput { throw std::runtime_error("download failed"); }});
  tasks.push_back({{"inverted", 2, 2}, [] {
                     auto input = street_scene();
                     input.raster.bounds = TBox<double>{1., 1., 0., 0.};
                     return input;
                   }});
  tasks.push_back({{"uniform", 3, 3}, [] {
                     LocationInput input;
                     input.raster = test::uniform_raster(20, 20, 150, 155, 160);
                     return input;
                   }});

  std::atomic<size_t> n_callbacks = 0;
  BatchOptions options;
  options.jobs = 3;
  options.on_success = [&](const LocationSummary&, const PlantingAnalysis&) {
    ++n_callbacks;
  };
  auto summaries = process_batch(tasks, uncorrected_config(), options);

  REQUIRE(summaries.size() == 4);
  CHECK(summaries[0].location.name == "street");
  CHECK(summaries[0].is_success());
  CHECK_FALSE(summaries[0].spots.empty());

  CHECK(summaries[1].status == "failed");
  CHECK(summaries[1].error_message == "download failed");
  CHECK(summaries[1].spots.empty());

  CHECK(summaries[2].status == "failed");
  CHECK(summaries[2].location.name == "inverted");

  CHECK(summaries[3].is_success());
  CHECK(n_callbacks.load() == 2);
}

TEST_CASE("batch reports timeouts per location") {
  std::vector<LocationTask> tasks = {
      {{"a", 0, 0}, [] { return street_scene(); }},
      {{"b", 0, 0}, [] { return street_scene(); }},
  };
  BatchOptions options;
  options.jobs = 2;
  options.timeout = std::chrono::milliseconds(0);
  auto summaries = process_batch(tasks, PlantingConfig(), options);
  REQUIRE(summaries.size() == 2);
  for (auto& s : summaries) {
    CHECK(s.status == "timeout");
    CHECK(s.spots.empty());
  }
}

TEST_CASE("a failing evaluation leaves the spots intact") {
  LocationSummary summary;
  summary.status = "success";
  for (int i = 0; i < 3; ++i) {
    SpotSummary spot;
    spot.id = i + 1;
    spot.latitude = 52 + i;
    spot.priority_score = 90 - i;
    summary.spots.push_back(spot);
  }

  FailingEvaluator evaluator;
  auto n = evaluate_spots(evaluator, summary, 2);
  CHECK(n == 1);
  CHECK(evaluator.calls == 2);
  CHECK(summary.spots[0].evaluated);
  CHECK(summary.spots[0].evaluation.at("visible_trees") == "none");
  CHECK_FALSE(summary.spots[1].evaluated);
  CHECK(summary.spots[1].evaluation.empty());
  // beyond max_spots
  CHECK_FALSE(summary.spots[2].evaluated);
  for (int i = 0; i < 3; ++i) {
    CHECK(summary.spots[i].priority_score == 90 - i);
  }
}

TEST_CASE("summary json") {
  auto input = street_scene();
  auto cfg = uncorrected_config();
  auto analysis = analyse(input.raster, input.geometry, cfg);
  auto summary = build_summary({"street", 0.0005, 0.0005}, analysis, cfg);

  auto writer = io::createSummaryWriterJSON();
  std::stringstream ss;
  writer->write_summary(ss, summary);
  auto j = nlohmann::json::parse(ss.str());

  CHECK(j["location"]["name"] == "street");
  CHECK(j["status"] == "success");
  CHECK(j["critical_spot_count"] == summary.spots.size());
  REQUIRE(j["critical_spots"].size() == summary.spots.size());
  CHECK(j["critical_spots"][0]["pixel_count"] == summary.spots[0].pixel_count);
  CHECK(j["coverage"].contains("plantable"));
  CHECK(j["priority_distribution"].contains("critical"));
  CHECK(j["score_components"]["sidewalk_proximity"]["max_points"] == 35);
  CHECK(j["street_network"]["pedestrian"]["count"] == 1);
  CHECK(j["amenity_count"] == 1);
  CHECK(j["metadata"]["raster"]["width"] == 100);
  CHECK(j["metadata"]["alignment"]["scale"] == 1);
  CHECK(j["metadata"]["buffers"]["sidewalk_m"] == 5);

  auto failed = make_failed_summary({"broken", 1, 2}, RunStatus::timeout,
                                    "time limit reached");
  std::stringstream ss_failed;
  writer->write_summary(ss_failed, failed);
  auto jf = nlohmann::json::parse(ss_failed.str());
  CHECK(jf["status"] == "timeout");
  CHECK(jf["error"] == "time limit reached");
  CHECK_FALSE(jf.contains("critical_spots"));

  std::stringstream ss_index;
  writer->write_index(ss_index, {summary, failed}, {"street.json", ""});
  auto ji = nlohmann::json::parse(ss_index.str());
  CHECK(ji["location_count"] == 2);
  CHECK(ji["success_count"] == 1);
  CHECK(ji["locations"][0]["file"] == "street.json");
  CHECK_FALSE(ji["locations"][1].contains("file"));
}

TEST_CASE("summary json with invalid UTF-8") {
  auto failed = make_failed_summary({"broken", 0, 0}, RunStatus::failed,
                                    "bad \xff path");
  auto writer = io::createSummaryWriterJSON();

  std::stringstream ss;
  REQUIRE_NOTHROW(writer->write_summary(ss, failed));
  auto j = nlohmann::json::parse(ss.str());
  CHECK(j["status"] == "failed");
  CHECK(j["error"] == "bad \xEF\xBF\xBD path");

  std::stringstream ss_index;
  REQUIRE_NOTHROW(writer->write_index(ss_index, {failed}, {""}));
  auto ji = nlohmann::json::parse(ss_index.str());
  CHECK(ji["location_count"] == 1);
}
