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

#include <canopy/common/common.hpp>
#include <canopy/planting/Summary.hpp>

#include <algorithm>
#include <array>
#include <cmath>

namespace canopy::planting {

  std::string_view to_string(RunStatus status) {
    switch (status) {
      case RunStatus::success:
        return "success";
      case RunStatus::failed:
        return "failed";
      case RunStatus::timeout:
        return "timeout";
    }
    return "unknown";
  }

  namespace {
    double finite_or_zero(double v) { return std::isfinite(v) ? v : 0; }

    CoverageStat coverage_stat(std::string name, size_t count,
                               size_t total_count, double pixel_area) {
      CoverageStat stat;
      stat.name = std::move(name);
      stat.pixel_count = std::int64_t(count);
      stat.area_m2 = finite_or_zero(double(count) * pixel_area);
      stat.percentage =
          total_count ? 100. * double(count) / double(total_count) : 0;
      return stat;
    }

    ComponentStat component_stat(std::string name, const FloatGrid& component,
                                 const MaskGrid& plantable, float max_points) {
      double sum = 0;
      size_t n = 0;
      for (size_t i = 0; i < component.size(); ++i) {
        if (!plantable[i]) continue;
        sum += component[i];
        ++n;
      }
      ComponentStat stat;
      stat.name = std::move(name);
      stat.average = n ? finite_or_zero(sum / double(n)) : 0;
      stat.max_points = max_points;
      return stat;
    }
  }  // namespace

  LocationSummary build_summary(const Location& location,
                                const PlantingAnalysis& analysis,
                                const PlantingConfig& cfg) {
    LocationSummary summary;
    summary.location = location;
    summary.status = to_string(RunStatus::success);

    const auto& masks = analysis.masks;
    const auto& scores = analysis.scores;
    const double res = masks.ground_resolution;
    const double pixel_area = res * res;
    const size_t total = masks.dim_x() * masks.dim_y();

    for (auto& spot : analysis.spots) {
      SpotSummary s;
      s.id = std::int64_t(spot.id);
      s.latitude = finite_or_zero(spot.centroid.latitude);
      s.longitude = finite_or_zero(spot.centroid.longitude);
      s.priority_score = finite_or_zero(spot.mean_score);
      s.area_m2 = finite_or_zero(spot.area_m2);
      s.pixel_count = std::int64_t(spot.pixel_count);
      summary.spots.push_back(std::move(s));
    }

    summary.coverage = {
        coverage_stat("building", count_true(masks.building), total,
                      pixel_area),
        coverage_stat("vegetation", count_true(masks.vegetation), total,
                      pixel_area),
        coverage_stat("shadow", count_true(masks.shadow), total, pixel_area),
        coverage_stat("street", count_true(masks.street), total, pixel_area),
        coverage_stat("plantable", count_true(masks.plantable), total,
                      pixel_area),
    };

    summary.components = {
        component_stat("sidewalk_proximity", scores.sidewalk_component,
                       masks.plantable, cfg.scoring.sidewalk_max_points),
        component_stat("building_cooling", scores.building_component,
                       masks.plantable, cfg.scoring.building_max_points),
        component_stat("sun_exposure", scores.sun_component, masks.plantable,
                       cfg.scoring.sun_max_points),
        component_stat("amenity_density", scores.amenity_component,
                       masks.plantable, cfg.scoring.amenity_max_points),
    };

    std::array<size_t, PRIORITY_TIER_COUNT> tier_counts{};
    for (auto& t : scores.tiers.array) ++tier_counts[size_t(t)];
    // highest tier first
    for (size_t i = PRIORITY_TIER_COUNT; i-- > 0;) {
      summary.tiers.push_back(coverage_stat(
          std::string(to_string(PriorityTier(i))), tier_counts[i], total,
          pixel_area));
    }

    for (auto& tier : analysis.aligned.street_tiers) {
      summary.street_tiers.push_back({std::string(to_string(tier.tier)),
                                      std::int64_t(tier.lines.size()),
                                      tier.buffer_m});
    }
    summary.amenity_count = std::int64_t(analysis.aligned.amenities.size());
    summary.dropped_feature_count =
        std::int64_t(analysis.aligned.dropped_features);
    summary.zeroed_pixel_count = std::int64_t(scores.zeroed_count);

    float max_score = 0;
    for (auto& v : scores.score.array) max_score = std::max(max_score, v);
    summary.max_priority_score = finite_or_zero(max_score);

    auto& md = summary.metadata;
    md.timestamp = utc_timestamp_ietf();
    md.alignment_scale = cfg.alignment.scale;
    md.alignment_offset_north_m = cfg.alignment.offset_north_m;
    md.alignment_offset_east_m = cfg.alignment.offset_east_m;
    md.width = std::int64_t(masks.dim_x());
    md.height = std::int64_t(masks.dim_y());
    md.ground_resolution = finite_or_zero(res);
    md.total_area_m2 = finite_or_zero(double(total) * pixel_area);
    md.buffer_pedestrian_m = cfg.buffers.pedestrian_m;
    md.buffer_low_m = cfg.buffers.low_m;
    md.buffer_medium_m = cfg.buffers.medium_m;
    md.buffer_high_m = cfg.buffers.high_m;
    md.buffer_sidewalk_m = cfg.buffers.sidewalk_m;
    return summary;
  }

  LocationSummary make_failed_summary(const Location& location,
                                      RunStatus status,
                                      const std::string& message) {
    LocationSummary summary;
    summary.location = location;
    summary.status = to_string(status);
    summary.error_message = message;
    summary.metadata.timestamp = utc_timestamp_ietf();
    return summary;
  }

}  // namespace canopy::planting
