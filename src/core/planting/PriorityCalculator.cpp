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

#include <canopy/logger/logger.h>
#include <canopy/planting/PriorityCalculator.hpp>

#include <algorithm>
#include <cmath>

namespace canopy::planting {

  std::string_view to_string(PriorityTier tier) {
    switch (tier) {
      case PriorityTier::low:
        return "low";
      case PriorityTier::medium:
        return "medium";
      case PriorityTier::high:
        return "high";
      case PriorityTier::critical:
        return "critical";
    }
    return "unknown";
  }

  PriorityTier classify_score(float score, const ClassificationConfig& cfg) {
    if (score >= cfg.critical_cutoff) return PriorityTier::critical;
    if (score >= cfg.high_cutoff) return PriorityTier::high;
    if (score >= cfg.medium_cutoff) return PriorityTier::medium;
    return PriorityTier::low;
  }

  class PriorityCalculator : public PriorityCalculatorInterface {
    FloatGrid banded(const FloatGrid& values, const ScoreBands& bands,
                     float max_points) {
      FloatGrid result(values.dim_x, values.dim_y, 0);
      for (size_t i = 0; i < values.size(); ++i) {
        result[i] = std::clamp(band_points(bands, values[i]), 0.f, max_points);
      }
      return result;
    }

    FloatGrid amenity_density(const FeatureMasks& masks,
                              const ScoringConfig& cfg,
                              const Deadline& deadline) {
      const long nx = long(masks.dim_x());
      const long ny = long(masks.dim_y());
      FloatGrid density(nx, ny, 0);
      if (masks.amenity_pixels.empty() || cfg.amenity_max_points == 0) {
        return density;
      }
      const double res = masks.ground_resolution;
      const double sigma = cfg.amenity_radius_m / 2.;
      const double radius_px = cfg.amenity_radius_m / res;
      for (auto& a : masks.amenity_pixels) {
        deadline.check("amenity density");
        // pixels whose centre can be within the radius
        const long x0 = std::max(0L, long(std::floor(a[0] - radius_px)));
        const long x1 = std::min(nx - 1, long(std::ceil(a[0] + radius_px)));
        const long y0 = std::max(0L, long(std::floor(a[1] - radius_px)));
        const long y1 = std::min(ny - 1, long(std::ceil(a[1] + radius_px)));
        for (long y = y0; y <= y1; ++y) {
          for (long x = x0; x <= x1; ++x) {
            const double dx = (x + 0.5 - a[0]) * res;
            const double dy = (y + 0.5 - a[1]) * res;
            const double d2 = dx * dx + dy * dy;
            if (d2 > double(cfg.amenity_radius_m) * cfg.amenity_radius_m)
              continue;
            density(x, y) += float(std::exp(-d2 / (2 * sigma * sigma)));
          }
        }
      }

      float max_density = 0;
      for (auto& v : density.array) max_density = std::max(max_density, v);
      if (max_density > 0) {
        for (auto& v : density.array) {
          v = std::clamp(cfg.amenity_max_points * v / max_density, 0.f,
                         cfg.amenity_max_points);
        }
      }
      return density;
    }

   public:
    void compute(const FeatureMasks& masks, ScoringConfig cfg,
                 ClassificationConfig classification,
                 const Deadline& deadline) override {
      auto& logger = logger::Logger::get_logger();
      const size_t nx = masks.dim_x();
      const size_t ny = masks.dim_y();
      masks.check_shape(nx, ny);

      scores = ScoreGrid();
      scores.sidewalk_component = banded(
          masks.sidewalk_distance, cfg.sidewalk_bands, cfg.sidewalk_max_points);
      scores.building_component = banded(
          masks.building_distance, cfg.building_bands, cfg.building_max_points);
      scores.sun_component =
          banded(masks.shadow_intensity, cfg.sun_bands, cfg.sun_max_points);
      deadline.check("score components");
      scores.amenity_component = amenity_density(masks, cfg, deadline);

      scores.raw = FloatGrid(nx, ny, 0);
      const float max_total = cfg.max_total();
      for (size_t i = 0; i < scores.raw.size(); ++i) {
        scores.raw[i] = std::clamp(
            scores.sidewalk_component[i] + scores.building_component[i] +
                scores.sun_component[i] + scores.amenity_component[i],
            0.f, max_total);
      }

      // masking is applied after the summation
      scores.score = scores.raw;
      scores.tiers = Grid<PriorityTier>(nx, ny, PriorityTier::low);
      for (size_t i = 0; i < scores.score.size(); ++i) {
        if (masks.building[i] || masks.street[i] || masks.vegetation[i]) {
          ++scores.zeroed_count;
          scores.score[i] = 0;
        } else {
          scores.tiers[i] = classify_score(scores.score[i], classification);
        }
      }

      logger.debug("Scored {} pixels, {} zeroed by masks", scores.raw.size(),
                   scores.zeroed_count);
    }
  };

  std::unique_ptr<PriorityCalculatorInterface> createPriorityCalculator() {
    return std::make_unique<PriorityCalculator>();
  };

}  // namespace canopy::planting
