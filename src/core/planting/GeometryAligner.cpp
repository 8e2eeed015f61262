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

#include <canopy/common/CGALPIPTester.hpp>
#include <canopy/logger/logger.h>
#include <canopy/planting/GeometryAligner.hpp>

#include <cmath>
#include <unordered_map>

namespace canopy::planting {

  // vertices closer than this (meters) are merged
  constexpr float DUPLICATE_THRESHOLD = 1e-3;
  // polygons with a smaller area (square meters) are considered degenerate
  constexpr float MIN_POLYGON_AREA = 1e-2;

  std::string_view to_string(TrafficTier tier) {
    switch (tier) {
      case TrafficTier::pedestrian:
        return "pedestrian";
      case TrafficTier::low:
        return "low";
      case TrafficTier::medium:
        return "medium";
      case TrafficTier::high:
        return "high";
    }
    return "unknown";
  }

  TrafficTier classify_street(std::string_view street_class) {
    static const std::unordered_map<std::string_view, TrafficTier> tiers = {
        {"footway", TrafficTier::pedestrian},
        {"pedestrian", TrafficTier::pedestrian},
        {"path", TrafficTier::pedestrian},
        {"steps", TrafficTier::pedestrian},
        {"cycleway", TrafficTier::pedestrian},
        {"corridor", TrafficTier::pedestrian},
        {"bridleway", TrafficTier::pedestrian},
        {"tertiary", TrafficTier::medium},
        {"tertiary_link", TrafficTier::medium},
        {"secondary", TrafficTier::medium},
        {"secondary_link", TrafficTier::medium},
        {"primary", TrafficTier::high},
        {"primary_link", TrafficTier::high},
        {"trunk", TrafficTier::high},
        {"trunk_link", TrafficTier::high},
        {"motorway", TrafficTier::high},
        {"motorway_link", TrafficTier::high},
    };
    auto it = tiers.find(street_class);
    if (it == tiers.end()) return TrafficTier::low;
    return it->second;
  }

  size_t AlignedGeometry::street_count() const {
    size_t n = 0;
    for (auto& st : street_tiers) n += st.lines.size();
    return n;
  }

  class GeometryAligner : public GeometryAlignerInterface {
    AlignmentConfig cfg_;

    arr3f align(const arr2d& lonlat) {
      auto p = pjHelper.coord_transform_fwd(lonlat[0], lonlat[1], 0);
      return {cfg_.scale * p[0] + cfg_.offset_east_m,
              cfg_.scale * p[1] + cfg_.offset_north_m, 0};
    }

    bool finite(const arr2d& p) {
      return std::isfinite(p[0]) && std::isfinite(p[1]);
    }

    template <typename Ring>
    bool align_ring(const vec2d& coordinates, Ring& ring) {
      for (auto& p : coordinates) {
        if (!finite(p)) return false;
        ring.push_back(align(p));
      }
      return true;
    }

    void drop(size_t index, std::string_view reason) {
      auto& logger = logger::Logger::get_logger();
      logger.warning("Dropping feature {}: {}", index, reason);
      ++aligned.dropped_features;
    }

    void add_building(size_t index, const GeoFeature& feature) {
      LinearRing ring;
      if (!align_ring(feature.coordinates, ring)) {
        return drop(index, "non-finite coordinate");
      }
      pop_back_if_equal_to_front(ring);
      for (auto& hole : feature.holes) {
        vec3f iring;
        if (!align_ring(hole, iring)) {
          return drop(index, "non-finite coordinate");
        }
        pop_back_if_equal_to_front(iring);
        ring.interior_rings().push_back(iring);
      }
      ring = fix_duplicates(ring, DUPLICATE_THRESHOLD);
      if (ring.size() < 3) {
        return drop(index, "polygon with fewer than 3 distinct vertices");
      }
      for (auto& iring : ring.interior_rings()) {
        if (iring.size() < 3) {
          return drop(index, "hole with fewer than 3 distinct vertices");
        }
      }
      orient_polygon(ring);
      if (ring.signed_area() < MIN_POLYGON_AREA) {
        return drop(index, "polygon with near-zero area");
      }
      if (!is_simple_polygon(ring)) {
        return drop(index, "self-intersecting polygon");
      }
      aligned.buildings.push_back(std::move(ring));
    }

    void add_street(size_t index, const GeoFeature& feature) {
      LineString line;
      if (!align_ring(feature.coordinates, line)) {
        return drop(index, "non-finite coordinate");
      }
      // remove consecutive duplicates, a line is not closed
      LineString cleaned;
      for (auto& p : line) {
        if (!cleaned.empty() &&
            std::fabs(cleaned.back()[0] - p[0]) < DUPLICATE_THRESHOLD &&
            std::fabs(cleaned.back()[1] - p[1]) < DUPLICATE_THRESHOLD) {
          continue;
        }
        cleaned.push_back(p);
      }
      if (cleaned.size() < 2) {
        return drop(index, "line with fewer than 2 distinct vertices");
      }
      aligned.tier(classify_street(feature.street_class))
          .lines.push_back(std::move(cleaned));
    }

    void add_amenity(size_t index, const GeoFeature& feature) {
      if (feature.coordinates.empty() || !finite(feature.coordinates[0])) {
        return drop(index, "amenity without a valid location");
      }
      aligned.amenities.push_back(align(feature.coordinates[0]));
    }

   public:
    using GeometryAlignerInterface::GeometryAlignerInterface;

    void compute(const TBox<double>& bounds,
                 const GeometryCollection& geometry, AlignmentConfig cfg,
                 BufferConfig buffers, const Deadline& deadline) override {
      auto& logger = logger::Logger::get_logger();
      cfg_ = cfg;
      aligned = AlignedGeometry();

      auto center = bounds.center();
      pjHelper.set_data_offset({center[0], center[1], 0});

      const std::array<float, TRAFFIC_TIER_COUNT> buffer_m = {
          buffers.pedestrian_m, buffers.low_m, buffers.medium_m,
          buffers.high_m};
      for (size_t i = 0; i < TRAFFIC_TIER_COUNT; ++i) {
        aligned.street_tiers[i].tier = TrafficTier(i);
        aligned.street_tiers[i].buffer_m = buffer_m[i];
      }

      for (size_t i = 0; i < geometry.size(); ++i) {
        deadline.check("geometry alignment");
        auto& feature = geometry[i];
        switch (feature.type) {
          case FeatureType::building:
            add_building(i, feature);
            break;
          case FeatureType::street:
            add_street(i, feature);
            break;
          case FeatureType::amenity:
            add_amenity(i, feature);
            break;
        }
      }

      logger.debug(
          "Aligned {} buildings, {} streets, {} amenities ({} dropped)",
          aligned.buildings.size(), aligned.street_count(),
          aligned.amenities.size(), aligned.dropped_features);
    }
  };

  std::unique_ptr<GeometryAlignerInterface> createGeometryAligner(
      misc::projHelperInterface& pjh) {
    return std::make_unique<GeometryAligner>(pjh);
  };

}  // namespace canopy::planting
