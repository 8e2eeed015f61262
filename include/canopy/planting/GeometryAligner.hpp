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
#include <canopy/PlantingConfig.hpp>
#include <canopy/common/Deadline.hpp>
#include <canopy/common/datastructures.hpp>
#include <canopy/misc/projHelper.hpp>

#include <array>
#include <memory>
#include <string_view>

namespace canopy::planting {

  // Traffic tier of a street, determines its buffer width.
  enum class TrafficTier : std::uint8_t { pedestrian = 0, low, medium, high };
  constexpr size_t TRAFFIC_TIER_COUNT = 4;

  std::string_view to_string(TrafficTier tier);

  /**
   * @brief Map an OSM highway value to its traffic tier. Unknown and empty
   * classes map to TrafficTier::low.
   */
  TrafficTier classify_street(std::string_view street_class);

  struct StreetTier {
    TrafficTier tier = TrafficTier::low;
    float buffer_m = 0;
    std::vector<LineString> lines;
  };

  /**
   * @brief Vector data corrected for the offset to the imagery, in the local
   * metric frame of the projHelper that was used for the alignment.
   */
  struct AlignedGeometry {
    std::vector<LinearRing> buildings;
    // indexed by TrafficTier
    std::array<StreetTier, TRAFFIC_TIER_COUNT> street_tiers;
    PointCollection amenities;
    size_t dropped_features = 0;

    const StreetTier& tier(TrafficTier t) const {
      return street_tiers[size_t(t)];
    }
    StreetTier& tier(TrafficTier t) { return street_tiers[size_t(t)]; }
    size_t street_count() const;
  };

  struct GeometryAlignerInterface {
    // output
    AlignedGeometry aligned;

    misc::projHelperInterface& pjHelper;

    GeometryAlignerInterface(misc::projHelperInterface& pjh) : pjHelper(pjh){};
    virtual ~GeometryAlignerInterface() = default;

    /**
     * @brief Project `geometry` to the metric frame centred on `bounds`, then
     * scale it around the centre and translate it by the configured offsets.
     * Malformed features are dropped and counted. Building exteriors are
     * stored counter-clockwise and their holes clockwise.
     *
     * @param bounds Geographic bounding box of the raster.
     */
    virtual void compute(const TBox<double>& bounds,
                         const GeometryCollection& geometry,
                         AlignmentConfig cfg = AlignmentConfig(),
                         BufferConfig buffers = BufferConfig(),
                         const Deadline& deadline = Deadline()) = 0;
  };

  std::unique_ptr<GeometryAlignerInterface> createGeometryAligner(
      misc::projHelperInterface& pjh);

}  // namespace canopy::planting
