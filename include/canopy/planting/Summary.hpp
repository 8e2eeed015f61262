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
#include <canopy/canopy.h>
#include <canopy/common/datastructures.hpp>

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace canopy::planting {

  enum class RunStatus : std::uint8_t { success = 0, failed, timeout };

  std::string_view to_string(RunStatus status);

  struct SpotSummary {
    std::int64_t id = 0;
    double latitude = 0;
    double longitude = 0;
    double priority_score = 0;
    double area_m2 = 0;
    std::int64_t pixel_count = 0;
    // filled by evaluate_spots
    bool evaluated = false;
    StrMap evaluation;
  };

  struct CoverageStat {
    std::string name;
    std::int64_t pixel_count = 0;
    double area_m2 = 0;
    // of the total raster area
    double percentage = 0;
  };

  struct ComponentStat {
    std::string name;
    // over plantable pixels, 0 if there are none
    double average = 0;
    double max_points = 0;
  };

  struct StreetTierStat {
    std::string name;
    std::int64_t line_count = 0;
    double buffer_m = 0;
  };

  struct SummaryMetadata {
    std::string timestamp;
    double alignment_scale = 0;
    double alignment_offset_north_m = 0;
    double alignment_offset_east_m = 0;
    std::int64_t width = 0;
    std::int64_t height = 0;
    double ground_resolution = 0;
    double total_area_m2 = 0;
    double buffer_pedestrian_m = 0;
    double buffer_low_m = 0;
    double buffer_medium_m = 0;
    double buffer_high_m = 0;
    double buffer_sidewalk_m = 0;
  };

  /**
   * @brief Result of one location in portable types only. Failed and timed
   * out locations only carry the location, the status and the error message.
   */
  struct LocationSummary {
    Location location;
    std::string status;
    std::string error_message;

    std::vector<SpotSummary> spots;
    std::vector<CoverageStat> coverage;
    std::vector<ComponentStat> components;
    // tier distribution over all pixels
    std::vector<CoverageStat> tiers;
    std::vector<StreetTierStat> street_tiers;
    std::int64_t amenity_count = 0;
    std::int64_t dropped_feature_count = 0;
    std::int64_t zeroed_pixel_count = 0;
    double max_priority_score = 0;
    SummaryMetadata metadata;

    bool is_success() const { return status == to_string(RunStatus::success); }
  };

  /**
   * @brief Convert an analysis into its summary. Non-finite values are
   * replaced by 0.
   */
  LocationSummary build_summary(const Location& location,
                                const PlantingAnalysis& analysis,
                                const PlantingConfig& cfg);

  LocationSummary make_failed_summary(const Location& location,
                                      RunStatus status,
                                      const std::string& message);

}  // namespace canopy::planting
