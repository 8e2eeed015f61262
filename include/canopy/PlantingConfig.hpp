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

#include <format>
#include <optional>
#include <string>
#include <vector>

namespace canopy {

  /**
   * @brief One step of a banded score. A value scores `points` if it is at
   * most `limit` and did not match an earlier band.
   */
  struct ScoreBand {
    float limit;
    float points;

    bool operator==(const ScoreBand& other) const = default;
  };
  typedef std::vector<ScoreBand> ScoreBands;

  /**
   * @brief Correction of the systematic offset between the vector data and
   * the imagery. Geometry is scaled around the raster centre and then
   * translated. Unit of the offsets: meters.
   */
  struct AlignmentConfig {
    float scale = 1.95;
    float offset_north_m = -5;
    float offset_east_m = -10;
  };

  /**
   * @brief Thresholds for the colour based vegetation and shadow detection.
   * Brightness and saturation are on the 0-255 scale.
   */
  struct DetectionConfig {
    /**
     * @brief A pixel is vegetation if (G-R)/(G+R) exceeds this value...
     */
    float ndvi_threshold = 0.2;
    /**
     * @brief ...and its brightness (HSV value) exceeds this value.
     */
    float min_vegetation_brightness = 60;
    /**
     * @brief Shadow pixels are darker than this brightness...
     */
    float shadow_dark_threshold = 80;
    /**
     * @brief ...and less saturated than this.
     */
    float shadow_desaturation_threshold = 60;
    /**
     * @brief Connected shadow regions with fewer pixels are treated as noise.
     */
    int shadow_min_cluster_px = 50;
    /**
     * @brief Standard deviation in pixels of the Gaussian blur applied to the
     * shadow intensity.
     */
    float shadow_blur_sigma = 2.0;
  };

  /**
   * @brief Buffer distances in meters. Streets are buffered per traffic tier,
   * sidewalks are derived from the pedestrian and low traffic tiers.
   */
  struct BufferConfig {
    float pedestrian_m = 5;
    float low_m = 10;
    float medium_m = 15;
    float high_m = 25;
    float sidewalk_m = 5;
  };

  struct ScoringConfig {
    /**
     * @brief Bands on the distance to the nearest sidewalk pixel (meters).
     */
    ScoreBands sidewalk_bands = {{3, 35}, {6, 28}, {10, 20}, {20, 10}};
    /**
     * @brief Bands on the distance to the nearest building pixel (meters).
     * Highest score in the middle: too close leaves no room for a crown, far
     * away the tree gives no shade to the building.
     */
    ScoreBands building_bands = {{3, 5}, {8, 15}, {20, 25}, {40, 12}, {60, 5}};
    /**
     * @brief Bands on the shadow intensity (0 is full sun, 1 is black).
     */
    ScoreBands sun_bands = {{0.4, 20}, {0.6, 15}, {0.8, 10}};

    float sidewalk_max_points = 35;
    float building_max_points = 25;
    float sun_max_points = 20;
    float amenity_max_points = 10;
    /**
     * @brief Amenities further away than this do not contribute to the
     * amenity density of a pixel. Unit: meters.
     */
    float amenity_radius_m = 100;

    float max_total() const {
      return sidewalk_max_points + building_max_points + sun_max_points +
             amenity_max_points;
    }
  };

  struct ClassificationConfig {
    float critical_cutoff = 80;
    float high_cutoff = 60;
    float medium_cutoff = 40;
  };

  struct ExtractionConfig {
    /**
     * @brief Minimum number of pixels of a critical region to be reported as
     * a spot.
     */
    int min_cluster_px = 20;
  };

  /**
   * @brief All parameters of one planting analysis run.
   */
  struct PlantingConfig {
    AlignmentConfig alignment;
    DetectionConfig detection;
    BufferConfig buffers;
    ScoringConfig scoring;
    ClassificationConfig classification;
    ExtractionConfig extraction;

    /**
     * @brief Check the parameters for consistency.
     *
     * @return Description of the first problem found, or nothing if the
     * configuration is valid.
     */
    std::optional<std::string> validate() const;
    bool is_valid() const { return !validate().has_value(); }
  };

  /**
   * @brief Check that band limits increase strictly and that the points are
   * within [0, max_points].
   */
  std::optional<std::string> validate_bands(const ScoreBands& bands,
                                            float max_points);

  // Points of the first band with value <= limit, 0 if no band matches.
  float band_points(const ScoreBands& bands, float value);

}  // namespace canopy

template <>
struct std::formatter<canopy::ScoreBands> {
  constexpr auto parse(std::format_parse_context& ctx) { return ctx.begin(); }

  auto format(const canopy::ScoreBands& bands,
              std::format_context& ctx) const {
    std::string result = "[";
    for (size_t i = 0; i < bands.size(); ++i) {
      if (i) result += ", ";
      result += std::format("[{}, {}]", bands[i].limit, bands[i].points);
    }
    result += "]";
    return std::format_to(ctx.out(), "{}", result);
  }
};
