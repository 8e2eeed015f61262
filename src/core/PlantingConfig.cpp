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

#include <canopy/PlantingConfig.hpp>

#include <cmath>

namespace canopy {

  std::optional<std::string> validate_bands(const ScoreBands& bands,
                                            float max_points) {
    for (size_t i = 0; i < bands.size(); ++i) {
      if (!std::isfinite(bands[i].limit)) {
        return std::format("band {} has a non-finite limit", i);
      }
      if (i > 0 && !(bands[i].limit > bands[i - 1].limit)) {
        return std::format("band limits must increase, band {} has limit {}",
                           i, bands[i].limit);
      }
      if (bands[i].points < 0 || bands[i].points > max_points) {
        return std::format("band {} scores {} points, allowed is [0, {}]", i,
                           bands[i].points, max_points);
      }
    }
    return std::nullopt;
  }

  float band_points(const ScoreBands& bands, float value) {
    for (const auto& band : bands) {
      if (value <= band.limit) return band.points;
    }
    return 0;
  }

  std::optional<std::string> PlantingConfig::validate() const {
    if (!(alignment.scale > 0)) {
      return std::format("alignment scale must be positive, is {}",
                         alignment.scale);
    }
    if (!std::isfinite(alignment.offset_north_m) ||
        !std::isfinite(alignment.offset_east_m)) {
      return std::string("alignment offsets must be finite");
    }

    if (detection.ndvi_threshold < -1 || detection.ndvi_threshold > 1) {
      return std::format("ndvi threshold must be in [-1, 1], is {}",
                         detection.ndvi_threshold);
    }
    for (float v : {detection.min_vegetation_brightness,
                    detection.shadow_dark_threshold,
                    detection.shadow_desaturation_threshold}) {
      if (v < 0 || v > 255) {
        return std::format("brightness and saturation thresholds must be in "
                           "[0, 255], found {}",
                           v);
      }
    }
    if (detection.shadow_min_cluster_px < 1) {
      return std::string("shadow minimum cluster size must be at least 1");
    }
    if (detection.shadow_blur_sigma < 0) {
      return std::string("shadow blur sigma must not be negative");
    }

    for (float d : {buffers.pedestrian_m, buffers.low_m, buffers.medium_m,
                    buffers.high_m, buffers.sidewalk_m}) {
      if (!(d > 0)) {
        return std::format("buffer distances must be positive, found {}", d);
      }
    }

    for (float w : {scoring.sidewalk_max_points, scoring.building_max_points,
                    scoring.sun_max_points, scoring.amenity_max_points}) {
      if (w < 0) {
        return std::format("maximum points must not be negative, found {}", w);
      }
    }
    if (auto msg = validate_bands(scoring.sidewalk_bands,
                                  scoring.sidewalk_max_points)) {
      return "sidewalk bands: " + *msg;
    }
    if (auto msg = validate_bands(scoring.building_bands,
                                  scoring.building_max_points)) {
      return "building bands: " + *msg;
    }
    if (auto msg = validate_bands(scoring.sun_bands, scoring.sun_max_points)) {
      return "sun bands: " + *msg;
    }
    if (!(scoring.amenity_radius_m > 0)) {
      return std::string("amenity radius must be positive");
    }

    if (!(classification.medium_cutoff < classification.high_cutoff &&
          classification.high_cutoff < classification.critical_cutoff)) {
      return std::format(
          "priority cutoffs must satisfy medium < high < critical, got {} {} "
          "{}",
          classification.medium_cutoff, classification.high_cutoff,
          classification.critical_cutoff);
    }

    if (extraction.min_cluster_px < 1) {
      return std::string("minimum cluster size must be at least 1");
    }
    return std::nullopt;
  }

}  // namespace canopy
