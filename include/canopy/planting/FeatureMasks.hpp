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
#include <canopy/common/datastructures.hpp>

#include <format>

namespace canopy::planting {

  /**
   * @brief Per-pixel features of one raster. All grids have the dimensions
   * of the raster they were derived from.
   */
  struct FeatureMasks {
    MaskGrid vegetation;
    MaskGrid shadow;
    MaskGrid building;
    MaskGrid street;
    MaskGrid sidewalk;
    // not building, not street and not vegetation
    MaskGrid plantable;

    // in [0, 1]
    FloatGrid shadow_intensity;
    // meters to the nearest sidewalk/building pixel, +inf if there is none
    FloatGrid sidewalk_distance;
    FloatGrid building_distance;

    // continuous pixel coordinates, may lie outside the raster
    vec2d amenity_pixels;
    double ground_resolution = 0;

    size_t dim_x() const { return plantable.dim_x; }
    size_t dim_y() const { return plantable.dim_y; }

    // Throws PreconditionError if any grid is not dim_x by dim_y.
    void check_shape(size_t dim_x, size_t dim_y) const {
      auto check = [&](const auto& grid, const char* name) {
        if (!grid.has_shape(dim_x, dim_y)) {
          throw PreconditionError(
              std::format("{} grid is {}x{}, expected {}x{}", name,
                          grid.dim_x, grid.dim_y, dim_x, dim_y));
        }
      };
      check(vegetation, "vegetation");
      check(shadow, "shadow");
      check(building, "building");
      check(street, "street");
      check(sidewalk, "sidewalk");
      check(plantable, "plantable");
      check(shadow_intensity, "shadow intensity");
      check(sidewalk_distance, "sidewalk distance");
      check(building_distance, "building distance");
    }
  };

}  // namespace canopy::planting
