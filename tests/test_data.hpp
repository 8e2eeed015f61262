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
#include <canopy/planting/FeatureMasks.hpp>

#include <limits>
#include <numbers>

namespace canopy::test {

  // meters per degree at the equator, see projHelper
  constexpr double METERS_PER_DEGREE = 6378137.0 * std::numbers::pi / 180.;

  // Geographic box at the equator of `w` x `h` pixels of `res` meters, so the
  // metric frame and the pixel grid line up.
  inline TBox<double> equator_box(size_t w, size_t h, double res) {
    return TBox<double>{0., 0., w * res / METERS_PER_DEGREE,
                        h * res / METERS_PER_DEGREE};
  }

  inline RasterBuffer uniform_raster(size_t w, size_t h, std::uint8_t r,
                                     std::uint8_t g, std::uint8_t b,
                                     double res = 1.) {
    RasterBuffer raster;
    raster.width = w;
    raster.height = h;
    raster.ground_resolution = res;
    raster.bounds = equator_box(w, h, res);
    raster.rgb.resize(3 * w * h);
    for (size_t i = 0; i < w * h; ++i) {
      raster.rgb[3 * i] = r;
      raster.rgb[3 * i + 1] = g;
      raster.rgb[3 * i + 2] = b;
    }
    return raster;
  }

  inline void set_pixel(RasterBuffer& raster, size_t x, size_t y,
                        std::uint8_t r, std::uint8_t g, std::uint8_t b) {
    auto i = 3 * (y * raster.width + x);
    raster.rgb[i] = r;
    raster.rgb[i + 1] = g;
    raster.rgb[i + 2] = b;
  }

  // Longitude, latitude of the metric point (x, y) in a box from equator_box,
  // measured from its south west corner.
  inline arr2d metric_to_geo(double x, double y) {
    return {x / METERS_PER_DEGREE, y / METERS_PER_DEGREE};
  }

  // Masks without any feature: everything plantable, full sun and every
  // distance infinite.
  inline planting::FeatureMasks empty_masks(size_t w, size_t h,
                                            double res = 1.) {
    const float inf = std::numeric_limits<float>::infinity();
    planting::FeatureMasks masks;
    masks.vegetation = MaskGrid(w, h, 0);
    masks.shadow = MaskGrid(w, h, 0);
    masks.building = MaskGrid(w, h, 0);
    masks.street = MaskGrid(w, h, 0);
    masks.sidewalk = MaskGrid(w, h, 0);
    masks.plantable = MaskGrid(w, h, 1);
    masks.shadow_intensity = FloatGrid(w, h, 0);
    masks.sidewalk_distance = FloatGrid(w, h, inf);
    masks.building_distance = FloatGrid(w, h, inf);
    masks.ground_resolution = res;
    return masks;
  }

}  // namespace canopy::test
