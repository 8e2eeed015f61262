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

namespace canopy::misc {

  /**
   * @brief Linear mapping between pixel coordinates and geographic
   * coordinates of a north-up raster.
   *
   * Pixel coordinates are continuous: (0, 0) is the top-left corner of the
   * raster and (dim_x, dim_y) the bottom-right corner, so the centre of pixel
   * (i, j) is (i + 0.5, j + 0.5). Longitude increases with x, latitude
   * decreases with y.
   */
  class PixelTransform {
    TBox<double> bounds_;
    size_t dim_x_;
    size_t dim_y_;

   public:
    PixelTransform(const TBox<double>& bounds, size_t dim_x, size_t dim_y);

    const TBox<double>& bounds() const { return bounds_; }
    size_t dim_x() const { return dim_x_; }
    size_t dim_y() const { return dim_y_; }

    // returns (longitude, latitude)
    arr2d pixel_to_geo(const arr2d& p) const;
    // returns continuous pixel coordinates (x, y)
    arr2d geo_to_pixel(const arr2d& lonlat) const;

    GeoCoordinate pixel_to_coordinate(const arr2d& p) const;
  };

}  // namespace canopy::misc
