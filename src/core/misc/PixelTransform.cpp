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

#include <canopy/misc/PixelTransform.hpp>

#include <cmath>
#include <format>

namespace canopy::misc {

  PixelTransform::PixelTransform(const TBox<double>& bounds, size_t dim_x,
                                 size_t dim_y)
      : bounds_(bounds), dim_x_(dim_x), dim_y_(dim_y) {
    if (bounds.is_degenerate() || !std::isfinite(bounds.pmin[0]) ||
        !std::isfinite(bounds.pmin[1]) || !std::isfinite(bounds.pmax[0]) ||
        !std::isfinite(bounds.pmax[1])) {
      throw PreconditionError(
          std::format("degenerate or inverted bounding box {}", bounds.wkt()));
    }
    if (dim_x == 0 || dim_y == 0) {
      throw PreconditionError(
          std::format("raster has no pixels ({}x{})", dim_x, dim_y));
    }
  }

  arr2d PixelTransform::pixel_to_geo(const arr2d& p) const {
    double lon = bounds_.pmin[0] + p[0] / dim_x_ * bounds_.size_x();
    double lat = bounds_.pmax[1] - p[1] / dim_y_ * bounds_.size_y();
    return {lon, lat};
  }

  arr2d PixelTransform::geo_to_pixel(const arr2d& lonlat) const {
    double x = (lonlat[0] - bounds_.pmin[0]) / bounds_.size_x() * dim_x_;
    double y = (bounds_.pmax[1] - lonlat[1]) / bounds_.size_y() * dim_y_;
    return {x, y};
  }

  GeoCoordinate PixelTransform::pixel_to_coordinate(const arr2d& p) const {
    auto lonlat = pixel_to_geo(p);
    return GeoCoordinate{.latitude = lonlat[1], .longitude = lonlat[0]};
  }

}  // namespace canopy::misc
