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
#include <canopy/common/common.hpp>

#include <memory>
#include <optional>

namespace canopy::misc {

  /**
   * @brief Converts between geographic coordinates (longitude, latitude in
   * degrees) and a local metric frame (x east, y north, in meters).
   *
   * The frame is a tangent plane at `data_offset` = (lon0, lat0, 0). If no
   * offset is set, the first forward transformed coordinate becomes the
   * origin.
   */
  struct projHelperInterface {
    std::optional<arr3d> data_offset;

    virtual ~projHelperInterface() = default;

    virtual void proj_clear() = 0;

    virtual arr3f coord_transform_fwd(const double& lon, const double& lat,
                                      const double& z) = 0;
    virtual arr3d coord_transform_rev(const float& x, const float& y,
                                      const float& z) const = 0;
    virtual arr3d coord_transform_rev(const arr3f& p) const = 0;

    // meters per degree of longitude and latitude at the origin
    virtual arr2d meters_per_degree() const = 0;

    virtual void set_data_offset(const arr3d& offset) = 0;
  };

  std::unique_ptr<projHelperInterface> createProjHelper();
}  // namespace canopy::misc
