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

#include <canopy/misc/projHelper.hpp>

#include <cmath>
#include <numbers>
#include <stdexcept>

namespace canopy::misc {

  // WGS84 semi-major axis
  constexpr double EARTH_RADIUS = 6378137.0;

  struct projHelper : public projHelperInterface {
    void proj_clear() override { data_offset.reset(); };

    arr2d meters_per_degree() const override {
      if (!data_offset.has_value()) {
        throw std::runtime_error("Projection origin is not set.");
      }
      const double deg2rad = std::numbers::pi / 180.;
      double lat0 = (*data_offset)[1] * deg2rad;
      return {EARTH_RADIUS * std::cos(lat0) * deg2rad, EARTH_RADIUS * deg2rad};
    }

    arr3f coord_transform_fwd(const double& lon, const double& lat,
                              const double& z) override {
      if (!data_offset.has_value()) {
        data_offset = {lon, lat, z};
      }
      auto mpd = meters_per_degree();
      return arr3f{float((lon - (*data_offset)[0]) * mpd[0]),
                   float((lat - (*data_offset)[1]) * mpd[1]),
                   float(z - (*data_offset)[2])};
    };
    arr3d coord_transform_rev(const float& x, const float& y,
                              const float& z) const override {
      if (!data_offset.has_value()) {
        return arr3d{x, y, z};
      }
      auto mpd = meters_per_degree();
      return arr3d{(*data_offset)[0] + double(x) / mpd[0],
                   (*data_offset)[1] + double(y) / mpd[1],
                   (*data_offset)[2] + double(z)};
    }
    arr3d coord_transform_rev(const arr3f& p) const override {
      return coord_transform_rev(p[0], p[1], p[2]);
    };

    void set_data_offset(const arr3d& offset) override {
      if (offset[1] <= -90 || offset[1] >= 90) {
        throw std::runtime_error("Projection origin latitude out of range.");
      }
      data_offset = offset;
    }
  };

  std::unique_ptr<projHelperInterface> createProjHelper() {
    return std::make_unique<projHelper>();
  };
}  // namespace canopy::misc
