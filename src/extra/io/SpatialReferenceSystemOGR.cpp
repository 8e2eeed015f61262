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

#include "SpatialReferenceSystemOGR.hpp"

#include <string>

namespace canopy::io {

  bool SpatialReferenceSystemOGR::is_set() const { return !srs.IsEmpty(); };

  bool SpatialReferenceSystemOGR::is_geographic() const {
    return srs.IsGeographic();
  };

  void SpatialReferenceSystemOGR::clear() { srs.Clear(); };

  std::string SpatialReferenceSystemOGR::get_auth_name() const {
    auto name = srs.GetAuthorityName(nullptr);
    return name ? name : "";
  };

  std::string SpatialReferenceSystemOGR::get_auth_code() const {
    auto code = srs.GetAuthorityCode(nullptr);
    return code ? code : "";
  };

  std::unique_ptr<SpatialReferenceSystemInterface>
  createSpatialReferenceSystemOGR() {
    return std::make_unique<SpatialReferenceSystemOGR>();
  };
}  // namespace canopy::io
