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
#include <canopy/io/SpatialReferenceSystem.hpp>

#include <ogr_spatialref.h>

namespace canopy::io {

  struct SpatialReferenceSystemOGR : public SpatialReferenceSystemInterface {
    OGRSpatialReference srs;

    bool is_set() const override;
    bool is_geographic() const override;
    void clear() override;
    std::string get_auth_name() const override;
    std::string get_auth_code() const override;
  };

}  // namespace canopy::io
