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

#include <memory>
#include <string>

namespace canopy::io {
  struct SpatialReferenceSystemInterface {
    virtual ~SpatialReferenceSystemInterface() = default;

    // false for an empty (unset) reference system
    virtual bool is_set() const = 0;
    virtual bool is_geographic() const = 0;
    virtual void clear() = 0;

    virtual std::string get_auth_name() const = 0;
    virtual std::string get_auth_code() const = 0;
  };

  std::unique_ptr<SpatialReferenceSystemInterface>
  createSpatialReferenceSystemOGR();
}  // namespace canopy::io
