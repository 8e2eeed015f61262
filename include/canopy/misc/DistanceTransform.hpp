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
#include <canopy/common/Grid.hpp>

namespace canopy::misc {

  /**
   * @brief Exact Euclidean distance from every cell to the nearest set cell
   * of `mask`, multiplied by `cellsize`.
   *
   * Set cells have distance 0. If the mask has no set cell at all, every
   * distance is +infinity.
   */
  FloatGrid distance_transform(const MaskGrid& mask, float cellsize);

}  // namespace canopy::misc
