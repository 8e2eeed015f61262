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
#include <vector>

namespace canopy::misc {

  struct Vector2DOpsInterface {
    virtual ~Vector2DOpsInterface() = default;

    /**
     * @brief Buffer each line by `offset` and dissolve the result.
     *
     * @return Polygons (with holes) of the union of all buffers, empty if
     * there are no lines.
     */
    virtual std::vector<LinearRing> buffer_lines(
        const std::vector<LineString>& lines, float offset) = 0;

    /**
     * @brief Dissolve overlapping polygons into their union.
     */
    virtual std::vector<LinearRing> union_polygons(
        const std::vector<LinearRing>& polygons) = 0;
  };

  // Every instance owns its own GEOS context, so instances can be used from
  // different threads concurrently.
  std::unique_ptr<Vector2DOpsInterface> createVector2DOpsGEOS();
}  // namespace canopy::misc
