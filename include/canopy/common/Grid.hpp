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

#include <cstddef>
#include <cstdint>
#include <vector>

namespace canopy {

  /**
   * @brief Row-major raster grid with the origin in the top-left corner. `x`
   * is the column, `y` the row (increasing downwards).
   */
  template <typename T>
  struct Grid {
    std::vector<T> array;
    size_t dim_x = 0;
    size_t dim_y = 0;

    Grid() = default;
    Grid(size_t dim_x, size_t dim_y, T fill = T())
        : array(dim_x * dim_y, fill), dim_x(dim_x), dim_y(dim_y){};

    T& operator()(size_t x, size_t y) { return array[y * dim_x + x]; };
    const T& operator()(size_t x, size_t y) const {
      return array[y * dim_x + x];
    };
    T& operator[](size_t i) { return array[i]; };
    const T& operator[](size_t i) const { return array[i]; };

    size_t size() const { return array.size(); };
    bool empty() const { return array.empty(); };

    template <typename U>
    bool same_shape(const Grid<U>& other) const {
      return dim_x == other.dim_x && dim_y == other.dim_y;
    };
    bool has_shape(size_t x, size_t y) const {
      return dim_x == x && dim_y == y;
    };

    bool operator==(const Grid& other) const = default;
  };

  typedef Grid<float> FloatGrid;
  // boolean grid, 0 is false and any other value is true
  typedef Grid<std::uint8_t> MaskGrid;

  template <typename T>
  size_t count_true(const Grid<T>& grid) {
    size_t n = 0;
    for (auto& v : grid.array) {
      if (v) ++n;
    }
    return n;
  }

}  // namespace canopy
