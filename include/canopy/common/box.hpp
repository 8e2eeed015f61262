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

#include <algorithm>
#include <array>
#include <initializer_list>
#include <iomanip>
#include <sstream>
#include <string>

namespace canopy {

  /**
   * @brief Axis aligned 2D box. For geographic boxes x is longitude and y is
   * latitude.
   */
  template <typename T>
  struct TBox {
    std::array<T, 2> pmin, pmax;
    bool just_cleared;

    TBox() { clear(); };

    TBox(std::initializer_list<T> initList) {
      clear();
      auto it = initList.begin();
      pmin[0] = *it++;
      pmin[1] = *it++;
      pmax[0] = *it++;
      pmax[1] = *it;
      just_cleared = false;
    }

    std::array<T, 2> min() const { return pmin; };
    std::array<T, 2> max() const { return pmax; };
    T size_x() const { return pmax[0] - pmin[0]; };
    T size_y() const { return pmax[1] - pmin[1]; };

    void add(const std::array<T, 2>& p) {
      if (just_cleared) {
        pmin = p;
        pmax = p;
        just_cleared = false;
      }
      pmin[0] = std::min(p[0], pmin[0]);
      pmin[1] = std::min(p[1], pmin[1]);
      pmax[0] = std::max(p[0], pmax[0]);
      pmax[1] = std::max(p[1], pmax[1]);
    };
    template <typename P>
    void add_xy(const P& p) {
      add(std::array<T, 2>{T(p[0]), T(p[1])});
    };
    void add(const TBox& otherBox) {
      if (otherBox.isEmpty()) return;
      add(otherBox.min());
      add(otherBox.max());
    };

    bool intersects(const TBox& otherBox) const {
      bool intersect_x =
          (pmin[0] < otherBox.pmax[0]) && (pmax[0] > otherBox.pmin[0]);
      bool intersect_y =
          (pmin[1] < otherBox.pmax[1]) && (pmax[1] > otherBox.pmin[1]);
      return intersect_x && intersect_y;
    };
    bool contains(const std::array<T, 2>& qpoint) const {
      return (pmin[0] <= qpoint[0]) && (pmax[0] >= qpoint[0]) &&
             (pmin[1] <= qpoint[1]) && (pmax[1] >= qpoint[1]);
    };

    // A box is degenerate when it is empty, flat or inverted
    bool is_degenerate() const {
      return just_cleared || !(pmax[0] > pmin[0]) || !(pmax[1] > pmin[1]);
    };

    void clear() {
      pmin.fill(0);
      pmax.fill(0);
      just_cleared = true;
    };
    bool isEmpty() const { return just_cleared; };
    std::array<T, 2> center() const {
      return {(pmax[0] + pmin[0]) / 2, (pmax[1] + pmin[1]) / 2};
    };
    std::string wkt() const {
      if (isEmpty()) return "POLYGON EMPTY";
      std::ostringstream oss;
      oss << std::fixed << std::setprecision(6);
      oss << "POLYGON((";
      oss << pmin[0] << " " << pmin[1] << ", ";
      oss << pmax[0] << " " << pmin[1] << ", ";
      oss << pmax[0] << " " << pmax[1] << ", ";
      oss << pmin[0] << " " << pmax[1] << ", ";
      oss << pmin[0] << " " << pmin[1];
      oss << "))";
      return oss.str();
    }
  };

  typedef TBox<float> Box;
}  // namespace canopy
