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

#include <CGAL/Exact_predicates_inexact_constructions_kernel.h>
#include <CGAL/Polygon_2.h>
#include <CGAL/Polygon_with_holes_2.h>

#include <memory>
#include <vector>

namespace canopy {

  /**
   * @brief Point in polygon test for a polygon with holes. Points on the
   * exterior boundary count as inside, points on a hole boundary as outside.
   */
  class CGALPIPTester {
   private:
    using K = CGAL::Exact_predicates_inexact_constructions_kernel;
    using Point_2 = K::Point_2;
    using Polygon_2 = CGAL::Polygon_2<K>;
    using Polygon_with_holes_2 = CGAL::Polygon_with_holes_2<K>;

    std::unique_ptr<Polygon_with_holes_2> polygon_with_holes;
    Box box_;

   public:
    CGALPIPTester(const LinearRing& polygon);
    CGALPIPTester(const CGALPIPTester&) = delete;
    CGALPIPTester& operator=(const CGALPIPTester&) = delete;
    ~CGALPIPTester() = default;

    const Box& box() const { return box_; }
    bool test(const arr2f& p) const;
  };

  // True if the exterior ring and all holes are simple (no self
  // intersections) and the exterior has a non-zero area.
  bool is_simple_polygon(const LinearRing& polygon);

}  // namespace canopy
