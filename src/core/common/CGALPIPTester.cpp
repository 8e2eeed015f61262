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

#include <canopy/common/CGALPIPTester.hpp>

namespace canopy {

  namespace {
    template <typename Polygon, typename Ring>
    Polygon to_cgal_ring(const Ring& ring) {
      Polygon poly;
      for (const auto& pt : ring) {
        poly.push_back(typename Polygon::Point_2(pt[0], pt[1]));
      }
      return poly;
    }
  }  // namespace

  CGALPIPTester::CGALPIPTester(const LinearRing& polygon) {
    Polygon_2 exterior = to_cgal_ring<Polygon_2>(polygon);

    std::vector<Polygon_2> holes;
    for (const auto& hole : polygon.interior_rings()) {
      holes.push_back(to_cgal_ring<Polygon_2>(hole));
    }

    polygon_with_holes = std::make_unique<Polygon_with_holes_2>(
        exterior, holes.begin(), holes.end());

    for (const auto& pt : polygon) {
      box_.add_xy(pt);
    }
  }

  bool CGALPIPTester::test(const arr2f& p) const {
    if (box_.isEmpty() || !box_.contains(p)) {
      return false;
    }
    Point_2 query_point(p[0], p[1]);

    auto outer_result =
        polygon_with_holes->outer_boundary().bounded_side(query_point);
    if (outer_result == CGAL::ON_UNBOUNDED_SIDE) {
      return false;
    }
    if (outer_result == CGAL::ON_BOUNDARY) {
      return true;
    }

    for (auto hole_it = polygon_with_holes->holes_begin();
         hole_it != polygon_with_holes->holes_end(); ++hole_it) {
      if (hole_it->bounded_side(query_point) != CGAL::ON_UNBOUNDED_SIDE) {
        return false;
      }
    }
    return true;
  }

  bool is_simple_polygon(const LinearRing& polygon) {
    using K = CGAL::Exact_predicates_inexact_constructions_kernel;
    using Polygon_2 = CGAL::Polygon_2<K>;

    if (polygon.size() < 3) return false;
    Polygon_2 exterior = to_cgal_ring<Polygon_2>(polygon);
    if (!exterior.is_simple() || exterior.area() == 0) return false;
    for (const auto& hole : polygon.interior_rings()) {
      if (hole.size() < 3) return false;
      if (!to_cgal_ring<Polygon_2>(hole).is_simple()) return false;
    }
    return true;
  }

}  // namespace canopy
