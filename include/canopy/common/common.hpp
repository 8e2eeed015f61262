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

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "box.hpp"

namespace canopy {

  typedef std::array<float, 2> arr2f;
  typedef std::array<double, 2> arr2d;
  typedef std::array<float, 3> arr3f;
  typedef std::array<double, 3> arr3d;
  typedef std::vector<std::array<double, 2>> vec2d;

  typedef std::vector<float> vec1f;
  typedef std::vector<arr3f> vec3f;

  typedef std::unordered_map<std::string, std::string> StrMap;

  class Geometry {
   protected:
    std::optional<Box> bbox;
    virtual void compute_box() = 0;

   public:
    virtual ~Geometry() = default;
    virtual size_t vertex_count() const = 0;
    virtual const Box& box();
  };

  // Polygon in the local metric frame, exterior ring plus holes. Rings are
  // stored open (last vertex not repeated).
  class LinearRing : public vec3f, public Geometry {
    std::vector<vec3f> interior_rings_;

   protected:
    void compute_box() override;

   public:
    size_t vertex_count() const override;
    std::vector<vec3f>& interior_rings();
    const std::vector<vec3f>& interior_rings() const;
    float signed_area() const;
  };

  class LineString : public vec3f, public Geometry {
   protected:
    void compute_box() override;

   public:
    size_t vertex_count() const override;
  };

  class PointCollection : public vec3f, public Geometry {
   protected:
    void compute_box() override;

   public:
    size_t vertex_count() const override;
  };

  std::vector<std::string> split_string(const std::string& s,
                                        std::string delimiter);

  LinearRing fix_duplicates(const LinearRing& poly, float dupe_threshold);
  void pop_back_if_equal_to_front(vec3f& ring);
  // exterior ring counter-clockwise, holes clockwise
  void orient_polygon(LinearRing& poly);

  // Current UTC time formatted as RFC 3339, eg. 2024-05-01T12:00:00Z
  std::string utc_timestamp_ietf();

}  // namespace canopy
