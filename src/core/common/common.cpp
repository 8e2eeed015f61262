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

#include <canopy/common/common.hpp>

#include <algorithm>
#include <cmath>
#include <ctime>
#include <iterator>
#include <mutex>

namespace canopy {

  const Box& Geometry::box() {
    if (!bbox.has_value()) {
      compute_box();
    }
    return *bbox;
  };

  // geometry helpers:
  template <typename T>
  float ring_signed_area(const T& ring) {
    float result = 0;
    const auto n = ring.size();
    for (size_t i = 0; i < n; ++i) {
      size_t i_n;
      if (i == (n - 1)) {
        i_n = 0;
      } else {
        i_n = i + 1;
      }

      result += ring[i][0] * ring[i_n][1] - ring[i_n][0] * ring[i][1];
    }
    return result / 2;
  }

  template <typename T>
  void add_to_box(std::optional<Box>& bbox, const T& points) {
    bbox = Box();
    for (auto& p : points) {
      bbox->add_xy(p);
    }
  }

  // geometry types:

  void LinearRing::compute_box() { add_to_box(bbox, *this); }
  float LinearRing::signed_area() const {
    float result = ring_signed_area(*this);
    for (auto& iring : interior_rings_) {
      // holes are expected to be stored clockwise, ie. with negative area
      result += ring_signed_area(iring);
    }
    return result;
  }
  size_t LinearRing::vertex_count() const { return size(); }
  std::vector<vec3f>& LinearRing::interior_rings() { return interior_rings_; }
  const std::vector<vec3f>& LinearRing::interior_rings() const {
    return interior_rings_;
  }

  void LineString::compute_box() { add_to_box(bbox, *this); }
  size_t LineString::vertex_count() const { return size(); }

  void PointCollection::compute_box() { add_to_box(bbox, *this); }
  size_t PointCollection::vertex_count() const { return size(); }

  std::vector<std::string> split_string(const std::string& s,
                                        std::string delimiter) {
    std::vector<std::string> parts;
    size_t last = 0;
    size_t next = 0;

    while ((next = s.find(delimiter, last)) != std::string::npos) {
      parts.push_back(s.substr(last, next - last));
      last = next + delimiter.size();
    }
    parts.push_back(s.substr(last));
    return parts;
  }

  void fix_duplicates_ring(const vec3f& poly, vec3f& new_ring,
                           float dupe_threshold) {
    if (poly.empty()) return;
    auto pl = *poly.rbegin();
    for (auto& p : poly) {
      if (!(std::fabs(pl[0] - p[0]) < dupe_threshold &&
            std::fabs(pl[1] - p[1]) < dupe_threshold)) {
        new_ring.push_back(p);
      }
      pl = p;
    }
  }

  LinearRing fix_duplicates(const LinearRing& poly, float dupe_threshold) {
    LinearRing new_lr;
    fix_duplicates_ring(poly, new_lr, dupe_threshold);

    for (auto& ring : poly.interior_rings()) {
      vec3f new_ring;
      fix_duplicates_ring(ring, new_ring, dupe_threshold);
      new_lr.interior_rings().push_back(new_ring);
    }
    return new_lr;
  }

  void pop_back_if_equal_to_front(vec3f& ring) {
    if (ring.size() < 2) return;
    auto it = ring.end();
    --it;
    if ((*ring.begin()) == *it) ring.erase(it);
  }

  void orient_polygon(LinearRing& poly) {
    if (ring_signed_area(poly) < 0) std::reverse(poly.begin(), poly.end());
    for (auto& iring : poly.interior_rings()) {
      if (ring_signed_area(iring) > 0) std::reverse(iring.begin(), iring.end());
    }
  }

  std::string utc_timestamp_ietf() {
    // std::gmtime returns a pointer to shared static storage
    static std::mutex gmtime_mutex;
    std::scoped_lock lock{gmtime_mutex};
    std::time_t t = std::time(nullptr);
    char timeString[std::size("yyyy-mm-ddThh:mm:ssZ")];
    std::strftime(std::data(timeString), std::size(timeString), "%FT%TZ",
                  std::gmtime(&t));
    std::string ret(timeString);
    return ret;
  }
}  // namespace canopy
