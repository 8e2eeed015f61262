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

#include <canopy/misc/DistanceTransform.hpp>

#include <algorithm>
#include <cmath>
#include <limits>
#include <vector>

namespace canopy::misc {

  namespace {
    constexpr double INF = std::numeric_limits<double>::infinity();

    // One dimensional squared distance transform of a sampled function f
    // (lower envelope of parabolas rooted at every sample). Result is written
    // to d. v and z are scratch buffers of size n and n+1.
    void edt_1d(const std::vector<double>& f, std::vector<double>& d,
                std::vector<long>& v, std::vector<double>& z, long n) {
      long k = -1;
      for (long q = 0; q < n; ++q) {
        if (f[q] == INF) continue;
        if (k < 0) {
          k = 0;
          v[0] = q;
          z[0] = -INF;
          z[1] = INF;
          continue;
        }
        const auto intersection = [&](long p) {
          return ((f[q] + double(q) * q) - (f[p] + double(p) * p)) /
                 (2.0 * (q - p));
        };
        double s = intersection(v[k]);
        // z[0] is -inf, so this stops at the first parabola
        while (s <= z[k]) {
          --k;
          s = intersection(v[k]);
        }
        ++k;
        v[k] = q;
        z[k] = s;
        z[k + 1] = INF;
      }

      if (k < 0) {
        for (long q = 0; q < n; ++q) d[q] = INF;
        return;
      }
      long j = 0;
      for (long q = 0; q < n; ++q) {
        while (z[j + 1] < q) ++j;
        const double dq = double(q - v[j]);
        d[q] = dq * dq + f[v[j]];
      }
    }
  }  // namespace

  FloatGrid distance_transform(const MaskGrid& mask, float cellsize) {
    const long nx = long(mask.dim_x);
    const long ny = long(mask.dim_y);
    FloatGrid result(mask.dim_x, mask.dim_y,
                     std::numeric_limits<float>::infinity());
    if (mask.empty() || count_true(mask) == 0) return result;

    // squared distances in pixel units
    std::vector<double> sq(mask.size());
    for (size_t i = 0; i < mask.size(); ++i) {
      sq[i] = mask[i] ? 0.0 : INF;
    }

    const long n = std::max(nx, ny);
    std::vector<double> f(n), d(n), z(n + 1);
    std::vector<long> v(n);

    // columns
    for (long x = 0; x < nx; ++x) {
      for (long y = 0; y < ny; ++y) f[y] = sq[y * nx + x];
      edt_1d(f, d, v, z, ny);
      for (long y = 0; y < ny; ++y) sq[y * nx + x] = d[y];
    }
    // rows
    for (long y = 0; y < ny; ++y) {
      for (long x = 0; x < nx; ++x) f[x] = sq[y * nx + x];
      edt_1d(f, d, v, z, nx);
      for (long x = 0; x < nx; ++x) {
        result(x, y) = float(std::sqrt(d[x]) * cellsize);
      }
    }
    return result;
  }

}  // namespace canopy::misc
