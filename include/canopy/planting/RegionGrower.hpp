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

#include <deque>
#include <map>
#include <vector>

namespace canopy::planting {

  namespace regiongrower {

    class Region {
      size_t region_id;

     public:
      Region(size_t region_id) : region_id(region_id){};

      size_t get_region_id() const { return region_id; }
    };

    /**
     * @brief Candidate data structure over the set pixels of a mask grid,
     * with 8-connected neighbourhoods. Handles are linear pixel indices.
     */
    template <typename T>
    class GridRegionGrowerDS {
     public:
      const Grid<T>& mask;
      size_t size;

      GridRegionGrowerDS(const Grid<T>& mask) : mask(mask), size(mask.size()){};

      // set pixels in raster-scan order
      std::deque<size_t> get_seeds() const {
        std::deque<size_t> seeds;
        for (size_t i = 0; i < size; ++i) {
          if (mask[i]) seeds.push_back(i);
        }
        return seeds;
      }

      std::vector<size_t> get_neighbours(size_t idx) const {
        std::vector<size_t> neighbours;
        neighbours.reserve(8);
        const long x = long(idx % mask.dim_x);
        const long y = long(idx / mask.dim_x);
        for (long dy = -1; dy <= 1; ++dy) {
          for (long dx = -1; dx <= 1; ++dx) {
            if (dx == 0 && dy == 0) continue;
            const long nx = x + dx;
            const long ny = y + dy;
            if (nx < 0 || ny < 0 || nx >= long(mask.dim_x) ||
                ny >= long(mask.dim_y))
              continue;
            neighbours.push_back(size_t(ny) * mask.dim_x + size_t(nx));
          }
        }
        return neighbours;
      }
    };

    // Accepts every neighbour that is set in the mask.
    struct MaskTester {
      template <typename candidateDS, typename regionType>
      bool is_valid(const candidateDS& cds, size_t current, size_t neighbour,
                    regionType& region) const {
        return cds.mask[neighbour];
      }
    };

    /**
     * @brief Labels connected regions. Region ids start at 1 and are only
     * consumed by regions that reach `min_segment_count`, so accepted regions
     * are numbered consecutively in seed order. Id 0 means unsegmented.
     */
    template <typename candidateDS, typename regionType>
    class RegionGrower {
      size_t cur_region_id = 1;

     public:
      std::vector<size_t> region_ids;
      std::vector<regionType> regions;
      size_t min_segment_count = 15;
      // pixels per accepted region, indexed by region id
      std::map<size_t, std::vector<size_t>> region_members;

     private:
      template <typename Tester>
      inline bool grow_one_region(candidateDS& cds, Tester& tester,
                                  size_t& seed_handle) {
        std::deque<size_t> candidates;
        std::vector<size_t> handles_in_region;
        regions.push_back(regionType(cur_region_id));

        candidates.push_back(seed_handle);
        handles_in_region.push_back(seed_handle);
        region_ids[seed_handle] = cur_region_id;

        while (candidates.size() > 0) {
          auto candidate = candidates.front();
          candidates.pop_front();
          for (auto neighbour : cds.get_neighbours(candidate)) {
            if (region_ids[neighbour] != 0) continue;
            if (tester.is_valid(cds, candidate, neighbour, regions.back())) {
              candidates.push_back(neighbour);
              handles_in_region.push_back(neighbour);
              region_ids[neighbour] = cur_region_id;
            }
          }
        }
        // undo region if it is too small, its pixels are marked with a
        // sentinel so they are not used as seed again
        if (handles_in_region.size() < min_segment_count) {
          regions.erase(regions.end() - 1);
          for (auto handle : handles_in_region) region_ids[handle] = rejected;
          return false;
        }
        region_members[cur_region_id] = std::move(handles_in_region);
        return true;
      };

     public:
      static constexpr size_t rejected = size_t(-1);

      template <typename Tester>
      void grow_regions(candidateDS& cds, Tester& tester) {
        std::deque<size_t> seeds = cds.get_seeds();

        region_ids.resize(cds.size, 0);
        // first region means unsegmented
        regions.push_back(regionType(0));

        while (seeds.size() > 0) {
          auto idx = seeds.front();
          seeds.pop_front();
          if (region_ids[idx] == 0) {
            if (grow_one_region(cds, tester, idx)) ++cur_region_id;
          }
        }
        for (auto& id : region_ids) {
          if (id == rejected) id = 0;
        }
      };
    };

  }  // namespace regiongrower

}  // namespace canopy::planting
