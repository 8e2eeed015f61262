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

#include <canopy/logger/logger.h>
#include <canopy/planting/RegionGrower.hpp>
#include <canopy/planting/SpotExtractor.hpp>

#include <algorithm>
#include <format>

namespace canopy::planting {

  class SpotExtractor : public SpotExtractorInterface {
   public:
    void compute(const ScoreGrid& scores,
                 const misc::PixelTransform& transform,
                 double ground_resolution, ExtractionConfig cfg,
                 const Deadline& deadline) override {
      auto& logger = logger::Logger::get_logger();
      const size_t nx = transform.dim_x();
      const size_t ny = transform.dim_y();
      if (!scores.tiers.has_shape(nx, ny) || !scores.score.has_shape(nx, ny)) {
        throw PreconditionError(
            std::format("score grid is {}x{}, raster is {}x{}",
                        scores.score.dim_x, scores.score.dim_y, nx, ny));
      }

      MaskGrid critical(nx, ny, 0);
      for (size_t i = 0; i < critical.size(); ++i) {
        critical[i] = scores.tiers[i] == PriorityTier::critical;
      }

      using DS = regiongrower::GridRegionGrowerDS<std::uint8_t>;
      DS cds(critical);
      regiongrower::RegionGrower<DS, regiongrower::Region> R;
      R.min_segment_count = size_t(std::max(cfg.min_cluster_px, 1));
      regiongrower::MaskTester tester;
      R.grow_regions(cds, tester);
      deadline.check("critical region growing");

      spots.clear();
      const double pixel_area = ground_resolution * ground_resolution;
      for (auto& [region_id, members] : R.region_members) {
        deadline.check("spot extraction");
        CriticalSpot spot;
        spot.id = region_id;
        double sum_x = 0, sum_y = 0, sum_score = 0;
        for (auto idx : members) {
          sum_x += double(idx % nx) + 0.5;
          sum_y += double(idx / nx) + 0.5;
          sum_score += scores.score[idx];
        }
        const double n = double(members.size());
        spot.centroid_px = {sum_x / n, sum_y / n};
        spot.centroid = transform.pixel_to_coordinate(spot.centroid_px);
        spot.mean_score = float(sum_score / n);
        spot.pixel_count = members.size();
        spot.area_m2 = n * pixel_area;
        spots.push_back(spot);
      }

      std::sort(spots.begin(), spots.end(),
                [](const CriticalSpot& a, const CriticalSpot& b) {
                  if (a.mean_score != b.mean_score)
                    return a.mean_score > b.mean_score;
                  return a.id < b.id;
                });

      logger.debug("Extracted {} critical spots from {} critical pixels",
                   spots.size(), count_true(critical));
    }
  };

  std::unique_ptr<SpotExtractorInterface> createSpotExtractor() {
    return std::make_unique<SpotExtractor>();
  };

}  // namespace canopy::planting
