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
#include <canopy/PlantingConfig.hpp>
#include <canopy/common/Deadline.hpp>
#include <canopy/misc/PixelTransform.hpp>
#include <canopy/planting/PriorityCalculator.hpp>

#include <memory>
#include <vector>

namespace canopy::planting {

  /**
   * @brief Connected region of critical priority pixels.
   */
  struct CriticalSpot {
    // 1-based, in order of discovery in a row by row scan
    size_t id = 0;
    // mean of the pixel centres, in continuous pixel coordinates
    arr2d centroid_px = {0, 0};
    GeoCoordinate centroid;
    float mean_score = 0;
    size_t pixel_count = 0;
    double area_m2 = 0;
  };

  struct SpotExtractorInterface {
    // output, sorted by descending mean score, then ascending id
    std::vector<CriticalSpot> spots;

    virtual ~SpotExtractorInterface() = default;
    virtual void compute(const ScoreGrid& scores,
                         const misc::PixelTransform& transform,
                         double ground_resolution,
                         ExtractionConfig cfg = ExtractionConfig(),
                         const Deadline& deadline = Deadline()) = 0;
  };

  std::unique_ptr<SpotExtractorInterface> createSpotExtractor();

}  // namespace canopy::planting
