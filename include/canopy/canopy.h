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
#include <canopy/common/datastructures.hpp>
#include <canopy/planting/FeatureDetector.hpp>
#include <canopy/planting/FeatureMasks.hpp>
#include <canopy/planting/GeometryAligner.hpp>
#include <canopy/planting/MaskGenerator.hpp>
#include <canopy/planting/PriorityCalculator.hpp>
#include <canopy/planting/SpotExtractor.hpp>

#include <vector>

namespace canopy {

  /**
   * @brief Everything computed for one raster.
   */
  struct PlantingAnalysis {
    planting::AlignedGeometry aligned;
    planting::FeatureMasks masks;
    planting::ScoreGrid scores;
    std::vector<planting::CriticalSpot> spots;
  };

  /**
   * @brief Check that a raster can be analysed.
   *
   * Throws PreconditionError for a degenerate or inverted bounding box, zero
   * dimensions, an RGB buffer whose size does not match the dimensions or a
   * ground resolution that is not positive.
   */
  void validate_raster(const RasterBuffer& raster);

  /**
   * @brief Compute the planting priority of every pixel of `raster` and
   * extract the critical spots.
   *
   * The run is deterministic and keeps no state: the same inputs always give
   * the same result.
   *
   * @param raster RGB image with its geographic bounding box
   * @param geometry Buildings, streets and amenities in geographic
   * coordinates
   * @param cfg Configuration parameters
   * @param deadline Checked before and after every stage
   *
   * @return PlantingAnalysis with the grids and the spots sorted by
   * descending mean score
   *
   * @throws PreconditionError if the raster is invalid
   * @throws TimeoutAbort if the deadline expires
   * @throws canopyException for an invalid configuration or any other failure
   */
  PlantingAnalysis analyse(const RasterBuffer& raster,
                           const GeometryCollection& geometry,
                           const PlantingConfig& cfg = PlantingConfig(),
                           const Deadline& deadline = Deadline());

}  // namespace canopy
