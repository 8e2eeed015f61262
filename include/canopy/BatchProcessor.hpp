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
#include <canopy/common/datastructures.hpp>
#include <canopy/planting/Summary.hpp>

#include <chrono>
#include <functional>
#include <optional>
#include <vector>

namespace canopy {

  struct LocationInput {
    RasterBuffer raster;
    GeometryCollection geometry;
  };

  /**
   * @brief One location of a batch. `load` acquires the input data and is
   * called on the worker thread that processes the location.
   */
  struct LocationTask {
    Location location;
    std::function<LocationInput()> load;
  };

  struct BatchOptions {
    // number of worker threads
    size_t jobs = 1;
    // time budget per location for the analysis, excluding loading
    std::optional<std::chrono::milliseconds> timeout;
    // called on the worker thread after each location, must be thread-safe
    std::function<void(const planting::LocationSummary&,
                       const PlantingAnalysis&)>
        on_success;
  };

  /**
   * @brief Analyse all locations in parallel. A failing location never
   * affects the others.
   *
   * @return One summary per task, in the order of `tasks`
   */
  std::vector<planting::LocationSummary> process_batch(
      const std::vector<LocationTask>& tasks, const PlantingConfig& cfg,
      const BatchOptions& options = BatchOptions());

}  // namespace canopy
