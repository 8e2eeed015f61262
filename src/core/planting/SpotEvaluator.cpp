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
#include <canopy/planting/SpotEvaluator.hpp>

#include <algorithm>

namespace canopy::planting {

  size_t evaluate_spots(SpotEvaluatorInterface& evaluator,
                        LocationSummary& summary, size_t max_spots) {
    auto& logger = logger::Logger::get_logger();
    size_t n_evaluated = 0;
    const size_t n = std::min(max_spots, summary.spots.size());
    for (size_t i = 0; i < n; ++i) {
      auto& spot = summary.spots[i];
      try {
        spot.evaluation = evaluator.evaluate_spot(
            GeoCoordinate{.latitude = spot.latitude,
                          .longitude = spot.longitude});
        spot.evaluated = true;
        ++n_evaluated;
      } catch (const std::exception& e) {
        spot.evaluation.clear();
        spot.evaluated = false;
        logger.warning("Evaluation of spot {} of {} failed: {}", spot.id,
                       summary.location.name, e.what());
      }
    }
    return n_evaluated;
  }

}  // namespace canopy::planting
