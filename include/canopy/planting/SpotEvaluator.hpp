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
#include <canopy/common/common.hpp>
#include <canopy/common/datastructures.hpp>
#include <canopy/planting/Summary.hpp>

namespace canopy::planting {

  /**
   * @brief Second opinion on a critical spot, eg. a ground truth check
   * against other imagery. Returns free-form key value pairs.
   */
  struct SpotEvaluatorInterface {
    virtual ~SpotEvaluatorInterface() = default;
    virtual StrMap evaluate_spot(const GeoCoordinate& coordinate) = 0;
  };

  /**
   * @brief Evaluate the first `max_spots` spots of a summary, in output
   * order. A spot whose evaluation throws is left unevaluated. Scores are
   * never changed.
   *
   * @return Number of spots that were evaluated successfully
   */
  size_t evaluate_spots(SpotEvaluatorInterface& evaluator,
                        LocationSummary& summary, size_t max_spots);

}  // namespace canopy::planting
