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
#include <canopy/planting/FeatureMasks.hpp>

#include <memory>
#include <string_view>

namespace canopy::planting {

  enum class PriorityTier : std::uint8_t { low = 0, medium, high, critical };
  constexpr size_t PRIORITY_TIER_COUNT = 4;

  std::string_view to_string(PriorityTier tier);

  PriorityTier classify_score(float score, const ClassificationConfig& cfg);

  struct ScoreGrid {
    // sum of the components, in [0, ScoringConfig::max_total()]
    FloatGrid raw;
    // raw score, set to 0 on pixels that are not plantable
    FloatGrid score;
    // tier of the final score, low where the pixel is not plantable
    Grid<PriorityTier> tiers;

    FloatGrid sidewalk_component;
    FloatGrid building_component;
    FloatGrid sun_component;
    FloatGrid amenity_component;

    // building, street or vegetation pixels, their score is set to 0
    size_t zeroed_count = 0;
  };

  struct PriorityCalculatorInterface {
    // output
    ScoreGrid scores;

    virtual ~PriorityCalculatorInterface() = default;
    virtual void compute(
        const FeatureMasks& masks, ScoringConfig cfg = ScoringConfig(),
        ClassificationConfig classification = ClassificationConfig(),
        const Deadline& deadline = Deadline()) = 0;
  };

  std::unique_ptr<PriorityCalculatorInterface> createPriorityCalculator();

}  // namespace canopy::planting
