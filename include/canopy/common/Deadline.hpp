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

#include <canopy/common/datastructures.hpp>

#include <chrono>
#include <format>
#include <optional>
#include <string_view>

namespace canopy {

  /**
   * @brief Time budget for one pipeline run. A default constructed deadline
   * never expires.
   */
  class Deadline {
    using clock = std::chrono::steady_clock;

    clock::time_point start_ = clock::now();
    std::optional<std::chrono::milliseconds> budget_;

   public:
    Deadline() = default;
    explicit Deadline(std::chrono::milliseconds budget) : budget_(budget){};

    bool has_limit() const { return budget_.has_value(); }

    long long elapsed_ms() const {
      return std::chrono::duration_cast<std::chrono::milliseconds>(
                 clock::now() - start_)
          .count();
    }

    bool expired() const {
      return budget_.has_value() && elapsed_ms() >= budget_->count();
    }

    /**
     * @brief Throws TimeoutAbort if the budget is used up.
     *
     * @param stage Name of the stage that is about to start or just finished.
     */
    void check(std::string_view stage) const {
      if (expired()) {
        throw TimeoutAbort(std::format("time limit of {} ms reached at {}",
                                       budget_->count(), stage));
      }
    }
  };

}  // namespace canopy
