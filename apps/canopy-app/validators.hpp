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
#include <canopy/common/box.hpp>

#include <algorithm>
#include <filesystem>
#include <format>
#include <fstream>
#include <functional>
#include <optional>
#include <string>
#include <vector>

template <typename T>
using Validator = std::function<std::optional<std::string>(const T&)>;

namespace canopy::validators {
  // Concept to ensure types are comparable
  template <typename T>
  concept Comparable = requires(T a, T b) {
    { a < b } -> std::convertible_to<bool>;
    { a > b } -> std::convertible_to<bool>;
  };

  // Generator function for range validators
  template <typename T>
    requires Comparable<T>
  auto InRange(T min, T max) {
    return [min, max](const T& val) -> std::optional<std::string> {
      if (val < min || val > max) {
        return std::format("Value {} is out of range <{}, {}>.", val, min, max);
      }
      return std::nullopt;
    };
  };

  // Generator function for validator to check if a value is higher than a given
  // value
  template <typename T>
    requires Comparable<T>
  auto HigherThan(T min) {
    return [min](const T& val) -> std::optional<std::string> {
      if (val <= min) {
        return std::format("Value must be higher than {}.", min);
      }
      return std::nullopt;
    };
  };

  // Generator function for validator to check if a value is higher than or
  // equal to a given value
  template <typename T>
    requires Comparable<T>
  auto HigherOrEqualTo(T min) {
    return [min](const T& val) -> std::optional<std::string> {
      if (val < min) {
        return std::format(
            "Value must be higher than or equal to {}. But is {}.", min, val);
      }
      return std::nullopt;
    };
  };

  // Generator function for validator to check if the value is one of the given
  // values
  template <typename T>
  auto OneOf(std::vector<T> values) {
    return [values](const T& val) -> std::optional<std::string> {
      if (std::find(values.begin(), values.end(), val) == values.end()) {
        return std::format("Value {} is not one of the allowed values.", val);
      }
      return std::nullopt;
    };
  };

  // Generator function for score band validators. `max_points` is read when
  // the validator runs, so it sees the value set from the config file or CLI.
  inline auto ValidBands(const float& max_points) {
    return [&max_points](
               const canopy::ScoreBands& bands) -> std::optional<std::string> {
      return canopy::validate_bands(bands, max_points);
    };
  };

  // Box validator
  inline auto ValidBox =
      [](const std::optional<canopy::TBox<double>>& box)
      -> std::optional<std::string> {
    if (box.has_value() &&
        (box->pmin[0] >= box->pmax[0] || box->pmin[1] >= box->pmax[1])) {
      return "Box is invalid.";
    }
    return std::nullopt;
  };

  // Path exists validator, an empty path is not checked
  inline auto PathExists =
      [](const std::string& path) -> std::optional<std::string> {
    if (!path.empty() && !std::filesystem::exists(path)) {
      return std::format("Path {} does not exist.", path);
    }
    return std::nullopt;
  };

  // Create a validator for file path writeability
  inline auto DirIsWritable =
      [](const std::string& path) -> std::optional<std::string> {
    std::filesystem::path fs_path(path);

    // convert to absolute path
    auto abs_path = std::filesystem::absolute(fs_path);

    // find the first parent folders that already exists
    auto parent = abs_path;
    while (!std::filesystem::exists(parent)) {
      parent = parent.parent_path();
    }

    // check if parent is a directory
    if (!std::filesystem::is_directory(parent)) {
      return std::format("Path {} is not a directory.", parent.string());
    }

    // Try to create a temporary file in parent
    auto testPath = parent / "write_test_tmp";
    std::ofstream test_file(testPath);
    if (test_file) {
      test_file.close();
      std::error_code ec;
      std::filesystem::remove(testPath, ec);
      return std::nullopt;
    }
    return std::format("Could not write to directory {}.", parent.string());
  };
}  // namespace canopy::validators
