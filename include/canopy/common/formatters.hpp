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

#include <format>
#include <optional>

// Formatter for canopy::TBox<T>
template <typename T>
struct std::formatter<canopy::TBox<T>> {
  constexpr auto parse(std::format_parse_context& ctx) { return ctx.begin(); }

  auto format(const canopy::TBox<T>& box, std::format_context& ctx) const {
    return std::format_to(ctx.out(), "[{},{},{},{}]", box.pmin[0], box.pmin[1],
                          box.pmax[0], box.pmax[1]);
  }
};

// Formatter for std::optional<canopy::TBox<T>>, empty if not set
template <typename T>
struct std::formatter<std::optional<canopy::TBox<T>>> {
  constexpr auto parse(std::format_parse_context& ctx) { return ctx.begin(); }

  auto format(const std::optional<canopy::TBox<T>>& box,
              std::format_context& ctx) const {
    if (!box.has_value()) {
      return std::format_to(ctx.out(), "");
    } else {
      return std::format_to(ctx.out(), "[{},{},{},{}]", box->pmin[0],
                            box->pmin[1], box->pmax[0], box->pmax[1]);
    }
  }
};

// Formatter for std::optional<double>, empty if not set
template <>
struct std::formatter<std::optional<double>> {
  constexpr auto parse(std::format_parse_context& ctx) { return ctx.begin(); }

  auto format(const std::optional<double>& value,
              std::format_context& ctx) const {
    if (!value.has_value()) {
      return std::format_to(ctx.out(), "");
    }
    return std::format_to(ctx.out(), "{}", *value);
  }
};
