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

#include <catch2/catch_test_macros.hpp>

TEST_CASE("logger") {
  auto& logger = canopy::logger::Logger::get_logger();
  logger.set_level(canopy::logger::LogLevel::trace);
  logger.trace("trace", 42);
  logger.debug("debug");
  logger.info("info");
  logger.warning("warning");
  logger.error("error");
  logger.critical("critical");
  CHECK(logger.get_level() == canopy::logger::LogLevel::trace);
  logger.set_level(canopy::logger::LogLevel::default_level);
}

TEST_CASE("log level names") {
  using canopy::logger::LogLevel;
  for (auto level : {LogLevel::off, LogLevel::trace, LogLevel::debug,
                     LogLevel::info, LogLevel::warning, LogLevel::error,
                     LogLevel::critical}) {
    auto parsed =
        canopy::logger::level_from_string(canopy::logger::to_string(level));
    REQUIRE(parsed.has_value());
    CHECK(*parsed == level);
  }
  CHECK_FALSE(canopy::logger::level_from_string("verbose").has_value());
}
