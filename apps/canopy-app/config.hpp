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
#include <canopy/logger/logger.h>

#include <cctype>
#include <filesystem>
#include <format>
#include <iomanip>
#include <iostream>
#include <list>
#include <optional>
#include <sstream>
#include <string>
#include <thread>
#include <unordered_map>
#include <utility>
#include <vector>

#include <toml.hpp>

#include "parameter.hpp"
#include "validators.hpp"

namespace fs = std::filesystem;
namespace check = canopy::validators;

#ifndef CN_VERSION
#define CN_VERSION "unknown"
#endif

/**
 * @brief One location to analyse, as given on the command line or in a
 * `[[locations]]` table of the config file.
 */
struct LocationSource {
  std::string name;
  // taken from the centre of the raster extent if not given
  std::optional<double> latitude;
  std::optional<double> longitude;
  std::string raster;
  std::string vector;
};

/**
 * @brief Settings of the application that are not part of the analysis
 * itself.
 */
struct AppConfig {
  std::string output_path;
  // restricts the vector features that are read, defaults to the raster
  // extent
  std::optional<canopy::TBox<double>> region_of_interest;
  std::string building_attribute = "building";
  std::string street_attribute = "highway";
  std::string amenity_attribute = "amenity";
  // meters per pixel, derived from the raster extent if not given
  std::optional<double> ground_resolution;
  bool pretty_print = true;
};

struct CLIArgs {
  std::string program_name;
  std::list<std::string> args;

  CLIArgs(int argc, const char* argv[]) {
    program_name = argv[0];
    // get the name of the binary
    auto pos = program_name.find_last_of("/\\");
    if (pos != std::string::npos) {
      program_name = program_name.substr(pos + 1);
    }
    for (int i = 1; i < argc; i++) {
      args.push_back(argv[i]);
    }
  }
};

struct CanopyConfigHandler {
  canopy::PlantingConfig cfg_;
  AppConfig app_cfg_;

  using param_group_map = std::vector<std::pair<std::string, ParameterVector>>;

  std::vector<LocationSource> locations_;
  param_group_map app_param_groups_;
  param_group_map param_groups_;
  std::unordered_map<std::string, ConfigParameter*> param_index_;
  std::unordered_map<std::string, ConfigParameter*> app_param_index_;

  // flags
  bool _print_help = false;
  bool _print_version = false;
  canopy::logger::LogLevel _loglevel = canopy::logger::LogLevel::info;
  std::string _config_path;
  int _jobs = std::thread::hardware_concurrency();
  // 0 means no limit
  int _timeout_ms = 0;

  // methods
  CanopyConfigHandler() {
    ParameterVector input, alignment, detection, buffers, scoring,
        classification, extraction, output;
    ParameterVector general;

    general.add("help", 'h', "Show help message", _print_help);
    general.add("version", 'v', "Show version", _print_version);
    general.add("jobs", 'j', "Number of locations to process in parallel",
                _jobs, {check::HigherThan<int>(0)});
    general.add("config", 'c', "Configuration file", _config_path,
                {check::PathExists});
    general.add("loglevel", "Specify loglevel", _loglevel);
    general.add("timeout-ms",
                "Time limit for the analysis of one location in milliseconds. "
                "Locations that take longer are reported with status "
                "`timeout`. 0 disables the limit.",
                _timeout_ms, {check::HigherOrEqualTo<int>(0)});

    input.add("box",
              "Only read vector features that intersect this geographic "
              "box (longitude, latitude). Defaults to the extent of each "
              "raster.",
              app_cfg_.region_of_interest, {check::ValidBox});
    input.add("building-attribute",
              "Vector attribute that marks a feature as building.",
              app_cfg_.building_attribute);
    input.add("street-attribute",
              "Vector attribute that marks a feature as street, its value is "
              "the street class (eg. `primary`, `residential`).",
              app_cfg_.street_attribute);
    input.add("amenity-attribute",
              "Vector attribute that marks a feature as amenity.",
              app_cfg_.amenity_attribute);
    input.add("ground-resolution",
              "Meters per pixel of the raster. Derived from the raster extent "
              "if not set.",
              app_cfg_.ground_resolution);

    alignment.add("scale",
                  "Scale factor applied to the vector geometry around the "
                  "raster centre.",
                  cfg_.alignment.scale, {check::HigherThan<float>(0)});
    alignment.add("offset-north",
                  "Northward shift of the vector geometry after scaling, in "
                  "meters.",
                  cfg_.alignment.offset_north_m);
    alignment.add("offset-east",
                  "Eastward shift of the vector geometry after scaling, in "
                  "meters.",
                  cfg_.alignment.offset_east_m);

    detection.add("ndvi-threshold",
                  "Minimum (G-R)/(G+R) of a vegetation pixel.",
                  cfg_.detection.ndvi_threshold,
                  {check::InRange<float>(-1, 1)});
    detection.add("min-vegetation-brightness",
                  "Minimum brightness (0-255) of a vegetation pixel.",
                  cfg_.detection.min_vegetation_brightness,
                  {check::InRange<float>(0, 255)});
    detection.add("shadow-dark-threshold",
                  "Shadow pixels are darker than this brightness (0-255).",
                  cfg_.detection.shadow_dark_threshold,
                  {check::InRange<float>(0, 255)});
    detection.add("shadow-desaturation-threshold",
                  "Shadow pixels are less saturated than this (0-255).",
                  cfg_.detection.shadow_desaturation_threshold,
                  {check::InRange<float>(0, 255)});
    detection.add("shadow-min-cluster",
                  "Shadow regions with fewer pixels are ignored.",
                  cfg_.detection.shadow_min_cluster_px,
                  {check::HigherOrEqualTo<int>(1)});
    detection.add("shadow-blur-sigma",
                  "Standard deviation in pixels of the blur applied to the "
                  "shadow intensity.",
                  cfg_.detection.shadow_blur_sigma,
                  {check::HigherOrEqualTo<float>(0)});

    buffers.add("buffer-pedestrian",
                "Buffer distance of pedestrian streets in meters.",
                cfg_.buffers.pedestrian_m, {check::HigherThan<float>(0)});
    buffers.add("buffer-low",
                "Buffer distance of low traffic streets in meters.",
                cfg_.buffers.low_m, {check::HigherThan<float>(0)});
    buffers.add("buffer-medium",
                "Buffer distance of medium traffic streets in meters.",
                cfg_.buffers.medium_m, {check::HigherThan<float>(0)});
    buffers.add("buffer-high",
                "Buffer distance of high traffic streets in meters.",
                cfg_.buffers.high_m, {check::HigherThan<float>(0)});
    buffers.add("buffer-sidewalk",
                "Width of the sidewalk along pedestrian and low traffic "
                "streets in meters.",
                cfg_.buffers.sidewalk_m, {check::HigherThan<float>(0)});

    scoring.add("sidewalk-max-points",
                "Maximum score of the sidewalk distance component.",
                cfg_.scoring.sidewalk_max_points,
                {check::HigherOrEqualTo<float>(0)});
    scoring.add("building-max-points",
                "Maximum score of the building distance component.",
                cfg_.scoring.building_max_points,
                {check::HigherOrEqualTo<float>(0)});
    scoring.add("sun-max-points", "Maximum score of the sun component.",
                cfg_.scoring.sun_max_points,
                {check::HigherOrEqualTo<float>(0)});
    scoring.add("amenity-max-points",
                "Maximum score of the amenity density component.",
                cfg_.scoring.amenity_max_points,
                {check::HigherOrEqualTo<float>(0)});
    scoring.add("sidewalk-bands",
                "Score bands on the distance to the nearest sidewalk in "
                "meters.",
                cfg_.scoring.sidewalk_bands,
                {check::ValidBands(cfg_.scoring.sidewalk_max_points)});
    scoring.add("building-bands",
                "Score bands on the distance to the nearest building in "
                "meters.",
                cfg_.scoring.building_bands,
                {check::ValidBands(cfg_.scoring.building_max_points)});
    scoring.add("sun-bands",
                "Score bands on the shadow intensity (0 is full sun, 1 is "
                "black).",
                cfg_.scoring.sun_bands,
                {check::ValidBands(cfg_.scoring.sun_max_points)});
    scoring.add("amenity-radius",
                "Amenities further away than this do not contribute to the "
                "score of a pixel. Unit: meters.",
                cfg_.scoring.amenity_radius_m, {check::HigherThan<float>(0)});

    classification.add("critical-cutoff",
                       "Minimum score of a critical priority pixel.",
                       cfg_.classification.critical_cutoff);
    classification.add("high-cutoff", "Minimum score of a high priority pixel.",
                       cfg_.classification.high_cutoff);
    classification.add("medium-cutoff",
                       "Minimum score of a medium priority pixel.",
                       cfg_.classification.medium_cutoff);

    extraction.add("min-cluster",
                   "Minimum number of pixels of a critical spot.",
                   cfg_.extraction.min_cluster_px,
                   {check::HigherOrEqualTo<int>(1)});

    output.add("pretty-print", "Indent the JSON output.",
               app_cfg_.pretty_print);

    // Move groups into param_group_map
    param_groups_.emplace_back("Input", std::move(input));
    param_groups_.emplace_back("Alignment", std::move(alignment));
    param_groups_.emplace_back("Detection", std::move(detection));
    param_groups_.emplace_back("Buffers", std::move(buffers));
    param_groups_.emplace_back("Scoring", std::move(scoring));
    param_groups_.emplace_back("Classification", std::move(classification));
    param_groups_.emplace_back("Extraction", std::move(extraction));
    param_groups_.emplace_back("Output", std::move(output));
    app_param_groups_.emplace_back("General", std::move(general));

    // Add to index
    for (auto& [group_name, group] : param_groups_) {
      group.add_to_index(param_index_);
    }
    for (auto& [group_name, group] : app_param_groups_) {
      group.add_to_index(app_param_index_);
    }
  };

  void validate() {
    for (auto& groups : {&app_param_groups_, &param_groups_}) {
      for (auto& [group_name, group] : *groups) {
        for (auto& param : group) {
          if (auto error_msg = param->validate()) {
            throw std::runtime_error(
                std::format("Validation error for {} parameter {}. {}",
                            group_name, param->longname_, *error_msg));
          }
        }
      }
    }
    // rules that involve more than one parameter
    if (auto error_msg = cfg_.validate()) {
      throw std::runtime_error(*error_msg);
    }

    if (locations_.empty()) {
      throw std::runtime_error("No input locations specified.");
    }
    for (auto& loc : locations_) {
      if (auto error_msg = check::PathExists(loc.raster)) {
        throw std::runtime_error(
            std::format("Raster of location {}: {}", loc.name, *error_msg));
      }
      if (loc.raster.empty() || loc.vector.empty()) {
        throw std::runtime_error(std::format(
            "Location {} needs both a raster and a vector source.", loc.name));
      }
    }
    if (auto error_msg = check::DirIsWritable(app_cfg_.output_path)) {
      throw std::runtime_error(
          std::format("Can't write to output directory: {}", *error_msg));
    }
  }

  template <typename T, typename node>
  void get_toml_value(const node& config, const std::string& key, T& result) {
    try {
      if (auto tml_value = config[key].template value<T>();
          tml_value.has_value()) {
        result = *tml_value;
      }
    } catch (const std::exception& e) {
      throw std::runtime_error(std::format(
          "Failed to read value for {} from config file. {}", key, e.what()));
    }
  }

  void print_help(std::string program_name) {
    // see http://docopt.org/
    std::cout << "Tree planting priority analysis of aerial imagery\n\n";
    std::cout << "\033[1mUsage\033[0m:" << "\n";
    std::cout << "  " << program_name;
    std::cout << " [options] <raster> <vector-source> <output-directory>"
              << "\n";
    std::cout << "  " << program_name;
    std::cout << " [options] (-c | --config) <config-file> [(<raster> "
                 "<vector-source>)] <output-directory>"
              << "\n";
    std::cout << "  " << program_name;
    std::cout << " -h | --help" << "\n";
    std::cout << "  " << program_name;
    std::cout << " -v | --version" << "\n";
    std::cout << "\n";
    std::cout << "\033[1mPositional arguments:\033[0m" << "\n";
    std::cout << "  <raster>                     Path to a north-up RGB "
                 "raster in geographic coordinates (eg. GeoTIFF).\n";
    std::cout << "  <vector-source>              Buildings, streets and "
                 "amenities. Can be an OGR supported file (eg. GPKG, "
                 "GeoJSON) or database connection string.\n";
    std::cout << "  <output-directory>           Output directory.\n";
    std::cout << "\n";
    std::cout << "Multiple locations can be given as [[locations]] tables "
                 "with the keys name, latitude, longitude, raster and vector "
                 "in the config file.\n";

    print_params(app_param_groups_);
    print_params(param_groups_);
  }

  // Utility function to wrap text to a specified width with proper indentation
  std::vector<std::string> wrap_text(const std::string& text, size_t max_width,
                                     size_t indent = 0) {
    std::vector<std::string> lines;
    std::string indent_str(indent, ' ');
    std::string current_line = indent_str;
    size_t current_width = indent;

    std::istringstream iss(text);
    std::string word;

    while (iss >> word) {
      // Check if adding the word exceeds max_width
      if (current_width + word.length() + (current_line.empty() ? 0 : 1) >
          max_width) {
        if (!current_line.empty() && current_line != indent_str) {
          lines.push_back(current_line);
          current_line = indent_str;
          current_width = indent;
        }
      }
      if (!current_line.empty() && current_line != indent_str) {
        current_line += " ";
        current_width += 1;
      }
      current_line += word;
      current_width += word.length();
    }
    if (!current_line.empty() && current_line != indent_str) {
      lines.push_back(current_line);
    }
    return lines;
  }

  void print_params(param_group_map& params) {
    const size_t param_column_width = 35;  // Fixed width for parameter column
    const size_t desc_column_width = 65;   // Fixed width for description column

    for (auto& [group_name, group] : params) {
      if (group.empty()) continue;
      std::cout << "\n";
      std::cout << "\033[1m" << group_name << " options:\033[0m\n";
      for (auto& param : group) {
        std::string param_text =
            param->cli_flag() + " " + param->type_description();
        std::string desc = param->description();
        std::string default_text = "Default: " + param->default_to_string();

        auto wrapped_desc =
            wrap_text(desc, param_column_width + desc_column_width,
                      param_column_width + 2);
        auto wrapped_default =
            wrap_text(default_text, param_column_width + desc_column_width,
                      param_column_width + 2);

        // Print parameter and first line of description
        if (param_text.size() <= param_column_width - 2) {
          std::cout << "  " << std::setw(param_column_width) << std::left
                    << param_text;
          if (!wrapped_desc.empty()) {
            std::cout << wrapped_desc[0].substr(param_column_width + 2) << "\n";
          } else {
            std::cout << "\n";
          }
        } else {
          // If parameter text is too long, print it on its own line
          std::cout << "  " << param_text << "\n";
          if (!wrapped_desc.empty()) {
            std::cout << std::string(param_column_width + 2, ' ')
                      << wrapped_desc[0].substr(param_column_width + 2) << "\n";
          }
        }

        for (size_t i = 1; i < wrapped_desc.size(); ++i) {
          std::cout << wrapped_desc[i] << "\n";
        }

        // Print default value lines in blue
        for (const auto& line : wrapped_default) {
          std::cout << "\033[34m" << line << "\033[0m" << "\n";
        }
      }
    }
  }

  void print_version() { std::cout << std::format("canopy {}\n", CN_VERSION); }

  void parse_cli_first_pass(CLIArgs& c) {
    // parse program control arguments (not in config file)
    auto it = c.args.begin();
    while (it != c.args.end()) {
      const std::string& arg = *it;
      std::string argname = "";
      if (arg.starts_with("--")) {
        argname = arg.substr(2);
      } else if (arg.starts_with("-")) {
        argname = arg.substr(1);
      }
      if (auto p = app_param_index_.find(argname);
          !argname.empty() && p != app_param_index_.end()) {
        it = c.args.erase(it);
        it = p->second->set(c.args, it);
      } else {
        ++it;
      }

      if (argname == "c" || argname == "config") {
        if (auto error_msg = check::PathExists(_config_path)) {
          throw std::runtime_error(std::format(
              "Invalid argument for -c or --config. {}", *error_msg));
        }
      }
    }
  }

  void parse_cli_second_pass(CLIArgs& c) {
    auto it = c.args.begin();
    while (it != c.args.end()) {
      std::string arg = *it;

      try {
        if (arg.starts_with("--no-")) {
          auto argname = arg.substr(5);
          if (auto p = param_index_.find(argname); p != param_index_.end()) {
            it = c.args.erase(it);
            p->second->unset();
          } else {
            throw std::runtime_error(std::format("Unknown argument: {}.", arg));
          }
        } else if (arg.starts_with("--")) {
          auto argname = arg.substr(2);
          if (auto p = param_index_.find(argname); p != param_index_.end()) {
            it = c.args.erase(it);
            it = p->second->set(c.args, it);
          } else {
            throw std::runtime_error(std::format("Unknown argument: {}.", arg));
          }
        } else if (arg.starts_with("-") && arg.size() > 1 &&
                   !std::isdigit(static_cast<unsigned char>(arg[1]))) {
          auto argname = arg.substr(1);
          if (auto p = param_index_.find(argname); p != param_index_.end()) {
            it = c.args.erase(it);
            it = p->second->set(c.args, it);
          } else {
            throw std::runtime_error(std::format("Unknown argument: {}.", arg));
          }
        } else {
          ++it;
        }
      } catch (const std::exception& e) {
        throw std::runtime_error(
            std::format("Error parsing argument: {}. {}.", arg, e.what()));
      }
    }

    // now c.args should only contain positional arguments, either only the
    // output directory or also the raster and vector source
    bool output_set = app_cfg_.output_path.size() > 0;
    bool locations_set = locations_.size() > 0;

    if (locations_set && output_set && c.args.size() == 0) {
      // all set
    } else if (locations_set && c.args.size() == 1) {
      app_cfg_.output_path = c.args.back();
    } else if (c.args.size() == 3) {
      app_cfg_.output_path = c.args.back();
      c.args.pop_back();
      LocationSource loc;
      loc.vector = c.args.back();
      c.args.pop_back();
      loc.raster = c.args.back();
      loc.name = fs::path(loc.raster).stem().string();

      locations_.clear();
      locations_.push_back(loc);
    } else {
      throw std::runtime_error(
          "Unable set all inputs and output. Need to provide at least <output "
          "directory> and set locations in config file or provide all of "
          "<raster> <vector-source> <output-directory>.");
    }
  };

  void parse_locations(const toml::array& arr) {
    for (auto& el : arr) {
      const toml::table* tb = el.as_table();
      if (!tb) {
        throw std::runtime_error("Each entry of locations must be a table.");
      }
      auto& loc = locations_.emplace_back();

      for (const auto& [key, value] : *tb) {
        if (key == "name") {
          get_toml_value(*tb, "name", loc.name);
        } else if (key == "latitude" || key == "longitude") {
          auto coordinate = value.value<double>();
          if (!coordinate.has_value()) {
            throw std::runtime_error(std::format(
                "{} of location {} is not a number.", key.str(), loc.name));
          }
          if (key == "latitude") {
            loc.latitude = coordinate;
          } else {
            loc.longitude = coordinate;
          }
        } else if (key == "raster") {
          get_toml_value(*tb, "raster", loc.raster);
        } else if (key == "vector") {
          get_toml_value(*tb, "vector", loc.vector);
        } else {
          throw std::runtime_error(std::format(
              "Unknown parameter in [[locations]] table in config file: {}.",
              key.data()));
        }
      }
      if (loc.name.empty()) {
        loc.name = fs::path(loc.raster).stem().string();
      }
    }
  }

  void parse_config_file() {
    toml::table config;
    try {
      config = toml::parse_file(_config_path);
    } catch (const toml::parse_error& e) {
      throw std::runtime_error(
          std::format("Syntax error. {}", e.description()));
    }

    // iterate config table
    for (const auto& [key, value] : config) {
      try {
        if (key == "output-directory") {
          get_toml_value(config, "output-directory", app_cfg_.output_path);
        } else if (auto p = param_index_.find(std::string(key.str()));
                   p != param_index_.end()) {
          p->second->set_from_toml(config, std::string(key.str()));
        } else if (key == "locations") {
          if (const toml::array* arr = config["locations"].as_array()) {
            parse_locations(*arr);
          } else {
            throw std::runtime_error("locations must be an array of tables.");
          }
        } else {
          throw std::runtime_error(
              std::format("Unknown parameter in config file: {}.", key.str()));
        }
      } catch (const std::exception& e) {
        throw std::runtime_error(
            std::format("Failed to read value for {} from config file. {}",
                        key.str(), e.what()));
      }
    }
  }
};

template <>
struct fmt::formatter<CanopyConfigHandler> {
  static constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }
  template <typename Context>
  auto format(CanopyConfigHandler const& cfgh, Context& ctx) const {
    fmt::format_to(ctx.out(), "CanopyConfig(output_directory={}, locations={}",
                   cfgh.app_cfg_.output_path, cfgh.locations_.size());

    // Add all parameters
    for (const auto& [groupname, param_list] : cfgh.param_groups_) {
      for (const auto& param : param_list) {
        fmt::format_to(ctx.out(), ", {}={}", param->longname_,
                       param->to_string());
      }
    }

    return fmt::format_to(ctx.out(), ")");
  }
};
