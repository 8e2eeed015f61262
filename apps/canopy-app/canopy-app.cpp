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

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <format>
#include <fstream>
#include <string>
#include <vector>
namespace fs = std::filesystem;

#include <canopy/BatchProcessor.hpp>
#include <canopy/io/RasterReader.hpp>
#include <canopy/io/SummaryWriter.hpp>
#include <canopy/io/VectorReader.hpp>
#include <canopy/logger/logger.h>
#include <canopy/misc/projHelper.hpp>

#include "config.hpp"
#include "summary_files.hpp"

/**
 * @brief Fill in missing location coordinates with the centre of the raster
 * extent.
 */
void resolve_location_coordinates(LocationSource& src) {
  if (src.latitude.has_value() && src.longitude.has_value()) return;
  auto pjh = canopy::misc::createProjHelper();
  auto raster_reader = canopy::io::createRasterReaderGDAL(*pjh);
  raster_reader->open(src.raster);
  auto center = raster_reader->get_extent().center();
  if (!src.longitude.has_value()) src.longitude = center[0];
  if (!src.latitude.has_value()) src.latitude = center[1];
}

canopy::LocationTask make_task(const LocationSource& src,
                               const AppConfig& app_cfg) {
  canopy::LocationTask task;
  task.location = canopy::Location{.name = src.name,
                                   .latitude = src.latitude.value_or(0),
                                   .longitude = src.longitude.value_or(0)};
  task.load = [src, app_cfg]() {
    auto& logger = canopy::logger::Logger::get_logger();
    canopy::LocationInput input;

    auto pjh = canopy::misc::createProjHelper();
    auto raster_reader = canopy::io::createRasterReaderGDAL(*pjh);
    raster_reader->ground_resolution = app_cfg.ground_resolution;
    raster_reader->open(src.raster);
    input.raster = raster_reader->read();
    logger.debug("[{}] read raster {} of {}x{} pixels, {} m per pixel",
                 src.name, src.raster, input.raster.width, input.raster.height,
                 input.raster.ground_resolution);

    auto vector_reader = canopy::io::createVectorReaderOGR();
    vector_reader->region_of_interest =
        app_cfg.region_of_interest.value_or(input.raster.bounds);
    vector_reader->building_attribute = app_cfg.building_attribute;
    vector_reader->street_attribute = app_cfg.street_attribute;
    vector_reader->amenity_attribute = app_cfg.amenity_attribute;
    vector_reader->open(src.vector);
    input.geometry = vector_reader->read_features();
    logger.debug("[{}] read {} features from {}", src.name,
                 input.geometry.size(), src.vector);
    return input;
  };
  return task;
}

int main(int argc, const char* argv[]) {
  auto& logger = canopy::logger::Logger::get_logger();

  // read cmdl options
  CLIArgs cli_args(argc, argv);
  CanopyConfigHandler handler;

  // Parse basic command line arguments (not yet the configuration parameters)
  try {
    handler.parse_cli_first_pass(cli_args);
  } catch (const std::exception& e) {
    logger.error("Failed to parse command line arguments.");
    logger.error("{} Use '-h' to print usage information.", e.what());
    return EXIT_FAILURE;
  }
  if (handler._print_help) {
    handler.print_help(cli_args.program_name);
    return EXIT_SUCCESS;
  }
  if (handler._print_version) {
    handler.print_version();
    return EXIT_SUCCESS;
  }

  // Read configuration file, config path has already been checked for existence
  if (handler._config_path.size()) {
    logger.info("Reading configuration from file {}", handler._config_path);
    try {
      handler.parse_config_file();
    } catch (const std::exception& e) {
      logger.error(
          "Unable to parse config file {}. {} Use '-h' to print usage "
          "information.",
          handler._config_path, e.what());
      return EXIT_FAILURE;
    }
  }

  // Parse further command line arguments, those will override values from
  // config file
  try {
    handler.parse_cli_second_pass(cli_args);
  } catch (const std::exception& e) {
    logger.error(
        "Failed to parse command line arguments. {} Use '-h' to print usage "
        "information.",
        e.what());
    return EXIT_FAILURE;
  }

  // validate configuration parameters
  try {
    handler.validate();
  } catch (const std::exception& e) {
    logger.error(
        "Failed to validate parameter values. {} Use '-h' to print usage "
        "information.",
        e.what());
    return EXIT_FAILURE;
  }

  logger.set_level(handler._loglevel);
  logger.debug("{}", handler);

  std::vector<canopy::LocationTask> tasks;
  for (auto& src : handler.locations_) {
    try {
      resolve_location_coordinates(src);
    } catch (const std::exception& e) {
      // the location fails again when it is loaded and is reported then
      logger.warning("Could not read the extent of {}. {}", src.raster,
                     e.what());
    }
    tasks.push_back(make_task(src, handler.app_cfg_));
  }

  canopy::BatchOptions options;
  options.jobs = handler._jobs;
  if (handler._timeout_ms > 0) {
    options.timeout = std::chrono::milliseconds(handler._timeout_ms);
  }

  logger.info("Analysing {} location(s) with {} thread(s)", tasks.size(),
              options.jobs);
  auto summaries = canopy::process_batch(tasks, handler.cfg_, options);

  // Write the per location summaries and the index
  fs::create_directories(handler.app_cfg_.output_path);
  auto writer = canopy::io::createSummaryWriterJSON();
  writer->prettyPrint_ = handler.app_cfg_.pretty_print;

  auto file_names = summary_file_names(summaries);
  std::vector<std::string> written_files;
  bool write_failed = false;
  for (size_t i = 0; i < summaries.size(); ++i) {
    auto path = fs::path(handler.app_cfg_.output_path) / file_names[i];
    std::ofstream ofs(path);
    if (!ofs) {
      logger.error("Could not open {} for writing", path.string());
      written_files.emplace_back();
      write_failed = true;
      continue;
    }
    try {
      writer->write_summary(ofs, summaries[i]);
    } catch (const std::exception& e) {
      logger.error("[{}] Could not write {}: {}", summaries[i].location.name,
                   path.string(), e.what());
      written_files.emplace_back();
      write_failed = true;
      continue;
    }
    written_files.push_back(file_names[i]);
    logger.info("[{}] {}, written to {}", summaries[i].location.name,
                summaries[i].status, path.string());
  }

  auto index_path = fs::path(handler.app_cfg_.output_path) / "index.json";
  std::ofstream index_ofs(index_path);
  if (!index_ofs) {
    logger.error("Could not open {} for writing", index_path.string());
    return EXIT_FAILURE;
  }
  try {
    writer->write_index(index_ofs, summaries, written_files);
  } catch (const std::exception& e) {
    logger.error("Could not write {}: {}", index_path.string(), e.what());
    return EXIT_FAILURE;
  }

  size_t n_success = std::count_if(
      summaries.begin(), summaries.end(),
      [](const canopy::planting::LocationSummary& s) { return s.is_success(); });
  logger.info("Finished canopy, {} of {} location(s) succeeded", n_success,
              summaries.size());

  if (write_failed || (n_success == 0 && !summaries.empty())) {
    return EXIT_FAILURE;
  }
  return EXIT_SUCCESS;
}
