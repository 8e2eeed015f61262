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

#include <canopy/BatchProcessor.hpp>
#include <canopy/canopy.h>
#include <canopy/logger/logger.h>

#include <BS_thread_pool.hpp>
#include <algorithm>
#include <atomic>

namespace canopy {

  std::vector<planting::LocationSummary> process_batch(
      const std::vector<LocationTask>& tasks, const PlantingConfig& cfg,
      const BatchOptions& options) {
    auto& logger = logger::Logger::get_logger();
    std::vector<planting::LocationSummary> summaries(tasks.size());
    std::atomic<size_t> processed_cnt = 0;

    {
      BS::thread_pool pool(std::max<size_t>(options.jobs, 1));
      logger.info("Processing {} locations with {} threads", tasks.size(),
                  pool.get_thread_count());

      for (size_t i = 0; i < tasks.size(); ++i) {
        // every task writes only to its own slot of `summaries`
        pool.detach_task([&, i] {
          auto& logger = logger::Logger::get_logger();
          const auto& task = tasks[i];
          try {
            logger.info("[{}] start", task.location.name);
            if (!task.load) {
              throw canopyException("no loader for location");
            }
            LocationInput input = task.load();
            Deadline deadline = options.timeout.has_value()
                                    ? Deadline(*options.timeout)
                                    : Deadline();
            auto analysis =
                analyse(input.raster, input.geometry, cfg, deadline);
            summaries[i] =
                planting::build_summary(task.location, analysis, cfg);
            if (options.on_success) options.on_success(summaries[i], analysis);
            logger.info("[{}] finished with {} critical spots in {} ms",
                        task.location.name, analysis.spots.size(),
                        deadline.elapsed_ms());
          } catch (const TimeoutAbort& e) {
            logger.warning("[{}] {}", task.location.name, e.what());
            summaries[i] = planting::make_failed_summary(
                task.location, planting::RunStatus::timeout, e.what());
          } catch (const std::exception& e) {
            logger.error("[{}] failed: {}", task.location.name, e.what());
            summaries[i] = planting::make_failed_summary(
                task.location, planting::RunStatus::failed, e.what());
          } catch (...) {
            logger.error("[{}] failed with an unknown exception",
                         task.location.name);
            summaries[i] = planting::make_failed_summary(
                task.location, planting::RunStatus::failed,
                "unknown exception");
          }
          logger.trace("processed_locations", ++processed_cnt);
        });
      }
      pool.wait();
    }

    size_t n_failed = 0;
    for (auto& s : summaries) {
      if (!s.is_success()) ++n_failed;
    }
    logger.info("Batch finished, {} of {} locations succeeded",
                tasks.size() - n_failed, tasks.size());
    return summaries;
  }

}  // namespace canopy
