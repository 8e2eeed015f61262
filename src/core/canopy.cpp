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

#include <canopy/canopy.h>
#include <canopy/logger/logger.h>
#include <canopy/misc/PixelTransform.hpp>
#include <canopy/misc/projHelper.hpp>

#include <cmath>
#include <format>

namespace canopy {

  void validate_raster(const RasterBuffer& raster) {
    if (raster.width == 0 || raster.height == 0) {
      throw PreconditionError(std::format("raster has no pixels ({}x{})",
                                          raster.width, raster.height));
    }
    if (raster.rgb.size() != 3 * raster.pixel_count()) {
      throw PreconditionError(
          std::format("RGB buffer holds {} bytes, expected {} for {}x{}",
                      raster.rgb.size(), 3 * raster.pixel_count(),
                      raster.width, raster.height));
    }
    if (!(raster.ground_resolution > 0) ||
        !std::isfinite(raster.ground_resolution)) {
      throw PreconditionError(
          std::format("ground resolution must be positive, is {}",
                      raster.ground_resolution));
    }
    // throws for degenerate and inverted boxes
    misc::PixelTransform(raster.bounds, raster.width, raster.height);
  }

  PlantingAnalysis analyse(const RasterBuffer& raster,
                           const GeometryCollection& geometry,
                           const PlantingConfig& cfg,
                           const Deadline& deadline) {
    try {
      auto& logger = logger::Logger::get_logger();

      if (auto problem = cfg.validate()) {
        throw canopyException("Invalid canopy configuration: " + *problem);
      }
      validate_raster(raster);

      PlantingAnalysis result;
      misc::PixelTransform transform(raster.bounds, raster.width,
                                     raster.height);
      auto pj = misc::createProjHelper();

      deadline.check("start");
      auto GeometryAligner = planting::createGeometryAligner(*pj);
      GeometryAligner->compute(raster.bounds, geometry, cfg.alignment,
                               cfg.buffers, deadline);
      result.aligned = std::move(GeometryAligner->aligned);
      deadline.check("alignment");

      auto FeatureDetector = planting::createFeatureDetector();
      FeatureDetector->compute(raster, cfg.detection, deadline);
      deadline.check("feature detection");

      auto MaskGenerator = planting::createMaskGenerator(*pj);
      MaskGenerator->compute(result.aligned, transform,
                             raster.ground_resolution,
                             FeatureDetector->vegetation, cfg.buffers,
                             deadline);
      deadline.check("mask generation");

      auto& masks = result.masks;
      masks.vegetation = std::move(FeatureDetector->vegetation);
      masks.shadow = std::move(FeatureDetector->shadow);
      masks.shadow_intensity = std::move(FeatureDetector->shadow_intensity);
      masks.building = std::move(MaskGenerator->building);
      masks.street = std::move(MaskGenerator->street);
      masks.sidewalk = std::move(MaskGenerator->sidewalk);
      masks.plantable = std::move(MaskGenerator->plantable);
      masks.sidewalk_distance = std::move(MaskGenerator->sidewalk_distance);
      masks.building_distance = std::move(MaskGenerator->building_distance);
      masks.amenity_pixels = std::move(MaskGenerator->amenity_pixels);
      masks.ground_resolution = raster.ground_resolution;
      masks.check_shape(raster.width, raster.height);

      auto PriorityCalculator = planting::createPriorityCalculator();
      PriorityCalculator->compute(masks, cfg.scoring, cfg.classification,
                                  deadline);
      result.scores = std::move(PriorityCalculator->scores);
      deadline.check("priority calculation");

      auto SpotExtractor = planting::createSpotExtractor();
      SpotExtractor->compute(result.scores, transform,
                             raster.ground_resolution, cfg.extraction,
                             deadline);
      result.spots = std::move(SpotExtractor->spots);
      deadline.check("spot extraction");

      logger.debug("Analysis finished in {} ms with {} critical spots",
                   deadline.elapsed_ms(), result.spots.size());
      return result;

    } catch (const canopyException&) {
      // includes PreconditionError and TimeoutAbort
      throw;
    } catch (const std::exception& e) {
      throw canopyException(e.what());
    }
  }

}  // namespace canopy
