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
#include <canopy/common/datastructures.hpp>

#include <memory>

namespace canopy::planting {

  // (G - R) / (G + R + 1e-6) per pixel, in [-1, 1]
  FloatGrid compute_ndvi(const RasterBuffer& raster);

  /**
   * @brief Morphological closing (dilation followed by erosion) with a 3x3
   * structuring element. Neighbours outside the grid are ignored.
   */
  MaskGrid close_3x3(const MaskGrid& mask);

  /**
   * @brief Separable Gaussian blur with a normalised kernel of radius
   * ceil(3 sigma) and replicated borders. A sigma of 0 returns the input.
   */
  FloatGrid gaussian_blur(const FloatGrid& grid, float sigma);

  struct FeatureDetectorInterface {
    // outputs, all with the dimensions of the input raster
    MaskGrid vegetation;
    MaskGrid shadow;
    // 1 - brightness/255 after blurring, in [0, 1]
    FloatGrid shadow_intensity;

    virtual ~FeatureDetectorInterface() = default;
    virtual void compute(const RasterBuffer& raster,
                         DetectionConfig cfg = DetectionConfig(),
                         const Deadline& deadline = Deadline()) = 0;
  };

  std::unique_ptr<FeatureDetectorInterface> createFeatureDetector();

}  // namespace canopy::planting
