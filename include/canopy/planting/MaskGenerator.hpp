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
#include <canopy/misc/PixelTransform.hpp>
#include <canopy/misc/projHelper.hpp>
#include <canopy/planting/GeometryAligner.hpp>

#include <memory>

namespace canopy::planting {

  struct MaskGeneratorInterface {
    // outputs
    MaskGrid building;
    MaskGrid street;
    MaskGrid sidewalk;
    MaskGrid plantable;
    FloatGrid sidewalk_distance;
    FloatGrid building_distance;
    vec2d amenity_pixels;

    // must be the projHelper the geometry was aligned with
    misc::projHelperInterface& pjHelper;

    MaskGeneratorInterface(misc::projHelperInterface& pjh) : pjHelper(pjh){};
    virtual ~MaskGeneratorInterface() = default;

    /**
     * @brief Rasterize the aligned geometry onto the pixel grid of
     * `transform`. A pixel belongs to a polygon if its centre is inside.
     *
     * @param vegetation Vegetation mask of the same raster, used to derive
     * the plantable mask.
     * @param ground_resolution Meters per pixel, used to convert distances.
     */
    virtual void compute(const AlignedGeometry& geometry,
                         const misc::PixelTransform& transform,
                         double ground_resolution, const MaskGrid& vegetation,
                         BufferConfig cfg = BufferConfig(),
                         const Deadline& deadline = Deadline()) = 0;
  };

  std::unique_ptr<MaskGeneratorInterface> createMaskGenerator(
      misc::projHelperInterface& pjh);

}  // namespace canopy::planting
