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
#include <canopy/io/SpatialReferenceSystem.hpp>
#include <canopy/misc/projHelper.hpp>

#include <memory>
#include <optional>
#include <string>

namespace canopy::io {
  struct RasterReaderInterface {
    canopy::misc::projHelperInterface& pjHelper;

    // overrides the resolution derived from the extent, meters per pixel
    std::optional<double> ground_resolution;

    RasterReaderInterface(canopy::misc::projHelperInterface& pjh)
        : pjHelper(pjh){};
    virtual ~RasterReaderInterface() = default;

    virtual void open(const std::string& source) = 0;

    virtual void get_crs(SpatialReferenceSystemInterface* srs) = 0;

    // geographic extent of the opened raster
    virtual TBox<double> get_extent() = 0;

    /**
     * @brief Read the first three bands as 8 bit RGB. The raster must be
     * north-up and in a geographic reference system.
     */
    virtual RasterBuffer read() = 0;
  };

  std::unique_ptr<RasterReaderInterface> createRasterReaderGDAL(
      canopy::misc::projHelperInterface& pjh);
}  // namespace canopy::io
