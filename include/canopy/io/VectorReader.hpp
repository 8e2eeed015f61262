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

#include <memory>
#include <optional>
#include <string>

namespace canopy::io {
  struct VectorReaderInterface {
    // geographic box, features outside are skipped
    std::optional<canopy::TBox<double>> region_of_interest;

    // a feature is of a type if the attribute is set (and not "no")
    std::string building_attribute = "building";
    std::string street_attribute = "highway";
    std::string amenity_attribute = "amenity";

    virtual ~VectorReaderInterface() = default;

    virtual void open(const std::string& source) = 0;

    // over all layers
    virtual size_t get_feature_count() = 0;

    // of the first layer that has one
    virtual void get_crs(SpatialReferenceSystemInterface* srs) = 0;

    /**
     * @brief Read the buildings, streets and amenities of all layers.
     * Coordinates are converted to longitude, latitude (WGS84).
     */
    virtual GeometryCollection read_features() = 0;
  };

  std::unique_ptr<VectorReaderInterface> createVectorReaderOGR();
}  // namespace canopy::io
