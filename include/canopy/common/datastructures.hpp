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
#include <canopy/common/Grid.hpp>

#include <exception>
#include <string>

namespace canopy {

  class canopyException : public std::exception {
   public:
    explicit canopyException(const std::string& message)
        : msg_("Error: " + message) {}
    virtual const char* what() const throw() { return msg_.c_str(); }

   protected:
    std::string msg_;
  };

  // Input does not satisfy the contract of a pipeline stage, eg. mismatching
  // grid dimensions or a degenerate bounding box.
  class PreconditionError : public canopyException {
   public:
    explicit PreconditionError(const std::string& message)
        : canopyException("Precondition violated: " + message) {}
  };

  // The run exceeded its time budget and was abandoned.
  class TimeoutAbort : public canopyException {
   public:
    explicit TimeoutAbort(const std::string& message)
        : canopyException("Timeout: " + message) {}
  };

  struct Location {
    std::string name;
    double latitude = 0;
    double longitude = 0;
  };

  struct GeoCoordinate {
    double latitude = 0;
    double longitude = 0;
  };

  /**
   * @brief Interleaved 8 bit RGB image with its geographic footprint.
   *
   * `bounds` is in geographic coordinates, x is longitude and y is latitude.
   * The first row of pixels is the northern edge.
   */
  struct RasterBuffer {
    std::vector<std::uint8_t> rgb;
    size_t width = 0;
    size_t height = 0;
    TBox<double> bounds;
    // meters per pixel
    double ground_resolution = 0;

    std::uint8_t r(size_t x, size_t y) const {
      return rgb[3 * (y * width + x)];
    };
    std::uint8_t g(size_t x, size_t y) const {
      return rgb[3 * (y * width + x) + 1];
    };
    std::uint8_t b(size_t x, size_t y) const {
      return rgb[3 * (y * width + x) + 2];
    };
    size_t pixel_count() const { return width * height; };
  };

  enum class FeatureType : std::uint8_t { building, street, amenity };

  /**
   * @brief A vector feature in geographic coordinates (longitude, latitude).
   *
   * Buildings use `coordinates` as exterior ring and `holes` for interior
   * rings, streets use `coordinates` as line and amenities use the first
   * coordinate as point location.
   */
  struct GeoFeature {
    FeatureType type = FeatureType::building;
    vec2d coordinates;
    std::vector<vec2d> holes;
    // OSM highway class, only used for streets
    std::string street_class;
  };
  typedef std::vector<GeoFeature> GeometryCollection;

}  // namespace canopy
