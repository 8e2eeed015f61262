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

#include <canopy/common/CGALPIPTester.hpp>
#include <canopy/logger/logger.h>
#include <canopy/misc/DistanceTransform.hpp>
#include <canopy/misc/Vector2DOps.hpp>
#include <canopy/planting/MaskGenerator.hpp>

namespace canopy::planting {

  class MaskGenerator : public MaskGeneratorInterface {
    // metric coordinates of the pixel centres, per column and per row
    vec1f col_x_;
    vec1f row_y_;

    void compute_pixel_centres(const misc::PixelTransform& transform) {
      // the local frame is separable: x only depends on the longitude and y
      // only on the latitude
      auto centre = transform.bounds().center();
      col_x_.resize(transform.dim_x());
      row_y_.resize(transform.dim_y());
      for (size_t i = 0; i < transform.dim_x(); ++i) {
        auto lonlat = transform.pixel_to_geo({i + 0.5, 0.5});
        col_x_[i] = pjHelper.coord_transform_fwd(lonlat[0], centre[1], 0)[0];
      }
      for (size_t j = 0; j < transform.dim_y(); ++j) {
        auto lonlat = transform.pixel_to_geo({0.5, j + 0.5});
        row_y_[j] = pjHelper.coord_transform_fwd(centre[0], lonlat[1], 0)[1];
      }
    }

    void rasterise(const std::vector<LinearRing>& polygons, MaskGrid& mask,
                   const Deadline& deadline) {
      for (auto& polygon : polygons) {
        if (polygon.size() < 3) continue;
        CGALPIPTester tester(polygon);
        auto& box = tester.box();
        for (size_t j = 0; j < row_y_.size(); ++j) {
          if (row_y_[j] < box.min()[1] || row_y_[j] > box.max()[1]) continue;
          deadline.check("mask rasterisation");
          for (size_t i = 0; i < col_x_.size(); ++i) {
            if (mask(i, j)) continue;
            if (col_x_[i] < box.min()[0] || col_x_[i] > box.max()[0]) continue;
            if (tester.test({col_x_[i], row_y_[j]})) mask(i, j) = 1;
          }
        }
      }
    }

   public:
    using MaskGeneratorInterface::MaskGeneratorInterface;

    void compute(const AlignedGeometry& geometry,
                 const misc::PixelTransform& transform,
                 double ground_resolution, const MaskGrid& vegetation,
                 BufferConfig cfg, const Deadline& deadline) override {
      auto& logger = logger::Logger::get_logger();
      const size_t nx = transform.dim_x();
      const size_t ny = transform.dim_y();
      if (!vegetation.has_shape(nx, ny)) {
        throw PreconditionError(std::format(
            "vegetation mask is {}x{}, raster is {}x{}", vegetation.dim_x,
            vegetation.dim_y, nx, ny));
      }
      if (!(ground_resolution > 0)) {
        throw PreconditionError(std::format(
            "ground resolution must be positive, is {}", ground_resolution));
      }

      compute_pixel_centres(transform);
      auto vector_ops = misc::createVector2DOpsGEOS();

      building = MaskGrid(nx, ny, 0);
      rasterise(geometry.buildings, building, deadline);

      std::vector<LinearRing> street_polygons;
      for (auto& tier : geometry.street_tiers) {
        if (tier.lines.empty()) continue;
        auto buffered = vector_ops->buffer_lines(tier.lines, tier.buffer_m);
        street_polygons.insert(street_polygons.end(), buffered.begin(),
                               buffered.end());
      }
      street = MaskGrid(nx, ny, 0);
      deadline.check("street buffering");
      rasterise(vector_ops->union_polygons(street_polygons), street, deadline);

      std::vector<LineString> sidewalk_lines;
      for (auto t : {TrafficTier::pedestrian, TrafficTier::low}) {
        auto& lines = geometry.tier(t).lines;
        sidewalk_lines.insert(sidewalk_lines.end(), lines.begin(), lines.end());
      }
      sidewalk = MaskGrid(nx, ny, 0);
      rasterise(vector_ops->buffer_lines(sidewalk_lines, cfg.sidewalk_m),
                sidewalk, deadline);
      deadline.check("sidewalk mask");

      sidewalk_distance =
          misc::distance_transform(sidewalk, float(ground_resolution));
      deadline.check("sidewalk distance");
      building_distance =
          misc::distance_transform(building, float(ground_resolution));

      plantable = MaskGrid(nx, ny, 0);
      for (size_t i = 0; i < plantable.size(); ++i) {
        plantable[i] = !(building[i] || street[i] || vegetation[i]);
      }

      amenity_pixels.clear();
      for (auto& p : geometry.amenities) {
        auto lonlat = pjHelper.coord_transform_rev(p);
        amenity_pixels.push_back(
            transform.geo_to_pixel({lonlat[0], lonlat[1]}));
      }

      logger.debug(
          "Masks: {} building, {} street, {} sidewalk, {} plantable pixels",
          count_true(building), count_true(street), count_true(sidewalk),
          count_true(plantable));
    }
  };

  std::unique_ptr<MaskGeneratorInterface> createMaskGenerator(
      misc::projHelperInterface& pjh) {
    return std::make_unique<MaskGenerator>(pjh);
  };

}  // namespace canopy::planting
