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

#include <canopy/io/RasterReader.hpp>
#include <canopy/logger/logger.h>

#include "SpatialReferenceSystemOGR.hpp"

#include <gdal_priv.h>

#include <array>
#include <format>
#include <stdexcept>

namespace canopy::io {

  class RasterReaderGDAL : public RasterReaderInterface {
    struct GDALDatasetCloser {
      void operator()(GDALDataset* ds) const { GDALClose(ds); }
    };
    std::unique_ptr<GDALDataset, GDALDatasetCloser> dataset_;
    std::string source_;

    void check_open() const {
      if (!dataset_) {
        throw std::runtime_error("RasterReader: no raster is opened.");
      }
    }

   public:
    using RasterReaderInterface::RasterReaderInterface;

    void open(const std::string& source) override {
      GDALAllRegister();
      dataset_.reset(static_cast<GDALDataset*>(GDALOpenEx(
          source.c_str(), GDAL_OF_RASTER | GDAL_OF_READONLY, nullptr, nullptr,
          nullptr)));
      if (!dataset_) {
        throw std::runtime_error("Unable to open raster " + source);
      }
      if (dataset_->GetRasterCount() < 3) {
        throw std::runtime_error(std::format(
            "Raster {} has {} bands, expected at least 3 (RGB)", source,
            dataset_->GetRasterCount()));
      }
      source_ = source;
    }

    void get_crs(SpatialReferenceSystemInterface* srs) override {
      check_open();
      auto ogr_srs = dynamic_cast<SpatialReferenceSystemOGR*>(srs);
      if (ogr_srs == nullptr) {
        throw std::runtime_error("RasterReader: unsupported SRS object.");
      }
      ogr_srs->clear();
      if (auto ref = dataset_->GetSpatialRef()) {
        ogr_srs->srs = *ref;
      }
    }

    TBox<double> get_extent() override {
      check_open();
      std::array<double, 6> gt;
      if (dataset_->GetGeoTransform(gt.data()) != CE_None) {
        throw std::runtime_error("Raster " + source_ +
                                 " has no geotransform.");
      }
      if (gt[2] != 0 || gt[4] != 0 || gt[5] >= 0) {
        throw std::runtime_error("Raster " + source_ + " is not north-up.");
      }
      const double width = dataset_->GetRasterXSize();
      const double height = dataset_->GetRasterYSize();
      return TBox<double>{gt[0], gt[3] + height * gt[5], gt[0] + width * gt[1],
                          gt[3]};
    }

    RasterBuffer read() override {
      check_open();
      auto& logger = logger::Logger::get_logger();

      auto srs = createSpatialReferenceSystemOGR();
      get_crs(srs.get());
      if (srs->is_set() && !srs->is_geographic()) {
        throw std::runtime_error(std::format(
            "Raster {} is in {}:{}, a geographic reference system is required",
            source_, srs->get_auth_name(), srs->get_auth_code()));
      }

      RasterBuffer raster;
      raster.bounds = get_extent();
      raster.width = size_t(dataset_->GetRasterXSize());
      raster.height = size_t(dataset_->GetRasterYSize());
      raster.rgb.resize(3 * raster.width * raster.height);

      for (int band = 1; band <= 3; ++band) {
        // write into the interleaved buffer: pixel stride 3, line stride 3*w
        auto err = dataset_->GetRasterBand(band)->RasterIO(
            GF_Read, 0, 0, int(raster.width), int(raster.height),
            raster.rgb.data() + (band - 1), int(raster.width),
            int(raster.height), GDT_Byte, 3, GSpacing(3 * raster.width),
            nullptr);
        if (err != CE_None) {
          throw std::runtime_error(
              std::format("Failed to read band {} of {}", band, source_));
        }
      }

      if (ground_resolution.has_value()) {
        raster.ground_resolution = *ground_resolution;
      } else {
        auto center = raster.bounds.center();
        pjHelper.set_data_offset({center[0], center[1], 0});
        raster.ground_resolution = raster.bounds.size_x() *
                                   pjHelper.meters_per_degree()[0] /
                                   double(raster.width);
      }

      logger.debug("Read {}x{} raster {} at {:.3f} m/px", raster.width,
                   raster.height, source_, raster.ground_resolution);
      return raster;
    }
  };

  std::unique_ptr<RasterReaderInterface> createRasterReaderGDAL(
      canopy::misc::projHelperInterface& pjh) {
    return std::make_unique<RasterReaderGDAL>(pjh);
  };

}  // namespace canopy::io
