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

#include <canopy/logger/logger.h>
#include <canopy/planting/FeatureDetector.hpp>
#include <canopy/planting/RegionGrower.hpp>

#include <cmath>
#include <format>
#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>

namespace canopy::planting {

  constexpr float NDVI_EPSILON = 1e-6;

  namespace {
    // view on the grid memory, OpenCV writes into it when size and type match
    template <typename T>
    cv::Mat as_mat(const Grid<T>& grid, int type) {
      return cv::Mat(int(grid.dim_y), int(grid.dim_x), type,
                     const_cast<T*>(grid.array.data()));
    }

    cv::Mat as_mat(const RasterBuffer& raster) {
      return cv::Mat(int(raster.height), int(raster.width), CV_8UC3,
                     const_cast<std::uint8_t*>(raster.rgb.data()));
    }

    const cv::Mat& closing_element() {
      static const cv::Mat element =
          cv::getStructuringElement(cv::MORPH_RECT, cv::Size(3, 3));
      return element;
    }

    // 0/255 image to 0/1 grid
    MaskGrid to_mask(const cv::Mat& mat) {
      MaskGrid mask(size_t(mat.cols), size_t(mat.rows), 0);
      cv::Mat view = as_mat(mask, CV_8U);
      cv::threshold(mat, view, 0, 1, cv::THRESH_BINARY);
      return mask;
    }

    void remove_small_regions(MaskGrid& mask, size_t min_count) {
      regiongrower::GridRegionGrowerDS<std::uint8_t> cds(mask);
      regiongrower::RegionGrower<regiongrower::GridRegionGrowerDS<std::uint8_t>,
                                 regiongrower::Region>
          R;
      R.min_segment_count = min_count;
      regiongrower::MaskTester tester;
      R.grow_regions(cds, tester);
      for (size_t i = 0; i < mask.size(); ++i) {
        mask[i] = R.region_ids[i] != 0;
      }
    }
  }  // namespace

  FloatGrid compute_ndvi(const RasterBuffer& raster) {
    FloatGrid result(raster.width, raster.height, 0);
    if (result.empty()) return result;

    cv::Mat channels[3];
    cv::split(as_mat(raster), channels);
    cv::Mat r, g;
    channels[0].convertTo(r, CV_32F);
    channels[1].convertTo(g, CV_32F);
    cv::Mat view = as_mat(result, CV_32F);
    cv::divide(g - r, g + r + NDVI_EPSILON, view);
    return result;
  }

  MaskGrid close_3x3(const MaskGrid& mask) {
    MaskGrid result(mask.dim_x, mask.dim_y, 0);
    if (mask.empty()) return result;
    // the default border value leaves out-of-grid pixels out of both passes
    cv::Mat view = as_mat(result, CV_8U);
    cv::morphologyEx(as_mat(mask, CV_8U), view, cv::MORPH_CLOSE,
                     closing_element());
    return result;
  }

  FloatGrid gaussian_blur(const FloatGrid& grid, float sigma) {
    if (sigma <= 0 || grid.empty()) return grid;

    const int radius = int(std::ceil(3 * sigma));
    FloatGrid result(grid.dim_x, grid.dim_y, 0);
    cv::Mat view = as_mat(result, CV_32F);
    cv::GaussianBlur(as_mat(grid, CV_32F), view,
                     cv::Size(2 * radius + 1, 2 * radius + 1), sigma, sigma,
                     cv::BORDER_REPLICATE);
    return result;
  }

  class FeatureDetector : public FeatureDetectorInterface {
   public:
    void compute(const RasterBuffer& raster, DetectionConfig cfg,
                 const Deadline& deadline) override {
      auto& logger = logger::Logger::get_logger();
      const size_t nx = raster.width;
      const size_t ny = raster.height;
      if (raster.rgb.size() != 3 * nx * ny) {
        throw PreconditionError(
            std::format("RGB buffer holds {} bytes, expected {} for {}x{}",
                        raster.rgb.size(), 3 * nx * ny, nx, ny));
      }
      if (nx == 0 || ny == 0) {
        vegetation = MaskGrid(nx, ny);
        shadow = MaskGrid(nx, ny);
        shadow_intensity = FloatGrid(nx, ny);
        return;
      }

      // V is the maximum channel, S is 255 * (max - min) / max
      cv::Mat hsv;
      cv::cvtColor(as_mat(raster), hsv, cv::COLOR_RGB2HSV);
      cv::Mat hsv_channels[3];
      cv::split(hsv, hsv_channels);
      const cv::Mat& sat = hsv_channels[1];
      const cv::Mat& val = hsv_channels[2];

      FloatGrid ndvi = compute_ndvi(raster);
      cv::Mat green = as_mat(ndvi, CV_32F) > cfg.ndvi_threshold;
      cv::Mat bright = val > cfg.min_vegetation_brightness;
      cv::Mat veg;
      cv::bitwise_and(green, bright, veg);
      cv::morphologyEx(veg, veg, cv::MORPH_CLOSE, closing_element());
      vegetation = to_mask(veg);
      deadline.check("vegetation detection");

      cv::Mat dark = (val < cfg.shadow_dark_threshold) &
                     (sat < cfg.shadow_desaturation_threshold) & ~veg;
      cv::morphologyEx(dark, dark, cv::MORPH_CLOSE, closing_element());
      shadow = to_mask(dark);
      remove_small_regions(shadow, size_t(cfg.shadow_min_cluster_px));
      deadline.check("shadow detection");

      FloatGrid intensity(nx, ny, 0);
      cv::Mat intensity_view = as_mat(intensity, CV_32F);
      val.convertTo(intensity_view, CV_32F, -1. / 255., 1.);
      shadow_intensity = gaussian_blur(intensity, cfg.shadow_blur_sigma);
      cv::Mat si = as_mat(shadow_intensity, CV_32F);
      cv::max(si, 0., si);
      cv::min(si, 1., si);

      logger.debug("Detected {} vegetation and {} shadow pixels of {}",
                   count_true(vegetation), count_true(shadow),
                   raster.pixel_count());
    }
  };

  std::unique_ptr<FeatureDetectorInterface> createFeatureDetector() {
    return std::make_unique<FeatureDetector>();
  };

}  // namespace canopy::planting
