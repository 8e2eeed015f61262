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

#include <canopy/io/VectorReader.hpp>
#include <canopy/logger/logger.h>

#include "SpatialReferenceSystemOGR.hpp"

#include <gdal_priv.h>
#include <ogrsf_frmts.h>

#include <stdexcept>

namespace canopy::io {

  class VectorReaderOGR : public VectorReaderInterface {
    struct GDALDatasetCloser {
      void operator()(GDALDataset* ds) const { GDALClose(ds); }
    };
    std::unique_ptr<GDALDataset, GDALDatasetCloser> dataset_;
    std::string source_;

    void check_open() const {
      if (!dataset_) {
        throw std::runtime_error("VectorReader: no source is opened.");
      }
    }

    static vec2d read_ring(const OGRSimpleCurve* curve) {
      vec2d ring;
      for (int i = 0; i < curve->getNumPoints(); ++i) {
        ring.push_back({curve->getX(i), curve->getY(i)});
      }
      return ring;
    }

    static void add_polygon(const OGRPolygon* polygon,
                            GeometryCollection& features) {
      if (polygon->IsEmpty()) return;
      GeoFeature feature;
      feature.type = FeatureType::building;
      feature.coordinates = read_ring(polygon->getExteriorRing());
      for (int i = 0; i < polygon->getNumInteriorRings(); ++i) {
        feature.holes.push_back(read_ring(polygon->getInteriorRing(i)));
      }
      features.push_back(std::move(feature));
    }

    static void add_line(const OGRSimpleCurve* line,
                         const std::string& street_class,
                         GeometryCollection& features) {
      GeoFeature feature;
      feature.type = FeatureType::street;
      feature.coordinates = read_ring(line);
      feature.street_class = street_class;
      features.push_back(std::move(feature));
    }

    bool has_attribute(OGRFeature& feature, const std::string& name) {
      int idx = feature.GetFieldIndex(name.c_str());
      if (idx < 0 || !feature.IsFieldSetAndNotNull(idx)) return false;
      std::string value = feature.GetFieldAsString(idx);
      return !value.empty() && value != "no";
    }

    void read_building(const OGRGeometry* geom, GeometryCollection& features) {
      switch (wkbFlatten(geom->getGeometryType())) {
        case wkbPolygon:
          add_polygon(geom->toPolygon(), features);
          break;
        case wkbMultiPolygon:
          for (auto poly : *geom->toMultiPolygon()) {
            add_polygon(poly, features);
          }
          break;
        default:
          break;
      }
    }

    void read_street(const OGRGeometry* geom, const std::string& street_class,
                     GeometryCollection& features) {
      switch (wkbFlatten(geom->getGeometryType())) {
        case wkbLineString:
          add_line(geom->toLineString(), street_class, features);
          break;
        case wkbMultiLineString:
          for (auto line : *geom->toMultiLineString()) {
            add_line(line, street_class, features);
          }
          break;
        case wkbPolygon:
          // eg. pedestrian areas
          add_line(geom->toPolygon()->getExteriorRing(), street_class,
                   features);
          break;
        default:
          break;
      }
    }

    void read_amenity(const OGRGeometry* geom, GeometryCollection& features) {
      OGRPoint point;
      if (wkbFlatten(geom->getGeometryType()) == wkbPoint) {
        point = *geom->toPoint();
      } else if (geom->Centroid(&point) != OGRERR_NONE) {
        return;
      }
      if (point.IsEmpty()) return;
      GeoFeature feature;
      feature.type = FeatureType::amenity;
      feature.coordinates.push_back({point.getX(), point.getY()});
      features.push_back(std::move(feature));
    }

   public:
    void open(const std::string& source) override {
      GDALAllRegister();
      dataset_.reset(static_cast<GDALDataset*>(GDALOpenEx(
          source.c_str(), GDAL_OF_VECTOR | GDAL_OF_READONLY, nullptr, nullptr,
          nullptr)));
      if (!dataset_) {
        throw std::runtime_error("Unable to open vector source " + source);
      }
      source_ = source;
    }

    size_t get_feature_count() override {
      check_open();
      size_t count = 0;
      for (auto layer : dataset_->GetLayers()) {
        auto n = layer->GetFeatureCount();
        if (n > 0) count += size_t(n);
      }
      return count;
    }

    void get_crs(SpatialReferenceSystemInterface* srs) override {
      check_open();
      auto ogr_srs = dynamic_cast<SpatialReferenceSystemOGR*>(srs);
      if (ogr_srs == nullptr) {
        throw std::runtime_error("VectorReader: unsupported SRS object.");
      }
      ogr_srs->clear();
      for (auto layer : dataset_->GetLayers()) {
        if (auto ref = layer->GetSpatialRef()) {
          ogr_srs->srs = *ref;
          return;
        }
      }
    }

    GeometryCollection read_features() override {
      check_open();
      auto& logger = logger::Logger::get_logger();

      OGRSpatialReference wgs84;
      wgs84.importFromEPSG(4326);
      wgs84.SetAxisMappingStrategy(OAMS_TRADITIONAL_GIS_ORDER);

      GeometryCollection features;
      size_t n_skipped = 0;
      for (auto layer : dataset_->GetLayers()) {
        std::unique_ptr<OGRCoordinateTransformation> transform;
        if (auto layer_srs = layer->GetSpatialRef()) {
          if (!layer_srs->IsSame(&wgs84)) {
            transform.reset(
                OGRCreateCoordinateTransformation(layer_srs, &wgs84));
            if (!transform) {
              throw std::runtime_error(
                  std::string("No transformation to WGS84 for layer ") +
                  layer->GetName());
            }
          }
        }
        if (region_of_interest.has_value() && !transform) {
          layer->SetSpatialFilterRect(
              region_of_interest->pmin[0], region_of_interest->pmin[1],
              region_of_interest->pmax[0], region_of_interest->pmax[1]);
        }

        layer->ResetReading();
        for (auto& feature : *layer) {
          OGRGeometry* geom = feature->GetGeometryRef();
          if (geom == nullptr || geom->IsEmpty()) {
            ++n_skipped;
            continue;
          }
          if (transform && geom->transform(transform.get()) != OGRERR_NONE) {
            ++n_skipped;
            continue;
          }
          if (region_of_interest.has_value()) {
            OGREnvelope env;
            geom->getEnvelope(&env);
            TBox<double> box{env.MinX, env.MinY, env.MaxX, env.MaxY};
            if (!box.intersects(*region_of_interest) &&
                !region_of_interest->contains(box.min())) {
              continue;
            }
          }

          if (has_attribute(*feature, building_attribute)) {
            read_building(geom, features);
          } else if (has_attribute(*feature, street_attribute)) {
            read_street(
                geom,
                feature->GetFieldAsString(street_attribute.c_str()),
                features);
          }
          // a school building is both a building and an amenity
          if (has_attribute(*feature, amenity_attribute)) {
            read_amenity(geom, features);
          }
        }
      }
      logger.debug("Read {} features from {} ({} without usable geometry)",
                   features.size(), source_, n_skipped);
      return features;
    }
  };

  std::unique_ptr<VectorReaderInterface> createVectorReaderOGR() {
    return std::make_unique<VectorReaderOGR>();
  };

}  // namespace canopy::io
