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

#include <canopy/misc/Vector2DOps.hpp>

#include <cstdarg>
#include <cstdio>
#include <stdexcept>
#include <string>

#include <geos_c.h>

namespace canopy::misc {

  class Vector2DOpsGEOS : public Vector2DOpsInterface {
    GEOSContextHandle_t ctx_;
    std::string last_error_;

    static void error_handler(const char* message, void* userdata) {
      auto* self = static_cast<Vector2DOpsGEOS*>(userdata);
      self->last_error_ = message;
    }

    // Owning handle for a GEOS geometry
    struct GeomPtr {
      GEOSContextHandle_t ctx;
      GEOSGeometry* geom;
      GeomPtr(GEOSContextHandle_t ctx, GEOSGeometry* geom)
          : ctx(ctx), geom(geom){};
      GeomPtr(const GeomPtr&) = delete;
      GeomPtr& operator=(const GeomPtr&) = delete;
      GeomPtr(GeomPtr&& other) noexcept
          : ctx(other.ctx), geom(other.release()){};
      ~GeomPtr() {
        if (geom) GEOSGeom_destroy_r(ctx, geom);
      }
      GEOSGeometry* release() {
        auto g = geom;
        geom = nullptr;
        return g;
      }
    };

    GEOSGeometry* check(GEOSGeometry* geom, const char* operation) {
      if (geom == nullptr) {
        throw std::runtime_error(std::string("GEOS ") + operation +
                                 " failed: " + last_error_);
      }
      return geom;
    }

    template <typename Ring>
    GEOSCoordSequence* create_coord_seq(const Ring& ring, bool close) {
      const unsigned n = ring.size();
      const unsigned size = close ? n + 1 : n;
      GEOSCoordSequence* seq = GEOSCoordSeq_create_r(ctx_, size, 2);
      if (seq == nullptr) {
        throw std::runtime_error("GEOS coordinate sequence creation failed.");
      }
      for (unsigned i = 0; i < n; ++i) {
        GEOSCoordSeq_setXY_r(ctx_, seq, i, ring[i][0], ring[i][1]);
      }
      if (close) {
        GEOSCoordSeq_setXY_r(ctx_, seq, n, ring[0][0], ring[0][1]);
      }
      return seq;
    }

    GEOSGeometry* create_linestring(const LineString& line) {
      return check(
          GEOSGeom_createLineString_r(ctx_, create_coord_seq(line, false)),
          "linestring creation");
    }

    GEOSGeometry* create_ring(const vec3f& ring) {
      return check(
          GEOSGeom_createLinearRing_r(ctx_, create_coord_seq(ring, true)),
          "ring creation");
    }

    GEOSGeometry* create_polygon(const LinearRing& polygon) {
      GeomPtr shell(ctx_, create_ring(polygon));
      std::vector<GeomPtr> holes;
      for (auto& iring : polygon.interior_rings()) {
        holes.emplace_back(ctx_, create_ring(iring));
      }
      // GEOS takes ownership of the rings, also when it fails
      std::vector<GEOSGeometry*> hole_geoms;
      hole_geoms.reserve(holes.size());
      for (auto& hole : holes) hole_geoms.push_back(hole.release());
      return check(GEOSGeom_createPolygon_r(ctx_, shell.release(),
                                            hole_geoms.data(),
                                            unsigned(hole_geoms.size())),
                   "polygon creation");
    }

    vec3f read_ring(const GEOSGeometry* ring) {
      vec3f result;
      const GEOSCoordSequence* seq = GEOSGeom_getCoordSeq_r(ctx_, ring);
      unsigned size = 0;
      GEOSCoordSeq_getSize_r(ctx_, seq, &size);
      // skip the closing vertex
      for (unsigned i = 0; i + 1 < size; ++i) {
        double x, y;
        GEOSCoordSeq_getXY_r(ctx_, seq, i, &x, &y);
        result.push_back({float(x), float(y), 0});
      }
      return result;
    }

    void read_polygons(const GEOSGeometry* geom,
                       std::vector<LinearRing>& polygons) {
      if (GEOSisEmpty_r(ctx_, geom) == 1) return;
      int type = GEOSGeomTypeId_r(ctx_, geom);
      if (type == GEOS_POLYGON) {
        LinearRing polygon;
        vec3f exterior = read_ring(GEOSGetExteriorRing_r(ctx_, geom));
        polygon.insert(polygon.end(), exterior.begin(), exterior.end());
        int n_holes = GEOSGetNumInteriorRings_r(ctx_, geom);
        for (int i = 0; i < n_holes; ++i) {
          polygon.interior_rings().push_back(
              read_ring(GEOSGetInteriorRingN_r(ctx_, geom, i)));
        }
        polygons.push_back(std::move(polygon));
      } else if (type == GEOS_MULTIPOLYGON ||
                 type == GEOS_GEOMETRYCOLLECTION) {
        int n = GEOSGetNumGeometries_r(ctx_, geom);
        for (int i = 0; i < n; ++i) {
          read_polygons(GEOSGetGeometryN_r(ctx_, geom, i), polygons);
        }
      }
      // lines and points can not be part of a buffer result
    }

    std::vector<LinearRing> dissolve(std::vector<GEOSGeometry*>& parts) {
      if (parts.empty()) return {};
      GeomPtr collection(
          ctx_, check(GEOSGeom_createCollection_r(
                          ctx_, GEOS_GEOMETRYCOLLECTION, parts.data(),
                          unsigned(parts.size())),
                      "collection creation"));
      // the collection owns the parts now
      parts.clear();
      GeomPtr dissolved(ctx_, check(GEOSUnaryUnion_r(ctx_, collection.geom),
                                    "union"));
      std::vector<LinearRing> polygons;
      read_polygons(dissolved.geom, polygons);
      return polygons;
    }

    void destroy_all(std::vector<GEOSGeometry*>& parts) {
      for (auto g : parts) GEOSGeom_destroy_r(ctx_, g);
      parts.clear();
    }

   public:
    Vector2DOpsGEOS() {
      ctx_ = GEOS_init_r();
      GEOSContext_setErrorMessageHandler_r(ctx_, error_handler, this);
    }
    Vector2DOpsGEOS(const Vector2DOpsGEOS&) = delete;
    Vector2DOpsGEOS& operator=(const Vector2DOpsGEOS&) = delete;
    ~Vector2DOpsGEOS() override { GEOS_finish_r(ctx_); }

    std::vector<LinearRing> buffer_lines(const std::vector<LineString>& lines,
                                         float offset) override {
      std::vector<GEOSGeometry*> parts;
      try {
        for (auto& line : lines) {
          if (line.size() < 2) continue;
          GeomPtr geos_line(ctx_, create_linestring(line));
          parts.push_back(check(GEOSBuffer_r(ctx_, geos_line.geom, offset, 8),
                                "buffer"));
        }
        return dissolve(parts);
      } catch (const std::exception&) {
        destroy_all(parts);
        throw;
      }
    }

    std::vector<LinearRing> union_polygons(
        const std::vector<LinearRing>& polygons) override {
      std::vector<GEOSGeometry*> parts;
      try {
        for (auto& polygon : polygons) {
          if (polygon.size() < 3) continue;
          parts.push_back(create_polygon(polygon));
        }
        return dissolve(parts);
      } catch (const std::exception&) {
        destroy_all(parts);
        throw;
      }
    }
  };

  std::unique_ptr<Vector2DOpsInterface> createVector2DOpsGEOS() {
    return std::make_unique<Vector2DOpsGEOS>();
  };

}  // namespace canopy::misc
