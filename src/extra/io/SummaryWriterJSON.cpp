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

#include <canopy/io/SummaryWriter.hpp>

#include <nlohmann/json.hpp>

#include <stdexcept>

namespace canopy::io {

  class SummaryWriterJSON : public SummaryWriterInterface {
    nlohmann::json location2json(const Location& location) {
      return {{"name", location.name},
              {"latitude", location.latitude},
              {"longitude", location.longitude}};
    }

    nlohmann::json spot2json(const planting::SpotSummary& spot) {
      nlohmann::json jspot = {{"id", spot.id},
                              {"latitude", spot.latitude},
                              {"longitude", spot.longitude},
                              {"priority_score", spot.priority_score},
                              {"area_m2", spot.area_m2},
                              {"pixel_count", spot.pixel_count}};
      if (spot.evaluated) {
        jspot["evaluation"] = spot.evaluation;
      }
      return jspot;
    }

    nlohmann::json coverage2json(
        const std::vector<planting::CoverageStat>& stats) {
      auto jstats = nlohmann::json::object();
      for (auto& stat : stats) {
        jstats[stat.name] = {{"pixel_count", stat.pixel_count},
                             {"area_m2", stat.area_m2},
                             {"percentage", stat.percentage}};
      }
      return jstats;
    }

    nlohmann::json summary2json(const planting::LocationSummary& summary) {
      nlohmann::json j;
      j["location"] = location2json(summary.location);
      j["status"] = summary.status;
      if (!summary.is_success()) {
        j["error"] = summary.error_message;
        j["timestamp"] = summary.metadata.timestamp;
        return j;
      }

      auto jspots = nlohmann::json::array();
      for (auto& spot : summary.spots) jspots.push_back(spot2json(spot));
      j["critical_spots"] = jspots;
      j["critical_spot_count"] = summary.spots.size();

      j["coverage"] = coverage2json(summary.coverage);
      j["priority_distribution"] = coverage2json(summary.tiers);

      auto jcomponents = nlohmann::json::object();
      for (auto& c : summary.components) {
        jcomponents[c.name] = {{"average", c.average},
                               {"max_points", c.max_points}};
      }
      j["score_components"] = jcomponents;
      j["max_priority_score"] = summary.max_priority_score;
      j["zeroed_pixel_count"] = summary.zeroed_pixel_count;

      auto jstreets = nlohmann::json::object();
      for (auto& st : summary.street_tiers) {
        jstreets[st.name] = {{"count", st.line_count},
                             {"buffer_m", st.buffer_m}};
      }
      j["street_network"] = jstreets;
      j["amenity_count"] = summary.amenity_count;
      j["dropped_feature_count"] = summary.dropped_feature_count;

      auto& md = summary.metadata;
      j["metadata"] = {
          {"timestamp", md.timestamp},
          {"alignment",
           {{"scale", md.alignment_scale},
            {"offset_north_m", md.alignment_offset_north_m},
            {"offset_east_m", md.alignment_offset_east_m}}},
          {"raster",
           {{"width", md.width},
            {"height", md.height},
            {"ground_resolution", md.ground_resolution},
            {"total_area_m2", md.total_area_m2}}},
          {"buffers",
           {{"pedestrian_m", md.buffer_pedestrian_m},
            {"low_m", md.buffer_low_m},
            {"medium_m", md.buffer_medium_m},
            {"high_m", md.buffer_high_m},
            {"sidewalk_m", md.buffer_sidewalk_m}}}};
      return j;
    }

    void write_to_stream(const nlohmann::json& outputJSON,
                         std::ostream& output_stream) {
      try {
        // invalid UTF-8 in names or messages becomes U+FFFD
        output_stream << outputJSON.dump(
            prettyPrint_ ? 2 : -1, ' ', false,
            nlohmann::json::error_handler_t::replace);
        output_stream << std::endl;
      } catch (const std::exception& e) {
        throw canopyException(e.what());
      }
    }

   public:
    void write_summary(std::ostream& output_stream,
                       const planting::LocationSummary& summary) override {
      write_to_stream(summary2json(summary), output_stream);
    }

    void write_index(std::ostream& output_stream,
                     const std::vector<planting::LocationSummary>& summaries,
                     const std::vector<std::string>& summary_files) override {
      if (summary_files.size() != summaries.size()) {
        throw canopyException("Index needs one file entry per summary.");
      }
      auto jlocations = nlohmann::json::array();
      size_t n_success = 0;
      for (size_t i = 0; i < summaries.size(); ++i) {
        auto& s = summaries[i];
        nlohmann::json jl = {{"location", location2json(s.location)},
                             {"status", s.status}};
        if (s.is_success()) {
          ++n_success;
          jl["critical_spot_count"] = s.spots.size();
        } else {
          jl["error"] = s.error_message;
        }
        if (!summary_files[i].empty()) jl["file"] = summary_files[i];
        jlocations.push_back(jl);
      }
      nlohmann::json j = {{"timestamp", utc_timestamp_ietf()},
                          {"location_count", summaries.size()},
                          {"success_count", n_success},
                          {"locations", jlocations}};
      write_to_stream(j, output_stream);
    }
  };

  std::unique_ptr<SummaryWriterInterface> createSummaryWriterJSON() {
    return std::make_unique<SummaryWriterJSON>();
  };

}  // namespace canopy::io
