// Copyright (c) 2024-2026 The mdu authors

// This file is part of mdu

// mdu is free software: you can redistribute it and/or modify it under the
// terms of the GNU General Public License as published by the Free Software
// Foundation, either version 3 of the License, or (at your option) any later
// version. mdu is distributed in the hope that it will be useful, but WITHOUT
// ANY WARRANTY; without even the implied warranty of MERCHANTABILITY or
// FITNESS FOR A PARTICULAR PURPOSE. See the GNU General Public License for
// more details. You should have received a copy of the GNU General Public
// License along with mdu. If not, see <https://www.gnu.org/licenses/>.

#include <fmt/format.h>

#include <mdu/GeoCore.hpp>
#include <mdu/ProcessingConfig.hpp>
#include <mdu/common/datastructures.hpp>
#include <mdu/logger/logger.h>
#include <mdu/misc/Reprojector.hpp>

namespace mdu {

  namespace {
    void check_epsg(int epsg) {
      if (epsg <= 0) {
        throw InvalidConfiguration(
            fmt::format("EPSG code must be a positive number, got {}", epsg));
      }
    }
  }  // namespace

  GeoCore::GeoCore(int epsg, int source_epsg) {
    set_epsg(epsg);
    set_source_epsg(source_epsg);
  }

  GeoCore GeoCore::from_config(const ProcessingConfig& cfg) {
    GeoCore core(cfg.output_epsg, cfg.source_epsg);
    if (cfg.bbox.has_value()) {
      core.set_bbox(*cfg.bbox);
    }
    core.set_output_path(cfg.output_path);
    return core;
  }

  void GeoCore::set_epsg(int epsg) {
    check_epsg(epsg);
    epsg_ = epsg;
  }

  void GeoCore::set_source_epsg(int epsg) {
    check_epsg(epsg);
    source_epsg_ = epsg;
  }

  std::string GeoCore::output_crs() const {
    return fmt::format("EPSG:{}", epsg_);
  }
  std::string GeoCore::source_crs() const {
    return fmt::format("EPSG:{}", source_epsg_);
  }

  void GeoCore::set_bbox(const BoundingBox& bbox) {
    validate_bbox(bbox);
    bbox_ = bbox;
  }

  void GeoCore::clear_bbox() { bbox_.reset(); }

  void GeoCore::set_output_path(const std::string& path) {
    output_path_ = path;
  }
  void GeoCore::set_output_path_shp(const std::string& path) {
    output_path_shp_ = path;
  }
  void GeoCore::set_filename_shp(const std::string& filename) {
    filename_shp_ = filename;
  }

  BoundingBox GeoCore::working_bbox(
      const misc::ReprojectorInterface& reprojector) const {
    if (!bbox_.has_value()) {
      throw InvalidBoundingBox("no bounding box has been set");
    }
    if (reprojector.source_crs() != source_crs() ||
        reprojector.target_crs() != output_crs()) {
      throw ReprojectionError(fmt::format(
          "reprojector goes from {} to {}, expected {} to {}",
          reprojector.source_crs(), reprojector.target_crs(), source_crs(),
          output_crs()));
    }
    auto box = reprojector.reproject(*bbox_);
    validate_bbox(box);
    logger::Logger::get_logger().debug("Working bounding box in {}: {}",
                                       output_crs(), box.wkt());
    return box;
  }

}  // namespace mdu
