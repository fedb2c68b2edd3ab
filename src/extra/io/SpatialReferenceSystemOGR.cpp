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

#include "SpatialReferenceSystemOGR.hpp"

#include <cpl_conv.h>
#include <fmt/format.h>

#include <mdu/logger/logger.h>
#include <string>

namespace mdu::io {

  SpatialReferenceSystemOGR::SpatialReferenceSystemOGR() {
    // x is always longitude / easting
    srs.SetAxisMappingStrategy(OAMS_TRADITIONAL_GIS_ORDER);
  }

  void SpatialReferenceSystemOGR::finish_import(OGRErr err) {
    imported_ = err == OGRERR_NONE;
    srs.SetAxisMappingStrategy(OAMS_TRADITIONAL_GIS_ORDER);
  }

  void SpatialReferenceSystemOGR::import(const std::string& user_input) {
    finish_import(srs.SetFromUserInput(user_input.c_str()));
    if (!imported_) {
      logger::Logger::get_logger().debug(
          "Could not interpret '{}' as a spatial reference system",
          user_input);
    }
  };

  void SpatialReferenceSystemOGR::import_epsg(const int epsg) {
    finish_import(srs.importFromEPSG(epsg));
    if (!imported_) {
      logger::Logger::get_logger().debug("Unknown EPSG code {}", epsg);
    }
  };

  void SpatialReferenceSystemOGR::import_wkt(const std::string& wkt) {
    finish_import(srs.importFromWkt(wkt.c_str()));
  };

  std::string SpatialReferenceSystemOGR::export_wkt() const {
    char* wkt_ptr = nullptr;
    std::string wkt;
    if (srs.exportToWkt(&wkt_ptr) == OGRERR_NONE && wkt_ptr != nullptr) {
      wkt = wkt_ptr;
    }
    CPLFree(wkt_ptr);
    return wkt;
  };

  bool SpatialReferenceSystemOGR::is_valid() const {
    return imported_ && srs.Validate() == OGRERR_NONE;
  };

  void SpatialReferenceSystemOGR::clear() {
    srs.Clear();
    imported_ = false;
  };

  bool SpatialReferenceSystemOGR::is_geographic() const {
    return srs.IsGeographic();
  };

  std::string SpatialReferenceSystemOGR::get_auth_name() const {
    auto name = srs.GetAuthorityName(nullptr);
    return name ? name : "";
  };

  std::string SpatialReferenceSystemOGR::get_auth_code() const {
    auto code = srs.GetAuthorityCode(nullptr);
    return code ? code : "";
  };

  std::unique_ptr<SpatialReferenceSystemInterface>
  createSpatialReferenceSystemOGR() {
    return std::make_unique<SpatialReferenceSystemOGR>();
  };

  std::string epsg_string(int epsg) { return fmt::format("EPSG:{}", epsg); }
}  // namespace mdu::io
