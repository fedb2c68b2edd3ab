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

#pragma once

#include <mdu/io/SpatialReferenceSystem.hpp>
#include <ogr_spatialref.h>

namespace mdu::io {

  // OGR backed reference system, shared between the reference system factory
  // and the OGR reprojector.
  struct SpatialReferenceSystemOGR : public SpatialReferenceSystemInterface {
    OGRSpatialReference srs;

    SpatialReferenceSystemOGR();

    void import(const std::string& user_input) override;
    void import_epsg(const int epsg) override;
    void import_wkt(const std::string& wkt) override;
    std::string export_wkt() const override;

    bool is_valid() const override;
    void clear() override;

    bool is_geographic() const override;
    std::string get_auth_name() const override;
    std::string get_auth_code() const override;

   private:
    bool imported_ = false;
    void finish_import(OGRErr err);
  };

}  // namespace mdu::io
