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

#include <memory>
#include <string>

namespace mdu::io {
  /**
   * @brief A coordinate reference system as understood by the backend.
   *
   * Importing a definition that the backend does not recognize leaves the
   * object invalid, check is_valid() before using it.
   */
  struct SpatialReferenceSystemInterface {
    virtual ~SpatialReferenceSystemInterface() = default;

    virtual bool is_valid() const = 0;
    virtual void clear() = 0;

    // Any of "EPSG:2154", a WKT string, a PROJ string.
    virtual void import(const std::string& user_input) = 0;
    virtual void import_epsg(const int epsg) = 0;
    virtual void import_wkt(const std::string& wkt) = 0;
    virtual std::string export_wkt() const = 0;

    virtual bool is_geographic() const = 0;
    virtual std::string get_auth_name() const = 0;
    virtual std::string get_auth_code() const = 0;
  };

  std::unique_ptr<SpatialReferenceSystemInterface>
  createSpatialReferenceSystemOGR();

  // "EPSG:<code>"
  std::string epsg_string(int epsg);
}  // namespace mdu::io
