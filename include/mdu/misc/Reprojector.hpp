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
#include <mdu/common/common.hpp>
#include <string>

namespace mdu::misc {

  /**
   * @brief Transforms coordinates from a source to a target reference
   * system.
   *
   * x is always the easting / longitude. Only the horizontal coordinates are
   * transformed, z values pass through unchanged. The container overloads
   * work on a copy and only write back when every coordinate transformed to
   * a finite value, otherwise they throw ReprojectionError and leave the
   * input untouched. Order and count of points and vertices are preserved.
   */
  struct ReprojectorInterface {
    virtual ~ReprojectorInterface() = default;

    // authority strings, eg. "EPSG:4326"
    virtual std::string source_crs() const = 0;
    virtual std::string target_crs() const = 0;

    virtual arr2d transform(double x, double y) const = 0;

    virtual void reproject(PointCloud& points) const = 0;
    virtual void reproject(LinearRing& ring) const = 0;
    // Envelope of the four transformed corners.
    virtual BoundingBox reproject(const BoundingBox& box) const = 0;

    // Transformation in the opposite direction.
    virtual std::unique_ptr<ReprojectorInterface> inverse() const = 0;
  };

  /**
   * @brief Create a GDAL/OGR backed reprojector.
   *
   * @param from_crs Anything OGR understands as user input: "EPSG:4326", WKT,
   * a PROJ string.
   * @throws ReprojectionError if either reference system is not recognized
   * or no transformation between them exists.
   */
  std::unique_ptr<ReprojectorInterface> createReprojectorOGR(
      const std::string& from_crs, const std::string& to_crs);
  std::unique_ptr<ReprojectorInterface> createReprojectorOGR(int from_epsg,
                                                             int to_epsg);

}  // namespace mdu::misc
