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

#include <mdu/common/box.hpp>
#include <optional>
#include <string>

namespace mdu {
  struct ProcessingConfig;
  namespace misc {
    struct ReprojectorInterface;
  }

  /**
   * @brief Reference system and area of interest shared by every product of
   * a processing run.
   *
   * The bounding box is given in the source (geographic) CRS and is
   * validated when it is set. Products are computed in the output CRS, see
   * working_bbox().
   */
  class GeoCore {
    int epsg_ = 2154;
    int source_epsg_ = 4326;
    std::optional<BoundingBox> bbox_;
    std::string output_path_ = "./temp";
    std::optional<std::string> output_path_shp_;
    std::optional<std::string> filename_shp_;

   public:
    GeoCore() = default;
    explicit GeoCore(int epsg, int source_epsg = 4326);
    static GeoCore from_config(const ProcessingConfig& cfg);

    int epsg() const { return epsg_; };
    // @throws InvalidConfiguration for codes <= 0
    void set_epsg(int epsg);
    int source_epsg() const { return source_epsg_; };
    void set_source_epsg(int epsg);

    // "EPSG:<code>" forms of the two reference systems
    std::string output_crs() const;
    std::string source_crs() const;

    const std::optional<BoundingBox>& bbox() const { return bbox_; };
    // @throws InvalidBoundingBox, the current box is kept in that case
    void set_bbox(const BoundingBox& bbox);
    void clear_bbox();

    const std::string& output_path() const { return output_path_; };
    void set_output_path(const std::string& path);
    const std::optional<std::string>& output_path_shp() const {
      return output_path_shp_;
    };
    void set_output_path_shp(const std::string& path);
    const std::optional<std::string>& filename_shp() const {
      return filename_shp_;
    };
    void set_filename_shp(const std::string& filename);

    /**
     * @brief The bounding box transformed to the output CRS.
     *
     * @param reprojector Transformation from source_crs() to output_crs().
     * @throws InvalidBoundingBox if no bounding box is set or the transformed
     * box is degenerate.
     * @throws ReprojectionError if the reprojector does not go from
     * source_crs() to output_crs() or the transformation fails.
     */
    BoundingBox working_bbox(
        const misc::ReprojectorInterface& reprojector) const;
  };
}  // namespace mdu
