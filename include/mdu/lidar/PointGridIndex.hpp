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

#include <cstdint>
#include <functional>
#include <mdu/common/common.hpp>
#include <unordered_map>

namespace mdu::lidar {

  /**
   * @brief Bucket index over a point cloud for bounding box queries.
   *
   * Points are bucketed by `floor((x - origin_x) / cell_size)` and
   * `floor((y - origin_y) / cell_size)`, with the origin at the minimum
   * corner of the cloud. Cell coordinates far from the origin are clamped,
   * so stray points share the outermost cells, and points with non-finite
   * coordinates are not indexed at all. The index refers to the cloud it was
   * built from, which must outlive it and must not be modified.
   */
  class PointGridIndex {
   public:
    struct CellKey {
      int64_t col;
      int64_t row;
      bool operator==(const CellKey& other) const {
        return col == other.col && row == other.row;
      }
    };
    struct CellKeyHash {
      size_t operator()(const CellKey& k) const {
        return std::hash<int64_t>()(k.col) ^
               (std::hash<int64_t>()(k.row) << 1);
      }
    };

    // @throws InvalidResolution if cell_size is not finite and > 0
    PointGridIndex(const PointCloud& points, double cell_size);

    // Indices of all points in cells that overlap bbox, ascending. This is a
    // superset of the points inside bbox.
    vec1ui query(const BoundingBox& bbox) const;
    // Points inside the closed bbox, in input order.
    PointCloud clip(const BoundingBox& bbox) const;

    double cell_size() const { return cell_size_; };
    // Number of points in the cloud, indexed or not.
    size_t point_count() const { return points_.size(); };
    size_t cell_count() const { return cells_.size(); };
    size_t max_points_per_cell() const;

   private:
    const PointCloud& points_;
    double cell_size_;
    double origin_x_ = 0;
    double origin_y_ = 0;
    std::unordered_map<CellKey, vec1ui, CellKeyHash> cells_;

    CellKey cell_key(double x, double y) const;
  };

}  // namespace mdu::lidar
