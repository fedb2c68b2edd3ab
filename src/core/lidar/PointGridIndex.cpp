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

#include <algorithm>
#include <cmath>
#include <mdu/common/datastructures.hpp>
#include <mdu/lidar/PointGridIndex.hpp>
#include <mdu/logger/logger.h>

namespace mdu::lidar {

  namespace {
    // Cell coordinates are clamped to +-2^61, which keeps the difference of
    // two keys representable.
    constexpr double max_cell_coord = 2305843009213693952.;

    int64_t clamped_cell_coord(double offset, double cell_size) {
      return static_cast<int64_t>(std::clamp(std::floor(offset / cell_size),
                                             -max_cell_coord, max_cell_coord));
    }

    bool is_finite(double x, double y) {
      return std::isfinite(x) && std::isfinite(y);
    }
  }  // namespace

  PointGridIndex::PointGridIndex(const PointCloud& points, double cell_size)
      : points_(points), cell_size_(cell_size) {
    validate_resolution(cell_size);

    bool has_origin = false;
    for (auto& p : points) {
      if (!is_finite(p.x, p.y)) continue;
      if (!has_origin) {
        origin_x_ = p.x;
        origin_y_ = p.y;
        has_origin = true;
      }
      origin_x_ = std::min(origin_x_, p.x);
      origin_y_ = std::min(origin_y_, p.y);
    }
    size_t skipped = 0;
    for (size_t i = 0; i < points.size(); ++i) {
      if (!is_finite(points[i].x, points[i].y)) {
        ++skipped;
        continue;
      }
      cells_[cell_key(points[i].x, points[i].y)].push_back(i);
    }
    auto& logger = logger::Logger::get_logger();
    if (skipped > 0) {
      logger.debug("Skipped {} points with non-finite coordinates", skipped);
    }
    logger.debug("Indexed {} points in {} cells of size {}",
                 points.size() - skipped, cells_.size(), cell_size);
  }

  PointGridIndex::CellKey PointGridIndex::cell_key(double x, double y) const {
    return {clamped_cell_coord(x - origin_x_, cell_size_),
            clamped_cell_coord(y - origin_y_, cell_size_)};
  }

  vec1ui PointGridIndex::query(const BoundingBox& bbox) const {
    vec1ui result;
    if (cells_.empty()) return result;
    if (!is_finite(bbox.min_x, bbox.min_y) ||
        !is_finite(bbox.max_x, bbox.max_y)) {
      return result;
    }

    auto kmin = cell_key(bbox.min_x, bbox.min_y);
    auto kmax = cell_key(bbox.max_x, bbox.max_y);
    if (kmax.col < kmin.col || kmax.row < kmin.row) return result;

    auto in_range = [&](const CellKey& k) {
      return k.col >= kmin.col && k.col <= kmax.col && k.row >= kmin.row &&
             k.row <= kmax.row;
    };

    // walk whichever is smaller, the cell range of the box or the occupied
    // cells
    double range_cells = double(kmax.col - kmin.col + 1) *
                         double(kmax.row - kmin.row + 1);
    if (range_cells <= double(cells_.size())) {
      for (auto row = kmin.row; row <= kmax.row; ++row) {
        for (auto col = kmin.col; col <= kmax.col; ++col) {
          auto it = cells_.find({col, row});
          if (it == cells_.end()) continue;
          result.insert(result.end(), it->second.begin(), it->second.end());
        }
      }
    } else {
      for (auto& [key, ids] : cells_) {
        if (in_range(key)) result.insert(result.end(), ids.begin(), ids.end());
      }
    }
    std::sort(result.begin(), result.end());
    return result;
  }

  PointCloud PointGridIndex::clip(const BoundingBox& bbox) const {
    PointCloud result;
    for (auto i : query(bbox)) {
      auto& p = points_[i];
      if (bbox.contains(p.x, p.y)) result.push_back(p);
    }
    return result;
  }

  size_t PointGridIndex::max_points_per_cell() const {
    size_t max_count = 0;
    for (auto& [key, ids] : cells_) {
      max_count = std::max(max_count, ids.size());
    }
    return max_count;
  }

}  // namespace mdu::lidar
