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
#include <limits>
#include <mdu/common/RasterGrid.hpp>
#include <mdu/common/datastructures.hpp>
#include <utility>

#include <fmt/format.h>

namespace mdu {

  GridGeometry GridGeometry::from_bbox(const BoundingBox& bbox,
                                       double cellsize, int epsg) {
    validate_bbox(bbox);
    validate_resolution(cellsize);

    double nx = std::ceil(bbox.size_x() / cellsize);
    double ny = std::ceil(bbox.size_y() / cellsize);
    constexpr auto max_dim = static_cast<double>(
        std::numeric_limits<size_t>::max());
    const auto max_cells =
        static_cast<double>(std::vector<double>().max_size());
    if (!(nx < max_dim) || !(ny < max_dim) || nx * ny > max_cells) {
      throw InvalidResolution(fmt::format(
          "cell size {} gives a grid of {} x {} cells, which is too large",
          cellsize, nx, ny));
    }

    GridGeometry geometry;
    geometry.bbox = bbox;
    geometry.cellsize = cellsize;
    geometry.dim_x = static_cast<size_t>(nx);
    geometry.dim_y = static_cast<size_t>(ny);
    geometry.epsg = epsg;
    return geometry;
  }

  std::optional<size_t> GridGeometry::locate(double x, double y) const {
    if (!bbox.contains(x, y)) return std::nullopt;
    auto col = static_cast<size_t>(std::floor((x - bbox.min_x) / cellsize));
    auto row = static_cast<size_t>(std::floor((y - bbox.min_y) / cellsize));
    // upper bbox edge belongs to the last column / row
    col = std::min(col, dim_x - 1);
    row = std::min(row, dim_y - 1);
    return linear_coord(col, row);
  }

  arr2d GridGeometry::cell_center(size_t col, size_t row) const {
    return {bbox.min_x + col * cellsize + cellsize / 2,
            bbox.min_y + row * cellsize + cellsize / 2};
  }

  BoundingBox GridGeometry::extent() const {
    return BoundingBox(bbox.min_x, bbox.min_y, bbox.min_x + dim_x * cellsize,
                       bbox.min_y + dim_y * cellsize);
  }

  std::array<double, 6> GridGeometry::geotransform() const {
    return {bbox.min_x, cellsize, 0, bbox.min_y + dim_y * cellsize,
            0,          -cellsize};
  }

  RasterGrid::RasterGrid(const GridGeometry& geometry)
      : geometry_(geometry),
        vals_(geometry.cell_count(), nodataval),
        counts_(geometry.cell_count(), 0) {}

  const GridGeometry& RasterGrid::geometry() const { return geometry_; }
  size_t RasterGrid::dim_x() const { return geometry_.dim_x; }
  size_t RasterGrid::dim_y() const { return geometry_.dim_y; }

  double RasterGrid::get(size_t col, size_t row) const {
    return vals_[geometry_.linear_coord(col, row)];
  }
  double RasterGrid::get(size_t linear_coord) const {
    return vals_[linear_coord];
  }
  uint32_t RasterGrid::count(size_t col, size_t row) const {
    return counts_[geometry_.linear_coord(col, row)];
  }
  bool RasterGrid::is_nodata(size_t col, size_t row) const {
    return get(col, row) == nodataval;
  }
  bool RasterGrid::is_nodata(size_t linear_coord) const {
    return vals_[linear_coord] == nodataval;
  }

  void RasterGrid::set(size_t col, size_t row, double val) {
    vals_[geometry_.linear_coord(col, row)] = val;
  }
  void RasterGrid::set(size_t linear_coord, double val) {
    vals_[linear_coord] = val;
  }

  void RasterGrid::add_value(size_t linear_coord, double z, Aggregation a) {
    auto& val = vals_[linear_coord];
    auto& cnt = counts_[linear_coord];
    if (cnt == 0) {
      val = z;
    } else if (a == MAX) {
      if (z >= val) val = z;
    } else if (a == MIN) {
      if (z <= val) val = z;
    }
    ++cnt;
  }

  size_t RasterGrid::nodata_count() const {
    return std::count(vals_.begin(), vals_.end(), nodataval);
  }
  size_t RasterGrid::data_count() const {
    return vals_.size() - nodata_count();
  }

  const std::vector<double>& RasterGrid::values() const { return vals_; }
  const std::vector<uint32_t>& RasterGrid::counts() const { return counts_; }

  std::vector<double> RasterGrid::north_up_values() const {
    std::vector<double> flipped;
    flipped.reserve(vals_.size());
    for (size_t row = geometry_.dim_y; row-- > 0;) {
      auto first = vals_.begin() + geometry_.linear_coord(0, row);
      flipped.insert(flipped.end(), first, first + geometry_.dim_x);
    }
    return flipped;
  }

  size_t RasterGrid::fill_nodata_min(size_t window) {
    std::vector<double> new_vals(vals_);
    size_t filled = 0;
    const auto dimx = geometry_.dim_x;
    const auto dimy = geometry_.dim_y;
    for (size_t row = 0; row < dimy; ++row) {
      for (size_t col = 0; col < dimx; ++col) {
        if (!is_nodata(col, row)) continue;

        size_t left = col > window ? col - window : 0;
        size_t right = std::min(dimx - 1, col + window);
        size_t bottom = row > window ? row - window : 0;
        size_t top = std::min(dimy - 1, row + window);
        std::optional<double> min_val;
        for (size_t wr = bottom; wr <= top; ++wr) {
          for (size_t wc = left; wc <= right; ++wc) {
            if (is_nodata(wc, wr)) continue;
            double v = get(wc, wr);
            if (!min_val.has_value() || v < *min_val) min_val = v;
          }
        }
        if (min_val.has_value()) {
          new_vals[geometry_.linear_coord(col, row)] = *min_val;
          ++filled;
        }
      }
    }
    vals_ = std::move(new_vals);
    return filled;
  }

}  // namespace mdu
