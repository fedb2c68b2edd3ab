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

#include <array>
#include <cstdint>
#include <limits>
#include <mdu/common/common.hpp>
#include <optional>
#include <vector>

namespace mdu {

  enum Aggregation { MIN, MAX };

  /**
   * @brief Geometry of a regular raster grid.
   *
   * The grid origin is the lower left corner of the requested bounding box,
   * column indices grow with x and row indices grow with y (row 0 is the
   * southernmost row). The number of columns and rows is
   * `ceil(bbox.size_x() / cellsize)` and `ceil(bbox.size_y() / cellsize)`, so
   * the last column and row may extend beyond the bounding box.
   */
  struct GridGeometry {
    BoundingBox bbox;
    double cellsize = 1.;
    size_t dim_x = 0;
    size_t dim_y = 0;
    int epsg = 0;

    /**
     * @brief Construct the grid covering a bounding box.
     *
     * @throws InvalidBoundingBox if the box is not strictly increasing.
     * @throws InvalidResolution if cellsize is not finite and > 0, or if
     * the resulting grid has more cells than can be addressed.
     */
    static GridGeometry from_bbox(const BoundingBox& bbox, double cellsize,
                                  int epsg = 0);

    size_t cell_count() const { return dim_x * dim_y; };
    size_t linear_coord(size_t col, size_t row) const {
      return row * dim_x + col;
    };

    /**
     * @brief Linear index of the cell containing (x, y).
     *
     * Points on the upper edge of the bounding box are assigned to the last
     * column / row. Returns std::nullopt for points outside the (closed)
     * bounding box.
     */
    std::optional<size_t> locate(double x, double y) const;

    // Centre of a cell in grid CRS coordinates
    arr2d cell_center(size_t col, size_t row) const;

    // Area covered by the full grid, including the overhang of the last
    // column and row.
    BoundingBox extent() const;

    // GDAL style geotransform of the north-up representation of this grid:
    // {top left x, cellsize, 0, top left y, 0, -cellsize}
    std::array<double, 6> geotransform() const;

    bool operator==(const GridGeometry& other) const {
      return bbox == other.bbox && cellsize == other.cellsize &&
             dim_x == other.dim_x && dim_y == other.dim_y &&
             epsg == other.epsg;
    };
    bool operator!=(const GridGeometry& other) const {
      return !(*this == other);
    };
  };

  /**
   * @brief Single band raster with one aggregated value and a point count per
   * cell.
   *
   * Every cell starts out as no-data. The no-data sentinel is the lowest
   * representable double, so it can never be confused with a valid
   * elevation (zero included).
   */
  class RasterGrid {
    GridGeometry geometry_;
    std::vector<double> vals_;
    std::vector<uint32_t> counts_;

   public:
    static constexpr double nodataval = std::numeric_limits<double>::lowest();

    RasterGrid() = default;
    explicit RasterGrid(const GridGeometry& geometry);

    const GridGeometry& geometry() const;
    size_t dim_x() const;
    size_t dim_y() const;

    double get(size_t col, size_t row) const;
    double get(size_t linear_coord) const;
    uint32_t count(size_t col, size_t row) const;
    bool is_nodata(size_t col, size_t row) const;
    bool is_nodata(size_t linear_coord) const;

    void set(size_t col, size_t row, double val);
    void set(size_t linear_coord, double val);

    // Aggregate z into a cell and increment its count. On equal values the
    // latest point wins.
    void add_value(size_t linear_coord, double z, Aggregation a);

    size_t nodata_count() const;
    size_t data_count() const;

    const std::vector<double>& values() const;
    const std::vector<uint32_t>& counts() const;

    // Row flipped copy of the values, first row is the northernmost row.
    // Matches geometry().geotransform().
    std::vector<double> north_up_values() const;

    /**
     * @brief Fill no-data cells with the minimum of the valid cells in a
     * square window around them.
     *
     * The window spans `window` cells on each side of the empty cell.
     * Neighbour values are read from the grid as it was before filling, and
     * cells without any valid neighbour stay no-data.
     *
     * @return Number of cells that were filled.
     */
    size_t fill_nodata_min(size_t window = 1);
  };

}  // namespace mdu
