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
#include <mdu/common/RasterGrid.hpp>
#include <mdu/common/common.hpp>

namespace mdu::lidar {

  struct GridBinnerConfig {
    // MAX for surfaces, MIN for terrain
    Aggregation aggregation = MAX;
  };

  /**
   * @brief Bins points onto a regular grid, keeping the aggregated elevation
   * and the number of points per cell.
   *
   * Points outside the grid's bounding box are discarded and counted in
   * `discarded`.
   */
  struct GridBinnerInterface {
    RasterGrid grid;
    size_t discarded = 0;

    virtual ~GridBinnerInterface() = default;
    virtual void compute(const PointCloud& points, const GridGeometry& geometry,
                         GridBinnerConfig config = GridBinnerConfig()) = 0;
  };

  std::unique_ptr<GridBinnerInterface> createGridBinner();

  /**
   * @brief Bin points onto a new grid covering bbox.
   *
   * @throws InvalidBoundingBox, InvalidResolution before any grid is
   * allocated.
   */
  RasterGrid bin(const PointCloud& points, const BoundingBox& bbox,
                 double resolution, Aggregation aggregation);
  RasterGrid bin(const PointCloud& points, const GridGeometry& geometry,
                 Aggregation aggregation);

}  // namespace mdu::lidar
