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

namespace mdu::lidar {

  struct RasterSynthesizerConfig {
    /**
     * @brief Fill empty DTM cells with the minimum of the defined cells in a
     * (2 * fill_window + 1) square window. Cells without any defined
     * neighbour stay empty.
     */
    bool fill_dtm_gaps = false;
    size_t fill_window = 1;
    /**
     * @brief Set negative canopy heights (vegetation below the terrain) to 0.
     */
    bool clamp_negative_chm = true;
  };

  /**
   * @brief The elevation products of one area, all on the same grid.
   *
   * - dsm: highest of ground and building surface
   * - dtm: ground surface
   * - chm: vegetation height above the dtm
   *
   * Empty cells hold RasterGrid::nodataval.
   */
  struct ElevationRasters {
    GridGeometry geometry;
    RasterGrid dsm;
    RasterGrid dtm;
    RasterGrid chm;
    // number of DTM cells that were filled from neighbours
    size_t filled_cells = 0;

    int epsg() const { return geometry.epsg; };
    static constexpr double nodata() { return RasterGrid::nodataval; };
  };

  struct RasterSynthesizerInterface {
    ElevationRasters rasters;

    virtual ~RasterSynthesizerInterface() = default;
    // @throws GridMismatch if the three grids do not share one geometry
    virtual void compute(
        const RasterGrid& ground, const RasterGrid& building,
        const RasterGrid& vegetation,
        RasterSynthesizerConfig config = RasterSynthesizerConfig()) = 0;
  };

  std::unique_ptr<RasterSynthesizerInterface> createRasterSynthesizer();

  ElevationRasters synthesize(
      const RasterGrid& ground, const RasterGrid& building,
      const RasterGrid& vegetation,
      RasterSynthesizerConfig config = RasterSynthesizerConfig());

}  // namespace mdu::lidar
