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
#include <fmt/format.h>
#include <mdu/common/datastructures.hpp>
#include <mdu/lidar/RasterSynthesizer.hpp>
#include <mdu/logger/logger.h>

namespace mdu::lidar {

  namespace {
    void check_geometry(const GridGeometry& expected, const RasterGrid& grid,
                        const char* name) {
      auto& g = grid.geometry();
      if (g != expected) {
        throw GridMismatch(fmt::format(
            "{} grid ({}x{}, cellsize {}, origin {}, {}, EPSG {}) differs from "
            "ground grid ({}x{}, cellsize {}, origin {}, {}, EPSG {})",
            name, g.dim_x, g.dim_y, g.cellsize, g.bbox.min_x, g.bbox.min_y,
            g.epsg, expected.dim_x, expected.dim_y, expected.cellsize,
            expected.bbox.min_x, expected.bbox.min_y, expected.epsg));
      }
    }
  }  // namespace

  class RasterSynthesizer : public RasterSynthesizerInterface {
   public:
    void compute(const RasterGrid& ground, const RasterGrid& building,
                 const RasterGrid& vegetation,
                 RasterSynthesizerConfig cfg) override {
      auto& geometry = ground.geometry();
      check_geometry(geometry, building, "building");
      check_geometry(geometry, vegetation, "vegetation");

      ElevationRasters result;
      result.geometry = geometry;
      result.dtm = ground;
      result.dsm = RasterGrid(geometry);
      result.chm = RasterGrid(geometry);

      if (cfg.fill_dtm_gaps) {
        result.filled_cells = result.dtm.fill_nodata_min(cfg.fill_window);
      }

      // dsm and chm are both derived from the output dtm so that dsm >= dtm
      // also holds in filled cells
      const auto& dtm = result.dtm;
      const auto n = geometry.cell_count();
      for (size_t i = 0; i < n; ++i) {
        bool has_ground = !dtm.is_nodata(i);
        bool has_building = !building.is_nodata(i);
        if (has_ground && has_building) {
          result.dsm.set(i, std::max(dtm.get(i), building.get(i)));
        } else if (has_ground) {
          result.dsm.set(i, dtm.get(i));
        } else if (has_building) {
          result.dsm.set(i, building.get(i));
        }
      }

      size_t clamped = 0;
      for (size_t i = 0; i < n; ++i) {
        if (vegetation.is_nodata(i) || dtm.is_nodata(i)) continue;
        double h = vegetation.get(i) - dtm.get(i);
        if (h < 0 && cfg.clamp_negative_chm) {
          h = 0;
          ++clamped;
        }
        result.chm.set(i, h);
      }

      auto& logger = logger::Logger::get_logger();
      if (cfg.fill_dtm_gaps) {
        logger.debug("Filled {} empty DTM cells", result.filled_cells);
      }
      if (clamped) {
        logger.debug("Clamped {} negative canopy heights to 0", clamped);
      }
      logger.debug("Synthesized rasters, empty cells: dsm {}, dtm {}, chm {}",
                   result.dsm.nodata_count(), result.dtm.nodata_count(),
                   result.chm.nodata_count());

      rasters = std::move(result);
    }
  };

  std::unique_ptr<RasterSynthesizerInterface> createRasterSynthesizer() {
    return std::make_unique<RasterSynthesizer>();
  }

  ElevationRasters synthesize(const RasterGrid& ground,
                              const RasterGrid& building,
                              const RasterGrid& vegetation,
                              RasterSynthesizerConfig config) {
    auto synthesizer = createRasterSynthesizer();
    synthesizer->compute(ground, building, vegetation, config);
    return std::move(synthesizer->rasters);
  }

}  // namespace mdu::lidar
