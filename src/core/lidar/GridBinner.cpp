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

#include <mdu/lidar/GridBinner.hpp>
#include <mdu/logger/logger.h>

namespace mdu::lidar {

  class GridBinner : public GridBinnerInterface {
   public:
    void compute(const PointCloud& points, const GridGeometry& geometry,
                 GridBinnerConfig cfg) override {
      grid = RasterGrid(geometry);
      discarded = 0;
      for (auto& p : points) {
        if (auto lc = geometry.locate(p.x, p.y)) {
          grid.add_value(*lc, p.z, cfg.aggregation);
        } else {
          ++discarded;
        }
      }

      auto& logger = logger::Logger::get_logger();
      if (discarded) {
        logger.debug("Discarded {} of {} points outside {}", discarded,
                     points.size(), geometry.bbox.wkt());
      }
      logger.debug("Binned {} points into {}x{} cells, {} cells empty",
                   points.size() - discarded, geometry.dim_x, geometry.dim_y,
                   grid.nodata_count());
    }
  };

  std::unique_ptr<GridBinnerInterface> createGridBinner() {
    return std::make_unique<GridBinner>();
  }

  RasterGrid bin(const PointCloud& points, const BoundingBox& bbox,
                 double resolution, Aggregation aggregation) {
    return bin(points, GridGeometry::from_bbox(bbox, resolution), aggregation);
  }

  RasterGrid bin(const PointCloud& points, const GridGeometry& geometry,
                 Aggregation aggregation) {
    auto binner = createGridBinner();
    binner->compute(points, geometry, {aggregation});
    return std::move(binner->grid);
  }

}  // namespace mdu::lidar
