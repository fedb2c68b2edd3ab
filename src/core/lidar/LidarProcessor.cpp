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
#include <mdu/lidar/GridBinner.hpp>
#include <mdu/lidar/LidarProcessor.hpp>
#include <mdu/lidar/PointClassifier.hpp>
#include <mdu/lidar/PointGridIndex.hpp>
#include <mdu/logger/logger.h>

namespace mdu::lidar {

  class LidarProcessor : public LidarProcessorInterface {
   public:
    void compute(const PointCloud& points, const BoundingBox& working_bbox,
                 const LidarConfig& cfg, int epsg) override {
      auto& logger = logger::Logger::get_logger();

      // fail before doing any work
      auto geometry = GridGeometry::from_bbox(working_bbox, cfg.resolution,
                                              epsg);
      if (cfg.fill_window < 1) {
        throw InvalidConfiguration(fmt::format(
            "fill_window must be at least 1, got {}", cfg.fill_window));
      }

      logger.info("Processing {} LiDAR points into a {}x{} grid of {} m",
                  points.size(), geometry.dim_x, geometry.dim_y,
                  cfg.resolution);

      // bucket size of a few raster cells, never more buckets over the
      // working area than points
      double area = working_bbox.size_x() * working_bbox.size_y();
      double n = double(std::max<size_t>(points.size(), 1));
      double index_cell = std::max(cfg.resolution * 8, std::sqrt(area / n));
      PointGridIndex index(points, index_cell);
      auto clipped = index.clip(working_bbox);
      logger.debug("{} of {} points inside the working bounding box",
                   clipped.size(), points.size());
      logger.trace("clip", clipped.size());

      if (cfg.class_filter.has_value()) {
        clipped = filter_by_class(clipped, *cfg.class_filter);
        logger.debug("{} points left after class filter", clipped.size());
      }
      used_points = clipped.size();

      auto partition = classify(clipped);
      if (!partition.other.empty()) {
        logger.debug("{} points with other classification codes are not "
                     "used for the rasters",
                     partition.other.size());
      }

      auto ground_pts = partition.select({cfg.ground_class});
      auto building_pts = partition.select({cfg.building_class});
      auto vegetation_pts = partition.select(cfg.vegetation_classes);

      auto binner = createGridBinner();
      binner->compute(ground_pts, geometry, {cfg.terrain_aggregation});
      auto ground = std::move(binner->grid);
      binner->compute(building_pts, geometry, {MAX});
      auto building = std::move(binner->grid);
      binner->compute(vegetation_pts, geometry, {MAX});
      auto vegetation = std::move(binner->grid);

      RasterSynthesizerConfig synth_cfg;
      synth_cfg.fill_dtm_gaps = cfg.fill_dtm_gaps;
      synth_cfg.fill_window = static_cast<size_t>(cfg.fill_window);
      synth_cfg.clamp_negative_chm = cfg.clamp_negative_chm;
      auto synthesizer = createRasterSynthesizer();
      synthesizer->compute(ground, building, vegetation, synth_cfg);
      rasters = std::move(synthesizer->rasters);

      if (rasters.dtm.data_count() == 0) {
        logger.warning("No ground points in the working bounding box, the DTM "
                       "is empty");
      }
      logger.info("Finished elevation rasters, {} of {} DTM cells defined",
                  rasters.dtm.data_count(), geometry.cell_count());
    }
  };

  std::unique_ptr<LidarProcessorInterface> createLidarProcessor() {
    return std::make_unique<LidarProcessor>();
  }

  ElevationRasters process(const PointCloud& points,
                           const BoundingBox& working_bbox,
                           const LidarConfig& config, int epsg) {
    auto processor = createLidarProcessor();
    processor->compute(points, working_bbox, config, epsg);
    return std::move(processor->rasters);
  }

}  // namespace mdu::lidar
