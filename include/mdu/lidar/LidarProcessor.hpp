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
#include <mdu/ProcessingConfig.hpp>
#include <mdu/common/common.hpp>
#include <mdu/lidar/RasterSynthesizer.hpp>

namespace mdu::lidar {

  /**
   * @brief Turns a classified point cloud into DSM, DTM and CHM rasters.
   *
   * Steps: clip the points to the working bounding box, apply the optional
   * class filter, classify, bin ground, building and vegetation points on
   * one shared grid and synthesize the three bands. Points and bounding box
   * are expected in the output CRS already.
   */
  struct LidarProcessorInterface {
    ElevationRasters rasters;
    // points inside the working bbox that passed the class filter
    size_t used_points = 0;

    virtual ~LidarProcessorInterface() = default;

    // @throws InvalidBoundingBox, InvalidResolution, InvalidConfiguration
    virtual void compute(const PointCloud& points,
                         const BoundingBox& working_bbox,
                         const LidarConfig& config = LidarConfig(),
                         int epsg = 0) = 0;
  };

  std::unique_ptr<LidarProcessorInterface> createLidarProcessor();

  ElevationRasters process(const PointCloud& points,
                           const BoundingBox& working_bbox,
                           const LidarConfig& config = LidarConfig(),
                           int epsg = 0);

}  // namespace mdu::lidar
