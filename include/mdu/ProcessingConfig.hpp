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

#include <mdu/common/RasterGrid.hpp>
#include <mdu/common/box.hpp>
#include <mdu/logger/logger.h>
#include <optional>
#include <string>
#include <vector>

namespace mdu {
  /**
   * @brief Parameters of the LiDAR to raster pipeline. Coordinate units are
   * those of the output CRS, normally meters.
   */
  struct LidarConfig {
    /**
     * @brief Raster cell size. Unit: output CRS units.
     */
    double resolution = 1.;
    /**
     * @brief Classification code of ground returns.
     */
    int ground_class = 2;
    /**
     * @brief Classification code of building returns.
     */
    int building_class = 6;
    /**
     * @brief Classification codes that together form the vegetation surface.
     */
    std::vector<int> vegetation_classes = {3, 4, 5};
    /**
     * @brief Per cell aggregation of ground points.
     *
     * MIN gives the lowest ground return in a cell, MAX the highest.
     */
    Aggregation terrain_aggregation = MIN;
    /**
     * @brief If set, only points with one of these classification codes are
     * used at all. Codes that are not well-known are only kept when listed
     * here.
     */
    std::optional<std::vector<int>> class_filter;
    /**
     * @brief Fill empty DTM cells with the minimum of their neighbours.
     */
    bool fill_dtm_gaps = false;
    /**
     * @brief Neighbourhood radius in cells for DTM gap filling. 1 means a 3x3
     * window.
     */
    int fill_window = 1;
    /**
     * @brief Clamp negative canopy heights to 0.
     */
    bool clamp_negative_chm = true;
  };

  /**
   * @brief Parameters of building height resolution, including the attribute
   * names under which the raw features carry the height information.
   * Attribute names are tried in the listed order, the first present and
   * parseable one wins.
   */
  struct BuildingConfig {
    /**
     * @brief Height of one storey, used to convert storey counts into a
     * height. Unit: meters.
     */
    double default_storey_height = 3.;
    std::vector<std::string> height_attributes = {"hauteur", "height"};
    std::vector<std::string> storeys_attributes = {"nombre_d_etages",
                                                   "storeys", "etages"};
    std::vector<std::string> alt_height_attributes = {"hauteur_2", "height_2",
                                                      "h2"};
    std::vector<std::string> district_attributes = {"district", "code_iris",
                                                    "quartier"};
  };

  /**
   * @brief Everything a processing run needs to know up front.
   */
  struct ProcessingConfig {
    /**
     * @brief EPSG code of the input data (raw points and features).
     */
    int source_epsg = 4326;
    /**
     * @brief EPSG code of the projected working and output CRS.
     */
    int output_epsg = 2154;
    /**
     * @brief Area of interest in the source CRS.
     */
    std::optional<BoundingBox> bbox;
    std::string output_path = "./temp";
    logger::LogLevel loglevel = logger::LogLevel::default_level;
    /**
     * @brief JSON log file. Without one, messages only go to the console.
     */
    std::optional<std::string> logfile;

    LidarConfig lidar;
    BuildingConfig building;

    /**
     * @brief Check all parameters.
     *
     * @throws InvalidConfiguration naming the first offending parameter.
     */
    void validate() const;
  };

  /**
   * @brief Apply the logging parameters of config to the process wide logger.
   *
   * A log file that cannot be opened is reported as a warning, logging then
   * continues on the console only.
   */
  void configure_logger(const ProcessingConfig& config);
}  // namespace mdu
