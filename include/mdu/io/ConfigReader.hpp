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

#include <mdu/ProcessingConfig.hpp>
#include <string>

namespace mdu::io {

  /**
   * @brief Read a processing configuration from a TOML file.
   *
   * Keys that are not present keep their default value. The result is
   * validated before it is returned.
   *
   * Example:
   * @code{.toml}
   * source_epsg = 4326
   * output_epsg = 2154
   * bbox = [2.35, 48.85, 2.36, 48.86]
   * output_path = "./temp"
   * loglevel = "info"
   * logfile = "mdu.log.json"
   *
   * [lidar]
   * resolution = 1.0
   * vegetation_classes = [3, 4, 5]
   * terrain_aggregation = "min"
   *
   * [building]
   * default_storey_height = 3.0
   * @endcode
   *
   * @throws InvalidConfiguration on syntax errors, unknown keys, values of
   * the wrong type and values that do not pass validation.
   */
  ProcessingConfig read_config_toml(const std::string& path);
  ProcessingConfig parse_config_toml(const std::string& text);

}  // namespace mdu::io
