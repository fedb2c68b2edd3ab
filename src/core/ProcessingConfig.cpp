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

#include <mdu/ProcessingConfig.hpp>
#include <mdu/common/datastructures.hpp>
#include <mdu/common/validators.hpp>

namespace mdu {

  namespace {
    template <typename T, typename V>
    void check(const std::string& name, const T& value, V validator) {
      if (auto error = validator(value)) {
        throw InvalidConfiguration(
            fmt::format("invalid value for '{}': {}", name, *error));
      }
    }
  }  // namespace

  void ProcessingConfig::validate() const {
    using namespace validators;

    check("source_epsg", source_epsg, HigherThan<int>(0));
    check("output_epsg", output_epsg, HigherThan<int>(0));
    if (bbox.has_value()) {
      check("bbox", *bbox, ValidBox);
    }
    if (output_path.empty()) {
      throw InvalidConfiguration(
          "invalid value for 'output_path': Path must not be empty.");
    }
    if (logfile.has_value() && logfile->empty()) {
      throw InvalidConfiguration(
          "invalid value for 'logfile': Path must not be empty.");
    }

    check("lidar.resolution", lidar.resolution, HigherThan<double>(0.));
    check("lidar.ground_class", lidar.ground_class, InRange<int>(0, 255));
    check("lidar.building_class", lidar.building_class, InRange<int>(0, 255));
    check("lidar.vegetation_classes", lidar.vegetation_classes, NotEmpty);
    for (auto code : lidar.vegetation_classes) {
      check("lidar.vegetation_classes", code, InRange<int>(0, 255));
    }
    check("lidar.terrain_aggregation", int(lidar.terrain_aggregation),
          OneOf<int>({MIN, MAX}));
    if (lidar.class_filter.has_value()) {
      for (auto code : *lidar.class_filter) {
        check("lidar.class_filter", code, InRange<int>(0, 255));
      }
    }
    check("lidar.fill_window", lidar.fill_window, InRange<int>(1, 10));

    check("building.default_storey_height", building.default_storey_height,
          HigherThan<double>(0.));
  }

  void configure_logger(const ProcessingConfig& config) {
    auto& logger = logger::Logger::get_logger();
    logger.set_level(config.loglevel);
    if (config.logfile.has_value()) {
      logger.set_logfile(*config.logfile);
    } else {
      logger.close_logfile();
    }
  }

}  // namespace mdu
