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

#include <fmt/format.h>

#include <mdu/common/datastructures.hpp>
#include <mdu/io/ConfigReader.hpp>
#include <mdu/logger/logger.h>
#include <toml++/toml.hpp>

namespace mdu::io {

  namespace {
    template <typename T, typename node>
    void get_toml_value(const node& config, const std::string& key,
                        T& result) {
      auto tml_node = config[key];
      if (!tml_node) return;
      if (auto tml_value = tml_node.template value<T>();
          tml_value.has_value()) {
        result = *tml_value;
      } else {
        throw InvalidConfiguration(fmt::format(
            "failed to read value for '{}' from config file, it has the wrong "
            "type",
            key));
      }
    }

    template <typename T, typename node>
    void get_toml_array(const node& config, const std::string& key,
                        std::vector<T>& result) {
      auto tml_node = config[key];
      if (!tml_node) return;
      const toml::array* arr = tml_node.as_array();
      if (!arr) {
        throw InvalidConfiguration(
            fmt::format("'{}' in config file must be an array", key));
      }
      std::vector<T> values;
      for (auto& el : *arr) {
        auto v = el.template value<T>();
        if (!v.has_value()) {
          throw InvalidConfiguration(fmt::format(
              "'{}' in config file contains a value of the wrong type", key));
        }
        values.push_back(*v);
      }
      result = std::move(values);
    }

    void read_bbox(const toml::table& config, ProcessingConfig& cfg) {
      std::vector<double> vals;
      get_toml_array(config, "bbox", vals);
      if (vals.size() != 4) {
        throw InvalidConfiguration(
            "'bbox' in config file must have 4 values: [min_x, min_y, max_x, "
            "max_y]");
      }
      cfg.bbox = BoundingBox(vals[0], vals[1], vals[2], vals[3]);
    }

    void read_lidar(const toml::table& tb, LidarConfig& cfg) {
      for (const auto& [key, value] : tb) {
        if (key == "resolution") {
          get_toml_value(tb, "resolution", cfg.resolution);
        } else if (key == "ground_class") {
          get_toml_value(tb, "ground_class", cfg.ground_class);
        } else if (key == "building_class") {
          get_toml_value(tb, "building_class", cfg.building_class);
        } else if (key == "vegetation_classes") {
          get_toml_array(tb, "vegetation_classes", cfg.vegetation_classes);
        } else if (key == "terrain_aggregation") {
          std::string agg;
          get_toml_value(tb, "terrain_aggregation", agg);
          agg = to_lower(agg);
          if (agg == "min") {
            cfg.terrain_aggregation = MIN;
          } else if (agg == "max") {
            cfg.terrain_aggregation = MAX;
          } else {
            throw InvalidConfiguration(fmt::format(
                "lidar.terrain_aggregation must be \"min\" or \"max\", got "
                "\"{}\"",
                agg));
          }
        } else if (key == "class_filter") {
          std::vector<int> codes;
          get_toml_array(tb, "class_filter", codes);
          cfg.class_filter = codes;
        } else if (key == "fill_dtm_gaps") {
          get_toml_value(tb, "fill_dtm_gaps", cfg.fill_dtm_gaps);
        } else if (key == "fill_window") {
          get_toml_value(tb, "fill_window", cfg.fill_window);
        } else if (key == "clamp_negative_chm") {
          get_toml_value(tb, "clamp_negative_chm", cfg.clamp_negative_chm);
        } else {
          throw InvalidConfiguration(fmt::format(
              "unknown parameter in [lidar] table in config file: {}",
              key.str()));
        }
      }
    }

    void read_building(const toml::table& tb, BuildingConfig& cfg) {
      for (const auto& [key, value] : tb) {
        if (key == "default_storey_height") {
          get_toml_value(tb, "default_storey_height",
                         cfg.default_storey_height);
        } else if (key == "height_attributes") {
          get_toml_array(tb, "height_attributes", cfg.height_attributes);
        } else if (key == "storeys_attributes") {
          get_toml_array(tb, "storeys_attributes", cfg.storeys_attributes);
        } else if (key == "alt_height_attributes") {
          get_toml_array(tb, "alt_height_attributes",
                         cfg.alt_height_attributes);
        } else if (key == "district_attributes") {
          get_toml_array(tb, "district_attributes", cfg.district_attributes);
        } else {
          throw InvalidConfiguration(fmt::format(
              "unknown parameter in [building] table in config file: {}",
              key.str()));
        }
      }
    }

    const toml::table& as_table(const toml::node& node, const char* name) {
      auto tb = node.as_table();
      if (!tb) {
        throw InvalidConfiguration(
            fmt::format("'{}' in config file must be a table", name));
      }
      return *tb;
    }

    ProcessingConfig config_from_table(const toml::table& config) {
      ProcessingConfig cfg;
      for (const auto& [key, value] : config) {
        if (key == "source_epsg") {
          get_toml_value(config, "source_epsg", cfg.source_epsg);
        } else if (key == "output_epsg") {
          get_toml_value(config, "output_epsg", cfg.output_epsg);
        } else if (key == "bbox") {
          read_bbox(config, cfg);
        } else if (key == "output_path") {
          get_toml_value(config, "output_path", cfg.output_path);
        } else if (key == "loglevel") {
          std::string name;
          get_toml_value(config, "loglevel", name);
          auto level = logger::parse_log_level(name);
          if (!level.has_value()) {
            throw InvalidConfiguration(
                fmt::format("unknown loglevel \"{}\" in config file", name));
          }
          cfg.loglevel = *level;
        } else if (key == "logfile") {
          std::string path;
          get_toml_value(config, "logfile", path);
          cfg.logfile = path;
        } else if (key == "lidar") {
          read_lidar(as_table(value, "lidar"), cfg.lidar);
        } else if (key == "building") {
          read_building(as_table(value, "building"), cfg.building);
        } else {
          throw InvalidConfiguration(fmt::format(
              "unknown parameter in config file: {}", key.str()));
        }
      }
      cfg.validate();
      return cfg;
    }
  }  // namespace

  ProcessingConfig read_config_toml(const std::string& path) {
    toml::table config;
    try {
      config = toml::parse_file(path);
    } catch (const toml::parse_error& err) {
      throw InvalidConfiguration(fmt::format(
          "could not parse config file {}: {}", path, err.description()));
    }
    logger::Logger::get_logger().debug("Reading config file {}", path);
    return config_from_table(config);
  }

  ProcessingConfig parse_config_toml(const std::string& text) {
    toml::table config;
    try {
      config = toml::parse(text);
    } catch (const toml::parse_error& err) {
      throw InvalidConfiguration(
          fmt::format("could not parse config: {}", err.description()));
    }
    return config_from_table(config);
  }

}  // namespace mdu::io
