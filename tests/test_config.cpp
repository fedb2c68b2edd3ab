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
#include <mdu/io/ConfigReader.hpp>

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include <filesystem>
#include <fstream>

using namespace mdu;
using Catch::Matchers::ContainsSubstring;

TEST_CASE("default configuration") {
  ProcessingConfig cfg;
  CHECK(cfg.source_epsg == 4326);
  CHECK(cfg.output_epsg == 2154);
  CHECK(cfg.output_path == "./temp");
  CHECK(cfg.lidar.resolution == 1.);
  CHECK(cfg.lidar.ground_class == 2);
  CHECK(cfg.lidar.building_class == 6);
  CHECK(cfg.lidar.vegetation_classes == std::vector<int>{3, 4, 5});
  CHECK(cfg.lidar.terrain_aggregation == MIN);
  CHECK_FALSE(cfg.lidar.class_filter.has_value());
  CHECK_FALSE(cfg.lidar.fill_dtm_gaps);
  CHECK(cfg.lidar.fill_window == 1);
  CHECK(cfg.lidar.clamp_negative_chm);
  CHECK(cfg.building.default_storey_height == 3.);
  CHECK_NOTHROW(cfg.validate());
}

TEST_CASE("validation names the offending parameter") {
  ProcessingConfig cfg;

  SECTION("resolution") {
    cfg.lidar.resolution = 0;
    CHECK_THROWS_WITH(cfg.validate(), ContainsSubstring("lidar.resolution"));
  }
  SECTION("storey height") {
    cfg.building.default_storey_height = -3;
    CHECK_THROWS_AS(cfg.validate(), InvalidConfiguration);
    CHECK_THROWS_WITH(cfg.validate(),
                      ContainsSubstring("building.default_storey_height"));
  }
  SECTION("bbox") {
    cfg.bbox = BoundingBox(1, 1, 0, 2);
    CHECK_THROWS_WITH(cfg.validate(), ContainsSubstring("bbox"));
  }
  SECTION("epsg") {
    cfg.output_epsg = 0;
    CHECK_THROWS_WITH(cfg.validate(), ContainsSubstring("output_epsg"));
  }
  SECTION("empty vegetation classes") {
    cfg.lidar.vegetation_classes.clear();
    CHECK_THROWS_WITH(cfg.validate(),
                      ContainsSubstring("lidar.vegetation_classes"));
  }
  SECTION("fill window") {
    cfg.lidar.fill_window = 0;
    CHECK_THROWS_AS(cfg.validate(), InvalidConfiguration);
  }
}

TEST_CASE("messages carry the error prefix") {
  ProcessingConfig cfg;
  cfg.lidar.resolution = -1;
  CHECK_THROWS_WITH(cfg.validate(), ContainsSubstring("Error: "));
}

TEST_CASE("parse toml config") {
  auto cfg = io::parse_config_toml(R"(
source_epsg = 4326
output_epsg = 3857
bbox = [2.35, 48.85, 2.36, 48.86]
output_path = "out"
loglevel = "debug"
logfile = "run.log.json"

[lidar]
resolution = 2
terrain_aggregation = "max"
vegetation_classes = [5]
class_filter = [2, 5, 6, 17]
fill_dtm_gaps = true
fill_window = 2
clamp_negative_chm = false

[building]
default_storey_height = 2.8
height_attributes = ["h"]
district_attributes = ["iris"]
)");

  CHECK(cfg.output_epsg == 3857);
  REQUIRE(cfg.bbox.has_value());
  CHECK(*cfg.bbox == BoundingBox(2.35, 48.85, 2.36, 48.86));
  CHECK(cfg.output_path == "out");
  CHECK(cfg.loglevel == logger::LogLevel::debug);
  CHECK(cfg.logfile == "run.log.json");
  CHECK(cfg.lidar.resolution == 2.);
  CHECK(cfg.lidar.terrain_aggregation == MAX);
  CHECK(cfg.lidar.vegetation_classes == std::vector<int>{5});
  REQUIRE(cfg.lidar.class_filter.has_value());
  CHECK(*cfg.lidar.class_filter == std::vector<int>{2, 5, 6, 17});
  CHECK(cfg.lidar.fill_dtm_gaps);
  CHECK(cfg.lidar.fill_window == 2);
  CHECK_FALSE(cfg.lidar.clamp_negative_chm);
  CHECK(cfg.building.default_storey_height == 2.8);
  CHECK(cfg.building.height_attributes == std::vector<std::string>{"h"});
  CHECK(cfg.building.district_attributes == std::vector<std::string>{"iris"});
  // untouched keys keep their defaults
  CHECK(cfg.lidar.ground_class == 2);
  CHECK(cfg.building.storeys_attributes.size() == 3);
}

TEST_CASE("empty toml config gives the defaults") {
  auto cfg = io::parse_config_toml("");
  CHECK(cfg.output_epsg == 2154);
  CHECK_FALSE(cfg.bbox.has_value());
  CHECK_FALSE(cfg.logfile.has_value());
}

TEST_CASE("configure logger from config") {
  auto& log = logger::Logger::get_logger();
  ProcessingConfig cfg;
  cfg.loglevel = logger::LogLevel::warning;
  cfg.logfile = (std::filesystem::temp_directory_path() / "mdu_missing_dir" /
                 "nested" / "mdu.log.json")
                    .string();
  // an unusable log file only costs a warning
  REQUIRE_NOTHROW(configure_logger(cfg));
  CHECK(log.get_level() == logger::LogLevel::warning);

  cfg.loglevel = logger::LogLevel::info;
  cfg.logfile.reset();
  REQUIRE_NOTHROW(configure_logger(cfg));
  CHECK(log.get_level() == logger::LogLevel::info);
}

TEST_CASE("toml config errors") {
  CHECK_THROWS_AS(io::parse_config_toml("unknown_key = 1"),
                  InvalidConfiguration);
  CHECK_THROWS_AS(io::parse_config_toml("[lidar]\nresolutoin = 1.0"),
                  InvalidConfiguration);
  CHECK_THROWS_AS(io::parse_config_toml("output_epsg = \"2154\""),
                  InvalidConfiguration);
  CHECK_THROWS_AS(io::parse_config_toml("bbox = [1, 2, 3]"),
                  InvalidConfiguration);
  CHECK_THROWS_AS(io::parse_config_toml("bbox = [3, 2, 1, 4]"),
                  InvalidConfiguration);
  CHECK_THROWS_AS(io::parse_config_toml("[lidar]\nresolution = -1"),
                  InvalidConfiguration);
  CHECK_THROWS_AS(
      io::parse_config_toml("[lidar]\nterrain_aggregation = \"mean\""),
      InvalidConfiguration);
  CHECK_THROWS_AS(io::parse_config_toml("loglevel = \"loud\""),
                  InvalidConfiguration);
  CHECK_THROWS_AS(io::parse_config_toml("lidar = 3"), InvalidConfiguration);
  CHECK_THROWS_AS(io::parse_config_toml("logfile = \"\""),
                  InvalidConfiguration);
  CHECK_THROWS_AS(io::parse_config_toml("this is not toml"),
                  InvalidConfiguration);
}

TEST_CASE("read toml config file") {
  auto path = std::filesystem::temp_directory_path() / "mdu_test_config.toml";
  {
    std::ofstream f(path);
    f << "output_epsg = 2154\n[lidar]\nresolution = 0.5\n";
  }
  auto cfg = io::read_config_toml(path.string());
  CHECK(cfg.lidar.resolution == 0.5);
  std::filesystem::remove(path);

  CHECK_THROWS_AS(io::read_config_toml("/nonexistent/mdu.toml"),
                  InvalidConfiguration);
}
