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

#include <mdu/common/datastructures.hpp>
#include <mdu/lidar/LidarProcessor.hpp>
#include <mdu/lidar/PointClassifier.hpp>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>
#include <limits>

using Catch::Approx;
using namespace mdu;
using namespace mdu::lidar;

namespace {
  // 4x4 m tile, 1 m cells: ground everywhere except the building block in
  // the north east, a tree in the south west.
  PointCloud tile() {
    PointCloud points;
    for (int row = 0; row < 4; ++row) {
      for (int col = 0; col < 4; ++col) {
        double x = col + 0.5, y = row + 0.5;
        if (col >= 2 && row >= 2) {
          points.push_back({x, y, 112, BUILDING});
          points.push_back({x + 0.1, y, 111, BUILDING});
        } else {
          points.push_back({x, y, 100 + 0.1 * col, GROUND});
          points.push_back({x + 0.1, y, 100.5 + 0.1 * col, GROUND});
        }
      }
    }
    points.push_back({0.5, 0.5, 106, HIGH_VEGETATION});
    points.push_back({0.6, 0.6, 104, MEDIUM_VEGETATION});
    // noise with an unknown code and a point outside the tile
    points.push_back({1.5, 1.5, 150, 7});
    points.push_back({20, 20, 100, GROUND});
    return points;
  }
}  // namespace

TEST_CASE("lidar pipeline") {
  auto r = process(tile(), BoundingBox(0, 0, 4, 4), LidarConfig(), 2154);

  REQUIRE(r.geometry.dim_x == 4);
  REQUIRE(r.geometry.dim_y == 4);
  CHECK(r.epsg() == 2154);

  SECTION("terrain takes the lowest ground return") {
    CHECK(r.dtm.get(0, 0) == 100.);
    CHECK(r.dtm.get(1, 1) == Approx(100.1));
    CHECK(r.dtm.is_nodata(3, 3));
  }

  SECTION("surface takes the highest building return") {
    CHECK(r.dsm.get(3, 3) == 112.);
    CHECK(r.dsm.get(0, 0) == 100.);
  }

  SECTION("canopy height relative to the terrain") {
    CHECK(r.chm.get(0, 0) == 6.);
    CHECK(r.chm.is_nodata(1, 0));
  }

  SECTION("unknown codes do not reach the rasters") {
    CHECK(r.dsm.get(1, 1) < 150.);
  }
}

TEST_CASE("lidar pipeline options") {
  LidarConfig cfg;

  SECTION("terrain with max aggregation") {
    cfg.terrain_aggregation = MAX;
    auto r = process(tile(), BoundingBox(0, 0, 4, 4), cfg);
    CHECK(r.dtm.get(0, 0) == 100.5);
  }

  SECTION("class filter drops vegetation") {
    cfg.class_filter = std::vector<int>{GROUND, BUILDING};
    auto processor = createLidarProcessor();
    processor->compute(tile(), BoundingBox(0, 0, 4, 4), cfg);
    CHECK(processor->rasters.chm.nodata_count() == 16);
    CHECK(processor->used_points == 32);
  }

  SECTION("unknown codes are used when selected") {
    cfg.class_filter = std::vector<int>{GROUND, BUILDING, 7};
    cfg.building_class = 7;
    auto r = process(tile(), BoundingBox(0, 0, 4, 4), cfg);
    CHECK(r.dsm.get(1, 1) == 150.);
  }

  SECTION("gap filling") {
    cfg.fill_dtm_gaps = true;
    auto r = process(tile(), BoundingBox(0, 0, 4, 4), cfg);
    // (3,3) only sees building cells in its 3x3 window
    CHECK(r.dtm.is_nodata(3, 3));
    CHECK(r.dtm.get(2, 2) == Approx(100.1));
  }

  SECTION("coarser cells") {
    cfg.resolution = 2;
    auto r = process(tile(), BoundingBox(0, 0, 4, 4), cfg);
    CHECK(r.geometry.dim_x == 2);
    CHECK(r.dtm.get(0, 0) == 100.);
    CHECK(r.dsm.get(1, 1) == 112.);
  }
}

TEST_CASE("lidar pipeline edge cases") {
  SECTION("no points") {
    auto r = process(PointCloud(), BoundingBox(0, 0, 4, 4));
    CHECK(r.dsm.nodata_count() == 16);
    CHECK(r.dtm.nodata_count() == 16);
    CHECK(r.chm.nodata_count() == 16);
  }

  SECTION("stray points are discarded") {
    auto points = tile();
    points.push_back({1e20, 1, 7, GROUND});
    points.push_back({-1e20, -1e20, 7, BUILDING});
    points.push_back(
        {std::numeric_limits<double>::quiet_NaN(), 1, 7, GROUND});
    auto clean = process(tile(), BoundingBox(0, 0, 4, 4));
    auto r = process(points, BoundingBox(0, 0, 4, 4));
    CHECK(r.dsm.values() == clean.dsm.values());
    CHECK(r.dtm.values() == clean.dtm.values());
    CHECK(r.chm.values() == clean.chm.values());
  }

  SECTION("invalid parameters") {
    LidarConfig cfg;
    cfg.resolution = 0;
    CHECK_THROWS_AS(process(tile(), BoundingBox(0, 0, 4, 4), cfg),
                    InvalidResolution);
    CHECK_THROWS_AS(process(tile(), BoundingBox(4, 0, 0, 4)),
                    InvalidBoundingBox);
    LidarConfig cfg2;
    cfg2.fill_window = 0;
    CHECK_THROWS_AS(process(tile(), BoundingBox(0, 0, 4, 4), cfg2),
                    InvalidConfiguration);
  }
}
