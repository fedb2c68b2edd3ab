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
#include <mdu/lidar/PointGridIndex.hpp>

#include <algorithm>
#include <catch2/catch_test_macros.hpp>
#include <limits>

using namespace mdu;
using namespace mdu::lidar;

TEST_CASE("point grid index clip") {
  PointCloud points;
  for (int i = 0; i < 100; ++i) {
    points.push_back({double(i % 10), double(i / 10), double(i), 2});
  }
  PointGridIndex index(points, 3);

  CHECK(index.point_count() == 100);
  CHECK(index.cell_count() == 16);
  CHECK(index.max_points_per_cell() == 9);

  SECTION("closed box, input order") {
    auto clipped = index.clip({2, 2, 4, 3});
    REQUIRE(clipped.size() == 6);
    CHECK(clipped[0] == points[22]);
    CHECK(clipped[1] == points[23]);
    CHECK(clipped[2] == points[24]);
    CHECK(clipped[3] == points[32]);
    CHECK(clipped[5] == points[34]);
  }

  SECTION("query returns ascending candidates") {
    auto ids = index.query({2, 2, 4, 3});
    REQUIRE(ids.size() >= 6);
    CHECK(std::is_sorted(ids.begin(), ids.end()));
  }

  SECTION("box larger than the cloud") {
    CHECK(index.clip({-100, -100, 100, 100}).size() == 100);
  }

  SECTION("box outside the cloud") {
    CHECK(index.clip({50, 50, 60, 60}).empty());
    CHECK(index.query({-60, -60, -50, -50}).empty());
  }
}

TEST_CASE("point grid index edge cases") {
  PointCloud empty;
  PointGridIndex index(empty, 1);
  CHECK(index.cell_count() == 0);
  CHECK(index.clip({0, 0, 1, 1}).empty());

  CHECK_THROWS_AS(PointGridIndex(empty, 0), InvalidResolution);
  CHECK_THROWS_AS(PointGridIndex(empty, -2), InvalidResolution);
}

TEST_CASE("point grid index with stray points") {
  const double nan = std::numeric_limits<double>::quiet_NaN();
  const double inf = std::numeric_limits<double>::infinity();
  PointCloud points{{1, 1, 50, 2}, {1e20, 1, 7, 2}, {-1e20, -1e20, 3, 2},
                    {nan, 2, 4, 2}, {2, 2, 5, 2},   {1, inf, 6, 2}};
  PointGridIndex index(points, 1);

  CHECK(index.point_count() == 6);

  auto clipped = index.clip({0, 0, 10, 10});
  REQUIRE(clipped.size() == 2);
  CHECK(clipped[0] == points[0]);
  CHECK(clipped[1] == points[4]);

  // far away boxes still find the stray points
  CHECK(index.clip({1e19, 0, 1e21, 10}).size() == 1);
  CHECK(index.clip({-1e21, -1e21, -1e19, -1e19}).size() == 1);
  CHECK(index.clip({-1e30, -1e30, 1e30, 1e30}).size() == 4);

  CHECK(index.query({nan, 0, 10, 10}).empty());
}
