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
#include <mdu/lidar/RasterSynthesizer.hpp>

#include <catch2/catch_test_macros.hpp>

using namespace mdu;
using namespace mdu::lidar;

namespace {
  struct Grids {
    GridGeometry geometry = GridGeometry::from_bbox({0, 0, 3, 1}, 1, 2154);
    RasterGrid ground{geometry};
    RasterGrid building{geometry};
    RasterGrid vegetation{geometry};
  };
}  // namespace

TEST_CASE("dsm and dtm") {
  Grids g;
  // col 0: ground and building, col 1: building only, col 2: nothing
  g.ground.set(0, 0, 10.);
  g.building.set(0, 0, 25.);
  g.building.set(1, 0, 30.);

  auto r = synthesize(g.ground, g.building, g.vegetation);

  CHECK(r.geometry == g.geometry);
  CHECK(r.epsg() == 2154);
  CHECK(r.dtm.get(0, 0) == 10.);
  CHECK(r.dtm.is_nodata(1, 0));
  CHECK(r.dsm.get(0, 0) == 25.);
  CHECK(r.dsm.get(1, 0) == 30.);
  CHECK(r.dsm.is_nodata(2, 0));
}

TEST_CASE("dsm falls back to ground") {
  Grids g;
  g.ground.set(0, 0, 10.);
  g.ground.set(1, 0, 12.);
  g.building.set(1, 0, 8.);
  auto r = synthesize(g.ground, g.building, g.vegetation);
  CHECK(r.dsm.get(0, 0) == 10.);
  // building below the terrain does not lower the surface
  CHECK(r.dsm.get(1, 0) == 12.);
}

TEST_CASE("canopy height") {
  Grids g;
  g.ground.set(0, 0, 10.);
  g.vegetation.set(0, 0, 18.5);
  g.ground.set(1, 0, 10.);
  g.vegetation.set(1, 0, 9.);
  g.vegetation.set(2, 0, 20.);

  SECTION("negative heights are clamped by default") {
    auto r = synthesize(g.ground, g.building, g.vegetation);
    CHECK(r.chm.get(0, 0) == 8.5);
    CHECK(r.chm.get(1, 0) == 0.);
    // no terrain, no canopy height
    CHECK(r.chm.is_nodata(2, 0));
  }

  SECTION("clamping can be switched off") {
    RasterSynthesizerConfig cfg;
    cfg.clamp_negative_chm = false;
    auto r = synthesize(g.ground, g.building, g.vegetation, cfg);
    CHECK(r.chm.get(1, 0) == -1.);
  }
}

TEST_CASE("dtm gap filling") {
  Grids g;
  g.ground.set(0, 0, 10.);
  g.ground.set(2, 0, 4.);
  g.vegetation.set(1, 0, 9.);
  g.building.set(1, 0, 2.);

  SECTION("off by default") {
    auto r = synthesize(g.ground, g.building, g.vegetation);
    CHECK(r.dtm.is_nodata(1, 0));
    CHECK(r.chm.is_nodata(1, 0));
    CHECK(r.filled_cells == 0);
  }

  SECTION("fills with the neighbour minimum") {
    RasterSynthesizerConfig cfg;
    cfg.fill_dtm_gaps = true;
    auto r = synthesize(g.ground, g.building, g.vegetation, cfg);
    CHECK(r.filled_cells == 1);
    CHECK(r.dtm.get(1, 0) == 4.);
    CHECK(r.chm.get(1, 0) == 5.);
    CHECK(r.dsm.get(1, 0) == 4.);
  }
}

TEST_CASE("dsm is never below dtm and chm follows dtm no-data") {
  auto geometry = GridGeometry::from_bbox({0, 0, 8, 8}, 1);
  RasterGrid ground(geometry), building(geometry), vegetation(geometry);
  for (size_t i = 0; i < geometry.cell_count(); ++i) {
    if (i % 3 != 0) ground.set(i, double(i % 7));
    if (i % 4 == 0) building.set(i, double(i % 11));
    if (i % 2 == 0) vegetation.set(i, double(i % 5) + 1);
  }

  for (bool fill : {false, true}) {
    RasterSynthesizerConfig cfg;
    cfg.fill_dtm_gaps = fill;
    auto r = synthesize(ground, building, vegetation, cfg);
    for (size_t i = 0; i < geometry.cell_count(); ++i) {
      if (!r.dsm.is_nodata(i) && !r.dtm.is_nodata(i)) {
        CHECK(r.dsm.get(i) >= r.dtm.get(i));
      }
      if (r.dtm.is_nodata(i)) {
        CHECK(r.chm.is_nodata(i));
      }
    }
  }
}

TEST_CASE("grids must share one geometry") {
  Grids g;
  RasterGrid other(GridGeometry::from_bbox({0, 0, 3, 1}, 0.5));
  CHECK_THROWS_AS(synthesize(g.ground, other, g.vegetation), GridMismatch);
  CHECK_THROWS_AS(synthesize(g.ground, g.building, other), GridMismatch);

  RasterGrid shifted(GridGeometry::from_bbox({1, 0, 4, 1}, 1, 2154));
  CHECK_THROWS_AS(synthesize(g.ground, shifted, g.vegetation), GridMismatch);
}
