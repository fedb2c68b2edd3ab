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

#include <mdu/building/HeightResolver.hpp>
#include <mdu/common/datastructures.hpp>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>
#include <cmath>

using Catch::Approx;
using namespace mdu;
using namespace mdu::building;

namespace {
  // axis aligned rectangle footprint with the given area
  LinearRing square(double x0, double area) {
    double s = std::sqrt(area);
    return LinearRing{{x0, 0, 0}, {x0 + s, 0, 0}, {x0 + s, s, 0}, {x0, s, 0}};
  }

  BuildingFeature feature(double x0, double area, BuildingAttributes attrs) {
    return BuildingFeature(square(x0, area), std::move(attrs));
  }

  BuildingAttributes with_height(double h, std::string district = "") {
    BuildingAttributes a;
    a.height = h;
    if (!district.empty()) a.district = district;
    return a;
  }

  BuildingAttributes in_district(std::string district) {
    BuildingAttributes a;
    a.district = district;
    return a;
  }
}  // namespace

TEST_CASE("explicit height wins") {
  BuildingCollection c;
  BuildingAttributes a;
  a.height = 12.;
  a.storeys = 5;
  a.alt_height = 20.;
  c.add(feature(0, 100, a));

  auto report = resolve_heights(c);
  REQUIRE(c[0].height.has_value());
  CHECK(*c[0].height == 12.);
  CHECK(report.sources[0] == HeightSource::EXPLICIT);
}

TEST_CASE("storey count times the storey height") {
  BuildingCollection c;
  BuildingAttributes a;
  a.storeys = 3;
  a.alt_height = 20.;
  c.add(feature(0, 100, a));

  auto report = resolve_heights(c);
  REQUIRE(c[0].height.has_value());
  CHECK(*c[0].height == Approx(9.));
  CHECK(report.sources[0] == HeightSource::STOREYS);
  CHECK(report.count(HeightSource::STOREYS) == 1);

  SECTION("custom storey height") {
    BuildingCollection c2(GeoCore(), 2.5);
    c2.add(feature(0, 100, a));
    resolve_heights(c2);
    CHECK(*c2[0].height == Approx(7.5));
  }
}

TEST_CASE("invalid values fall through to the next source") {
  BuildingCollection c;
  BuildingAttributes a;
  a.height = 0.;
  a.storeys = -2;
  a.alt_height = 14.;
  c.add(feature(0, 100, a));

  BuildingAttributes b;
  b.height = std::nan("");
  b.storeys = 2;
  c.add(feature(20, 100, b));

  auto report = resolve_heights(c);
  CHECK(*c[0].height == 14.);
  CHECK(report.sources[0] == HeightSource::ALTERNATE);
  CHECK(*c[1].height == Approx(6.));
  CHECK(report.sources[1] == HeightSource::STOREYS);
}

TEST_CASE("area weighted district mean") {
  BuildingCollection c;
  c.add(feature(0, 100, with_height(10, "A")));
  c.add(feature(20, 200, with_height(20, "A")));
  c.add(feature(40, 300, with_height(30, "A")));
  c.add(feature(60, 50, in_district("A")));
  // other district, must not contribute
  c.add(feature(80, 1000, with_height(100, "B")));

  auto report = resolve_heights(c);
  REQUIRE(c[3].height.has_value());
  CHECK(*c[3].height == Approx(23.3333).epsilon(1e-4));
  CHECK(report.sources[3] == HeightSource::DISTRICT_MEAN);
  CHECK(report.count(HeightSource::EXPLICIT) == 4);
  CHECK(report.count(HeightSource::DISTRICT_MEAN) == 1);
  CHECK(report.resolved() == 5);
}

TEST_CASE("district mean only uses heights from the attributes") {
  BuildingCollection c;
  c.add(feature(0, 100, with_height(10, "A")));
  c.add(feature(20, 100, in_district("A")));
  c.add(feature(40, 900, in_district("A")));

  resolve_heights(c);
  // the second feature's fallback height does not feed the third
  CHECK(*c[1].height == Approx(10.));
  CHECK(*c[2].height == Approx(10.));
}

TEST_CASE("unresolved heights stay empty") {
  BuildingCollection c;
  // no attributes at all
  c.add(feature(0, 100, {}));
  // district without any known height
  c.add(feature(20, 100, in_district("Z")));
  // district neighbour without area
  BuildingFeature flat(LinearRing{{0, 0, 0}, {1, 0, 0}, {2, 0, 0}},
                       with_height(10, "Y"));
  c.add(flat);
  c.add(feature(40, 100, in_district("Y")));

  auto report = resolve_heights(c);
  CHECK_FALSE(c[0].height.has_value());
  CHECK_FALSE(c[1].height.has_value());
  CHECK(*c[2].height == 10.);
  CHECK_FALSE(c[3].height.has_value());
  CHECK(report.count(HeightSource::UNRESOLVED) == 3);
  CHECK(report.resolved() == 1);
  CHECK(c.unresolved_indices() == vec1ui{0, 1, 3});
}

TEST_CASE("resolution is idempotent") {
  BuildingCollection c;
  c.add(feature(0, 100, with_height(10, "A")));
  BuildingAttributes s;
  s.storeys = 4;
  s.district = "A";
  c.add(feature(20, 300, s));
  c.add(feature(40, 100, in_district("A")));
  c.add(feature(60, 100, {}));

  resolve_heights(c);
  std::vector<std::optional<double>> first;
  for (auto& f : c) first.push_back(f.height);

  auto report = resolve_heights(c);
  for (size_t i = 0; i < c.size(); ++i) {
    CHECK(c[i].height == first[i]);
  }
  CHECK(report.count(HeightSource::PRESET) == 3);
  CHECK(report.count(HeightSource::UNRESOLVED) == 1);
}

TEST_CASE("present heights are not touched") {
  BuildingCollection c;
  auto f = feature(0, 100, with_height(10));
  f.height = 42.;
  c.add(f);
  auto report = resolve_heights(c);
  CHECK(*c[0].height == 42.);
  CHECK(report.sources[0] == HeightSource::PRESET);
  // only the height field is written
  CHECK(*c[0].attributes.height == 10.);
}

TEST_CASE("unusable present heights are replaced or cleared") {
  BuildingCollection c;
  auto negative = feature(0, 100, {});
  negative.height = -1.;
  c.add(negative);
  auto zero = feature(20, 100, {});
  zero.height = 0.;
  c.add(zero);
  auto replaced = feature(40, 100, with_height(8));
  replaced.height = -3.;
  c.add(replaced);

  auto report = resolve_heights(c);
  CHECK_FALSE(c[0].height.has_value());
  CHECK_FALSE(c[1].height.has_value());
  REQUIRE(c[2].height.has_value());
  CHECK(*c[2].height == 8.);
  CHECK(report.sources[0] == HeightSource::UNRESOLVED);
  CHECK(report.sources[2] == HeightSource::EXPLICIT);
  CHECK(c.unresolved_indices() == vec1ui{0, 1});
}

TEST_CASE("empty collection") {
  BuildingCollection c;
  auto report = resolve_heights(c);
  CHECK(report.sources.empty());
  CHECK(report.resolved() == 0);
}

TEST_CASE("height source names") {
  CHECK(std::string(to_string(HeightSource::DISTRICT_MEAN)) ==
        "district_mean");
  CHECK(std::string(to_string(HeightSource::UNRESOLVED)) == "unresolved");
}
