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

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <fmt/format.h>
#include <mdu/common/common.hpp>
#include <mdu/common/datastructures.hpp>

namespace mdu {

  // geometry helpers:
  template <typename T>
  double ring_signed_area(const T& ring) {
    double result = 0;
    const auto n = ring.size();
    for (size_t i = 0; i < n; ++i) {
      size_t i_n;
      if (i == (n - 1)) {
        i_n = 0;
      } else {
        i_n = i + 1;
      }

      result += ring[i][0] * ring[i_n][1] - ring[i_n][0] * ring[i][1];
    }
    return result / 2;
  }

  // first moments of a ring, used for the centroid
  template <typename T>
  arr2d ring_moments(const T& ring) {
    double cx = 0, cy = 0;
    const auto n = ring.size();
    for (size_t i = 0; i < n; ++i) {
      size_t i_n = (i == n - 1) ? 0 : i + 1;
      double cross = ring[i][0] * ring[i_n][1] - ring[i_n][0] * ring[i][1];
      cx += (ring[i][0] + ring[i_n][0]) * cross;
      cy += (ring[i][1] + ring[i_n][1]) * cross;
    }
    return {cx / 6, cy / 6};
  }

  std::optional<BoundingBox> PointCloud::box() const {
    if (empty()) return std::nullopt;
    BoundingBox box(front().x, front().y, front().x, front().y);
    for (auto& p : *this) {
      box.add(p.x, p.y);
    }
    return box;
  }

  std::vector<vec3d>& LinearRing::interior_rings() { return interior_rings_; }
  const std::vector<vec3d>& LinearRing::interior_rings() const {
    return interior_rings_;
  }

  size_t LinearRing::vertex_count() const {
    size_t cnt = size();
    for (auto& iring : interior_rings_) {
      cnt += iring.size();
    }
    return cnt;
  }

  double LinearRing::signed_area() const {
    double result = ring_signed_area(*this);
    for (auto& iring : interior_rings_) {
      // negative if iring is stored clockwise as it should
      result += ring_signed_area(iring);
    }
    return result;
  }

  double LinearRing::area() const {
    if (size() < 3) return 0;
    double result = std::abs(ring_signed_area(*this));
    for (auto& iring : interior_rings_) {
      result -= std::abs(ring_signed_area(iring));
    }
    return std::max(result, 0.);
  }

  std::optional<arr2d> LinearRing::centroid() const {
    if (size() < 3) return std::nullopt;
    // Orient every ring so that the exterior counts positive and the holes
    // negative.
    double a_ext = ring_signed_area(*this);
    double sign_ext = a_ext < 0 ? -1 : 1;
    auto m = ring_moments(*this);
    double area = std::abs(a_ext);
    double mx = sign_ext * m[0], my = sign_ext * m[1];
    for (auto& iring : interior_rings_) {
      if (iring.size() < 3) continue;
      double a_int = ring_signed_area(iring);
      double sign_int = a_int < 0 ? -1 : 1;
      auto mi = ring_moments(iring);
      area -= std::abs(a_int);
      mx -= sign_int * mi[0];
      my -= sign_int * mi[1];
    }
    if (area <= 0) return std::nullopt;
    return arr2d{mx / area, my / area};
  }

  std::optional<BoundingBox> LinearRing::box() const {
    if (empty()) return std::nullopt;
    BoundingBox box(front()[0], front()[1], front()[0], front()[1]);
    for (auto& p : *this) {
      box.add(p[0], p[1]);
    }
    return box;
  }

  AttributeRow::attrmap::iterator AttributeRow::begin() {
    return _attributes.begin();
  }
  AttributeRow::attrmap::iterator AttributeRow::end() {
    return _attributes.end();
  }
  AttributeRow::attrmap::const_iterator AttributeRow::begin() const {
    return _attributes.begin();
  }
  AttributeRow::attrmap::const_iterator AttributeRow::end() const {
    return _attributes.end();
  }
  size_t AttributeRow::size() const { return _attributes.size(); }

  void AttributeRow::set_null(const std::string& name) {
    _attributes[name] = std::monostate();
  }
  bool AttributeRow::is_null(const std::string& name) const {
    auto it = _attributes.find(name);
    if (it == _attributes.end()) return true;
    return std::holds_alternative<std::monostate>(it->second);
  }
  bool AttributeRow::has_name(const std::string& name) const {
    return _attributes.find(name) != _attributes.end();
  }

  std::optional<double> AttributeRow::get_as_double(
      const std::string& name) const {
    auto it = _attributes.find(name);
    if (it == _attributes.end()) return std::nullopt;

    std::optional<double> result;
    if (auto v = std::get_if<int>(&it->second)) {
      result = double(*v);
    } else if (auto v = std::get_if<double>(&it->second)) {
      result = *v;
    } else if (auto v = std::get_if<std::string>(&it->second)) {
      // trim surrounding whitespace, the remainder must be a number
      auto first = v->find_first_not_of(" \t");
      if (first == std::string::npos) return std::nullopt;
      auto last = v->find_last_not_of(" \t");
      double parsed;
      auto begin = v->data() + first;
      auto end = v->data() + last + 1;
      auto [ptr, ec] = std::from_chars(begin, end, parsed);
      if (ec == std::errc() && ptr == end) {
        result = parsed;
      }
    }
    if (result.has_value() && !std::isfinite(*result)) return std::nullopt;
    return result;
  }

  std::optional<std::string> AttributeRow::get_as_string(
      const std::string& name) const {
    auto it = _attributes.find(name);
    if (it == _attributes.end()) return std::nullopt;
    if (auto v = std::get_if<std::string>(&it->second)) {
      return *v;
    } else if (auto v = std::get_if<int>(&it->second)) {
      return std::to_string(*v);
    } else if (auto v = std::get_if<double>(&it->second)) {
      return fmt::format("{}", *v);
    }
    return std::nullopt;
  }

  std::vector<std::string> split_string(const std::string& s,
                                        std::string delimiter) {
    std::vector<std::string> parts;
    size_t last = 0;
    size_t next = 0;
    while ((next = s.find(delimiter, last)) != std::string::npos) {
      parts.push_back(s.substr(last, next - last));
      last = next + delimiter.size();
    }
    parts.push_back(s.substr(last));
    return parts;
  }

  std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return s;
  }

  void pop_back_if_equal_to_front(LinearRing& poly) {
    if (poly.size() > 1 && poly.front() == poly.back()) {
      poly.pop_back();
    }
    for (auto& iring : poly.interior_rings()) {
      if (iring.size() > 1 && iring.front() == iring.back()) {
        iring.pop_back();
      }
    }
  }

  void validate_bbox(const BoundingBox& bbox) {
    if (!bbox.is_valid()) {
      throw InvalidBoundingBox(fmt::format(
          "bounding box ({}, {}, {}, {}) must satisfy min_x < max_x and "
          "min_y < max_y",
          bbox.min_x, bbox.min_y, bbox.max_x, bbox.max_y));
    }
  }

  void validate_resolution(double resolution) {
    if (!std::isfinite(resolution) || resolution <= 0) {
      throw InvalidResolution(fmt::format(
          "resolution must be a positive number, got {}", resolution));
    }
  }

}  // namespace mdu
