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

#include <algorithm>
#include <array>
#include <cmath>
#include <iomanip>
#include <optional>
#include <sstream>
#include <string>

namespace mdu {

  /**
   * @brief Axis aligned 2D box given as (min_x, min_y, max_x, max_y).
   *
   * The box itself does not know its reference system, the owner (GeoCore,
   * GridGeometry) records the EPSG code next to it. A box is only usable for
   * processing when is_valid() holds, see validate_bbox() in
   * datastructures.hpp.
   */
  template <typename T>
  struct TBox2 {
    T min_x = 0, min_y = 0, max_x = 0, max_y = 0;

    TBox2() = default;
    TBox2(T minx, T miny, T maxx, T maxy)
        : min_x(minx), min_y(miny), max_x(maxx), max_y(maxy){};

    T size_x() const { return max_x - min_x; };
    T size_y() const { return max_y - min_y; };
    std::array<T, 2> min() const { return {min_x, min_y}; };
    std::array<T, 2> max() const { return {max_x, max_y}; };
    std::array<T, 2> center() const {
      return {(max_x + min_x) / 2, (max_y + min_y) / 2};
    };

    bool is_valid() const {
      return std::isfinite(min_x) && std::isfinite(min_y) &&
             std::isfinite(max_x) && std::isfinite(max_y) && min_x < max_x &&
             min_y < max_y;
    };

    // closed interval on all sides
    bool contains(T x, T y) const {
      return x >= min_x && x <= max_x && y >= min_y && y <= max_y;
    };

    bool intersects(const TBox2& other) const {
      return (min_x < other.max_x) && (max_x > other.min_x) &&
             (min_y < other.max_y) && (max_y > other.min_y);
    };

    std::optional<TBox2> intersect(const TBox2& other) const {
      TBox2 result(std::max(min_x, other.min_x), std::max(min_y, other.min_y),
                   std::min(max_x, other.max_x), std::min(max_y, other.max_y));
      if (result.min_x >= result.max_x || result.min_y >= result.max_y) {
        return std::nullopt;
      }
      return result;
    };

    void add(T x, T y) {
      min_x = std::min(x, min_x);
      min_y = std::min(y, min_y);
      max_x = std::max(x, max_x);
      max_y = std::max(y, max_y);
    };

    bool operator==(const TBox2& other) const {
      return min_x == other.min_x && min_y == other.min_y &&
             max_x == other.max_x && max_y == other.max_y;
    };

    std::string wkt() const {
      std::ostringstream oss;
      oss << std::fixed << std::setprecision(2);
      oss << "POLYGON((";
      oss << min_x << " " << min_y << ", ";
      oss << max_x << " " << min_y << ", ";
      oss << max_x << " " << max_y << ", ";
      oss << min_x << " " << max_y << ", ";
      oss << min_x << " " << min_y;
      oss << "))";
      return oss.str();
    }
  };

  typedef TBox2<double> BoundingBox;
}  // namespace mdu
