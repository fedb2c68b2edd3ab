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

#include <array>
#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

#include "box.hpp"

namespace mdu {

  typedef std::array<double, 2> arr2d;
  typedef std::array<double, 3> arr3d;
  typedef std::vector<arr2d> vec2d;
  typedef std::vector<arr3d> vec3d;

  typedef std::vector<size_t> vec1ui;
  typedef std::vector<int> vec1i;
  typedef std::vector<double> vec1d;
  typedef std::vector<std::string> vec1s;

  /**
   * @brief A single LiDAR return: position plus its ASPRS classification
   * code.
   */
  struct PointRecord {
    double x = 0;
    double y = 0;
    double z = 0;
    int classification = 0;

    bool operator==(const PointRecord& other) const {
      return x == other.x && y == other.y && z == other.z &&
             classification == other.classification;
    }
  };

  class PointCloud : public std::vector<PointRecord> {
   public:
    using std::vector<PointRecord>::vector;

    // Returns std::nullopt for an empty cloud
    std::optional<BoundingBox> box() const;
  };

  // Exterior ring of a polygon with its holes. The first vertex is not
  // repeated at the end.
  class LinearRing : public vec3d {
    std::vector<vec3d> interior_rings_;

   public:
    using vec3d::vec3d;

    std::vector<vec3d>& interior_rings();
    const std::vector<vec3d>& interior_rings() const;

    size_t vertex_count() const;
    // Signed area of the exterior ring plus the (negative) signed area of the
    // holes, positive for a counter clockwise exterior.
    double signed_area() const;
    // Exterior area minus hole areas, independent of ring orientation.
    double area() const;
    std::optional<arr2d> centroid() const;
    std::optional<BoundingBox> box() const;
  };

  // Raw attribute bag as handed over by the ingestion layer. Values that
  // were null in the source are stored as std::monostate.
  typedef std::variant<std::monostate, bool, int, double, std::string>
      AttributeValue;

  struct AttributeRow {
    using attrmap = std::unordered_map<std::string, AttributeValue>;
    attrmap _attributes;

    attrmap::iterator begin();
    attrmap::iterator end();
    attrmap::const_iterator begin() const;
    attrmap::const_iterator end() const;
    size_t size() const;

    template <typename T>
    void insert(const std::string& name, T value) {
      _attributes[name] = value;
    };
    template <typename T>
    void insert_optional(const std::string& name, std::optional<T> opt) {
      if (opt.has_value())
        _attributes[name] = opt.value();
      else
        _attributes[name] = std::monostate();
    };

    void set_null(const std::string& name);
    bool is_null(const std::string& name) const;
    bool has_name(const std::string& name) const;

    template <typename T>
    bool holds_alternative(const std::string& name) const {
      auto it = _attributes.find(name);
      if (it == _attributes.end()) return false;
      return std::holds_alternative<T>(it->second);
    };
    template <typename T>
    const T* get_if(const std::string& name) const {
      auto it = _attributes.find(name);
      if (it == _attributes.end()) return nullptr;
      return std::get_if<T>(&it->second);
    };

    // Numeric interpretation of an attribute. Strings are parsed, bools and
    // nulls are not numbers. Returns std::nullopt for absent, null,
    // unparsable and non-finite values.
    std::optional<double> get_as_double(const std::string& name) const;
    // Text interpretation of an attribute, ints and doubles are formatted.
    std::optional<std::string> get_as_string(const std::string& name) const;
  };

  std::vector<std::string> split_string(const std::string& s,
                                        std::string delimiter);
  std::string to_lower(std::string s);

  void pop_back_if_equal_to_front(LinearRing& poly);

}  // namespace mdu
