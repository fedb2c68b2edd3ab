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
#include <concepts>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <functional>
#include <mdu/common/box.hpp>
#include <optional>
#include <string>
#include <vector>

namespace mdu::validators {

  // A validator returns an error message, or std::nullopt when the value is
  // acceptable.
  template <typename T>
  using Validator = std::function<std::optional<std::string>(const T&)>;

  template <typename T>
  concept Comparable = requires(T a, T b) {
    { a < b } -> std::convertible_to<bool>;
    { a > b } -> std::convertible_to<bool>;
  };

  template <typename T>
    requires Comparable<T>
  auto InRange(T min, T max) {
    return [min, max](const T& val) -> std::optional<std::string> {
      if (!(val >= min && val <= max)) {
        return fmt::format("Value {} is out of range <{}, {}>.", val, min, max);
      }
      return std::nullopt;
    };
  };

  // Also rejects NaN.
  template <typename T>
    requires Comparable<T>
  auto HigherThan(T min) {
    return [min](const T& val) -> std::optional<std::string> {
      if (!(val > min)) {
        return fmt::format("Value must be higher than {}. But is {}.", min,
                           val);
      }
      return std::nullopt;
    };
  };

  template <typename T>
    requires Comparable<T>
  auto HigherOrEqualTo(T min) {
    return [min](const T& val) -> std::optional<std::string> {
      if (!(val >= min)) {
        return fmt::format(
            "Value must be higher than or equal to {}. But is {}.", min, val);
      }
      return std::nullopt;
    };
  };

  template <typename T>
  auto OneOf(std::vector<T> values) {
    return [values](const T& val) -> std::optional<std::string> {
      if (std::find(values.begin(), values.end(), val) == values.end()) {
        return fmt::format("Value {} is not one of the allowed values {}.",
                           val, values);
      }
      return std::nullopt;
    };
  };

  inline std::optional<std::string> ValidBox(const BoundingBox& box) {
    if (!box.is_valid()) {
      return fmt::format(
          "Box ({}, {}, {}, {}) is invalid, it must satisfy min_x < max_x and "
          "min_y < max_y.",
          box.min_x, box.min_y, box.max_x, box.max_y);
    }
    return std::nullopt;
  };

  inline std::optional<std::string> NotEmpty(const std::vector<int>& codes) {
    if (codes.empty()) return "List must not be empty.";
    return std::nullopt;
  };
}  // namespace mdu::validators
