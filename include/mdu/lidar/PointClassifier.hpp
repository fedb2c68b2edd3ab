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
#include <map>
#include <mdu/common/common.hpp>
#include <vector>

namespace mdu::lidar {

  // ASPRS classification codes with a meaning in the pipeline.
  enum ClassCode : int {
    GROUND = 2,
    LOW_VEGETATION = 3,
    MEDIUM_VEGETATION = 4,
    HIGH_VEGETATION = 5,
    BUILDING = 6,
    WATER = 9,
  };

  constexpr std::array<int, 6> well_known_classes = {
      GROUND, LOW_VEGETATION, MEDIUM_VEGETATION,
      HIGH_VEGETATION, BUILDING, WATER};

  bool is_well_known(int code);

  // {3, 4, 5}
  std::vector<int> vegetation_classes();

  /**
   * @brief Points grouped by classification code.
   *
   * Every well-known code has an entry, possibly empty. Points with any other
   * code end up in `other` with their code untouched. Within each group the
   * input order is kept.
   */
  struct ClassPartition {
    std::map<int, PointCloud> known;
    PointCloud other;

    size_t total() const;
    // Points of one well-known code. Unknown codes yield an empty cloud, they
    // are only reachable through `other` or select().
    const PointCloud& at(int code) const;
    // All points whose code is in `codes`, grouped in the order of `codes`.
    // Codes that are not well-known are looked up in `other`.
    PointCloud select(const std::vector<int>& codes) const;
  };

  ClassPartition classify(const PointCloud& points);

  // Points whose code is in `codes`, in input order.
  PointCloud filter_by_class(const PointCloud& points,
                             const std::vector<int>& codes);

  std::map<int, size_t> class_histogram(const PointCloud& points);

}  // namespace mdu::lidar
