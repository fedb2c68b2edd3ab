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
#include <iterator>
#include <mdu/lidar/PointClassifier.hpp>
#include <mdu/logger/logger.h>

namespace mdu::lidar {

  bool is_well_known(int code) {
    return std::find(well_known_classes.begin(), well_known_classes.end(),
                     code) != well_known_classes.end();
  }

  std::vector<int> vegetation_classes() {
    return {LOW_VEGETATION, MEDIUM_VEGETATION, HIGH_VEGETATION};
  }

  size_t ClassPartition::total() const {
    size_t n = other.size();
    for (auto& [code, pc] : known) {
      n += pc.size();
    }
    return n;
  }

  const PointCloud& ClassPartition::at(int code) const {
    static const PointCloud empty;
    auto it = known.find(code);
    if (it == known.end()) return empty;
    return it->second;
  }

  PointCloud ClassPartition::select(const std::vector<int>& codes) const {
    PointCloud result;
    for (auto code : codes) {
      if (is_well_known(code)) {
        auto& pc = at(code);
        result.insert(result.end(), pc.begin(), pc.end());
      } else {
        std::copy_if(
            other.begin(), other.end(), std::back_inserter(result),
            [code](const PointRecord& p) { return p.classification == code; });
      }
    }
    return result;
  }

  ClassPartition classify(const PointCloud& points) {
    ClassPartition partition;
    for (auto code : well_known_classes) {
      partition.known[code];
    }
    for (auto& p : points) {
      auto it = partition.known.find(p.classification);
      if (it != partition.known.end()) {
        it->second.push_back(p);
      } else {
        partition.other.push_back(p);
      }
    }

    auto& logger = logger::Logger::get_logger();
    logger.debug(
        "Classified {} points: ground {}, vegetation {}/{}/{}, building {}, "
        "water {}, other {}",
        points.size(), partition.at(GROUND).size(),
        partition.at(LOW_VEGETATION).size(),
        partition.at(MEDIUM_VEGETATION).size(),
        partition.at(HIGH_VEGETATION).size(), partition.at(BUILDING).size(),
        partition.at(WATER).size(), partition.other.size());
    return partition;
  }

  PointCloud filter_by_class(const PointCloud& points,
                             const std::vector<int>& codes) {
    PointCloud result;
    std::copy_if(points.begin(), points.end(), std::back_inserter(result),
                 [&codes](const PointRecord& p) {
                   return std::find(codes.begin(), codes.end(),
                                    p.classification) != codes.end();
                 });
    return result;
  }

  std::map<int, size_t> class_histogram(const PointCloud& points) {
    std::map<int, size_t> histogram;
    for (auto& p : points) {
      ++histogram[p.classification];
    }
    return histogram;
  }

}  // namespace mdu::lidar
