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

#include <map>
#include <memory>
#include <mdu/building/Building.hpp>
#include <vector>

namespace mdu::building {

  enum class HeightSource {
    // height was already set before resolution, left untouched
    PRESET,
    EXPLICIT,
    STOREYS,
    ALTERNATE,
    DISTRICT_MEAN,
    UNRESOLVED,
  };

  const char* to_string(HeightSource source);

  struct HeightResolutionReport {
    // one entry per feature, in collection order
    std::vector<HeightSource> sources;
    std::map<HeightSource, size_t> counts;

    size_t count(HeightSource source) const;
    // features that have a height after resolution
    size_t resolved() const;
  };

  /**
   * @brief Fills in missing building heights.
   *
   * Sources are tried in order, the first that gives a height wins:
   * 1. the explicit height attribute, if finite and > 0
   * 2. storey count (finite, > 0) times the default storey height
   * 3. the alternate height attribute, if finite and > 0
   * 4. the area weighted mean height of the other buildings in the same
   *    district that got their height from 1-3 or already had one
   * 5. none, the height stays empty
   *
   * Features that already have a height are left alone, so running the
   * resolver twice gives the same heights. Only the height field is written.
   */
  struct HeightResolverInterface {
    HeightResolutionReport report;

    virtual ~HeightResolverInterface() = default;
    // @throws InvalidConfiguration if the default storey height is not > 0,
    // before any feature is modified
    virtual void compute(BuildingCollection& collection) = 0;
  };

  std::unique_ptr<HeightResolverInterface> createHeightResolver();

  HeightResolutionReport resolve_heights(BuildingCollection& collection);

}  // namespace mdu::building
