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

#include <cmath>
#include <mdu/building/HeightResolver.hpp>
#include <mdu/common/datastructures.hpp>
#include <mdu/logger/logger.h>
#include <unordered_map>

namespace mdu::building {

  const char* to_string(HeightSource source) {
    switch (source) {
      case HeightSource::PRESET:
        return "preset";
      case HeightSource::EXPLICIT:
        return "explicit";
      case HeightSource::STOREYS:
        return "storeys";
      case HeightSource::ALTERNATE:
        return "alternate";
      case HeightSource::DISTRICT_MEAN:
        return "district_mean";
      case HeightSource::UNRESOLVED:
        return "unresolved";
    }
    return "unknown";
  }

  size_t HeightResolutionReport::count(HeightSource source) const {
    auto it = counts.find(source);
    return it == counts.end() ? 0 : it->second;
  }

  size_t HeightResolutionReport::resolved() const {
    return sources.size() - count(HeightSource::UNRESOLVED);
  }

  namespace {
    bool usable(const std::optional<double>& v) {
      return v.has_value() && std::isfinite(*v) && *v > 0;
    }
  }  // namespace

  class HeightResolver : public HeightResolverInterface {
   public:
    void compute(BuildingCollection& collection) override {
      const double storey_height = collection.default_storey_height();
      if (!std::isfinite(storey_height) || storey_height <= 0) {
        throw InvalidConfiguration(fmt::format(
            "default storey height must be a positive number, got {}",
            storey_height));
      }

      const size_t n = collection.size();
      std::vector<std::optional<double>> heights(n);
      std::vector<HeightSource> sources(n, HeightSource::UNRESOLVED);

      // attribute based heights
      for (size_t i = 0; i < n; ++i) {
        auto& f = collection[i];
        auto& attrs = f.attributes;
        if (f.has_height()) {
          heights[i] = f.height;
          sources[i] = HeightSource::PRESET;
        } else if (usable(attrs.height)) {
          heights[i] = attrs.height;
          sources[i] = HeightSource::EXPLICIT;
        } else if (usable(attrs.storeys)) {
          heights[i] = *attrs.storeys * storey_height;
          sources[i] = HeightSource::STOREYS;
        } else if (usable(attrs.alt_height)) {
          heights[i] = attrs.alt_height;
          sources[i] = HeightSource::ALTERNATE;
        }
      }

      // per district sums over the heights found so far
      struct DistrictSum {
        double weighted = 0;
        double weight = 0;
      };
      std::unordered_map<std::string, DistrictSum> districts;
      for (size_t i = 0; i < n; ++i) {
        auto& district = collection[i].attributes.district;
        if (!heights[i].has_value() || !district.has_value()) continue;
        double a = collection[i].area();
        auto& sum = districts[*district];
        sum.weighted += a * *heights[i];
        sum.weight += a;
      }

      // district fallback, a feature without height never contributed to its
      // own district sum
      for (size_t i = 0; i < n; ++i) {
        if (heights[i].has_value()) continue;
        auto& district = collection[i].attributes.district;
        if (!district.has_value()) continue;
        auto it = districts.find(*district);
        if (it == districts.end() || it->second.weight <= 0) continue;
        heights[i] = it->second.weighted / it->second.weight;
        sources[i] = HeightSource::DISTRICT_MEAN;
      }

      for (size_t i = 0; i < n; ++i) {
        if (sources[i] == HeightSource::UNRESOLVED) {
          // drops an unusable preset such as 0 or a negative height
          collection[i].height.reset();
        } else if (sources[i] != HeightSource::PRESET) {
          collection[i].height = heights[i];
        }
      }

      report = HeightResolutionReport();
      report.sources = std::move(sources);
      for (auto s : report.sources) {
        ++report.counts[s];
      }

      auto& logger = logger::Logger::get_logger();
      logger.info(
          "Resolved {} of {} building heights (preset {}, explicit {}, "
          "storeys {}, alternate {}, district mean {})",
          report.resolved(), n, report.count(HeightSource::PRESET),
          report.count(HeightSource::EXPLICIT),
          report.count(HeightSource::STOREYS),
          report.count(HeightSource::ALTERNATE),
          report.count(HeightSource::DISTRICT_MEAN));
      if (auto unresolved = report.count(HeightSource::UNRESOLVED)) {
        logger.warning("{} buildings have no height", unresolved);
      }
      logger.trace("resolve_heights", report.resolved());
    }
  };

  std::unique_ptr<HeightResolverInterface> createHeightResolver() {
    return std::make_unique<HeightResolver>();
  }

  HeightResolutionReport resolve_heights(BuildingCollection& collection) {
    auto resolver = createHeightResolver();
    resolver->compute(collection);
    return std::move(resolver->report);
  }

}  // namespace mdu::building
