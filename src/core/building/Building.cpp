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

#include <charconv>
#include <cmath>
#include <mdu/building/Building.hpp>
#include <mdu/common/datastructures.hpp>
#include <mdu/logger/logger.h>
#include <mdu/misc/Reprojector.hpp>
#include <unordered_set>

namespace mdu::building {

  namespace {
    std::optional<double> first_number(const AttributeRow& row,
                                       const std::vector<std::string>& names) {
      for (auto& name : names) {
        if (auto v = row.get_as_double(name)) return v;
      }
      return std::nullopt;
    }

    std::optional<std::string> first_string(
        const AttributeRow& row, const std::vector<std::string>& names) {
      for (auto& name : names) {
        if (auto v = row.get_as_string(name)) {
          if (!v->empty()) return v;
        }
      }
      return std::nullopt;
    }

    void check_storey_height(double h) {
      if (!std::isfinite(h) || h <= 0) {
        throw InvalidConfiguration(fmt::format(
            "default storey height must be a positive number, got {}", h));
      }
    }

    std::optional<int> epsg_code(const std::string& crs) {
      const std::string prefix = "EPSG:";
      if (crs.rfind(prefix, 0) != 0) return std::nullopt;
      int code;
      auto first = crs.data() + prefix.size();
      auto last = crs.data() + crs.size();
      auto [ptr, ec] = std::from_chars(first, last, code);
      if (ec != std::errc() || ptr != last) return std::nullopt;
      return code;
    }
  }  // namespace

  BuildingAttributes parse_attributes(const AttributeRow& row,
                                      const BuildingConfig& cfg) {
    BuildingAttributes attrs;
    attrs.height = first_number(row, cfg.height_attributes);
    attrs.storeys = first_number(row, cfg.storeys_attributes);
    attrs.alt_height = first_number(row, cfg.alt_height_attributes);
    attrs.district = first_string(row, cfg.district_attributes);

    std::unordered_set<std::string> consumed;
    for (auto* names :
         {&cfg.height_attributes, &cfg.storeys_attributes,
          &cfg.alt_height_attributes, &cfg.district_attributes}) {
      consumed.insert(names->begin(), names->end());
    }
    for (auto& [name, value] : row) {
      if (!consumed.count(name)) attrs.extra._attributes[name] = value;
    }
    return attrs;
  }

  BuildingFeature::BuildingFeature(LinearRing footprint,
                                   BuildingAttributes attributes)
      : footprint(std::move(footprint)), attributes(std::move(attributes)) {}

  double BuildingFeature::area() const { return footprint.area(); }

  std::optional<arr2d> BuildingFeature::centroid() const {
    return footprint.centroid();
  }

  bool BuildingFeature::has_height() const {
    return height.has_value() && std::isfinite(*height) && *height > 0;
  }

  BuildingCollection::BuildingCollection(GeoCore geo_core,
                                         double default_storey_height)
      : geo_core_(std::move(geo_core)) {
    set_default_storey_height(default_storey_height);
  }

  BuildingCollection BuildingCollection::from_raw_features(
      const std::vector<RawFeature>& raw, GeoCore geo_core,
      const BuildingConfig& cfg) {
    BuildingCollection collection(std::move(geo_core),
                                  cfg.default_storey_height);
    auto& logger = logger::Logger::get_logger();
    size_t skipped = 0;
    for (auto& feature : raw) {
      LinearRing footprint = feature.footprint;
      pop_back_if_equal_to_front(footprint);
      if (footprint.size() < 3) {
        ++skipped;
        continue;
      }
      collection.add(BuildingFeature(std::move(footprint),
                                     parse_attributes(feature.attributes, cfg)));
    }
    if (skipped) {
      logger.warning("Skipped {} features with a degenerate footprint",
                     skipped);
    }
    logger.debug("Created building collection with {} features",
                 collection.size());
    return collection;
  }

  void BuildingCollection::set_default_storey_height(double h) {
    check_storey_height(h);
    default_storey_height_ = h;
  }

  void BuildingCollection::add(BuildingFeature feature) {
    features_.push_back(std::move(feature));
  }

  std::optional<double> BuildingCollection::mean_height() const {
    double sum = 0, weight = 0;
    for (auto& f : features_) {
      if (!f.has_height()) continue;
      double a = f.area();
      sum += a * *f.height;
      weight += a;
    }
    if (weight <= 0) return std::nullopt;
    return sum / weight;
  }

  vec1ui BuildingCollection::resolved_indices() const {
    vec1ui ids;
    for (size_t i = 0; i < features_.size(); ++i) {
      if (features_[i].has_height()) ids.push_back(i);
    }
    return ids;
  }

  vec1ui BuildingCollection::unresolved_indices() const {
    vec1ui ids;
    for (size_t i = 0; i < features_.size(); ++i) {
      if (!features_[i].has_height()) ids.push_back(i);
    }
    return ids;
  }

  void BuildingCollection::reproject(
      const misc::ReprojectorInterface& reprojector) {
    std::vector<LinearRing> footprints;
    footprints.reserve(features_.size());
    for (auto& f : features_) {
      footprints.push_back(f.footprint);
      reprojector.reproject(footprints.back());
    }
    for (size_t i = 0; i < features_.size(); ++i) {
      features_[i].footprint = std::move(footprints[i]);
    }
    if (auto code = epsg_code(reprojector.target_crs())) {
      geo_core_.set_epsg(*code);
    }
    logger::Logger::get_logger().debug("Reprojected {} footprints to {}",
                                       features_.size(),
                                       reprojector.target_crs());
  }

}  // namespace mdu::building
