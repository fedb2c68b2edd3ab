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

#include <mdu/GeoCore.hpp>
#include <mdu/ProcessingConfig.hpp>
#include <mdu/common/common.hpp>
#include <optional>
#include <string>
#include <vector>

namespace mdu::misc {
  struct ReprojectorInterface;
}

namespace mdu::building {

  /**
   * @brief Height related attributes of a building, each of them optional.
   * Everything else the source provided is kept in `extra`.
   */
  struct BuildingAttributes {
    std::optional<double> height;
    std::optional<double> storeys;
    std::optional<double> alt_height;
    std::optional<std::string> district;
    AttributeRow extra;
  };

  // A footprint with its raw attributes, as delivered by the data source.
  struct RawFeature {
    LinearRing footprint;
    AttributeRow attributes;
  };

  /**
   * @brief Pick the height related attributes out of a raw attribute row.
   *
   * For each attribute the configured names are tried in order and the first
   * one holding a usable value wins. Numbers stored as strings are parsed,
   * values that cannot be parsed count as absent. Attributes that are not
   * consumed end up in `extra`.
   */
  BuildingAttributes parse_attributes(const AttributeRow& row,
                                      const BuildingConfig& cfg);

  struct BuildingFeature {
    LinearRing footprint;
    BuildingAttributes attributes;
    // Resolved height, empty while unresolved.
    std::optional<double> height;

    BuildingFeature() = default;
    explicit BuildingFeature(LinearRing footprint,
                             BuildingAttributes attributes = {});

    // Footprint area with holes subtracted, in squared CRS units
    double area() const;
    std::optional<arr2d> centroid() const;
    // height is present, finite and > 0
    bool has_height() const;
  };

  /**
   * @brief Buildings of one processing run, together with their reference
   * system and the storey height used to turn storey counts into heights.
   */
  class BuildingCollection {
    GeoCore geo_core_;
    double default_storey_height_ = 3.;
    std::vector<BuildingFeature> features_;

   public:
    BuildingCollection() = default;
    // @throws InvalidConfiguration if default_storey_height is not > 0
    explicit BuildingCollection(GeoCore geo_core,
                                double default_storey_height = 3.);

    /**
     * @brief Build a collection from raw features. Features with fewer than
     * three footprint vertices are skipped with a warning.
     */
    static BuildingCollection from_raw_features(
        const std::vector<RawFeature>& raw, GeoCore geo_core,
        const BuildingConfig& cfg = BuildingConfig());

    const GeoCore& geo_core() const { return geo_core_; };
    GeoCore& geo_core() { return geo_core_; };

    double default_storey_height() const { return default_storey_height_; };
    void set_default_storey_height(double h);

    void add(BuildingFeature feature);
    size_t size() const { return features_.size(); };
    bool empty() const { return features_.empty(); };
    BuildingFeature& operator[](size_t i) { return features_[i]; };
    const BuildingFeature& operator[](size_t i) const { return features_[i]; };
    std::vector<BuildingFeature>::iterator begin() { return features_.begin(); };
    std::vector<BuildingFeature>::iterator end() { return features_.end(); };
    std::vector<BuildingFeature>::const_iterator begin() const {
      return features_.begin();
    };
    std::vector<BuildingFeature>::const_iterator end() const {
      return features_.end();
    };

    // Area weighted mean of the resolved heights, std::nullopt if there are
    // none or their total area is 0.
    std::optional<double> mean_height() const;
    vec1ui resolved_indices() const;
    vec1ui unresolved_indices() const;

    /**
     * @brief Reproject all footprints.
     *
     * Either every footprint is transformed or, when one of them fails, none
     * is and ReprojectionError is thrown. On success the output EPSG of the
     * geo core follows the target CRS when that is an EPSG code.
     */
    void reproject(const misc::ReprojectorInterface& reprojector);
  };

}  // namespace mdu::building
