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

#include <ogr_spatialref.h>

#include <cmath>
#include <mdu/common/datastructures.hpp>
#include <mdu/logger/logger.h>
#include <mdu/misc/Reprojector.hpp>

#include "../io/SpatialReferenceSystemOGR.hpp"

namespace mdu::misc {

  struct OCTDeleter {
    void operator()(OGRCoordinateTransformation* t) const {
      OGRCoordinateTransformation::DestroyCT(t);
    }
  };

  class ReprojectorOGR : public ReprojectorInterface {
    std::string from_crs_;
    std::string to_crs_;
    io::SpatialReferenceSystemOGR from_srs_;
    io::SpatialReferenceSystemOGR to_srs_;
    std::unique_ptr<OGRCoordinateTransformation, OCTDeleter> transformation_;

    static std::string describe(const io::SpatialReferenceSystemOGR& srs,
                                const std::string& user_input) {
      auto name = srs.get_auth_name();
      auto code = srs.get_auth_code();
      if (!name.empty() && !code.empty()) return name + ":" + code;
      return user_input;
    }

    // Transform n coordinates in place, throws when any of them fails.
    void transform_n(std::vector<double>& xs, std::vector<double>& ys) const {
      if (xs.empty()) return;
      std::vector<int> success(xs.size(), 0);
      bool ok = transformation_->Transform(xs.size(), xs.data(), ys.data(),
                                           nullptr, success.data());
      for (size_t i = 0; i < xs.size(); ++i) {
        if (!ok || !success[i] || !std::isfinite(xs[i]) ||
            !std::isfinite(ys[i])) {
          throw ReprojectionError(
              fmt::format("could not transform coordinate #{} from {} to {}",
                          i, from_crs_, to_crs_));
        }
      }
    }

   public:
    ReprojectorOGR(const std::string& from_crs, const std::string& to_crs)
        : from_crs_(from_crs), to_crs_(to_crs) {
      from_srs_.import(from_crs);
      if (!from_srs_.is_valid()) {
        throw ReprojectionError(
            fmt::format("unsupported source CRS '{}'", from_crs));
      }
      to_srs_.import(to_crs);
      if (!to_srs_.is_valid()) {
        throw ReprojectionError(
            fmt::format("unsupported target CRS '{}'", to_crs));
      }
      from_crs_ = describe(from_srs_, from_crs);
      to_crs_ = describe(to_srs_, to_crs);

      transformation_.reset(
          OGRCreateCoordinateTransformation(&from_srs_.srs, &to_srs_.srs));
      if (!transformation_) {
        throw ReprojectionError(fmt::format(
            "no coordinate transformation from {} to {}", from_crs_, to_crs_));
      }
      logger::Logger::get_logger().debug("Created transformation {} -> {}",
                                         from_crs_, to_crs_);
    }

    std::string source_crs() const override { return from_crs_; }
    std::string target_crs() const override { return to_crs_; }

    arr2d transform(double x, double y) const override {
      std::vector<double> xs{x}, ys{y};
      transform_n(xs, ys);
      return {xs[0], ys[0]};
    }

    void reproject(PointCloud& points) const override {
      std::vector<double> xs, ys;
      xs.reserve(points.size());
      ys.reserve(points.size());
      for (auto& p : points) {
        xs.push_back(p.x);
        ys.push_back(p.y);
      }
      transform_n(xs, ys);
      for (size_t i = 0; i < points.size(); ++i) {
        points[i].x = xs[i];
        points[i].y = ys[i];
      }
    }

    void reproject(LinearRing& ring) const override {
      // all rings are gathered in one batch so that a failure in a hole
      // leaves the exterior untouched as well
      std::vector<double> xs, ys;
      xs.reserve(ring.vertex_count());
      ys.reserve(ring.vertex_count());
      auto gather = [&](const vec3d& r) {
        for (auto& p : r) {
          xs.push_back(p[0]);
          ys.push_back(p[1]);
        }
      };
      gather(ring);
      for (auto& iring : ring.interior_rings()) gather(iring);

      transform_n(xs, ys);

      size_t i = 0;
      auto scatter = [&](vec3d& r) {
        for (auto& p : r) {
          p[0] = xs[i];
          p[1] = ys[i];
          ++i;
        }
      };
      scatter(ring);
      for (auto& iring : ring.interior_rings()) scatter(iring);
    }

    BoundingBox reproject(const BoundingBox& box) const override {
      std::vector<double> xs{box.min_x, box.max_x, box.max_x, box.min_x};
      std::vector<double> ys{box.min_y, box.min_y, box.max_y, box.max_y};
      transform_n(xs, ys);
      BoundingBox result(xs[0], ys[0], xs[0], ys[0]);
      for (size_t i = 1; i < 4; ++i) {
        result.add(xs[i], ys[i]);
      }
      return result;
    }

    std::unique_ptr<ReprojectorInterface> inverse() const override {
      return std::make_unique<ReprojectorOGR>(to_crs_, from_crs_);
    }
  };

  std::unique_ptr<ReprojectorInterface> createReprojectorOGR(
      const std::string& from_crs, const std::string& to_crs) {
    return std::make_unique<ReprojectorOGR>(from_crs, to_crs);
  }

  std::unique_ptr<ReprojectorInterface> createReprojectorOGR(int from_epsg,
                                                             int to_epsg) {
    return std::make_unique<ReprojectorOGR>(io::epsg_string(from_epsg),
                                            io::epsg_string(to_epsg));
  }

}  // namespace mdu::misc
