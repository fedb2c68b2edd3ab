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

#include <exception>
#include <mdu/common/common.hpp>
#include <string>

namespace mdu {

  class mduException : public std::exception {
   public:
    explicit mduException(const std::string& message)
        : msg_("Error: " + message) {}
    virtual const char* what() const throw() { return msg_.c_str(); }

   protected:
    std::string msg_;
  };

  // Configuration mistakes. These are raised before any processing starts.
  class InvalidBoundingBox : public mduException {
   public:
    using mduException::mduException;
  };
  class InvalidResolution : public mduException {
   public:
    using mduException::mduException;
  };
  class InvalidConfiguration : public mduException {
   public:
    using mduException::mduException;
  };
  class ReprojectionError : public mduException {
   public:
    using mduException::mduException;
  };
  // Raised when rasters that should share one grid do not.
  class GridMismatch : public mduException {
   public:
    using mduException::mduException;
  };

  // Throw InvalidBoundingBox unless min < max on both axes.
  void validate_bbox(const BoundingBox& bbox);
  // Throw InvalidResolution unless resolution is finite and > 0.
  void validate_resolution(double resolution);

}  // namespace mdu
