// Copyright 2012 The Chromium Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "base/location.h"

namespace base {

Location::Location() = default;
Location::Location(const Location& other) = default;

Location::Location(const char* function_name,
                   const char* file_name,
                   int line_number)
    : function_name_(function_name),
      file_name_(file_name),
      line_number_(line_number) {}

std::string Location::ToString() const {
  if (!has_source_info())
    return "unknown";
  return std::string(function_name_) + "@" + file_name_ + ":" +
         std::to_string(line_number_);
}

}  // namespace base
