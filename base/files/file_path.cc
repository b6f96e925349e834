// Copyright 2026 The trustpin Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "base/files/file_path.h"

#include <ostream>

#include "base/logging.h"

namespace base {

namespace {

bool IsSeparator(FilePath::CharType character) {
  return character == FilePath::kSeparators[0];
}

}  // namespace

constexpr FilePath::CharType FilePath::kSeparators[];
constexpr FilePath::CharType FilePath::kExtensionSeparator;

FilePath::FilePath() = default;

FilePath::FilePath(const FilePath& that) = default;

FilePath::FilePath(std::string_view path) : path_(path) {
  StringType::size_type nul_pos = path_.find('\0');
  if (nul_pos != StringType::npos)
    path_.erase(nul_pos, StringType::npos);
}

FilePath::~FilePath() = default;

FilePath& FilePath::operator=(const FilePath& that) = default;

FilePath FilePath::DirName() const {
  FilePath new_path(path_);
  new_path.StripTrailingSeparatorsInternal();

  StringType::size_type last_separator = new_path.path_.rfind(kSeparators[0]);
  if (last_separator == StringType::npos) {
    // path_ is in the current directory.
    new_path.path_ = ".";
  } else if (last_separator == 0) {
    // path_ is in the root directory.
    new_path.path_.resize(1);
  } else {
    // path_ is somewhere else, trim the basename.
    new_path.path_.resize(last_separator);
  }

  new_path.StripTrailingSeparatorsInternal();
  if (new_path.path_.empty())
    new_path.path_ = ".";

  return new_path;
}

FilePath FilePath::BaseName() const {
  FilePath new_path(path_);
  new_path.StripTrailingSeparatorsInternal();

  StringType::size_type last_separator = new_path.path_.rfind(kSeparators[0]);
  if (last_separator != StringType::npos &&
      last_separator < new_path.path_.length() - 1) {
    new_path.path_.erase(0, last_separator + 1);
  }

  return new_path;
}

FilePath::StringType FilePath::FinalExtension() const {
  StringType base(BaseName().value());
  if (base == "." || base == "..")
    return StringType();

  StringType::size_type last_dot = base.rfind(kExtensionSeparator);
  if (last_dot == StringType::npos || last_dot == 0)
    return StringType();
  return base.substr(last_dot);
}

FilePath FilePath::Append(std::string_view component) const {
  DCHECK(component.empty() || !IsSeparator(component[0]))
      << "Append() requires a relative component: " << component;

  if (path_.empty() || path_ == ".")
    return FilePath(component);

  FilePath new_path(path_);
  new_path.StripTrailingSeparatorsInternal();
  if (!component.empty() && !new_path.path_.empty() &&
      !IsSeparator(new_path.path_.back())) {
    new_path.path_.push_back(kSeparators[0]);
  }
  new_path.path_.append(component.data(), component.size());
  return new_path;
}

FilePath FilePath::Append(const FilePath& component) const {
  return Append(std::string_view(component.value()));
}

FilePath FilePath::StripTrailingSeparators() const {
  FilePath new_path(path_);
  new_path.StripTrailingSeparatorsInternal();
  return new_path;
}

void FilePath::StripTrailingSeparatorsInternal() {
  // Keep a lone leading separator so that "/" stays the root.
  while (path_.size() > 1 && IsSeparator(path_.back()))
    path_.pop_back();
}

std::ostream& operator<<(std::ostream& out, const FilePath& file_path) {
  return out << file_path.value();
}

}  // namespace base
