// Copyright 2026 The trustpin Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

// FilePath is a container for pathnames stored in a platform's native string
// type. Only POSIX paths are supported: the separator is '/' and the string
// type is std::string.
//
// FilePath objects are intended to be used anywhere paths are needed.
// Passing pathnames around as std::string is discouraged because it makes it
// too easy to confuse a path with some other string.

#ifndef BASE_FILES_FILE_PATH_H_
#define BASE_FILES_FILE_PATH_H_

#include <stddef.h>

#include <iosfwd>
#include <string>
#include <string_view>

#include "base/base_export.h"

namespace base {

class BASE_EXPORT FilePath {
 public:
  using StringType = std::string;
  using CharType = StringType::value_type;

  static constexpr CharType kSeparators[] = "/";
  static constexpr CharType kExtensionSeparator = '.';

  FilePath();
  FilePath(const FilePath& that);
  explicit FilePath(std::string_view path);
  ~FilePath();
  FilePath& operator=(const FilePath& that);

  bool operator==(const FilePath& that) const { return path_ == that.path_; }
  bool operator!=(const FilePath& that) const { return path_ != that.path_; }
  bool operator<(const FilePath& that) const { return path_ < that.path_; }

  const StringType& value() const { return path_; }

  bool empty() const { return path_.empty(); }

  // Returns a FilePath corresponding to the directory containing the path
  // named by this object, stripping away the file component.
  FilePath DirName() const;

  // Returns a FilePath corresponding to the last path component of this
  // object, either a file or a directory.
  FilePath BaseName() const;

  // Returns the final extension of the last path component, including the
  // leading '.', or an empty string if there is none. "foo.tar.gz" yields
  // ".gz"; ".bashrc" yields "".
  StringType FinalExtension() const;

  // Returns a FilePath by appending a separator and |component|. |component|
  // must be a relative path.
  FilePath Append(std::string_view component) const;
  FilePath Append(const FilePath& component) const;

  // Removes trailing separators, except the one for the root directory.
  FilePath StripTrailingSeparators() const;

 private:
  void StripTrailingSeparatorsInternal();

  StringType path_;
};

BASE_EXPORT std::ostream& operator<<(std::ostream& out,
                                     const FilePath& file_path);

}  // namespace base

#endif  // BASE_FILES_FILE_PATH_H_
