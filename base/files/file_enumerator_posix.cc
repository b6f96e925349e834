// Copyright 2026 The trustpin Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "base/files/file_enumerator.h"

#include <dirent.h>
#include <errno.h>
#include <string.h>

#include "base/logging.h"

namespace base {

// FileEnumerator::FileInfo ----------------------------------------------------

FileEnumerator::FileInfo::FileInfo() {
  memset(&stat_, 0, sizeof(stat_));
}

FileEnumerator::FileInfo::~FileInfo() = default;

bool FileEnumerator::FileInfo::IsDirectory() const {
  return S_ISDIR(stat_.st_mode);
}

// FileEnumerator --------------------------------------------------------------

FileEnumerator::FileEnumerator(const FilePath& root_path,
                               bool recursive,
                               int file_type)
    : current_directory_entry_(0),
      root_path_(root_path),
      recursive_(recursive),
      file_type_(file_type) {
  pending_paths_.push(root_path);
}

FileEnumerator::~FileEnumerator() = default;

FilePath FileEnumerator::Next() {
  ++current_directory_entry_;

  // While we've exhausted the entries in the current directory, do the next
  while (current_directory_entry_ >= directory_entries_.size()) {
    if (pending_paths_.empty())
      return FilePath();

    root_path_ = pending_paths_.top();
    root_path_ = root_path_.StripTrailingSeparators();
    pending_paths_.pop();

    std::vector<FileInfo> entries;
    if (!ReadDirectory(&entries, root_path_))
      continue;

    directory_entries_.clear();
    current_directory_entry_ = 0;
    for (const auto& entry : entries) {
      FilePath full_path = root_path_.Append(entry.filename_);
      if (entry.IsDirectory() && recursive_)
        pending_paths_.push(full_path);

      if ((file_type_ & FileEnumerator::DIRECTORIES && entry.IsDirectory()) ||
          (file_type_ & FileEnumerator::FILES && !entry.IsDirectory())) {
        directory_entries_.push_back(entry);
      }
    }
  }

  return root_path_.Append(
      directory_entries_[current_directory_entry_].filename_);
}

FileEnumerator::FileInfo FileEnumerator::GetInfo() const {
  return directory_entries_[current_directory_entry_];
}

// static
bool FileEnumerator::ReadDirectory(std::vector<FileInfo>* entries,
                                   const FilePath& source) {
  DIR* dir = opendir(source.value().c_str());
  if (!dir) {
    DVLOG(1) << "opendir " << source << ": " << strerror(errno);
    return false;
  }

  struct dirent* dent;
  while ((dent = readdir(dir))) {
    if (strcmp(dent->d_name, ".") == 0 || strcmp(dent->d_name, "..") == 0)
      continue;

    FileInfo info;
    info.filename_ = FilePath(dent->d_name);

    FilePath full_name = source.Append(dent->d_name);
    // Symlinks are followed so that a link to a certificate file is enumerated
    // like the file itself.
    if (stat(full_name.value().c_str(), &info.stat_) < 0) {
      DVLOG(1) << "Couldn't stat " << full_name << ": " << strerror(errno);
      memset(&info.stat_, 0, sizeof(info.stat_));
    }
    entries->push_back(info);
  }

  closedir(dir);
  return true;
}

}  // namespace base
