// Copyright (c) 2012 The Chromium Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "base/files/file_util.h"

#include <errno.h>
#include <fcntl.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

#include <stack>
#include <vector>

#include "base/files/file_enumerator.h"
#include "base/logging.h"
#include "base/posix/eintr_wrapper.h"

namespace base {

namespace {

bool GetTempDir(FilePath* path) {
  const char* tmp = getenv("TMPDIR");
  if (tmp && *tmp)
    *path = FilePath(tmp);
  else
    *path = FilePath("/tmp");
  return true;
}

std::string TempFileName() {
  return std::string(".org.trustpin.trustpin.XXXXXX");
}

bool HasParentReference(const FilePath& path) {
  const std::string& value = path.value();
  size_t start = 0;
  while (start <= value.size()) {
    size_t end = value.find('/', start);
    if (end == std::string::npos)
      end = value.size();
    if (value.compare(start, end - start, "..") == 0)
      return true;
    start = end + 1;
  }
  return false;
}

}  // namespace

bool DeleteFile(const FilePath& path, bool recursive) {
  const char* path_str = path.value().c_str();
  struct stat file_info;
  if (lstat(path_str, &file_info) != 0) {
    // The Windows version defines this condition as success.
    return (errno == ENOENT || errno == ENOTDIR);
  }
  if (!S_ISDIR(file_info.st_mode))
    return (unlink(path_str) == 0);
  if (!recursive)
    return (rmdir(path_str) == 0);

  bool success = true;
  std::stack<std::string> directories;
  directories.push(path.value());
  FileEnumerator traversal(path, true,
                           FileEnumerator::FILES | FileEnumerator::DIRECTORIES);
  for (FilePath current = traversal.Next(); !current.empty();
       current = traversal.Next()) {
    if (traversal.GetInfo().IsDirectory())
      directories.push(current.value());
    else
      success &= (unlink(current.value().c_str()) == 0);
  }

  while (!directories.empty()) {
    FilePath dir = FilePath(directories.top());
    directories.pop();
    success &= (rmdir(dir.value().c_str()) == 0);
  }
  return success;
}

bool PathExists(const FilePath& path) {
  return access(path.value().c_str(), F_OK) == 0;
}

bool DirectoryExists(const FilePath& path) {
  struct stat file_info;
  if (stat(path.value().c_str(), &file_info) != 0)
    return false;
  return S_ISDIR(file_info.st_mode);
}

bool ReadFileToString(const FilePath& path, std::string* contents) {
  return ReadFileToStringWithMaxSize(path, contents,
                                     std::numeric_limits<size_t>::max());
}

bool ReadFileToStringWithMaxSize(const FilePath& path,
                                 std::string* contents,
                                 size_t max_size) {
  if (contents)
    contents->clear();
  if (HasParentReference(path))
    return false;

  int fd = HANDLE_EINTR(open(path.value().c_str(), O_RDONLY | O_CLOEXEC));
  if (fd < 0)
    return false;

  struct stat file_info;
  if (fstat(fd, &file_info) != 0 || S_ISDIR(file_info.st_mode)) {
    IGNORE_EINTR(close(fd));
    return false;
  }

  const size_t kBufferSize = 1 << 16;
  std::vector<char> buf(kBufferSize);
  size_t size = 0;
  bool read_status = true;
  while (true) {
    ssize_t len = HANDLE_EINTR(read(fd, buf.data(), buf.size()));
    if (len < 0) {
      read_status = false;
      break;
    }
    if (len == 0)
      break;
    size_t chunk = static_cast<size_t>(len);
    if (size + chunk > max_size) {
      chunk = max_size - size;
      read_status = false;
    }
    if (contents)
      contents->append(buf.data(), chunk);
    size += chunk;
    if (!read_status)
      break;
  }

  IGNORE_EINTR(close(fd));
  return read_status;
}

bool CreateDirectory(const FilePath& full_path) {
  std::vector<FilePath> subpaths;

  // Collect a list of all parent directories.
  FilePath last_path = full_path;
  subpaths.push_back(full_path);
  for (FilePath path = full_path.DirName(); path.value() != last_path.value();
       path = path.DirName()) {
    subpaths.push_back(path);
    last_path = path;
  }

  // Iterate through the parents and create the missing ones.
  for (std::vector<FilePath>::reverse_iterator i = subpaths.rbegin();
       i != subpaths.rend(); ++i) {
    if (DirectoryExists(*i))
      continue;
    if (mkdir(i->value().c_str(), 0700) == 0)
      continue;
    // Mkdir failed, but it might have failed with EEXIST, or some other error
    // due to the the directory appearing out of thin air. This can occur if
    // two processes are trying to create the same file system tree at the same
    // time. Check to see if it exists and make sure it is a directory.
    int saved_errno = errno;
    if (!DirectoryExists(*i)) {
      DVLOG(1) << "mkdir " << *i << ": " << strerror(saved_errno);
      return false;
    }
  }
  return true;
}

bool CreateNewTempDirectory(const FilePath::StringType& prefix,
                            FilePath* new_temp_path) {
  FilePath tmpdir;
  if (!GetTempDir(&tmpdir))
    return false;

  std::string sub_dir = tmpdir.Append(TempFileName()).value();
  // this should be OK since mkdtemp just replaces characters in place
  char* buffer = &sub_dir[0];
  char* dtemp = mkdtemp(buffer);
  if (!dtemp) {
    DVLOG(1) << "mkdtemp failed: " << strerror(errno);
    return false;
  }
  *new_temp_path = FilePath(dtemp);
  return true;
}

int WriteFile(const FilePath& filename, const char* data, int size) {
  int fd = HANDLE_EINTR(creat(filename.value().c_str(), 0666));
  if (fd < 0)
    return -1;

  int bytes_written = WriteFileDescriptor(fd, data, size) ? size : -1;
  if (IGNORE_EINTR(close(fd)) < 0)
    return -1;
  return bytes_written;
}

bool WriteFileDescriptor(const int fd, const char* data, int size) {
  // Allow for partial writes.
  ssize_t bytes_written_total = 0;
  for (ssize_t bytes_written_partial = 0; bytes_written_total < size;
       bytes_written_total += bytes_written_partial) {
    bytes_written_partial = HANDLE_EINTR(
        write(fd, data + bytes_written_total, size - bytes_written_total));
    if (bytes_written_partial < 0)
      return false;
  }

  return true;
}

}  // namespace base
