// Copyright 2026 The trustpin Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "base/files/file_util.h"

#include <string>

#include "base/files/file_enumerator.h"
#include "base/files/file_path.h"
#include "base/files/scoped_temp_dir.h"
#include "gtest/gtest.h"

namespace base {

namespace {

class FileUtilTest : public testing::Test {
 protected:
  void SetUp() override { ASSERT_TRUE(temp_dir_.CreateUniqueTempDir()); }

  bool WriteString(const FilePath& path, const std::string& data) {
    return WriteFile(path, data.data(), static_cast<int>(data.size())) ==
           static_cast<int>(data.size());
  }

  ScopedTempDir temp_dir_;
};

TEST_F(FileUtilTest, ReadFileToString) {
  const std::string kData("0123456789");
  FilePath file_path = temp_dir_.GetPath().Append("ReadFileToStringTest");
  ASSERT_TRUE(WriteString(file_path, kData));

  std::string data;
  EXPECT_TRUE(ReadFileToString(file_path, &data));
  EXPECT_EQ(kData, data);

  data = "temp";
  EXPECT_FALSE(ReadFileToStringWithMaxSize(file_path, &data, 0));
  EXPECT_EQ(0u, data.length());

  data = "temp";
  EXPECT_FALSE(ReadFileToStringWithMaxSize(file_path, &data, 2));
  EXPECT_EQ("01", data);

  data = "temp";
  EXPECT_TRUE(ReadFileToStringWithMaxSize(file_path, &data, 10));
  EXPECT_EQ(kData, data);

  EXPECT_TRUE(ReadFileToStringWithMaxSize(file_path, nullptr, 10));
}

TEST_F(FileUtilTest, ReadFileToStringFailures) {
  std::string data = "temp";
  EXPECT_FALSE(ReadFileToString(temp_dir_.GetPath().Append("missing"), &data));
  EXPECT_TRUE(data.empty());

  // Directories are not files.
  EXPECT_FALSE(ReadFileToString(temp_dir_.GetPath(), &data));

  // Paths that step out of their directory are refused.
  FilePath parent_ref = temp_dir_.GetPath().Append("..").Append("x");
  EXPECT_FALSE(ReadFileToString(parent_ref, &data));
}

TEST_F(FileUtilTest, DirectoryExistsAndCreateDirectory) {
  FilePath nested = temp_dir_.GetPath().Append("a").Append("b");
  EXPECT_FALSE(PathExists(nested));
  EXPECT_FALSE(DirectoryExists(nested));

  EXPECT_TRUE(CreateDirectory(nested));
  EXPECT_TRUE(DirectoryExists(nested));

  FilePath file_path = nested.Append("file");
  ASSERT_TRUE(WriteString(file_path, "x"));
  EXPECT_TRUE(PathExists(file_path));
  EXPECT_FALSE(DirectoryExists(file_path));

  EXPECT_TRUE(DeleteFile(temp_dir_.GetPath().Append("a"), true));
  EXPECT_FALSE(PathExists(nested));
}

TEST_F(FileUtilTest, FileEnumeratorListsFilesOnly) {
  FilePath dir = temp_dir_.GetPath();
  ASSERT_TRUE(WriteString(dir.Append("one.crt"), "1"));
  ASSERT_TRUE(WriteString(dir.Append("two.der"), "2"));
  ASSERT_TRUE(CreateDirectory(dir.Append("sub")));
  ASSERT_TRUE(WriteString(dir.Append("sub").Append("three.cer"), "3"));

  FileEnumerator files(dir, false, FileEnumerator::FILES);
  int count = 0;
  for (FilePath name = files.Next(); !name.empty(); name = files.Next()) {
    EXPECT_EQ(dir, name.DirName());
    ++count;
  }
  EXPECT_EQ(2, count);
}

}  // namespace

}  // namespace base
