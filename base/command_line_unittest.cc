// Copyright 2026 The trustpin Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "base/command_line.h"

#include <string>
#include <vector>

#include "base/files/file_path.h"
#include "gtest/gtest.h"

namespace base {

TEST(CommandLineTest, CommandLineConstructor) {
  const CommandLine::CharType* argv[] = {
      "program",
      "--foo=",
      "-bAr",
      "-spaetzel=pierogi",
      "other-switches=--dog=canine --cat=feline",
      "--pinning-mode=public-key",
      "chain.pem",
      "--",
      "--not-a-switch",
      "-also-not"};
  CommandLine cl(static_cast<int>(sizeof(argv) / sizeof(argv[0])), argv);

  EXPECT_EQ(FilePath("program"), cl.GetProgram());

  EXPECT_TRUE(cl.HasSwitch("foo"));
  EXPECT_TRUE(cl.HasSwitch("bar"));
  EXPECT_TRUE(cl.HasSwitch("spaetzel"));
  EXPECT_TRUE(cl.HasSwitch("pinning-mode"));
  EXPECT_FALSE(cl.HasSwitch("cruller"));
  EXPECT_FALSE(cl.HasSwitch("not-a-switch"));
  EXPECT_FALSE(cl.HasSwitch("also-not"));

  EXPECT_EQ("", cl.GetSwitchValueASCII("foo"));
  EXPECT_EQ("", cl.GetSwitchValueASCII("bar"));
  EXPECT_EQ("pierogi", cl.GetSwitchValueASCII("spaetzel"));
  EXPECT_EQ("public-key", cl.GetSwitchValueASCII("pinning-mode"));
  EXPECT_EQ("", cl.GetSwitchValueASCII("cruller"));

  const CommandLine::StringVector& args = cl.GetArgs();
  ASSERT_EQ(4U, args.size());

  std::vector<CommandLine::StringType>::const_iterator iter = args.begin();
  EXPECT_EQ("other-switches=--dog=canine --cat=feline", *iter);
  ++iter;
  EXPECT_EQ("chain.pem", *iter);
  ++iter;
  EXPECT_EQ("--not-a-switch", *iter);
  ++iter;
  EXPECT_EQ("-also-not", *iter);
  ++iter;
  EXPECT_TRUE(iter == args.end());
}

TEST(CommandLineTest, AppendSwitches) {
  CommandLine cl(FilePath("program"));
  cl.AppendSwitch("switch1");
  cl.AppendSwitchASCII("switch2", "value");
  cl.AppendSwitchPath("switch3", FilePath("/tmp/certs"));
  cl.AppendArg("arg");

  EXPECT_TRUE(cl.HasSwitch("switch1"));
  EXPECT_EQ("value", cl.GetSwitchValueASCII("switch2"));
  EXPECT_EQ(FilePath("/tmp/certs"), cl.GetSwitchValuePath("switch3"));

  const CommandLine::StringVector& args = cl.GetArgs();
  ASSERT_EQ(1U, args.size());
  EXPECT_EQ("arg", args[0]);

  const CommandLine::StringVector& argv = cl.argv();
  ASSERT_EQ(5U, argv.size());
  EXPECT_EQ("--switch2=value", argv[2]);
}

TEST(CommandLineTest, LastSwitchValueWins) {
  const CommandLine::CharType* argv[] = {"program", "--mode=none",
                                         "--mode=certificate"};
  CommandLine cl(3, argv);
  EXPECT_EQ("certificate", cl.GetSwitchValueASCII("mode"));
}

}  // namespace base
