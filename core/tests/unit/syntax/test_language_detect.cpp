// test_language_detect.cpp - File extension and shebang mapping

#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>

#include "tierflow/syntax/language_detect.hpp"

namespace fs = std::filesystem;

TEST(LanguageDetect, MapsExtensions)
{
  EXPECT_EQ(tierflow::language_for_extension(".py"), "python");
  EXPECT_EQ(tierflow::language_for_extension(".PY"), "python");
  EXPECT_EQ(tierflow::language_for_extension(".tsx"), "typescript");
  EXPECT_EQ(tierflow::language_for_extension(".hpp"), "cpp");
  EXPECT_EQ(tierflow::language_for_extension(".h"), "c");
  EXPECT_FALSE(tierflow::language_for_extension(".txt").has_value());
  EXPECT_FALSE(tierflow::language_for_extension("").has_value());
}

TEST(LanguageDetect, MapsShebangs)
{
  EXPECT_EQ(tierflow::language_for_shebang("#!/usr/bin/env python2.7"), "python");
  EXPECT_EQ(tierflow::language_for_shebang("#!/usr/bin/env node"), "javascript");
  EXPECT_EQ(tierflow::language_for_shebang("#!/bin/bash -e"), "bash");
  EXPECT_EQ(tierflow::language_for_shebang("#!/bin/sh"), "bash");
  EXPECT_FALSE(tierflow::language_for_shebang("# just a comment").has_value());
  EXPECT_FALSE(tierflow::language_for_shebang("#!/usr/bin/awk -f").has_value());
}

TEST(LanguageDetect, FallsBackToShebangForExtensionlessFiles)
{
  const auto now = std::chrono::steady_clock::now().time_since_epoch().count();
  const fs::path dir = fs::temp_directory_path() / ("tierflow_detect_" + std::to_string(now));
  fs::create_directories(dir);

  {
    std::ofstream out(dir / "runner");
    out << "#!/usr/bin/python\nprint 'hello'\n";
  }

  EXPECT_EQ(tierflow::detect_language(dir / "runner"), "python");
  EXPECT_EQ(tierflow::detect_language(dir / "script.rb"), "ruby");
  EXPECT_FALSE(tierflow::detect_language(dir / "missing").has_value());
}
