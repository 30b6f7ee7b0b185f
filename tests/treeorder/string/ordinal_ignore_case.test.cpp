// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <string_view>
#include <unordered_set>

#include <treeorder/string/ordinal_ignore_case.hpp>

using namespace treeorder::string;

TEST_CASE("ordinal_ignore_case comparison", "[string][ordinal]")
{
  SECTION("ASCII letters fold")
  {
    CHECK(ordinal_ignore_case::equals("Program.cs", "PROGRAM.CS"));
    CHECK(ordinal_ignore_case::equals("folder1", "Folder1"));
    CHECK_FALSE(ordinal_ignore_case::equals("Folder1", "Folder2"));
    CHECK_FALSE(ordinal_ignore_case::equals("abc", "abcd"));
  }

  SECTION("Non-letters and non-ASCII compare ordinally")
  {
    CHECK_FALSE(ordinal_ignore_case::equals("a_b", "a-b"));
    CHECK(ordinal_ignore_case::equals("\xC3\xA9", "\xC3\xA9"));
    CHECK_FALSE(ordinal_ignore_case::equals("\xC3\xA9", "\xC3\x89"));
  }

  SECTION("Ordering")
  {
    CHECK(ordinal_ignore_case::compare("apple", "Banana") < 0);
    CHECK(ordinal_ignore_case::compare("APPLE", "apple") == 0);
    CHECK(ordinal_ignore_case::compare("app", "apple") < 0);
    CHECK(ordinal_ignore_case::compare("b", "A") > 0);
  }

  SECTION("Constant evaluation")
  {
    static_assert(ordinal_ignore_case::equals("Abc", "aBC"));
    static_assert(ordinal_ignore_case::hash("Abc") == ordinal_ignore_case::hash("ABC"));
  }
}

TEST_CASE("ordinal_ignore_case function objects", "[string][ordinal]")
{
  auto const hash  = ordinal_ignore_case_hash{};
  auto const equal = ordinal_ignore_case_equal{};
  auto const less  = ordinal_ignore_case_less{};

  CHECK(hash("README.md") == hash(std::string{"readme.MD"}));
  CHECK(equal(std::string{"README.md"}, "readme.md"));
  CHECK(less("a", "B"));
  CHECK_FALSE(less("B", "a"));

  auto set = std::unordered_set<std::string, ordinal_ignore_case_hash, ordinal_ignore_case_equal>{};
  set.insert("Folder1");
  CHECK_FALSE(set.insert("FOLDER1").second);
  CHECK(set.contains(std::string_view{"folder1"}));
}
