// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_vector.hpp>

#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include <treeorder/path/path_segments.hpp>

using namespace treeorder::path;
using Catch::Matchers::Equals;

namespace {
  auto to_strings(std::vector<std::string_view> const& views) -> std::vector<std::string>
  {
    return {views.begin(), views.end()};
  }
} // namespace

TEST_CASE("path_separators", "[path][separators]")
{
  SECTION("Default set holds both slashes")
  {
    auto const seps = path_separators{};
    CHECK(seps.is_separator('/'));
    CHECK(seps.is_separator('\\'));
    CHECK_FALSE(seps.is_separator(':'));
    CHECK(seps.chars() == path_separators::default_set);
  }

  SECTION("Custom set")
  {
    auto const seps = path_separators{":|"};
    CHECK(seps.is_separator(':'));
    CHECK(seps.is_separator('|'));
    CHECK_FALSE(seps.is_separator('/'));
  }

  SECTION("Empty set is rejected")
  {
    CHECK_THROWS_AS(path_separators{""}, std::invalid_argument);
  }
}

TEST_CASE("split_path", "[path][split]")
{
  SECTION("Simple relative path")
  {
    CHECK_THAT(to_strings(split_path("src/app/main.cpp")),
      Equals(std::vector<std::string>{"src", "app", "main.cpp"}));
  }

  SECTION("Mixed separators")
  {
    CHECK_THAT(to_strings(split_path("src\\app/main.cpp")),
      Equals(std::vector<std::string>{"src", "app", "main.cpp"}));
  }

  SECTION("Empty segments are dropped")
  {
    CHECK_THAT(to_strings(split_path("//src\\\\app//main.cpp/")),
      Equals(std::vector<std::string>{"src", "app", "main.cpp"}));
  }

  SECTION("Degenerate inputs")
  {
    CHECK(split_path("").empty());
    CHECK(split_path("/").empty());
    CHECK(split_path("\\//\\").empty());
    CHECK_THAT(to_strings(split_path("file")), Equals(std::vector<std::string>{"file"}));
  }

  SECTION("Views refer into the input")
  {
    auto const path     = std::string{"a/bc"};
    auto const segments = split_path(path);

    REQUIRE(segments.size() == 2);
    CHECK(segments[1].data() == path.data() + 2);
  }
}

TEST_CASE("leaf_name", "[path][leaf]")
{
  CHECK(leaf_name("src/app/main.cpp") == "main.cpp");
  CHECK(leaf_name("src\\app\\main.cpp") == "main.cpp");
  CHECK(leaf_name("main.cpp") == "main.cpp");
  CHECK(leaf_name("src/app/") == "");
  CHECK(leaf_name("") == "");
  CHECK(leaf_name("a:b", path_separators{":"}) == "b");
}
