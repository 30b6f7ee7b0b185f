// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception

#include <catch2/catch_template_test_macros.hpp>
#include <catch2/catch_test_macros.hpp>

#include <boost/container/flat_map.hpp>
#include <functional> // For std::hash, std::equal_to
#include <map>
#include <stdexcept> // For std::out_of_range
#include <string>
#include <string_view>
#include <unordered_map>

#include <treeorder/containers/map_view.hpp>
#include <treeorder/string/ordinal_ignore_case.hpp>

using namespace treeorder::containers;

// =============================================================================
// Helpers & Types
// =============================================================================

/**
 * @brief Transparent hasher for std::unordered_map.
 * * Required because std::hash<std::string> is not transparent.
 */
struct string_view_hash {
  using is_transparent = void;

  [[nodiscard]] auto operator()(std::string_view sv) const noexcept
    -> std::size_t
  {
    return std::hash<std::string_view>{}(sv);
  }
};

using transparent_map = std::map<std::string, int, std::less<>>;
using transparent_flat_map =
  boost::container::flat_map<std::string, int, std::less<>>;
using transparent_unordered_map =
  std::unordered_map<std::string, int, string_view_hash, std::equal_to<>>;
using case_insensitive_flat_map = boost::container::
  flat_map<std::string, int, treeorder::string::ordinal_ignore_case_less>;

// Helper to verify pointer results from map_view::find
template <typename T> auto verify_entry(const T* ptr, const T& expected) -> void
{
  REQUIRE(ptr != nullptr);
  CHECK(*ptr == expected);
}

// =============================================================================
// Test Suite: map_view (Read-Only)
// =============================================================================

TEMPLATE_TEST_CASE("map_view: Heterogeneous Lookup",
  "[map_view][heterogeneous]",
  transparent_map,
  transparent_flat_map,
  transparent_unordered_map)
{
  using container_t = TestType;
  auto container    = container_t{};
  container.try_emplace("alpha", 100);
  container.try_emplace("beta", 200);

  auto const view = map_view<std::string_view, int>{container};

  SECTION("Capacity")
  {
    CHECK_FALSE(view.empty());
    CHECK(view.size() == 2);
  }

  SECTION("Lookup via .find()")
  {
    verify_entry(view.find("alpha"), 100);
    CHECK(view.find("gamma") == nullptr);
  }

  SECTION("Lookup via .at()")
  {
    CHECK(view.at("beta") == 200);
    CHECK_THROWS_AS(view.at("delta"), std::out_of_range);
  }

  SECTION("Presence via .contains() and .count()")
  {
    CHECK(view.contains("alpha"));
    CHECK_FALSE(view.contains("delta"));
    CHECK(view.count("beta") == 1);
    CHECK(view.count("delta") == 0);
  }

  SECTION("View tracks the container")
  {
    container.try_emplace("gamma", 300);
    CHECK(view.size() == 3);
    verify_entry(view.find("gamma"), 300);
  }
}

TEST_CASE("map_view: Case-Insensitive Container", "[map_view][case]")
{
  auto container = case_insensitive_flat_map{};
  container.try_emplace("Folder1", 1);
  container.try_emplace("FileA.cs", 2);

  auto const view = map_view<std::string_view, int>{container};

  verify_entry(view.find("FOLDER1"), 1);
  verify_entry(view.find("filea.cs"), 2);
  CHECK_FALSE(view.contains("Folder2"));
}

TEST_CASE("map_view: Empty Container", "[map_view][empty]")
{
  auto const container = transparent_map{};
  auto const view      = map_view<std::string_view, int>{container};

  CHECK(view.empty());
  CHECK(view.size() == 0);
  CHECK(view.find("anything") == nullptr);
}

TEST_CASE("map_view: String Values", "[map_view][values]")
{
  auto const container = std::map<std::string, std::string, std::less<>>{
    {"FullPath", "/proj/a.cs"}};
  auto const view = map_view<std::string_view, std::string>{container};

  verify_entry(view.find("FullPath"), std::string{"/proj/a.cs"});
  CHECK(view.find("fullpath") == nullptr);
}
