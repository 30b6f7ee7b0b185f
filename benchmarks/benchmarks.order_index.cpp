// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception

#include <cstddef>
#include <functional>
#include <map>
#include <random>
#include <string>
#include <vector>

#include <benchmark/benchmark.h>

#include <treeorder/order/order_index.hpp>
#include <treeorder/path/path_rooter.hpp>

using namespace treeorder;

// Helper: Generate a project-like include list. Roughly one leaf in eight
// is reused in another folder so the rooted-path map gets exercised.
std::vector<order::item_identity> generate_items(std::size_t count)
{
  std::vector<order::item_identity> items;
  items.reserve(count);

  std::mt19937_64                            rng(42);
  std::uniform_int_distribution<std::size_t> folder(0, count / 16 + 1);
  std::uniform_int_distribution<std::size_t> depth(1, 4);
  std::uniform_int_distribution<std::size_t> reuse(0, 7);

  for (std::size_t i = 0; i < count; ++i) {
    std::string include;
    for (std::size_t d = depth(rng); d > 0; --d) {
      include += "dir" + std::to_string(folder(rng)) + "/";
    }

    auto const leaf = (reuse(rng) == 0 && i > 0) ? i / 2 : i;
    include += "file" + std::to_string(leaf) + ".cs";

    items.push_back(order::item_identity{std::move(include)});
  }
  return items;
}

static void BM_OrderIndexBuild(benchmark::State& state)
{
  auto const items  = generate_items(static_cast<std::size_t>(state.range(0)));
  auto const rooter = path::project_path_rooter{"/work/project"};

  for (auto _ : state) {
    auto index = order::order_index{items, rooter};
    benchmark::DoNotOptimize(index.size());
  }

  state.SetItemsProcessed(state.iterations() * state.range(0));
}

static void BM_OrderIndexEvaluate(benchmark::State& state)
{
  auto const items  = generate_items(static_cast<std::size_t>(state.range(0)));
  auto const rooter = path::project_path_rooter{"/work/project"};
  auto const index  = order::order_index{items, rooter};

  std::vector<std::string> names;
  std::vector<std::map<std::string, std::string, std::less<>>> metadata;
  names.reserve(items.size());
  metadata.reserve(items.size());

  for (auto const& item : items) {
    names.emplace_back(path::leaf_name(item.evaluated_include));
    metadata.push_back({{std::string{order::full_path_property}, rooter(item.evaluated_include)}});
  }

  std::size_t i = 0;
  for (auto _ : state) {
    auto result = index.evaluate(names[i], false, "Compile", order::metadata_view{metadata[i]});
    benchmark::DoNotOptimize(result);
    i = (i + 1 == names.size()) ? 0 : i + 1;
  }

  state.SetItemsProcessed(state.iterations());
}

BENCHMARK(BM_OrderIndexBuild)->RangeMultiplier(8)->Range(64, 1 << 15);
BENCHMARK(BM_OrderIndexEvaluate)->RangeMultiplier(8)->Range(64, 1 << 15);

BENCHMARK_MAIN();
