// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception

#include <treeorder/order/order_index.hpp>

#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>

#include <boost/container/flat_map.hpp>

#include <range/v3/range/conversion.hpp>
#include <range/v3/view/filter.hpp>
#include <range/v3/view/transform.hpp>

#include <treeorder/debug/debug.hpp>
#include <treeorder/string/ordinal_ignore_case.hpp>

namespace treeorder::order {

  namespace {
    using order_map = boost::container::
      flat_map<std::string, int, string::ordinal_ignore_case_less>;

    using leaf_set = std::unordered_set<std::string_view,
      string::ordinal_ignore_case_hash,
      string::ordinal_ignore_case_equal>;

    // Insertion-side map used while indices are handed out. Keys are never
    // overwritten; the first assignment of a key wins.
    class first_wins_map {
    public:
      [[nodiscard]] bool contains(std::string_view key) const
      {
        return entries_.contains(key);
      }

      void assign(std::string key, int index)
      {
        entries_.try_emplace(std::move(key), index);
      }

      [[nodiscard]] order_map freeze() &&
      {
        return order_map(entries_.begin(), entries_.end());
      }

    private:
      std::unordered_map<std::string,
        int,
        string::ordinal_ignore_case_hash,
        string::ordinal_ignore_case_equal>
        entries_;
    };

    // Leaf names shared by two or more includes. The views point into
    // `items`, which must outlive the result.
    auto duplicate_leaf_names(
      std::span<item_identity const> items, const path::path_separators& separators)
      -> leaf_set
    {
      auto leaves = items
        | ranges::views::transform([&](const item_identity& item) {
            return path::leaf_name(item.evaluated_include, separators);
          })
        | ranges::views::filter([](std::string_view leaf) { return !leaf.empty(); })
        | ranges::to<std::vector>();

      auto counts = std::unordered_map<std::string_view,
        std::size_t,
        string::ordinal_ignore_case_hash,
        string::ordinal_ignore_case_equal>{};

      for (auto leaf : leaves) {
        ++counts[leaf];
      }

      auto duplicates = leaf_set{};
      for (auto const& [leaf, count] : counts) {
        if (count > 1) {
          duplicates.insert(leaf);
        }
      }

      return duplicates;
    }
  } // namespace

  struct order_index::impl {
    std::vector<item_identity> ordered_items;
    order_map                  name_order;
    order_map                  path_order;
    std::size_t                assigned = 0;

    [[nodiscard]] static std::optional<int> lookup(const order_map& map, std::string_view key)
    {
      auto it = map.find(key);
      if (it == map.end()) {
        return std::nullopt;
      }
      return it->second;
    }
  };

  order_index::order_index(std::vector<item_identity> ordered_items,
    path::make_rooted_fn                              make_rooted,
    order_index_options                               options)
  {
    auto state = std::make_shared<impl>();
    state->ordered_items = std::move(ordered_items);

    auto const& items      = state->ordered_items;
    auto const& separators = options.separators;
    auto const  duplicates = duplicate_leaf_names(items, separators);

    for (auto leaf : duplicates) {
      debug::trace("leaf name '{}' is shared by several items; keyed by rooted path", leaf);
    }

    auto names = first_wins_map{};
    auto paths = first_wins_map{};
    auto index = 1;

    for (auto const& item : items) {
      // Rooted lazily, at most once per item.
      auto rooted = std::optional<std::string>{};

      for (auto part : path::split_path(item.evaluated_include, separators)) {
        if (duplicates.contains(part)) {
          if (!rooted) {
            rooted = make_rooted(item.evaluated_include);
          }
          if (!paths.contains(*rooted)) {
            paths.assign(*rooted, index++);
          }
        } else if (!names.contains(part)) {
          names.assign(std::string{part}, index++);
        }
      }
    }

    state->name_order = std::move(names).freeze();
    state->path_order = std::move(paths).freeze();
    state->assigned   = static_cast<std::size_t>(index - 1);

    debug::info("computed display order for {} items: {} indices, {} names, {} rooted paths, {} duplicate leaf names",
      items.size(),
      state->assigned,
      state->name_order.size(),
      state->path_order.size(),
      duplicates.size());

    p_impl = std::move(state);
  }

  order_index::~order_index() = default;

  std::span<item_identity const> order_index::ordered_items() const noexcept
  {
    return p_impl->ordered_items;
  }

  std::optional<int> order_index::name_index(std::string_view segment) const
  {
    return impl::lookup(p_impl->name_order, segment);
  }

  std::optional<int> order_index::path_index(std::string_view full_path) const
  {
    return impl::lookup(p_impl->path_order, full_path);
  }

  std::optional<int> order_index::evaluate(std::string_view item_name,
    bool                                                    is_folder,
    std::optional<std::string_view>                         item_type,
    metadata_view                                           metadata) const
  {
    auto index = name_index(item_name);

    if (!index) {
      if (auto const* full_path = metadata.find(full_path_property)) {
        index = path_index(*full_path);
      }
    }

    if (index) {
      // Nodes still being populated carry no item type; leave them alone.
      if (!item_type || item_type->empty()) {
        return std::nullopt;
      }
      return index;
    }

    // Unlisted files (typically only visible with "show all files") go last.
    if (!is_folder) {
      return max_display_order;
    }

    return std::nullopt;
  }

  order_map_view order_index::name_order() const noexcept
  {
    return order_map_view{p_impl->name_order};
  }

  order_map_view order_index::path_order() const noexcept
  {
    return order_map_view{p_impl->path_order};
  }

  std::size_t order_index::size() const noexcept { return p_impl->assigned; }

  bool order_index::empty() const noexcept { return p_impl->assigned == 0; }

} // namespace treeorder::order
