// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception

#ifndef TREEORDER_ORDER_ORDER_INDEX_HPP
#define TREEORDER_ORDER_ORDER_INDEX_HPP

#include <cstddef>
#include <limits>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <treeorder/containers/map_view.hpp>
#include <treeorder/path/path_rooter.hpp>
#include <treeorder/path/path_segments.hpp>

namespace treeorder::order {

  // One entry of the ordered project item list.
  struct item_identity {
    std::string evaluated_include;

    bool operator==(const item_identity&) const = default;
  };

  struct order_index_options {
    path::path_separators separators{};
  };

  // Metadata key holding a node's fully-qualified path.
  constexpr inline std::string_view full_path_property = "FullPath";

  // Order given to non-folder nodes that were never listed.
  constexpr inline int max_display_order = std::numeric_limits<int>::max();

  using metadata_view  = containers::map_view<std::string_view, std::string>;
  using order_map_view = containers::map_view<std::string_view, int>;

  /**
   * @brief Display order of tree items derived from an ordered include list.
   *
   * Every folder and file name seen in the includes gets the next index on
   * first appearance. Leaf names shared by more than one include are keyed
   * by the rooted path of their include instead, since the name alone
   * cannot tell them apart.
   *
   * The object is immutable once constructed. Copies share state, and all
   * const members may be called concurrently without synchronization.
   */
  class order_index {
  public:
    /// @throws whatever `make_rooted` throws; no object is created then.
    [[nodiscard]] order_index(std::vector<item_identity> ordered_items,
      path::make_rooted_fn                              make_rooted,
      order_index_options                               options = {});

    // Copies share the frozen state; there is no separate moved-from state.
    [[nodiscard]] order_index(const order_index&) = default;
    order_index& operator=(const order_index&)    = default;
    ~order_index();

    // The span points into state shared by all copies of this index and is
    // valid only while at least one copy is alive.
    [[nodiscard]] std::span<item_identity const> ordered_items() const noexcept;

    /**
     * @brief Display order for one tree node.
     *
     * @param item_name  the node's own name, looked up case-insensitively.
     * @param is_folder  whether the node is a folder.
     * @param item_type  the node's item type. Absent or empty while the host
     *                   is still populating the node.
     * @param metadata   node metadata; `FullPath` is used for duplicates.
     *
     * @return the assigned index when the node is known and has an item
     *   type; `max_display_order` for unknown non-folders; otherwise
     *   `std::nullopt` (keep the host's default order).
     */
    [[nodiscard]] std::optional<int> evaluate(std::string_view item_name,
      bool                                                      is_folder,
      std::optional<std::string_view>                           item_type,
      metadata_view                                             metadata) const;

    [[nodiscard]] std::optional<int> name_index(std::string_view segment) const;
    [[nodiscard]] std::optional<int> path_index(std::string_view full_path) const;

    // Read-only views into state shared by all copies of this index. Like
    // any map_view, they must not outlive the last copy.
    [[nodiscard]] order_map_view name_order() const noexcept;
    [[nodiscard]] order_map_view path_order() const noexcept;

    // Number of indices assigned; they are exactly 1..size().
    [[nodiscard]] std::size_t size() const noexcept;
    [[nodiscard]] bool        empty() const noexcept;

  private:
    struct impl;
    std::shared_ptr<impl const> p_impl;
  };

} // namespace treeorder::order

#endif // TREEORDER_ORDER_ORDER_INDEX_HPP
