// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception

#ifndef TREEORDER_TREE_TREE_ITEM_ORDER_PROVIDER_HPP
#define TREEORDER_TREE_TREE_ITEM_ORDER_PROVIDER_HPP

#include <optional>
#include <span>
#include <string_view>
#include <vector>

#include <treeorder/order/order_index.hpp>
#include <treeorder/path/path_rooter.hpp>

namespace treeorder::tree {

  // What the host tree knows about the node being customized.
  struct property_context {
    std::string_view                item_name;
    bool                            is_folder = false;
    std::optional<std::string_view> item_type;
    order::metadata_view            metadata;
  };

  // Host-owned mutable properties of one node.
  class property_values {
  public:
    virtual ~property_values() = default;
  };

  // Extended write surface. Hosts that cannot reorder nodes do not provide it.
  class display_order_property_values : public property_values {
  public:
    virtual void display_order(int order) = 0;
  };

  class tree_properties_provider {
  public:
    virtual ~tree_properties_provider() = default;

    virtual void calculate_property_values(
      const property_context& context, property_values& values) const = 0;
  };

  /**
   * @brief Properties provider assigning display order from the project's
   * ordered item list.
   *
   * Called once per node by the tree pipeline, possibly from several
   * threads at once.
   */
  class tree_item_order_provider final : public tree_properties_provider {
  public:
    [[nodiscard]] tree_item_order_provider(std::vector<order::item_identity> ordered_items,
      path::make_rooted_fn                                                 make_rooted,
      order::order_index_options                                           options = {});

    [[nodiscard]] explicit tree_item_order_provider(order::order_index index);

    void calculate_property_values(
      const property_context& context, property_values& values) const override;

    [[nodiscard]] std::span<order::item_identity const> ordered_items() const noexcept
    {
      return index_.ordered_items();
    }

    [[nodiscard]] const order::order_index& index() const noexcept { return index_; }

  private:
    order::order_index index_;
  };

} // namespace treeorder::tree

#endif // TREEORDER_TREE_TREE_ITEM_ORDER_PROVIDER_HPP
