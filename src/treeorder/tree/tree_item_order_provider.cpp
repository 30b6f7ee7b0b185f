// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception

#include <treeorder/tree/tree_item_order_provider.hpp>

#include <utility>

namespace treeorder::tree {

  tree_item_order_provider::tree_item_order_provider(
    std::vector<order::item_identity> ordered_items,
    path::make_rooted_fn              make_rooted,
    order::order_index_options        options)
      : index_(std::move(ordered_items), std::move(make_rooted), std::move(options))
  {}

  tree_item_order_provider::tree_item_order_provider(order::order_index index)
      : index_(std::move(index))
  {}

  void tree_item_order_provider::calculate_property_values(
    const property_context& context, property_values& values) const
  {
    auto* writable = dynamic_cast<display_order_property_values*>(&values);
    if (writable == nullptr) {
      return;
    }

    auto const order = index_.evaluate(
      context.item_name, context.is_folder, context.item_type, context.metadata);

    if (order) {
      writable->display_order(*order);
    }
  }

} // namespace treeorder::tree
