// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception

#ifndef TREEORDER_CONTAINERS_MAP_VIEW_HPP
#define TREEORDER_CONTAINERS_MAP_VIEW_HPP

#include <concepts>
#include <cstddef>
#include <memory>      // For std::addressof
#include <stdexcept>   // For std::out_of_range

namespace treeorder::containers {

  // =============================================================================
  // Concepts
  // =============================================================================

  namespace concepts {

    /**
     * @brief Minimal requirements for a read-only map view.
     * * We only strictly require .find(), .end(), .size(), and .empty() on a
     * * const container. .contains() and .count() are polyfilled at
     * * compile-time if missing.
     */
    template <typename Container, typename ViewKey, typename Value>
    concept map_compatible = requires(const Container& c, const ViewKey& key) {
      { c.find(key) == c.end() } -> std::convertible_to<bool>;
      { c.find(key)->second } -> std::same_as<const Value&>;

      { c.size() } -> std::convertible_to<std::size_t>;
      { c.empty() } -> std::convertible_to<bool>;
    };

  } // namespace concepts

  // =============================================================================
  // map_view (Read-Only, Heterogeneous Optimized)
  // =============================================================================

  /**
   * @brief A non-owning, zero-allocation, read-only view for looking up values.
   * *
   * * The referenced container must outlive the view. No operation of the
   * * view can modify the container.
   * *
   * * @tparam ViewKey The type used for lookup (e.g., std::string_view).
   * * @tparam Value The mapped type.
   */
  template <typename ViewKey, typename Value> class [[nodiscard]] map_view {
  public:
    using key_type    = ViewKey;
    using mapped_type = Value;
    using size_type   = std::size_t;

    /**
     * @brief Constructs a view from any compatible container.
     */
    template <concepts::map_compatible<ViewKey, Value> Container>
    constexpr explicit map_view(const Container& container) noexcept
        : container_ptr_{std::addressof(container)}
        , vtable_ptr_{&vtable_storage<Container>}
    {}

    [[nodiscard]] auto at(const ViewKey& key) const -> const Value&
    {
      auto const* value = find(key);
      if (value == nullptr) {
        throw std::out_of_range("map_view::at - key not found");
      }
      return *value;
    }

    [[nodiscard]] auto contains(const ViewKey& key) const -> bool
    {
      return vtable_ptr_->contains(container_ptr_, key);
    }

    [[nodiscard]] auto find(const ViewKey& key) const -> const Value*
    {
      return vtable_ptr_->find(container_ptr_, key);
    }

    [[nodiscard]] auto count(const ViewKey& key) const -> size_type
    {
      return contains(key) ? 1 : 0;
    }

    [[nodiscard]] auto size() const noexcept -> size_type
    {
      return vtable_ptr_->size(container_ptr_);
    }

    [[nodiscard]] auto empty() const noexcept -> bool
    {
      return vtable_ptr_->empty(container_ptr_);
    }

  private:
    struct vtable {
      bool (*contains)(const void*, const ViewKey&);
      const Value* (*find)(const void*, const ViewKey&);
      size_type (*size)(const void*) noexcept;
      bool (*empty)(const void*) noexcept;
    };

    template <typename Container>
    static constexpr auto vtable_storage =
      vtable{.contains = [](const void* ptr, const ViewKey& key) -> bool {
               auto const& c = *static_cast<const Container*>(ptr);
               // Compile-time branch: Use native .contains() (C++20) if available
               if constexpr (requires { { c.contains(key) } -> std::convertible_to<bool>; }) {
                 return c.contains(key);
               } else {
                 return c.find(key) != c.end();
               }
             },
        .find = [](const void* ptr, const ViewKey& key) -> const Value* {
          auto const& c  = *static_cast<const Container*>(ptr);
          auto        it = c.find(key);
          return (it != c.end()) ? std::addressof(it->second) : nullptr;
        },
        .size = [](const void* ptr) noexcept -> size_type {
          return static_cast<const Container*>(ptr)->size();
        },
        .empty = [](const void* ptr) noexcept -> bool {
          return static_cast<const Container*>(ptr)->empty();
        }};

    const void*   container_ptr_{nullptr};
    const vtable* vtable_ptr_{nullptr};
  };

} // namespace treeorder::containers

#endif // TREEORDER_CONTAINERS_MAP_VIEW_HPP
