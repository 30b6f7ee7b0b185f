// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception

#ifndef TREEORDER_STRING_ORDINAL_IGNORE_CASE_HPP
#define TREEORDER_STRING_ORDINAL_IGNORE_CASE_HPP

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace treeorder::string {

  namespace ordinal_ignore_case {

    // Folds ASCII letters only. Bytes >= 0x80 compare as-is, which keeps
    // UTF-8 sequences ordinal.
    [[nodiscard]] constexpr inline auto fold(char c) noexcept -> unsigned char
    {
      auto const u = static_cast<unsigned char>(c);
      return (u >= 'a' && u <= 'z') ? static_cast<unsigned char>(u - ('a' - 'A')) : u;
    }

    [[nodiscard]] constexpr inline auto compare(std::string_view a, std::string_view b) noexcept -> int
    {
      auto const n = a.size() < b.size() ? a.size() : b.size();

      for (auto i = std::size_t{0}; i < n; ++i) {
        auto const fa = fold(a[i]);
        auto const fb = fold(b[i]);

        if (fa != fb) {
          return fa < fb ? -1 : 1;
        }
      }

      if (a.size() == b.size()) {
        return 0;
      }

      return a.size() < b.size() ? -1 : 1;
    }

    [[nodiscard]] constexpr inline auto equals(std::string_view a, std::string_view b) noexcept -> bool
    {
      return a.size() == b.size() && compare(a, b) == 0;
    }

    // FNV-1a over the folded bytes.
    [[nodiscard]] constexpr inline auto hash(std::string_view s) noexcept -> std::size_t
    {
      auto h = std::uint64_t{0xcbf29ce484222325ULL};

      for (char c : s) {
        h ^= fold(c);
        h *= 0x100000001b3ULL;
      }

      return static_cast<std::size_t>(h);
    }

  } // namespace ordinal_ignore_case

  struct ordinal_ignore_case_equal {
    using is_transparent = void;

    [[nodiscard]] constexpr auto operator()(std::string_view a, std::string_view b) const noexcept -> bool
    {
      return ordinal_ignore_case::equals(a, b);
    }
  };

  struct ordinal_ignore_case_less {
    using is_transparent = void;

    [[nodiscard]] constexpr auto operator()(std::string_view a, std::string_view b) const noexcept -> bool
    {
      return ordinal_ignore_case::compare(a, b) < 0;
    }
  };

  struct ordinal_ignore_case_hash {
    using is_transparent = void;

    [[nodiscard]] constexpr auto operator()(std::string_view s) const noexcept -> std::size_t
    {
      return ordinal_ignore_case::hash(s);
    }
  };

} // namespace treeorder::string

#endif // TREEORDER_STRING_ORDINAL_IGNORE_CASE_HPP
