// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception

#include <treeorder/path/path_segments.hpp>

#include <algorithm>
#include <stdexcept>

namespace treeorder::path {

  path_separators::path_separators()
      : chars_(default_set)
  {}

  path_separators::path_separators(std::string_view chars)
      : chars_(chars)
  {
    if (chars_.empty()) {
      throw std::invalid_argument("path_separators: separator set is empty");
    }
  }

  bool path_separators::is_separator(char c) const noexcept
  {
    return chars_.find(c) != std::string::npos;
  }

  std::vector<std::string_view> split_path(
    std::string_view path, const path_separators& separators)
  {
    auto segments = std::vector<std::string_view>{};

    auto const is_sep = [&](char c) { return separators.is_separator(c); };

    auto first = path.begin();
    while (first != path.end()) {
      first = std::find_if_not(first, path.end(), is_sep);
      if (first == path.end()) {
        break;
      }

      auto last = std::find_if(first, path.end(), is_sep);
      segments.emplace_back(first, last);
      first = last;
    }

    return segments;
  }

  std::string_view leaf_name(
    std::string_view path, const path_separators& separators) noexcept
  {
    auto const pos = path.find_last_of(separators.chars());
    if (pos == std::string_view::npos) {
      return path;
    }

    return path.substr(pos + 1);
  }

} // namespace treeorder::path
