// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception

#ifndef TREEORDER_PATH_PATH_SEGMENTS_HPP
#define TREEORDER_PATH_PATH_SEGMENTS_HPP

#include <string>
#include <string_view>
#include <vector>

namespace treeorder::path {

  /**
   * @brief The fixed set of characters treated as path delimiters.
   *
   * Project includes may mix both separators, so the default set holds
   * `/` and `\` regardless of platform.
   */
  class path_separators {
  public:
    static constexpr inline std::string_view default_set = "/\\";

    [[nodiscard]] path_separators();

    /// @throws std::invalid_argument if `chars` is empty.
    [[nodiscard]] explicit path_separators(std::string_view chars);

    [[nodiscard]] bool is_separator(char c) const noexcept;

    [[nodiscard]] std::string_view chars() const noexcept { return chars_; }

    bool operator==(const path_separators&) const = default;

  private:
    std::string chars_;
  };

  // Empty segments are dropped, so "a//b/", "/a/b" and "a\\b" all yield
  // {"a", "b"}. The returned views point into `path`.
  [[nodiscard]] std::vector<std::string_view> split_path(
    std::string_view path, const path_separators& separators = {});

  // Everything after the last separator. Empty when `path` ends with one.
  [[nodiscard]] std::string_view leaf_name(
    std::string_view path, const path_separators& separators = {}) noexcept;

} // namespace treeorder::path

#endif // TREEORDER_PATH_PATH_SEGMENTS_HPP
