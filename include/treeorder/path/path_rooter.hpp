// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception

#ifndef TREEORDER_PATH_PATH_ROOTER_HPP
#define TREEORDER_PATH_PATH_ROOTER_HPP

#include <filesystem>
#include <string>
#include <string_view>

#include <function2/function2.hpp>

namespace treeorder::path {

  // Resolves a possibly relative include to its fully-qualified form. Must
  // be deterministic; anything it throws propagates to the caller.
  using make_rooted_fn = fu2::function<std::string(std::string_view) const>;

  /**
   * @brief Roots includes against a project directory.
   *
   * Backslashes are treated as separators, relative includes are joined to
   * the project directory and the result is normalized lexically. No file
   * system access is performed.
   */
  class project_path_rooter {
  public:
    /// @throws std::invalid_argument if `project_directory` is not absolute.
    [[nodiscard]] explicit project_path_rooter(std::filesystem::path project_directory);

    /// @throws std::invalid_argument for an empty include or an embedded NUL.
    [[nodiscard]] std::string operator()(std::string_view include) const;

    [[nodiscard]] const std::filesystem::path& project_directory() const noexcept
    {
      return project_directory_;
    }

  private:
    std::filesystem::path project_directory_;
  };

} // namespace treeorder::path

#endif // TREEORDER_PATH_PATH_ROOTER_HPP
