// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception

#include <treeorder/path/path_rooter.hpp>

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace treeorder::path {

  namespace {
    auto to_generic(std::string_view include) -> std::string
    {
      auto s = std::string{include};
      std::ranges::replace(s, '\\', '/');
      return s;
    }
  } // namespace

  project_path_rooter::project_path_rooter(std::filesystem::path project_directory)
      : project_directory_(std::move(project_directory))
  {
    if (!project_directory_.is_absolute()) {
      throw std::invalid_argument(
        "project_path_rooter: project directory must be absolute: "
        + project_directory_.generic_string());
    }

    project_directory_ = project_directory_.lexically_normal();
  }

  std::string project_path_rooter::operator()(std::string_view include) const
  {
    if (include.empty()) {
      throw std::invalid_argument("project_path_rooter: include is empty");
    }
    if (include.find('\0') != std::string_view::npos) {
      throw std::invalid_argument("project_path_rooter: include contains a NUL character");
    }

    auto const relative = std::filesystem::path{to_generic(include)};
    auto const rooted   = relative.is_absolute() ? relative : project_directory_ / relative;

    return rooted.lexically_normal().generic_string();
  }

} // namespace treeorder::path
