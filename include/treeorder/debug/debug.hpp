// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception

#ifndef TREEORDER_DEBUG_DEBUG_HPP
#define TREEORDER_DEBUG_DEBUG_HPP

#include <cstdint>
#include <format>
#include <string>
#include <string_view>
#include <utility>

#include <function2/function2.hpp>

namespace treeorder::debug {

  enum class level : std::uint32_t {
    error   = 0x1,
    warning = 0x2,
    info    = 0x4,
    debug   = 0x8,
  };

  namespace level_mask {
    constexpr inline std::uint32_t none    = 0x0;
    constexpr inline std::uint32_t error   = 0x1;
    constexpr inline std::uint32_t warning = error | 0x2;
    constexpr inline std::uint32_t info    = warning | 0x4;
    constexpr inline std::uint32_t all     = 0xF;
  } // namespace level_mask

  using sink_fn = fu2::unique_function<void(level, std::string_view)>;

  [[nodiscard]] std::string_view to_string(level lvl) noexcept;

  // Default mask is level_mask::warning.
  void          set_level_mask(std::uint32_t mask) noexcept;
  [[nodiscard]] std::uint32_t level_mask_value() noexcept;
  [[nodiscard]] bool          enabled(level lvl) noexcept;

  // Replaces the sink. An empty function restores the default std::clog sink.
  void set_sink(sink_fn sink);

  // Reads TREEORDER_LOG_LEVEL (none, error, warning, info, debug, all).
  // Returns false and keeps the current mask when the value is unknown.
  bool configure_from_environment();

  // Parses a level name case-insensitively into a mask.
  [[nodiscard]] bool parse_level_mask(std::string_view name, std::uint32_t& mask) noexcept;

  void write(level lvl, std::string_view message);

  template <typename... Args>
  inline void log(level lvl, std::format_string<Args...> format, Args&&... args)
  {
    if (!enabled(lvl)) {
      return;
    }
    write(lvl, std::format(format, std::forward<Args>(args)...));
  }

  template <typename... Args>
  inline void error(std::format_string<Args...> format, Args&&... args)
  {
    log(level::error, format, std::forward<Args>(args)...);
  }

  template <typename... Args>
  inline void warning(std::format_string<Args...> format, Args&&... args)
  {
    log(level::warning, format, std::forward<Args>(args)...);
  }

  template <typename... Args>
  inline void info(std::format_string<Args...> format, Args&&... args)
  {
    log(level::info, format, std::forward<Args>(args)...);
  }

  template <typename... Args>
  inline void trace(std::format_string<Args...> format, Args&&... args)
  {
    log(level::debug, format, std::forward<Args>(args)...);
  }

} // namespace treeorder::debug

#endif // TREEORDER_DEBUG_DEBUG_HPP
