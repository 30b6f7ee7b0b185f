// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception

#include <treeorder/debug/debug.hpp>

#include <atomic>
#include <chrono>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <mutex>

#include <treeorder/string/ordinal_ignore_case.hpp>

namespace treeorder::debug {

  namespace {
    struct named_mask {
      std::string_view name;
      std::uint32_t    mask;
    };

    constexpr named_mask const named_masks[] = {
      {"none", level_mask::none},
      {"error", level_mask::error},
      {"warning", level_mask::warning},
      {"info", level_mask::info},
      {"debug", level_mask::all},
      {"all", level_mask::all},
    };

    auto mask_storage() -> std::atomic<std::uint32_t>&
    {
      static std::atomic<std::uint32_t> mask{level_mask::warning};
      return mask;
    }

    // Recursive so a sink may itself log or replace the sink. Writes hold
    // their own reference, so a sink replaced mid-call stays alive until it
    // returns.
    struct sink_state {
      std::recursive_mutex     mutex;
      std::shared_ptr<sink_fn> sink;
    };

    auto state() -> sink_state&
    {
      static sink_state s;
      return s;
    }

    void write_to_clog(level lvl, std::string_view message)
    {
      auto const now = std::chrono::floor<std::chrono::milliseconds>(
        std::chrono::system_clock::now());

      std::clog << std::format("{:%H:%M:%S} [treeorder] {}: {}\n", now, to_string(lvl), message);
    }
  } // namespace

  std::string_view to_string(level lvl) noexcept
  {
    switch (lvl) {
      case level::error: return "error";
      case level::warning: return "warning";
      case level::info: return "info";
      case level::debug: return "debug";
    }
    return "unknown";
  }

  void set_level_mask(std::uint32_t mask) noexcept
  {
    mask_storage().store(mask & level_mask::all, std::memory_order_relaxed);
  }

  std::uint32_t level_mask_value() noexcept
  {
    return mask_storage().load(std::memory_order_relaxed);
  }

  bool enabled(level lvl) noexcept
  {
    return (level_mask_value() & static_cast<std::uint32_t>(lvl)) != 0;
  }

  void set_sink(sink_fn sink)
  {
    auto& s = state();
    auto  lock = std::scoped_lock{s.mutex};

    if (sink) {
      s.sink = std::make_shared<sink_fn>(std::move(sink));
    } else {
      s.sink.reset();
    }
  }

  bool parse_level_mask(std::string_view name, std::uint32_t& mask) noexcept
  {
    for (auto const& entry : named_masks) {
      if (string::ordinal_ignore_case::equals(entry.name, name)) {
        mask = entry.mask;
        return true;
      }
    }
    return false;
  }

  bool configure_from_environment()
  {
    auto const* value = std::getenv("TREEORDER_LOG_LEVEL");
    if (value == nullptr) {
      return true;
    }

    auto mask = std::uint32_t{0};
    if (!parse_level_mask(value, mask)) {
      warning("ignoring unknown TREEORDER_LOG_LEVEL value '{}'", value);
      return false;
    }

    set_level_mask(mask);
    return true;
  }

  void write(level lvl, std::string_view message)
  {
    auto& s = state();
    auto  lock = std::scoped_lock{s.mutex};
    auto  sink = s.sink;

    if (sink) {
      (*sink)(lvl, message);
    } else {
      write_to_clog(lvl, message);
    }
  }

} // namespace treeorder::debug
