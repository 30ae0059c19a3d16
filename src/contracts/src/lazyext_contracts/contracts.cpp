/*****************************************************************/ /**
 * @file   contracts.cpp
 * @brief  Implementation of `contracts.h`
 * 
 * @author Raphael Dib Nehme
 * @date   Oct 2025
 *********************************************************************/
#include <atomic>
#include <cstdio>
#include <cstdlib>
#include <string>
#include <cpptrace/cpptrace.hpp>

#include <lazyext_debugging/debugging.h>
#include "contracts.h"

namespace lazyext::contracts
{
  static std::atomic<violation_handler_fn_t*> global_handler = nullptr;

  void unreachable(const std::source_location& loc) noexcept
  {
    violation_handler(
        "lazyext::contracts::unreachable()", "An unreachable branch was hit.",
        Kind::Assert, loc);
    std::abort();
  }

  /// @brief Generates the current stack trace, or an empty string on failure
  /// @param with_color Set to true if stderr is a terminal
  /// @return The stack trace
  static std::string current_trace(bool& with_color) noexcept
  {
    try
    {
      with_color = cpptrace::isatty(cpptrace::stderr_fileno);
      // skip `current_trace`, `default_runtime_violation_handler`,
      // `runtime_violation_handler` and `violation_handler`
      return cpptrace::generate_trace(4).to_string(with_color);
    }
    catch (...)
    {
      // the report is still printed, without a trace
      with_color = false;
      return {};
    }
  }

  void default_runtime_violation_handler(
      const char* expr, const char* explanation, Kind kind,
      const std::optional<std::source_location>& loc_opt) noexcept
  {
    const char* kind_str = to_string(kind);
    bool with_color         = false;
    const std::string trace = current_trace(with_color);

    // color codes are empty strings when not writing to a terminal
    const char* red     = with_color ? "\x1b[41m" : "";
    const char* green   = with_color ? "\x1b[32m" : "";
    const char* blue    = with_color ? "\x1b[34m" : "";
    const char* yellow  = with_color ? "\x1b[33m" : "";
    const char* magenta = with_color ? "\x1b[95m" : "";
    const char* cyan    = with_color ? "\x1b[96m" : "";
    const char* reset   = with_color ? "\x1b[0m" : "";

    std::fprintf(stderr, "%sFATAL ERROR:%s\n", red, reset);
    if (loc_opt.has_value())
    {
      auto& loc = *loc_opt;
      std::fprintf(
          stderr, "  in %s%s%s:%s%u:%u%s\n  in %s%s%s\n", green,
          loc.file_name(), reset, blue, static_cast<unsigned>(loc.line()),
          static_cast<unsigned>(loc.column()), reset, yellow,
          loc.function_name(), reset);
    }
    std::fprintf(
        stderr, "  %s%s%s: %s%s%s\n  %sexplanation%s: %s\n", magenta, kind_str,
        reset, cyan, expr, reset, magenta, reset, explanation);
    if (!trace.empty())
      std::fprintf(stderr, "\n  %s", trace.c_str());

    std::fflush(stderr);
    lazyext::breakpoint_if_debugging();
    std::abort();
  }

  void runtime_violation_handler(
      const char* expr, const char* explanation, Kind kind,
      const std::optional<std::source_location>& loc) noexcept
  {
    auto handler = global_handler.load(std::memory_order_acquire);
    if (handler)
      handler(expr, explanation, kind, loc);
    else
      default_runtime_violation_handler(expr, explanation, kind, loc);
  }

  violation_handler_fn_t* register_violation_handler(
      violation_handler_fn_t* fn) noexcept
  {
    return global_handler.exchange(fn, std::memory_order_acq_rel);
  }
} // namespace lazyext::contracts
