/*****************************************************************/ /**
 * @file   contracts.h
 * @brief  Contains macros for assertions, pre/post conditions.
 * Contract violations are programmer errors: the default handler
 * reports them and aborts the process.
 * 
 * @author Raphael Dib Nehme
 * @date   Oct 2025
 *********************************************************************/
#ifndef __HG_LAZYEXT_CONTRACTS_CONTRACTS
#define __HG_LAZYEXT_CONTRACTS_CONTRACTS

#include "lazyext_contracts_export.h"
#include "lazyext_contracts_config.h"
#include <lazyext_macros/compiler.h>
#include <optional>
#include <source_location>
#include <type_traits>

#ifdef LAZYEXT_NO_SOURCE_LOCATION
  /// @brief The current source location
  #define LAZYEXT_CURRENT_SOURCE_LOCATION std::source_location()
#else
  /// @brief The current source location
  #define LAZYEXT_CURRENT_SOURCE_LOCATION std::source_location::current()
#endif // LAZYEXT_NO_SOURCE_LOCATION

namespace lazyext::contracts
{
  /// @brief The contract kind
  enum class Kind : unsigned char
  {
    /// @brief Precondition
    Pre,
    /// @brief Postcondition
    Post,
    /// @brief Assertion
    Assert,
  };

  /// @brief Returns a human readable name for a contract kind
  /// @param kind The kind
  /// @return "precondition", "postcondition" or "assertion"
  constexpr const char* to_string(Kind kind) noexcept
  {
    switch (kind)
    {
    case Kind::Pre:
      return "precondition";
    case Kind::Post:
      return "postcondition";
    default:
      return "assertion";
    }
  }

  [[noreturn]] LAZYEXT_CONTRACTS_EXPORT
      /// @brief Marks a branch as unreachable.
      /// Reaching it calls the violation handler then aborts, even if the
      /// installed handler returns.
      /// @param loc The source location
      void
      unreachable(
          const std::source_location& loc =
              LAZYEXT_CURRENT_SOURCE_LOCATION) noexcept;

  /// @brief A precondition failed during constant evaluation.
  /// Not being `constexpr`, calling it halts compilation.
  inline void precondition_failed_in_constexpr()
  {
    // A precondition failed at compile-time!
  }
  /// @brief A postcondition failed during constant evaluation.
  inline void postcondition_failed_in_constexpr()
  {
    // A postcondition failed at compile-time!
  }
  /// @brief An assertion failed during constant evaluation.
  inline void assertion_failed_in_constexpr()
  {
    // An assertion failed at compile-time!
  }
  /// @brief An invalid `kind` reached the violation handler during
  /// constant evaluation.
  inline void handler_failed_in_constexpr()
  {
    // Invalid contract kind!
  }

  /// @brief The type of a violation handler function
  using violation_handler_fn_t = void(
      const char*, const char*, Kind,
      const std::optional<std::source_location>&) noexcept;

  [[noreturn]] LAZYEXT_CONTRACTS_EXPORT
      /// @brief The default runtime contract violation handler.
      /// Prints a stack trace and source code information, then aborts.
      /// @param expr The expression as a string
      /// @param explanation The explanation
      /// @param kind The kind of the violation
      /// @param loc The source location
      void
      default_runtime_violation_handler(
          const char* expr, const char* explanation, Kind kind,
          const std::optional<std::source_location>& loc) noexcept;

  LAZYEXT_CONTRACTS_EXPORT
  /// @brief Calls the registered violation handler, or the default one.
  /// @param expr The expression as a string
  /// @param explanation The explanation
  /// @param kind The kind of the violation
  /// @param loc The source location
  void runtime_violation_handler(
      const char* expr, const char* explanation, Kind kind,
      const std::optional<std::source_location>& loc) noexcept;

  /// @brief The contract violation handler.
  /// At compile-time, only a compilation error can be generated.
  /// At runtime, calls the runtime violation handler.
  /// @param expr The expression as a string
  /// @param explanation The explanation
  /// @param kind The violation kind
  /// @param loc The source code location
  constexpr void violation_handler(
      const char* expr, const char* explanation, Kind kind,
      const std::optional<std::source_location>& loc =
          LAZYEXT_CURRENT_SOURCE_LOCATION) noexcept
  {
    if (std::is_constant_evaluated())
    {
      // calling a non-constexpr function halts compilation
      switch (kind)
      {
      case Kind::Pre:
        precondition_failed_in_constexpr();
        break;
      case Kind::Post:
        postcondition_failed_in_constexpr();
        break;
      case Kind::Assert:
        assertion_failed_in_constexpr();
        break;
      default:
        handler_failed_in_constexpr();
        break;
      }
    }
    else
    {
      runtime_violation_handler(expr, explanation, kind, loc);
    }
  }

  LAZYEXT_CONTRACTS_EXPORT
  /// @brief Replaces the current violation handler.
  /// The registered function should not return: if it is called
  /// then a violation happened and program execution should abort.
  /// @param fn The new violation handler, or nullptr to restore the default one
  /// @return The previously registered handler (nullptr for the default one)
  /// @note This function is thread safe.
  violation_handler_fn_t* register_violation_handler(
      violation_handler_fn_t* fn) noexcept;
} // namespace lazyext::contracts

/// @brief Checks that `cond` evaluates to true, reporting a violation of `kind`
#define __LAZYEXT_CONTRACT(cond, explanation, kind)                           \
  do                                                                          \
  {                                                                           \
    if (LAZYEXT_UNLIKELY(!static_cast<bool>(cond)))                           \
      lazyext::contracts::violation_handler(                                  \
          #cond, explanation, lazyext::contracts::Kind::kind);                \
  } while (false)

/// @brief Precondition (checks that `cond` evaluates to true)
#define LAZYEXT_pre(cond, explanation) \
  __LAZYEXT_CONTRACT(cond, explanation, Pre)
/// @brief Postcondition (checks that `cond` evaluates to true)
#define LAZYEXT_post(cond, explanation) \
  __LAZYEXT_CONTRACT(cond, explanation, Post)
/// @brief Assertion (checks that `cond` evaluates to true)
#define LAZYEXT_assert(cond, explanation) \
  __LAZYEXT_CONTRACT(cond, explanation, Assert)

#ifdef LAZYEXT_DEBUG
  /// @brief Precondition that is only evaluated on Debug config
  #define LAZYEXT_debug_pre(cond, explanation) LAZYEXT_pre(cond, explanation)
  /// @brief Postcondition that is only evaluated on Debug config
  #define LAZYEXT_debug_post(cond, explanation) LAZYEXT_post(cond, explanation)
  /// @brief Assertion that is only evaluated on Debug config
  #define LAZYEXT_debug_assert(cond, explanation) \
    LAZYEXT_assert(cond, explanation)
#else
  /// @brief Precondition that is only evaluated on Debug config
  #define LAZYEXT_debug_pre(cond, explanation) \
    do                                         \
    {                                          \
    } while (false)
  /// @brief Postcondition that is only evaluated on Debug config
  #define LAZYEXT_debug_post(cond, explanation) \
    do                                          \
    {                                           \
    } while (false)
  /// @brief Assertion that is only evaluated on Debug config
  #define LAZYEXT_debug_assert(cond, explanation) \
    do                                            \
    {                                             \
    } while (false)
#endif // LAZYEXT_DEBUG

#endif // !__HG_LAZYEXT_CONTRACTS_CONTRACTS
