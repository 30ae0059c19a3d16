/*****************************************************************/ /**
 * @file   tracing.h
 * @brief  Contains tracing macros.
 * Zones are only emitted when built with `LAZYEXT_ENABLE_TRACING`.
 * 
 * @author Raphael Dib Nehme
 * @date   December 2025
 *********************************************************************/
#ifndef __HG_LAZYEXT_TRACING_TRACING
#define __HG_LAZYEXT_TRACING_TRACING

#ifdef LAZYEXT_ENABLE_TRACING
  #include <tracy/Tracy.hpp>

  /// @brief Traces the current function
  #define LAZYEXT_TRACE_FN() ZoneScoped
  /// @brief Traces the current function (with color, 0xRRGGBB)
  #define LAZYEXT_TRACE_FN_C(color) ZoneScopedC(color)
  /// @brief Traces the rest of the current block (which is named)
  /// @code{.cpp}
  /// {
  ///   LAZYEXT_TRACE_BLOCK("eval");
  ///   return P::eval(host);
  /// }
  /// @endcode
  #define LAZYEXT_TRACE_BLOCK(name) ZoneScopedN(name)
  /// @brief Traces the rest of the current block (with color, 0xRRGGBB)
  #define LAZYEXT_TRACE_BLOCK_C(name, color) ZoneScopedNC(name, color)
  /// @brief Attaches a dynamic text to the innermost zone
  #define LAZYEXT_TRACE_TEXT(str, size) ZoneText(str, size)

#else

  /// @brief Traces the current function
  #define LAZYEXT_TRACE_FN() \
    do                       \
    {                        \
    } while (0)
  /// @brief Traces the current function (with color, 0xRRGGBB)
  #define LAZYEXT_TRACE_FN_C(color) \
    do                              \
    {                               \
    } while (0)
  /// @brief Traces the rest of the current block (which is named)
  #define LAZYEXT_TRACE_BLOCK(name)          (void)0
  /// @brief Traces the rest of the current block (with color, 0xRRGGBB)
  #define LAZYEXT_TRACE_BLOCK_C(name, color) (void)0
  /// @brief Attaches a dynamic text to the innermost zone
  #define LAZYEXT_TRACE_TEXT(str, size)      (void)0
#endif // LAZYEXT_ENABLE_TRACING

namespace lazyext
{
  /// @brief Check if the library is built with tracing enabled
  /// @return True if tracing is enabled
  consteval bool is_tracing_enabled() noexcept
  {
#ifndef LAZYEXT_ENABLE_TRACING
    return false;
#else
    return true;
#endif
  }
} // namespace lazyext

#endif // !__HG_LAZYEXT_TRACING_TRACING
