/*****************************************************************/ /**
 * @file   compiler.h
 * @brief  Contains macros to abstract compiler differences.
 * 
 * @author Raphael Dib Nehme
 * @date   October 2025
 *********************************************************************/
#ifndef __HG_LAZYEXT_MACROS_COMPILER
#define __HG_LAZYEXT_MACROS_COMPILER

#if defined(_MSC_VER)
  #define LAZYEXT_MSVC 1
#else
  #define LAZYEXT_MSVC 0
#endif

#if defined(__clang__)
  #define LAZYEXT_CLANG 1
#else
  #define LAZYEXT_CLANG 0
#endif

#if defined(__GNUC__) && !LAZYEXT_CLANG
  #define LAZYEXT_GCC 1
#else
  #define LAZYEXT_GCC 0
#endif

#if LAZYEXT_MSVC
  /// @brief Forces inlining of a function
  #define LAZYEXT_FORCE_INLINE __forceinline
#elif LAZYEXT_GCC || LAZYEXT_CLANG
  /// @brief Forces inlining of a function
  #define LAZYEXT_FORCE_INLINE inline __attribute__((always_inline))
#else
  /// @brief Forces inlining of a function
  #define LAZYEXT_FORCE_INLINE inline
#endif

#if LAZYEXT_GCC || LAZYEXT_CLANG
  /// @brief Hints that `x` is usually true
  #define LAZYEXT_LIKELY(x) __builtin_expect(!!(x), 1)
  /// @brief Hints that `x` is usually false
  #define LAZYEXT_UNLIKELY(x) __builtin_expect(!!(x), 0)
#else
  #define LAZYEXT_LIKELY(x)   (x)
  #define LAZYEXT_UNLIKELY(x) (x)
#endif

#endif // !__HG_LAZYEXT_MACROS_COMPILER
