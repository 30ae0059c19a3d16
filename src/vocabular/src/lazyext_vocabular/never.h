/*****************************************************************/ /**
 * @file   never.h
 * @brief  Contains `Never`, a type without any value.
 * @author Raphael Dib Nehme
 * @date   January 2026
 *********************************************************************/
#ifndef __HG_LAZYEXT_VOCABULAR_NEVER
#define __HG_LAZYEXT_VOCABULAR_NEVER

#include <type_traits>
#include <lazyext_contracts/contracts.h>
#include <lazyext_vocabular/expected.h>

namespace lazyext
{
  /// @brief Uninhabited type: no object of this type can ever be created.
  /// Used as the error type of operations that cannot fail:
  /// `Expected<T, Never>` can only be constructed holding a value.
  /// It is copyable so that containers of it stay copyable, but as
  /// there is no first object, there is nothing to copy.
  struct Never
  {
    Never()                        = delete;
    Never(const Never&)            = default;
    Never(Never&&)                 = default;
    Never& operator=(const Never&) = default;
    Never& operator=(Never&&)      = default;
  };

  /// @brief Check if `T` is `Never`
  template<typename T>
  inline constexpr bool is_never_v = std::is_same_v<std::remove_cv_t<T>, Never>;

  /// @brief Returns the value of an infallible Expected.
  /// @param exp The Expected, which cannot contain an error
  /// @return The value
  template<typename T>
  constexpr T& into_value(Expected<T, Never>& exp) noexcept
  {
    if (exp.is_error())
      contracts::unreachable();
    return *exp;
  }

  /// @brief Returns the value of an infallible Expected.
  /// @param exp The Expected, which cannot contain an error
  /// @return The value
  template<typename T>
  constexpr T into_value(Expected<T, Never>&& exp) noexcept(
      std::is_nothrow_move_constructible_v<T>)
  {
    if (exp.is_error())
      contracts::unreachable();
    return std::move(*exp);
  }
} // namespace lazyext

#endif // !__HG_LAZYEXT_VOCABULAR_NEVER
