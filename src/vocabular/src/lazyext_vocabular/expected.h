/*****************************************************************/ /**
 * @file   expected.h
 * @brief  Contains the `Expected` vocabulary type.
 * @author Raphael Dib Nehme
 * @date   January 2026
 *********************************************************************/
#ifndef __HG_LAZYEXT_VOCABULAR_EXPECTED
#define __HG_LAZYEXT_VOCABULAR_EXPECTED

#include <concepts>
#include <functional>
#include <new>
#include <type_traits>
#include <utility>
#include <lazyext_contracts/contracts.h>

namespace lazyext
{
  /// @brief Tag struct for constructing errors in Expected
  struct unexpected_t
  {
  };

  /// @brief Tag object for constructing errors in Expected
  inline constexpr unexpected_t unexpected;

  /// @brief Tag struct for constructing an object in place
  struct in_place_t
  {
  };

  /// @brief Tag object for constructing an object in place
  inline constexpr in_place_t in_place;

  /// @brief A helper class that can hold either a value or an error.
  /// Example Usage:
  /// @code{.cpp}
  /// Expected<int, const char*> div(int a, int b)
  /// {
  ///   if (b != 0)
  ///     return a / b;
  ///   return { unexpected, "Division by zero is prohibited!" };
  /// }
  /// @endcode
  /// The error constructors only exist if the error type can be built
  /// from their arguments: an `Expected` over an uninhabited error type
  /// (see `Never`) can only ever be constructed with a value.
  /// @tparam ExpectedTy The expected type
  /// @tparam ErrorTy The error type
  template<typename ExpectedTy, typename ErrorTy>
  class Expected
  {
    static_assert(
        !std::is_reference_v<ExpectedTy> && !std::is_reference_v<ErrorTy>,
        "Expected cannot store references, use pointers instead!");

    /// @brief Buffer for both error type and expected value
    union
    {
      /// @brief The expected value (active when is_error_v == false)
      ExpectedTy expected;
      /// @brief The error value (active when is_error_v == true)
      ErrorTy error_v;
    };

    /// @brief True if an error is stored in the Expected
    bool is_error_v;

    /// @brief Destroys the active member
    constexpr void destroy() noexcept(
        std::is_nothrow_destructible_v<ExpectedTy>
        && std::is_nothrow_destructible_v<ErrorTy>)
    {
      if (is_error_v)
        error_v.~ErrorTy();
      else
        expected.~ExpectedTy();
    }

    /// @brief Constructs the active member of `this` from `other`.
    /// `is_error_v` must already be set.
    /// @param other The Expected to copy or move from
    template<typename Other>
    constexpr void construct_from(Other&& other)
    {
      if (is_error_v)
        new (&error_v) ErrorTy(std::forward<Other>(other).error_v);
      else
        new (&expected) ExpectedTy(std::forward<Other>(other).expected);
    }

  public:
    /// @brief The value type
    using value_type = ExpectedTy;
    /// @brief The error type
    using error_type = ErrorTy;

    /// @brief Default constructs an error in the Expected
    /// @param  unexpected_t tag
    constexpr Expected(unexpected_t) noexcept(
        std::is_nothrow_default_constructible_v<ErrorTy>)
      requires std::default_initializable<ErrorTy>
        : is_error_v(true)
    {
      new (&error_v) ErrorTy();
    }

    /// @brief Copy constructs an error in the Expected
    /// @param  unexpected_t tag
    /// @param value The value to copy
    constexpr Expected(unexpected_t, const ErrorTy& value) noexcept(
        std::is_nothrow_copy_constructible_v<ErrorTy>)
      requires std::copy_constructible<ErrorTy>
        : is_error_v(true)
    {
      new (&error_v) ErrorTy(value);
    }

    /// @brief Move constructs an error in the Expected
    /// @param  unexpected_t tag
    /// @param to_move The value to move
    constexpr Expected(unexpected_t, ErrorTy&& to_move) noexcept(
        std::is_nothrow_move_constructible_v<ErrorTy>)
      requires std::move_constructible<ErrorTy>
        : is_error_v(true)
    {
      new (&error_v) ErrorTy(std::move(to_move));
    }

    /// @brief Constructs an error in place in the Expected
    /// @tparam ...Args Parameter pack
    /// @param ...args Argument pack forwarded to the constructor
    template<typename... Args>
      requires std::constructible_from<ErrorTy, Args...>
    constexpr Expected(in_place_t, unexpected_t, Args&&... args) noexcept(
        std::is_nothrow_constructible_v<ErrorTy, Args...>)
        : is_error_v(true)
    {
      new (&error_v) ErrorTy(std::forward<Args>(args)...);
    }

    /// @brief Default constructs an expected value in the Expected
    constexpr Expected() noexcept(
        std::is_nothrow_default_constructible_v<ExpectedTy>)
      requires std::default_initializable<ExpectedTy>
        : is_error_v(false)
    {
      new (&expected) ExpectedTy();
    }

    /// @brief Copy constructs an expected value in the Expected
    /// @param value The value to copy
    constexpr Expected(const ExpectedTy& value) noexcept(
        std::is_nothrow_copy_constructible_v<ExpectedTy>)
        : is_error_v(false)
    {
      new (&expected) ExpectedTy(value);
    }

    /// @brief Move constructs an expected value in the Expected
    /// @param to_move The value to move
    constexpr Expected(ExpectedTy&& to_move) noexcept(
        std::is_nothrow_move_constructible_v<ExpectedTy>)
        : is_error_v(false)
    {
      new (&expected) ExpectedTy(std::move(to_move));
    }

    /// @brief Constructs an expected value in place in the Expected
    /// @param arg The first argument forwarded to the constructor
    /// @param ...args The rest of the arguments
    template<typename Ty, typename... Args>
      requires(!std::same_as<std::remove_cvref_t<Ty>, unexpected_t>)
    constexpr Expected(in_place_t, Ty&& arg, Args&&... args) noexcept(
        std::is_nothrow_constructible_v<ExpectedTy, Ty, Args...>)
        : is_error_v(false)
    {
      new (&expected) ExpectedTy(std::forward<Ty>(arg), std::forward<Args>(args)...);
    }

    /// @brief Copy constructs an Expected
    /// @param copy The Expected to copy
    constexpr Expected(const Expected& copy) noexcept(
        std::is_nothrow_copy_constructible_v<ExpectedTy>
        && std::is_nothrow_copy_constructible_v<ErrorTy>)
        : is_error_v(copy.is_error_v)
    {
      construct_from(copy);
    }

    /// @brief Move constructs an Expected
    /// @param move The Expected to move
    constexpr Expected(Expected&& move) noexcept(
        std::is_nothrow_move_constructible_v<ExpectedTy>
        && std::is_nothrow_move_constructible_v<ErrorTy>)
        : is_error_v(move.is_error_v)
    {
      construct_from(std::move(move));
    }

    /// @brief Copy assignment operator
    /// @param copy The Expected to copy
    /// @return Self
    constexpr Expected& operator=(const Expected& copy) noexcept(
        std::is_nothrow_copy_constructible_v<ExpectedTy>
        && std::is_nothrow_copy_constructible_v<ErrorTy>
        && std::is_nothrow_destructible_v<ErrorTy>
        && std::is_nothrow_destructible_v<ExpectedTy>)
    {
      if (&copy == this)
        return *this;
      destroy();
      is_error_v = copy.is_error_v;
      construct_from(copy);
      return *this;
    }

    /// @brief Move assignment operator
    /// @param move The Expected to move
    /// @return Self
    constexpr Expected& operator=(Expected&& move) noexcept(
        std::is_nothrow_move_constructible_v<ExpectedTy>
        && std::is_nothrow_move_constructible_v<ErrorTy>
        && std::is_nothrow_destructible_v<ErrorTy>
        && std::is_nothrow_destructible_v<ExpectedTy>)
    {
      if (&move == this)
        return *this;
      destroy();
      is_error_v = move.is_error_v;
      construct_from(std::move(move));
      return *this;
    }

    /// @brief Destructs the value/error contained in the Expected
    constexpr ~Expected() noexcept(
        std::is_nothrow_destructible_v<ExpectedTy>
        && std::is_nothrow_destructible_v<ErrorTy>)
    {
      destroy();
    }

    /// @brief Check if the Expected contains an error
    /// @return True if the Expected contains an error
    constexpr bool is_error() const noexcept { return is_error_v; }
    /// @brief Check if the Expected contains an expected value
    /// @return True if the Expected contains an expected value
    constexpr bool is_expect() const noexcept { return !is_error_v; }

    /// @brief Check if the Expected contains an error.
    /// Same as is_error().
    /// @return True if the Expected contains an error
    constexpr bool operator!() const noexcept { return is_error_v; }
    /// @brief Check if the Expected contains an expected value.
    /// Same as is_expect().
    /// @return True if the Expected contains an expected value
    explicit constexpr operator bool() const noexcept { return !is_error_v; }

    /// @brief Returns the stored Expected value.
    /// @return The Expected value
    /// @pre is_expect()
    constexpr const ExpectedTy* operator->() const noexcept
    {
      LAZYEXT_pre(is_expect(), "Expected contained an error!");
      return &expected;
    }

    /// @brief Returns the stored Expected value.
    /// @return The Expected value
    /// @pre is_expect()
    constexpr ExpectedTy* operator->() noexcept
    {
      LAZYEXT_pre(is_expect(), "Expected contained an error!");
      return &expected;
    }

    /// @brief Returns the stored Expected value.
    /// @return The Expected value.
    /// @pre is_expect()
    constexpr const ExpectedTy& operator*() const& noexcept { return value(); }
    /// @brief Returns the stored Expected value.
    /// @return The Expected value.
    /// @pre is_expect()
    constexpr ExpectedTy& operator*() & noexcept { return value(); }
    /// @brief Returns the stored Expected value.
    /// @return The Expected value.
    /// @pre is_expect()
    constexpr ExpectedTy&& operator*() && noexcept
    {
      return std::move(*this).value();
    }

    /// @brief Returns the stored Expected value.
    /// @return The Expected value.
    /// @pre is_expect()
    constexpr const ExpectedTy& value() const& noexcept
    {
      LAZYEXT_pre(is_expect(), "Expected contained an error!");
      return expected;
    }

    /// @brief Returns the stored Expected value.
    /// @return The Expected value.
    /// @pre is_expect()
    constexpr ExpectedTy& value() & noexcept
    {
      LAZYEXT_pre(is_expect(), "Expected contained an error!");
      return expected;
    }

    /// @brief Returns the stored Expected value.
    /// @return The Expected value.
    /// @pre is_expect()
    constexpr ExpectedTy&& value() && noexcept
    {
      LAZYEXT_pre(is_expect(), "Expected contained an error!");
      return std::move(expected);
    }

    /// @brief Returns the stored error value.
    /// @return The error value.
    /// @pre is_error()
    constexpr const ErrorTy& error() const& noexcept
    {
      LAZYEXT_pre(is_error(), "Expected did not contain an error!");
      return error_v;
    }

    /// @brief Returns the stored error value.
    /// @return The error value.
    /// @pre is_error()
    constexpr ErrorTy& error() & noexcept
    {
      LAZYEXT_pre(is_error(), "Expected did not contain an error!");
      return error_v;
    }

    /// @brief Returns the stored error value.
    /// @return The error value.
    /// @pre is_error()
    constexpr ErrorTy&& error() && noexcept
    {
      LAZYEXT_pre(is_error(), "Expected did not contain an error!");
      return std::move(error_v);
    }

    /********************************/
    // MAP
    /********************************/

    /// @brief Transforms the value if contained, keeping the error otherwise.
    /// @param f Function taking the value
    /// @return Expected of the result of `f`
    template<typename F>
    constexpr auto map(F&& f) const&
    {
      static_assert(
          std::invocable<F, const ExpectedTy&>,
          "Function must have the value type as argument!");
      using U = std::remove_cvref_t<std::invoke_result_t<F, const ExpectedTy&>>;
      if (is_expect())
        return Expected<U, ErrorTy>(std::invoke(std::forward<F>(f), expected));
      return Expected<U, ErrorTy>(unexpected, error_v);
    }

    /// @brief Transforms the value if contained, keeping the error otherwise.
    /// @param f Function taking the value
    /// @return Expected of the result of `f`
    template<typename F>
    constexpr auto map(F&& f) &&
    {
      static_assert(
          std::invocable<F, ExpectedTy&&>,
          "Function must have the value type as argument!");
      using U = std::remove_cvref_t<std::invoke_result_t<F, ExpectedTy&&>>;
      if (is_expect())
        return Expected<U, ErrorTy>(
            std::invoke(std::forward<F>(f), std::move(expected)));
      return Expected<U, ErrorTy>(unexpected, std::move(error_v));
    }
  };
} // namespace lazyext

#endif // !__HG_LAZYEXT_VOCABULAR_EXPECTED
