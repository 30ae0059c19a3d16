/*****************************************************************/ /**
 * @file   plugin.h
 * @brief  Contains the requirements on plugins computing extensions.
 *
 * A plugin is a key type `P` whose value is computed from a host `E`.
 * The evaluation function is either a static member of the key:
 * @code{.cpp}
 * struct Name
 * {
 *   std::string value;
 *   static std::optional<Name> eval(const Request& req);
 * };
 * @endcode
 * or, for keys that cannot have members, a function found through argument
 * dependent lookup:
 * @code{.cpp}
 * std::optional<int> eval(Request& req, lazyext::Phantom<int>);
 * @endcode
 * Evaluation reports failures either by returning an empty
 * `std::optional<key_value_t<P>>`, or by returning an
 * `Expected<key_value_t<P>, Error>` holding an error.
 * Plugins that cannot fail use `Never` as error type.
 *
 * @author Raphael Dib Nehme
 * @date   January 2026
 *********************************************************************/
#ifndef __HG_LAZYEXT_PLUGIN_PLUGIN
#define __HG_LAZYEXT_PLUGIN_PLUGIN

#include <concepts>
#include <optional>
#include <type_traits>
#include <utility>

#include <lazyext_macros/compiler.h>
#include <lazyext_vocabular/expected.h>
#include <lazyext_vocabular/never.h>
#include <lazyext_plugin/key.h>

namespace lazyext
{
  namespace details
  {
    /// @brief True if `P::eval(E&)` exists
    template<typename P, typename E>
    concept HasMemberEval = requires(E& host) { P::eval(host); };

    /// @brief True if `eval(E&, Phantom<P>)` can be found through ADL
    template<typename P, typename E>
    concept HasPhantomEval =
        requires(E& host) { eval(host, Phantom<P>{}); };

    /// @brief Calls the evaluation function of `P` with `host`
    /// @param host The host
    /// @return The result of the evaluation
    template<typename P, typename E>
      requires HasMemberEval<P, E> || HasPhantomEval<P, E>
    LAZYEXT_FORCE_INLINE decltype(auto) evaluate(E& host)
    {
      if constexpr (HasMemberEval<P, E>)
        return P::eval(host);
      else
        return eval(host, Phantom<P>{});
    }

    /// @brief The type returned by the evaluation function of `P`
    template<typename P, typename E>
    using eval_result_t = decltype(evaluate<P>(std::declval<E&>()));

    template<typename R>
    struct is_expected : std::false_type
    {
    };
    template<typename T, typename Err>
    struct is_expected<Expected<T, Err>> : std::true_type
    {
    };
  } // namespace details

  /// @brief Plugin signaling failures through an empty `std::optional`
  template<typename P, typename E>
  concept IsOptionalPlugin =
      IsKey<P>
      && (details::HasMemberEval<P, E> || details::HasPhantomEval<P, E>)
      && std::same_as<
          details::eval_result_t<P, E>, std::optional<key_value_t<P>>>;

  /// @brief Plugin signaling failures through an `Expected` holding an error
  template<typename P, typename E>
  concept IsFalliblePlugin =
      IsKey<P>
      && (details::HasMemberEval<P, E> || details::HasPhantomEval<P, E>)
      && details::is_expected<details::eval_result_t<P, E>>::value
      && std::same_as<
          typename details::eval_result_t<P, E>::value_type, key_value_t<P>>;

  /// @brief Plugin computing the value of `P` from a host of type `E`
  template<typename P, typename E>
  concept IsPlugin = IsOptionalPlugin<P, E> || IsFalliblePlugin<P, E>;

  /// @brief The error type of a fallible plugin
  template<typename P, typename E>
    requires IsFalliblePlugin<P, E>
  using plugin_error_t = typename details::eval_result_t<P, E>::error_type;

  /// @brief True if the plugin can never fail (its error type is `Never`)
  template<typename P, typename E>
  inline constexpr bool is_infallible_v = false;
  /// @brief True if the plugin can never fail (its error type is `Never`)
  template<typename P, typename E>
    requires IsFalliblePlugin<P, E>
  inline constexpr bool is_infallible_v<P, E> = is_never_v<plugin_error_t<P, E>>;

  /// @brief Describes what is returned to callers for an evaluation result
  /// @tparam R The evaluation result
  template<typename R>
  struct EvalOutcome;

  /// @brief Outcome of plugins signaling failure through `std::optional`.
  /// Failures are returned as null pointers or empty optionals.
  template<typename T>
  struct EvalOutcome<std::optional<T>>
  {
    /// @brief Returned by `get_mut`
    using mut_type = T*;
    /// @brief Returned by `get_ref`
    using ref_type = const T*;
    /// @brief Returned by `get`
    using copy_type = std::optional<T>;

    /// @brief True if the evaluation can fail
    static constexpr bool can_fail = true;

    static bool is_failure(const std::optional<T>& result) noexcept
    {
      return !result.has_value();
    }
    static T&& value(std::optional<T>& result) noexcept { return std::move(*result); }
    static mut_type failure(std::optional<T>&&) noexcept { return nullptr; }
    static mut_type success(T& value) noexcept { return &value; }
    static ref_type to_ref(mut_type value) noexcept { return value; }
    static copy_type to_copy(mut_type value)
    {
      if (value == nullptr)
        return std::nullopt;
      return *value;
    }
  };

  /// @brief Outcome of plugins signaling failure through `Expected`.
  /// Errors are forwarded to the caller unchanged.
  template<typename T, typename Err>
  struct EvalOutcome<Expected<T, Err>>
  {
    /// @brief Returned by `get_mut`
    using mut_type = Expected<T*, Err>;
    /// @brief Returned by `get_ref`
    using ref_type = Expected<const T*, Err>;
    /// @brief Returned by `get`
    using copy_type = Expected<T, Err>;

    /// @brief True if the evaluation can fail
    static constexpr bool can_fail = !is_never_v<Err>;

    static bool is_failure(const Expected<T, Err>& result) noexcept
    {
      return result.is_error();
    }
    static T&& value(Expected<T, Err>& result) noexcept
    {
      return std::move(result).value();
    }
    static mut_type failure(Expected<T, Err>&& result)
    {
      return mut_type(unexpected, std::move(result).error());
    }
    static mut_type success(T& value) noexcept { return mut_type(&value); }
    static ref_type to_ref(mut_type&& value)
    {
      return std::move(value).map([](T* ptr) -> const T* { return ptr; });
    }
    static copy_type to_copy(mut_type&& value)
    {
      return std::move(value).map([](T* ptr) { return T(*ptr); });
    }
  };

  /// @brief The outcome of evaluating `P` with a host of type `E`
  template<typename P, typename E>
    requires IsPlugin<P, E>
  using plugin_outcome_t = EvalOutcome<details::eval_result_t<P, E>>;
} // namespace lazyext

#endif // !__HG_LAZYEXT_PLUGIN_PLUGIN
