/*****************************************************************/ /**
 * @file   pluggable.h
 * @brief  Contains the functions returning (and caching) extensions.
 *
 * The value of a plugin is computed the first time it is requested from
 * a host, then stored in the host's `KeyedStore`: every later request
 * returns the stored value, whatever the order of the requests.
 * Failures are returned to the caller and never stored, so a later
 * request evaluates the plugin again.
 * @code{.cpp}
 * struct Request : lazyext::Extensible, lazyext::Pluggable<Request>
 * {
 *   std::string path;
 * };
 *
 * struct Segments
 * {
 *   using extension_type = std::vector<std::string>;
 *   static std::optional<extension_type> eval(const Request& req);
 * };
 *
 * Request req{...};
 * if (auto* segments = req.get_ref<Segments>())
 *   ...
 * @endcode
 *
 * @author Raphael Dib Nehme
 * @date   January 2026
 *********************************************************************/
#ifndef __HG_LAZYEXT_PLUGIN_PLUGGABLE
#define __HG_LAZYEXT_PLUGIN_PLUGGABLE

#include <concepts>
#include <cstring>

#include <lazyext_contracts/contracts.h>
#include <lazyext_macros/compiler.h>
#include <lazyext_tracing/tracing.h>
#include <lazyext_type_erase/type_id.h>
#include <lazyext_plugin/extensible.h>
#include <lazyext_plugin/keyed_store.h>
#include <lazyext_plugin/plugin.h>

namespace lazyext
{
  /// @brief Returns the value of `P` for `host`, computing it if needed.
  /// On a miss, `P` is evaluated with `host` and its value is stored in
  /// the host's extensions. While `P` is being evaluated, requesting
  /// `P` again from the same host is a precondition violation.
  /// @tparam P The plugin
  /// @param host The host
  /// @return Pointer to the stored value (nullptr on failure for plugins
  /// returning `std::optional`, `Expected` holding the error otherwise).
  /// The pointer is valid until the entry is removed from the host.
  template<typename P, IsExtensible E>
    requires IsPlugin<P, E>
  auto get_mut(E& host) -> typename plugin_outcome_t<P, E>::mut_type
  {
    using outcome = plugin_outcome_t<P, E>;
    using value_t = key_value_t<P>;

    const TypeId key   = TypeId::of<P>();
    KeyedStore& store  = host.extensions();
    if (value_t* cached = store.retrieve_mut<P>(); LAZYEXT_LIKELY(cached != nullptr))
      return outcome::success(*cached);

    LAZYEXT_TRACE_BLOCK("lazyext::get_mut");
    LAZYEXT_TRACE_TEXT(key.name(), std::strlen(key.name()));

    KeyedStore::ComputationGuard guard{store, key};
    auto result = details::evaluate<P>(host);
    if constexpr (outcome::can_fail)
    {
      if (outcome::is_failure(result))
        return outcome::failure(std::move(result));
    }

    LAZYEXT_assert(
        !store.contains(key),
        "An extension was stored while its plugin was being evaluated!");
    return outcome::success(store.insert<P>(outcome::value(result)));
  }

  /// @brief Returns the value of `P` for `host`, computing it if needed.
  /// @tparam P The plugin
  /// @param host The host
  /// @return Pointer to the stored value (see `get_mut`)
  template<typename P, IsExtensible E>
    requires IsPlugin<P, E>
  auto get_ref(E& host) -> typename plugin_outcome_t<P, E>::ref_type
  {
    return plugin_outcome_t<P, E>::to_ref(get_mut<P>(host));
  }

  /// @brief Returns a copy of the value of `P` for `host`, computing it if needed.
  /// @tparam P The plugin
  /// @param host The host
  /// @return Copy of the stored value (`std::optional` or `Expected`)
  template<typename P, IsExtensible E>
    requires IsPlugin<P, E> && std::copy_constructible<key_value_t<P>>
  auto get(E& host) -> typename plugin_outcome_t<P, E>::copy_type
  {
    return plugin_outcome_t<P, E>::to_copy(get_mut<P>(host));
  }

  /// @brief Evaluates `P` for `host` without looking at nor storing
  /// into the host's extensions.
  /// The host does not need to be extensible.
  /// @tparam P The plugin
  /// @param host The host
  /// @return The result of the evaluation
  template<typename P, typename E>
    requires IsPlugin<P, E>
  auto compute(E& host) -> details::eval_result_t<P, E>
  {
    LAZYEXT_TRACE_BLOCK("lazyext::compute");
    return details::evaluate<P>(host);
  }

  /// @brief Mixin providing the extension functions as members.
  /// @code{.cpp}
  /// struct Request : lazyext::Extensible, lazyext::Pluggable<Request>
  /// {
  /// };
  /// @endcode
  /// @tparam Derived The host type
  template<typename Derived>
  class Pluggable
  {
    Derived& derived() noexcept { return static_cast<Derived&>(*this); }
    const Derived& derived() const noexcept
    {
      return static_cast<const Derived&>(*this);
    }

  public:
    /// @brief Returns a copy of the value of `P` (see `lazyext::get`)
    template<typename P>
    auto get()
    {
      return lazyext::get<P>(derived());
    }
    /// @brief Returns the value of `P` (see `lazyext::get_ref`)
    template<typename P>
    auto get_ref()
    {
      return lazyext::get_ref<P>(derived());
    }
    /// @brief Returns the value of `P` (see `lazyext::get_mut`)
    template<typename P>
    auto get_mut()
    {
      return lazyext::get_mut<P>(derived());
    }
    /// @brief Evaluates `P` without caching (see `lazyext::compute`)
    template<typename P>
    auto compute()
    {
      return lazyext::compute<P>(derived());
    }
    /// @brief Evaluates `P` without caching (see `lazyext::compute`)
    template<typename P>
    auto compute() const
    {
      return lazyext::compute<P>(derived());
    }
  };
} // namespace lazyext

#endif // !__HG_LAZYEXT_PLUGIN_PLUGGABLE
