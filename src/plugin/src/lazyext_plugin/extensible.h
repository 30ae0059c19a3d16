/*****************************************************************/ /**
 * @file   extensible.h
 * @brief  Contains the requirements on hosts owning a `KeyedStore`.
 * 
 * @author Raphael Dib Nehme
 * @date   January 2026
 *********************************************************************/
#ifndef __HG_LAZYEXT_PLUGIN_EXTENSIBLE
#define __HG_LAZYEXT_PLUGIN_EXTENSIBLE

#include <concepts>
#include <lazyext_plugin/keyed_store.h>

namespace lazyext
{
  /// @brief A host exposing the store in which its extensions are cached.
  /// The same store must be returned for the whole lifetime of the host.
  template<typename E>
  concept IsExtensible = requires(E& host, const E& const_host) {
    { host.extensions() } -> std::same_as<KeyedStore&>;
    { const_host.extensions() } -> std::same_as<const KeyedStore&>;
  };

  /// @brief Base class for hosts that own their extensions directly.
  /// @code{.cpp}
  /// struct Request : lazyext::Extensible
  /// {
  ///   std::string path;
  /// };
  /// @endcode
  class Extensible
  {
    /// @brief The extensions of the host
    KeyedStore _extensions;

  public:
    /// @brief Returns the extensions of the host
    /// @return The extensions
    KeyedStore& extensions() noexcept { return _extensions; }
    /// @brief Returns the extensions of the host
    /// @return The extensions
    const KeyedStore& extensions() const noexcept { return _extensions; }
  };
} // namespace lazyext

#endif // !__HG_LAZYEXT_PLUGIN_EXTENSIBLE
