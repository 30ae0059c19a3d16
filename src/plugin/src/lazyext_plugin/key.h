/*****************************************************************/ /**
 * @file   key.h
 * @brief  Contains the association of extension keys to their values.
 * 
 * @author Raphael Dib Nehme
 * @date   January 2026
 *********************************************************************/
#ifndef __HG_LAZYEXT_PLUGIN_KEY
#define __HG_LAZYEXT_PLUGIN_KEY

#include <type_traits>

namespace lazyext
{
  /// @brief Maps a key type to the type of the value stored for it.
  /// By default, a key is its own value type.
  /// A key can choose another value type by declaring it as
  /// `extension_type`, or by specializing `key_traits`:
  /// @code{.cpp}
  /// struct Counter { using extension_type = int; };
  /// // key_value_t<Counter> is int
  /// @endcode
  /// @tparam K The key type
  template<typename K>
  struct key_traits
  {
    /// @brief The type stored for `K`
    using value_type = K;
  };

  /// @brief Maps a key type declaring `extension_type` to that type
  /// @tparam K The key type
  template<typename K>
    requires requires { typename K::extension_type; }
  struct key_traits<K>
  {
    /// @brief The type stored for `K`
    using value_type = typename K::extension_type;
  };

  /// @brief The type stored for key `K`
  template<typename K>
  using key_value_t = typename key_traits<K>::value_type;

  /// @brief A type usable as a key: its value must be a non-const,
  /// non-array object type.
  template<typename K>
  concept IsKey = std::is_object_v<K> && std::is_object_v<key_value_t<K>>
                  && !std::is_const_v<key_value_t<K>>
                  && !std::is_array_v<key_value_t<K>>;

  /// @brief Empty tag carrying a key type.
  /// Used to select plugin evaluation functions declared outside of the key:
  /// `eval(Host&, Phantom<Key>)` is found through argument dependent lookup.
  /// @tparam K The key type
  template<typename K>
  struct Phantom
  {
    /// @brief The key type
    using key_type = K;
  };
} // namespace lazyext

#endif // !__HG_LAZYEXT_PLUGIN_KEY
