/*****************************************************************/ /**
 * @file   keyed_store.h
 * @brief  Contains `KeyedStore`, a map from key types to values.
 *
 * @author Raphael Dib Nehme
 * @date   January 2026
 *********************************************************************/
#ifndef __HG_LAZYEXT_PLUGIN_KEYED_STORE
#define __HG_LAZYEXT_PLUGIN_KEYED_STORE

#include <cstddef>
#include <optional>
#include <unordered_map>
#include <utility>
#include <vector>

#include <lazyext_plugin_export.h>
#include <lazyext_plugin_config.h>
#include <lazyext_contracts/contracts.h>
#include <lazyext_type_erase/box.h>
#include <lazyext_type_erase/type_id.h>
#include <lazyext_plugin/key.h>

namespace lazyext
{
  /// @brief Heterogeneous map storing at most one value per key type.
  /// The value stored for a key `K` is always of type `key_value_t<K>`:
  /// the typed API upholds this by construction, and the type-erased
  /// API (taking a `TypeId`) relies on the caller to do the same.
  /// Pointers returned by the store are invalidated when their entry is
  /// removed, replaced, or when the store is destroyed.
  /// @note Not thread safe.
  class LAZYEXT_PLUGIN_EXPORT KeyedStore
  {
    /// @brief The entries
    std::unordered_map<TypeId, Box> _entries;
#if LAZYEXT_REENTRANCY_CHECKS
    /// @brief The keys whose value is being computed (innermost last)
    std::vector<TypeId> _in_flight;
#endif

  public:
    /// @brief Marks a key as being computed for the lifetime of the guard.
    /// Constructing a guard for a key that is already being computed in
    /// the same store is a precondition violation.
    /// Does nothing if built without `LAZYEXT_REENTRANCY_CHECKS`.
    class LAZYEXT_PLUGIN_EXPORT ComputationGuard
    {
      /// @brief The store in which the key is marked
      KeyedStore* _store;
      /// @brief The key being computed
      TypeId _key;

    public:
      /// @brief Marks `key` as being computed in `store`
      /// @param store The store
      /// @param key The key
      /// @pre !store.is_computing(key)
      /// @throw std::bad_alloc on allocation failure
      ComputationGuard(KeyedStore& store, TypeId key);
      /// @brief Unmarks the key
      ~ComputationGuard() noexcept;

      ComputationGuard(const ComputationGuard&)            = delete;
      ComputationGuard& operator=(const ComputationGuard&) = delete;
    };

    /// @brief Constructs an empty store
    KeyedStore() noexcept = default;
    KeyedStore(KeyedStore&&) noexcept            = default;
    KeyedStore& operator=(KeyedStore&&) noexcept = default;
    KeyedStore(const KeyedStore&)                = delete;
    KeyedStore& operator=(const KeyedStore&)     = delete;
    ~KeyedStore() noexcept                       = default;

    /// @brief Returns the number of entries
    /// @return The number of entries
    std::size_t size() const noexcept { return _entries.size(); }
    /// @brief Check if the store has no entries
    /// @return True if the store is empty
    bool is_empty() const noexcept { return _entries.empty(); }
    /// @brief Removes all the entries
    void clear() noexcept;

    /// @brief Check if an entry exists for a key
    /// @param key The key
    /// @return True if an entry exists
    bool contains(TypeId key) const noexcept;
    /// @brief Returns the box stored for a key
    /// @param key The key
    /// @return The box or nullptr if there is no entry
    Box* find(TypeId key) noexcept;
    /// @brief Returns the box stored for a key
    /// @param key The key
    /// @return The box or nullptr if there is no entry
    const Box* find(TypeId key) const noexcept;
    /// @brief Stores a box for a key, replacing any previous entry
    /// @param key The key
    /// @param value The box (must not be empty)
    /// @return The stored box
    Box& insert_box(TypeId key, Box&& value);
    /// @brief Removes the entry of a key, if any
    /// @param key The key
    /// @return True if an entry was removed
    bool erase(TypeId key) noexcept;
    /// @brief Check if a value is being computed for a key.
    /// Always false if built without `LAZYEXT_REENTRANCY_CHECKS`.
    /// @param key The key
    /// @return True if a guard exists for that key
    bool is_computing(TypeId key) const noexcept;

    /// @brief Check if an entry exists for `K`
    /// @tparam K The key type
    /// @return True if an entry exists
    template<IsKey K>
    bool contains() const noexcept
    {
      return contains(TypeId::of<K>());
    }

    /// @brief Stores the value of `K`, replacing any previous entry
    /// @tparam K The key type
    /// @param value The value to store
    /// @return Reference to the stored value
    template<IsKey K>
    key_value_t<K>& insert(key_value_t<K> value)
    {
      return emplace<K>(std::move(value));
    }

    /// @brief Constructs the value of `K` in place, replacing any previous entry
    /// @tparam K The key type
    /// @param ...args The arguments forwarded to the constructor
    /// @return Reference to the stored value
    template<IsKey K, typename... Args>
    key_value_t<K>& emplace(Args&&... args)
    {
      using value_t = key_value_t<K>;
      return insert_box(
                 TypeId::of<K>(), Box::make<value_t>(std::forward<Args>(args)...))
          .template as<value_t>();
    }

    /// @brief Returns the value of `K`
    /// @tparam K The key type
    /// @return Pointer to the value, or nullptr if there is no entry
    /// @pre The entry, if any, holds a `key_value_t<K>`
    template<IsKey K>
    const key_value_t<K>* retrieve_ref() const noexcept
    {
      auto box = find(TypeId::of<K>());
      if (box == nullptr)
        return nullptr;
      auto value = box->template try_as<key_value_t<K>>();
      LAZYEXT_pre(value != nullptr, "The entry does not hold the value type of its key!");
      return value;
    }

    /// @brief Returns the value of `K`
    /// @tparam K The key type
    /// @return Pointer to the value, or nullptr if there is no entry
    /// @pre The entry, if any, holds a `key_value_t<K>`
    template<IsKey K>
    key_value_t<K>* retrieve_mut() noexcept
    {
      auto box = find(TypeId::of<K>());
      if (box == nullptr)
        return nullptr;
      auto value = box->template try_as<key_value_t<K>>();
      LAZYEXT_pre(value != nullptr, "The entry does not hold the value type of its key!");
      return value;
    }

    /// @brief Removes the entry of `K`, if any
    /// @tparam K The key type
    /// @return True if an entry was removed
    template<IsKey K>
    bool remove() noexcept
    {
      return erase(TypeId::of<K>());
    }

    /// @brief Removes the entry of `K` and returns its value
    /// @tparam K The key type
    /// @return The value, or nullopt if there was no entry
    template<IsKey K>
    std::optional<key_value_t<K>> take()
    {
      const auto key = TypeId::of<K>();
      auto value     = retrieve_mut<K>();
      if (value == nullptr)
        return std::nullopt;
      std::optional<key_value_t<K>> ret{std::move(*value)};
      erase(key);
      return ret;
    }

    /// @brief Check if a value is being computed for `K`
    /// @tparam K The key type
    /// @return True if a value is being computed
    template<IsKey K>
    bool is_computing() const noexcept
    {
      return is_computing(TypeId::of<K>());
    }
  };
} // namespace lazyext

#endif // !__HG_LAZYEXT_PLUGIN_KEYED_STORE
