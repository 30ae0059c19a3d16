/*****************************************************************/ /**
 * @file   keyed_store.cpp
 * @brief  Implementation of `keyed_store.h`
 * 
 * @author Raphael Dib Nehme
 * @date   January 2026
 *********************************************************************/
#include "keyed_store.h"
#include <algorithm>
#include <lazyext_contracts/contracts.h>

namespace lazyext
{
  void KeyedStore::clear() noexcept
  {
    _entries.clear();
  }

  bool KeyedStore::contains(TypeId key) const noexcept
  {
    return _entries.contains(key);
  }

  Box* KeyedStore::find(TypeId key) noexcept
  {
    auto it = _entries.find(key);
    return it == _entries.end() ? nullptr : &it->second;
  }

  const Box* KeyedStore::find(TypeId key) const noexcept
  {
    auto it = _entries.find(key);
    return it == _entries.end() ? nullptr : &it->second;
  }

  Box& KeyedStore::insert_box(TypeId key, Box&& value)
  {
    LAZYEXT_pre(!value.is_empty(), "Cannot store an empty Box!");
    return _entries.insert_or_assign(key, std::move(value)).first->second;
  }

  bool KeyedStore::erase(TypeId key) noexcept
  {
    return _entries.erase(key) != 0;
  }

  bool KeyedStore::is_computing(TypeId key) const noexcept
  {
#if LAZYEXT_REENTRANCY_CHECKS
    return std::find(_in_flight.begin(), _in_flight.end(), key)
           != _in_flight.end();
#else
    (void)key;
    return false;
#endif
  }

  KeyedStore::ComputationGuard::ComputationGuard(KeyedStore& store, TypeId key)
      : _store(&store)
      , _key(key)
  {
#if LAZYEXT_REENTRANCY_CHECKS
    LAZYEXT_pre(
        !store.is_computing(key),
        "An extension was requested while its own value was being computed!");
    store._in_flight.push_back(key);
#endif
  }

  KeyedStore::ComputationGuard::~ComputationGuard() noexcept
  {
#if LAZYEXT_REENTRANCY_CHECKS
    auto& in_flight = _store->_in_flight;
    // guards are destroyed in reverse order of construction
    auto it = std::find(in_flight.rbegin(), in_flight.rend(), _key);
    if (it != in_flight.rend())
      in_flight.erase(std::next(it).base());
#endif
  }
} // namespace lazyext
