/*****************************************************************/ /**
 * @file   type_id.h
 * @brief  Contains `TypeId`, a comparable and hashable type identity.
 * 
 * @author Raphael Dib Nehme
 * @date   January 2026
 *********************************************************************/
#ifndef __HG_LAZYEXT_TYPE_ERASE_TYPE_ID
#define __HG_LAZYEXT_TYPE_ERASE_TYPE_ID

#include <compare>
#include <cstddef>
#include <functional>
#include <typeinfo>

namespace lazyext
{
  /// @brief Identity of a type, obtained through `TypeId::of<T>()`.
  /// Two TypeId compare equal if and only if they were obtained from the
  /// same type (ignoring top-level cv-qualifiers and references).
  /// TypeIds are totally ordered and hashable, but the ordering and hash
  /// values are not stable across runs.
  class TypeId
  {
    /// @brief The type information (never null)
    const std::type_info* _info;

    constexpr explicit TypeId(const std::type_info& info) noexcept
        : _info(&info)
    {
    }

  public:
    /// @brief Returns the identity of `T`
    /// @tparam T The type
    /// @return The TypeId of `T`
    template<typename T>
    static TypeId of() noexcept
    {
      return TypeId{typeid(T)};
    }

    /// @brief Returns the implementation-defined name of the type.
    /// Only meant for diagnostics.
    /// @return The name of the type
    const char* name() const noexcept { return _info->name(); }
    /// @brief Returns the hash of the type
    /// @return The hash
    std::size_t hash() const noexcept { return _info->hash_code(); }

    friend bool operator==(const TypeId& a, const TypeId& b) noexcept
    {
      return *a._info == *b._info;
    }

    friend std::strong_ordering operator<=>(
        const TypeId& a, const TypeId& b) noexcept
    {
      if (*a._info == *b._info)
        return std::strong_ordering::equal;
      return a._info->before(*b._info) ? std::strong_ordering::less
                                       : std::strong_ordering::greater;
    }
  };
} // namespace lazyext

template<>
struct std::hash<lazyext::TypeId>
{
  std::size_t operator()(const lazyext::TypeId& id) const noexcept
  {
    return id.hash();
  }
};

#endif // !__HG_LAZYEXT_TYPE_ERASE_TYPE_ID
