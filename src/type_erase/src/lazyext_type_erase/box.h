/*****************************************************************/ /**
 * @file   box.h
 * @brief  Contains `Box`, an owning container for an object of any type.
 *
 * @author Raphael Dib Nehme
 * @date   January 2026
 *********************************************************************/
#ifndef __HG_LAZYEXT_TYPE_ERASE_BOX
#define __HG_LAZYEXT_TYPE_ERASE_BOX

#include <cstddef>
#include <cstdint>
#include <new>
#include <type_traits>
#include <utility>

#include <lazyext_contracts/contracts.h>
#include <lazyext_type_erase/type_id.h>
#include "lazyext_type_erase_config.h"

/// @brief Utilities used to implement `Box`
namespace lazyext::type_erase
{
  /// @brief Type erased destructor call
  using type_erased_destructor_t = void (*)(void*) noexcept;
  /// @brief Type erased move constructor call (out, to_move).
  /// The moved-from object is destroyed.
  using type_erased_relocate_t = void (*)(void*, void*) noexcept;

  /// @brief The alignment of the inline buffer of a `Box`
  inline constexpr std::size_t INLINE_BUFFER_ALIGN = alignof(std::max_align_t);
  /// @brief The size of the inline buffer of a `Box`
  inline constexpr std::size_t INLINE_BUFFER_SIZE =
      LAZYEXT_BOX_INLINE_BUFFER_SIZE < sizeof(void*)
          ? sizeof(void*)
          : LAZYEXT_BOX_INLINE_BUFFER_SIZE;

  /// @brief True if an object of type `T` is stored in the inline buffer.
  /// Objects stored inline are relocated when the box is moved, which
  /// must not fail.
  template<typename T>
  inline constexpr bool is_stored_inline_v =
      sizeof(T) <= INLINE_BUFFER_SIZE && alignof(T) <= INLINE_BUFFER_ALIGN
      && std::is_nothrow_move_constructible_v<T>;

  /// @brief Per-type operations of a `Box`
  struct BoxVTable
  {
    /// @brief The identity of the stored type
    TypeId type;
    /// @brief sizeof the stored type
    std::size_t size;
    /// @brief alignof the stored type
    std::size_t align;
    /// @brief Type erased destructor
    type_erased_destructor_t destroy;
    /// @brief Type erased relocation (only used for inline objects)
    type_erased_relocate_t relocate;
  };

  /// @brief Returns the v-table of `T`
  /// @tparam T The type whose operations to type erase
  /// @return Pointer to the v-table (with static storage duration)
  template<typename T>
  const BoxVTable* vtable_of() noexcept
  {
    static const BoxVTable VTABLE = {
        TypeId::of<T>(), sizeof(T), alignof(T),
        +[](void* obj) noexcept { static_cast<T*>(obj)->~T(); },
        +[](void* out, void* in) noexcept
        {
          if constexpr (is_stored_inline_v<T>)
          {
            new (out) T(std::move(*static_cast<T*>(in)));
            static_cast<T*>(in)->~T();
          }
          else
            contracts::unreachable();
        }};
    return &VTABLE;
  }
} // namespace lazyext::type_erase

namespace lazyext
{
  /// @brief Owning, move-only container for a single object of any type.
  /// Small objects that can be moved without throwing are stored in an
  /// inline buffer, other objects are stored on the heap.
  /// The stored type is recovered through `as<T>()`: the caller is trusted
  /// to know the stored type, which is only verified in debug builds.
  /// Use `try_as<T>()` to check the stored type.
  class Box
  {
    union
    {
      /// @brief Inline buffer (active if !_on_heap)
      alignas(type_erase::INLINE_BUFFER_ALIGN) unsigned char
          _buffer[type_erase::INLINE_BUFFER_SIZE];
      /// @brief Heap storage (active if _on_heap)
      void* _heap;
    };
    /// @brief The v-table of the stored object, nullptr if empty
    const type_erase::BoxVTable* _vtable = nullptr;
    /// @brief True if the object is stored on the heap
    bool _on_heap = false;

    void* get_ptr() noexcept { return _on_heap ? _heap : _buffer; }
    const void* get_ptr() const noexcept { return _on_heap ? _heap : _buffer; }

    /// @brief Steals the object of `other`, leaving it empty.
    /// `this` must be empty.
    /// @param other The box to steal from
    void steal(Box& other) noexcept
    {
      if (other._vtable == nullptr)
        return;
      if (other._on_heap)
        _heap = other._heap;
      else
        other._vtable->relocate(_buffer, other._buffer);
      _vtable        = other._vtable;
      _on_heap       = other._on_heap;
      other._vtable  = nullptr;
      other._on_heap = false;
    }

  public:
    /// @brief Constructs an empty box
    Box() noexcept {}
    Box(const Box&)            = delete;
    Box& operator=(const Box&) = delete;
    /// @brief Move constructor
    /// @param other The box to move from (empty after the move)
    Box(Box&& other) noexcept { steal(other); }
    /// @brief Move assignment operator
    /// @param other The box to move from (empty after the move)
    /// @return Self
    Box& operator=(Box&& other) noexcept
    {
      if (&other == this)
        return *this;
      reset();
      steal(other);
      return *this;
    }
    /// @brief Destroys the stored object, if any
    ~Box() noexcept { reset(); }

    /// @brief Constructs a box containing a `T` built from `args`.
    /// @tparam T The type to store
    /// @param ...args The arguments forwarded to the constructor
    /// @return Box containing the new object
    /// @throw std::bad_alloc on allocation failure, or what the constructor throws
    template<typename T, typename... Args>
    static Box make(Args&&... args)
    {
      static_assert(
          std::is_object_v<T> && !std::is_const_v<T> && !std::is_array_v<T>,
          "Box can only store non-const, non-array object types!");

      Box box;
      if constexpr (type_erase::is_stored_inline_v<T>)
      {
        new (box._buffer) T(std::forward<Args>(args)...);
      }
      else
      {
        void* ptr = ::operator new(sizeof(T), std::align_val_t{alignof(T)});
        try
        {
          new (ptr) T(std::forward<Args>(args)...);
        }
        catch (...)
        {
          ::operator delete(ptr, sizeof(T), std::align_val_t{alignof(T)});
          throw;
        }
        box._heap    = ptr;
        box._on_heap = true;
      }
      box._vtable = type_erase::vtable_of<T>();
      return box;
    }

    /// @brief Destroys the stored object, making the box empty
    void reset() noexcept
    {
      if (_vtable == nullptr)
        return;
      _vtable->destroy(get_ptr());
      if (_on_heap)
        ::operator delete(_heap, _vtable->size, std::align_val_t{_vtable->align});
      _vtable  = nullptr;
      _on_heap = false;
    }

    /// @brief Check if the box is empty
    /// @return True if the box does not contain an object
    bool is_empty() const noexcept { return _vtable == nullptr; }
    /// @brief Check if the stored object lives in the inline buffer
    /// @return True if the box is not empty and its object is stored inline
    bool is_inline() const noexcept { return _vtable != nullptr && !_on_heap; }

    /// @brief Returns the identity of the stored type
    /// @return The TypeId of the stored object
    /// @pre !is_empty()
    TypeId type() const noexcept
    {
      LAZYEXT_pre(!is_empty(), "Box was empty!");
      return _vtable->type;
    }

    /// @brief Check if the box contains an object of type `T`
    /// @tparam T The type to check for
    /// @return True if not empty and the stored type is `T`
    template<typename T>
    bool is_type() const noexcept
    {
      return _vtable != nullptr && _vtable->type == TypeId::of<T>();
    }

    /// @brief Returns the stored object if it is of type `T`
    /// @tparam T The type to check for
    /// @return Pointer to the stored object, or nullptr
    template<typename T>
    T* try_as() noexcept
    {
      return is_type<T>() ? static_cast<T*>(get_ptr()) : nullptr;
    }
    /// @brief Returns the stored object if it is of type `T`
    /// @tparam T The type to check for
    /// @return Pointer to the stored object, or nullptr
    template<typename T>
    const T* try_as() const noexcept
    {
      return is_type<T>() ? static_cast<const T*>(get_ptr()) : nullptr;
    }

    /// @brief Returns the stored object.
    /// @tparam T The stored type
    /// @return Reference to the stored object
    /// @pre is_type<T>() (only checked in debug)
    template<typename T>
    T& as() noexcept
    {
      LAZYEXT_debug_pre(is_type<T>(), "Box does not contain an object of that type!");
      return *static_cast<T*>(get_ptr());
    }
    /// @brief Returns the stored object.
    /// @tparam T The stored type
    /// @return Reference to the stored object
    /// @pre is_type<T>() (only checked in debug)
    template<typename T>
    const T& as() const noexcept
    {
      LAZYEXT_debug_pre(is_type<T>(), "Box does not contain an object of that type!");
      return *static_cast<const T*>(get_ptr());
    }

    /// @brief Moves the stored object out of the box, making it empty.
    /// @tparam T The stored type
    /// @return The stored object
    /// @pre is_type<T>() (only checked in debug)
    template<typename T>
    T take() noexcept(std::is_nothrow_move_constructible_v<T>)
    {
      T ret = std::move(as<T>());
      reset();
      return ret;
    }
  };
} // namespace lazyext

#endif // !__HG_LAZYEXT_TYPE_ERASE_BOX
