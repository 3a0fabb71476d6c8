#pragma once

#include <ordered-map/assert.hh>
#include <ordered-map/fwd.hh>

#include <functional>
#include <type_traits>

// Small building blocks for the containers: value-category casts, alignment arithmetic,
// raw object storage and a range end marker. Kept free of <utility> and <new>.

namespace om
{
/// static_cast to T&&, usable in constant expressions and free of <utility>
template <class T>
[[nodiscard]] OM_FORCE_INLINE constexpr T&& move(T& value) noexcept
{
    return static_cast<T&&>(value);
}

template <class T>
[[nodiscard]] OM_FORCE_INLINE constexpr T&& forward(T& value) noexcept
{
    return static_cast<T&&>(value);
}
template <class T>
[[nodiscard]] OM_FORCE_INLINE constexpr T&& forward(T&& value) noexcept // NOLINT
{
    return static_cast<T&&>(value);
}

/// Stores new_val in obj and hands back what was there before.
///   alloc_start = om::exchange(rhs.alloc_start, nullptr);
template <class T, class U = T>
[[nodiscard]] OM_FORCE_INLINE constexpr T exchange(T& obj, U&& new_val) // NOLINT
{
    T previous = static_cast<T&&>(obj);
    obj = static_cast<U&&>(new_val);
    return previous;
}

/// Returns a on ties
template <class T>
[[nodiscard]] constexpr T const& max(T const& a, T const& b)
{
    return a < b ? b : a;
}

template <class T>
[[nodiscard]] constexpr bool is_power_of_two(T value)
{
    return value > 0 && (value & (value - 1)) == 0;
}

/// Smallest multiple of alignment that is >= value. Works on integers and pointers.
/// Precondition: alignment is a power of two.
template <class T>
[[nodiscard]] constexpr T align_up(T value, isize alignment)
{
    OM_ASSERT(om::is_power_of_two(alignment), "alignment must be a power of 2");
    auto const mask = alignment - 1;
    if constexpr (std::is_pointer_v<T>)
        return reinterpret_cast<T>((reinterpret_cast<std::uintptr_t>(value) + mask) & ~std::uintptr_t(mask));
    else
        return T((value + mask) & ~mask);
}

struct placement_new_t
{
};

/// new (om::placement_new, ptr) T(args...);
/// Selects the placement operator new declared at the end of this header.
constexpr placement_new_t placement_new = {};

/// Raw, suitably aligned room for exactly one T.
/// Nothing is constructed or destroyed automatically; the owner tracks whether `value` is alive.
/// Inherits trivial copy and trivial destruction from T.
template <class T>
union storage_for
{
    T value;

    constexpr storage_for() {}

    ~storage_for()
        requires std::is_trivially_destructible_v<T>
    = default;
    ~storage_for()
        requires(!std::is_trivially_destructible_v<T>)
    {
    }

    storage_for(storage_for const&)
        requires std::is_trivially_copyable_v<T>
    = default;
    storage_for& operator=(storage_for const&)
        requires std::is_trivially_copyable_v<T>
    = default;
};

/// std::invoke under the library's name, used by the lock guards to call user callables
template <class F, class... Args>
constexpr decltype(auto) invoke(F&& f, Args&&... args)
{
    return std::invoke(om::forward<F>(f), om::forward<Args>(args)...);
}

/// end() of ranges that only learn they are exhausted while stepping, like the map traversals.
/// The iterator compares equal to it once there is nothing left.
struct sentinel
{
};
} // namespace om

[[nodiscard]] inline void* operator new(std::size_t, om::placement_new_t, void* p) noexcept
{
    return p;
}

// only called by the compiler if a constructor throws
inline void operator delete(void*, om::placement_new_t, void*) noexcept {}
