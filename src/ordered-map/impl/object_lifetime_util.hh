#pragma once

#include <ordered-map/fwd.hh>
#include <ordered-map/utility.hh>

#include <cstring>
#include <type_traits>

namespace om::impl
{
/// Calls destructors on [start, end) in reverse order.
/// Empty ranges (start == end) and nullptr are valid and result in a no-op.
template <class T>
void destroy_objects_in_reverse(T* start, T* end)
{
    static_assert(sizeof(T) > 0, "T must be a complete type (did you forget to include a header?)");

    if constexpr (!std::is_trivially_destructible_v<T>)
    {
        while (end != start)
        {
            --end;
            end->~T();
        }
    }
}

/// Copy-constructs objects from [src_start, src_end) into uninitialized memory starting at dest_end.
/// dest_end is incremented for each successfully constructed object; if a copy throws,
/// [original dest_end, dest_end) is exactly the constructed range and can be destroyed by the owner.
template <class T>
void copy_create_objects_to(T*& dest_end, T const* src_start, T const* src_end)
{
    static_assert(sizeof(T) > 0, "T must be a complete type (did you forget to include a header?)");
    static_assert(std::is_copy_constructible_v<T>, "T must be copy constructible");

    if constexpr (std::is_trivially_copyable_v<T>)
    {
        auto const size = src_end - src_start;
        if (size > 0)
        {
            std::memcpy(static_cast<void*>(dest_end), src_start, size * sizeof(T));
            dest_end += size;
        }
    }
    else
    {
        while (src_start != src_end)
        {
            new (om::placement_new, dest_end) T(*src_start);
            ++dest_end;
            ++src_start;
        }
    }
}

/// Move-constructs objects from [src_start, src_end) into uninitialized memory ending at dest_start, back to front.
/// dest_start is decremented after each successful construction, so [dest_start, original dest_start)
/// is always the constructed range, even if a move throws.
///
/// Usage pattern (relocating an old live range in front of freshly appended elements):
///   auto obj_start = new_elements_start;
///   move_create_objects_to_reverse(obj_start, old_start, old_end);
///   // [obj_start, new_elements_end) is now the constructed live range
template <class T>
void move_create_objects_to_reverse(T*& dest_start, T* src_start, T* src_end)
{
    static_assert(sizeof(T) > 0, "T must be a complete type (did you forget to include a header?)");
    static_assert(std::is_move_constructible_v<T>, "T must be move constructible");

    if constexpr (std::is_trivially_copyable_v<T>)
    {
        auto const size = src_end - src_start;
        if (size > 0)
        {
            dest_start -= size;
            std::memcpy(static_cast<void*>(dest_start), src_start, size * sizeof(T));
        }
    }
    else
    {
        while (src_start != src_end)
        {
            --src_end;
            new (om::placement_new, dest_start - 1) T(om::move(*src_end));
            --dest_start; // _after_ construction so exceptions leave dest_start at the constructed range
        }
    }
}

/// Move-constructs objects from [src_start, src_end) into uninitialized memory starting at dest_end.
/// dest_end is incremented for each successfully constructed object, so after an exception
/// [original dest_end, dest_end) is exactly the constructed range.
/// Trivially copyable types are a single memcpy.
///
/// Usage pattern:
///   auto obj_end = obj_start;
///   move_create_objects_to(obj_end, src, src + count);
///   // [obj_start, obj_end) is now the constructed live range
template <class T>
void move_create_objects_to(T*& dest_end, T* src_start, T* src_end)
{
    static_assert(sizeof(T) > 0, "T must be a complete type (did you forget to include a header?)");
    static_assert(std::is_move_constructible_v<T>, "T must be move constructible");

    if constexpr (std::is_trivially_copyable_v<T>)
    {
        auto const size = src_end - src_start;
        if (size > 0)
        {
            std::memcpy(static_cast<void*>(dest_end), src_start, size * sizeof(T));
            dest_end += size;
        }
    }
    else
    {
        while (src_start != src_end)
        {
            new (om::placement_new, dest_end) T(om::move(*src_start));
            ++dest_end;
            ++src_start;
        }
    }
}

/// Shifts the live objects [src_start, src_end) down onto [dest, dest + (src_end - src_start)) by move assignment.
/// Precondition: dest < src_start and every object in [dest, src_end) is alive.
/// Afterwards the objects in [dest + (src_end - src_start), src_end) are alive but moved-from;
/// the caller destroys them.
/// Order-preserving: the object that was at src_start + i ends up at dest + i.
template <class T>
void compact_move_objects_backward(T* dest, T* src_start, T* src_end)
{
    static_assert(sizeof(T) > 0, "T must be a complete type (did you forget to include a header?)");
    static_assert(std::is_move_assignable_v<T>, "T must be move assignable");

    if constexpr (std::is_trivially_copyable_v<T>)
    {
        auto const size = src_end - src_start;
        if (size > 0)
            std::memmove(static_cast<void*>(dest), src_start, size * sizeof(T));
    }
    else
    {
        while (src_start != src_end)
        {
            *dest = om::move(*src_start);
            ++dest;
            ++src_start;
        }
    }
}
} // namespace om::impl
