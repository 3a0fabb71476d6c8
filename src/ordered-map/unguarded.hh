#pragma once

#include <ordered-map/fwd.hh>
#include <ordered-map/optional.hh>
#include <ordered-map/utility.hh>

#include <type_traits>

/// Drop-in replacement for om::rw_mutex<T> that performs no synchronization at all
/// Same read/write/try_read/try_write surface, so code written against one works with the other
/// The caller is responsible for exclusive access during writes (single thread or an outer lock)
/// Movable, unlike rw_mutex
template <class T>
struct om::unguarded
{
    template <class F>
    auto read(F&& f) const
    {
        return om::invoke(om::forward<F>(f), static_cast<T const&>(_value));
    }

    template <class F>
    auto write(F&& f)
    {
        return om::invoke(om::forward<F>(f), _value);
    }

    /// Always succeeds
    template <class F>
    auto try_read(F&& f) const
    {
        return impl_invoke_wrapped(om::forward<F>(f), static_cast<T const&>(_value));
    }

    /// Always succeeds
    template <class F>
    auto try_write(F&& f)
    {
        return impl_invoke_wrapped(om::forward<F>(f), _value);
    }

    unguarded() = default;

    template <class... Args>
        requires std::is_constructible_v<T, Args&&...>
    explicit unguarded(Args&&... args) : _value(om::forward<Args>(args)...)
    {
    }

private:
    template <class F, class U>
    static auto impl_invoke_wrapped(F&& f, U& value)
    {
        using result_t = decltype(om::invoke(om::forward<F>(f), value));

        if constexpr (std::is_void_v<result_t>)
        {
            om::invoke(om::forward<F>(f), value);
            return true;
        }
        else
        {
            return optional<result_t>(om::invoke(om::forward<F>(f), value));
        }
    }

private:
    T _value;
};
