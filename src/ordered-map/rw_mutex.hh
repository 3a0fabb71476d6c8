#pragma once

#include <ordered-map/fwd.hh>
#include <ordered-map/optional.hh>
#include <ordered-map/utility.hh>

#include <mutex>
#include <shared_mutex>
#include <type_traits>

/// Thread-safe wrapper for data T protected by a reader/writer lock
/// Rust-style RwLock: the lock owns the data, access is only possible through scoped lock operations
/// Any number of readers may hold the shared lock at once, a writer holds it exclusively
/// Neither copyable nor movable (the lock pins the data)
template <class T>
struct om::rw_mutex
{
    /// Acquire the shared lock, invoke f with a const reference to the protected value, and return the result
    /// The lock is held for the duration of the call only
    /// Returns: the result of f (auto to prevent reference leaks)
    /// Usage:
    ///   om::rw_mutex<int> counter;
    ///   int current = counter.read([](int const& val) { return val; });
    template <class F>
    auto read(F&& f) const
    {
        std::shared_lock lock(_mutex);
        return om::invoke(om::forward<F>(f), static_cast<T const&>(_value));
    }

    /// Acquire the exclusive lock, invoke f with the protected value, and return the result
    /// Usage:
    ///   om::rw_mutex<int> counter;
    ///   counter.write([](int& val) { val++; });
    template <class F>
    auto write(F&& f)
    {
        std::unique_lock lock(_mutex);
        return om::invoke(om::forward<F>(f), _value);
    }

    /// Attempt to acquire the shared lock without blocking
    /// Returns: optional containing the result of f, or nullopt if a writer holds the lock
    ///          For void functions, returns bool indicating whether the lock was acquired
    template <class F>
    auto try_read(F&& f) const
    {
        std::shared_lock lock(_mutex, std::try_to_lock);
        return impl_invoke_if_owned(lock.owns_lock(), om::forward<F>(f), static_cast<T const&>(_value));
    }

    /// Attempt to acquire the exclusive lock without blocking
    /// Returns: optional containing the result of f, or nullopt if any reader or writer holds the lock
    ///          For void functions, returns bool indicating whether the lock was acquired
    /// Usage:
    ///   if (counter.try_write([](int& val) { val++; }))
    ///       // lock was acquired
    template <class F>
    auto try_write(F&& f)
    {
        std::unique_lock lock(_mutex, std::try_to_lock);
        return impl_invoke_if_owned(lock.owns_lock(), om::forward<F>(f), _value);
    }

    /// Default constructor - default-constructs the protected value
    rw_mutex() = default;

    /// Construct the protected value in place
    template <class... Args>
        requires std::is_constructible_v<T, Args&&...>
    explicit rw_mutex(Args&&... args) : _value(om::forward<Args>(args)...)
    {
    }

    rw_mutex(rw_mutex const&) = delete;
    rw_mutex& operator=(rw_mutex const&) = delete;
    rw_mutex(rw_mutex&&) = delete;
    rw_mutex& operator=(rw_mutex&&) = delete;

private:
    template <class F, class U>
    static auto impl_invoke_if_owned(bool owned, F&& f, U& value)
    {
        using result_t = decltype(om::invoke(om::forward<F>(f), value));

        if constexpr (std::is_void_v<result_t>)
        {
            if (!owned)
                return false;
            om::invoke(om::forward<F>(f), value);
            return true;
        }
        else
        {
            if (!owned)
                return optional<result_t>();
            return optional<result_t>(om::invoke(om::forward<F>(f), value));
        }
    }

private:
    T _value;
    mutable std::shared_mutex _mutex;
};
