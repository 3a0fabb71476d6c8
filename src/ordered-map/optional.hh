#pragma once

#include <ordered-map/assert.hh>
#include <ordered-map/fwd.hh>
#include <ordered-map/utility.hh>

#include <type_traits>

/// Type of om::nullopt, the "not found" marker returned by map lookups.
/// Not default constructible, so `opt = {}` keeps meaning "empty optional" without ambiguity.
struct om::nullopt_t
{
    struct private_tag
    {
    };
    explicit constexpr nullopt_t(private_tag) {}
};

namespace om
{
/// if (map.get(key) == om::nullopt) ...
inline constexpr nullopt_t nullopt = nullopt_t{nullopt_t::private_tag{}};
} // namespace om

/// Either a value of type T or nothing. This is how lookups report "not found".
/// A safer subset of std::optional: no operator* or operator->, access goes through value() or value_or().
/// Trivially copyable when T is trivially copyable.
template <class T>
struct om::optional
{
    // construction
public:
    optional() = default;

    template <class U = std::remove_cv_t<T>>
        requires(!std::is_same_v<std::remove_cvref_t<U>, optional> && !std::is_same_v<std::remove_cvref_t<U>, nullopt_t>
                 && std::is_constructible_v<T, U &&>)
    explicit(!std::is_convertible_v<U, T>) optional(U&& value) : _has_value(true) // NOLINT
    {
        new (om::placement_new, &_storage.value) T(om::forward<U>(value));
    }

    optional(nullopt_t) {}

    // trivial copy/move/destroy
public:
    optional(optional&&)
        requires std::is_trivially_copyable_v<T>
    = default;
    optional(optional const&)
        requires std::is_trivially_copyable_v<T>
    = default;
    optional& operator=(optional&&)
        requires std::is_trivially_copyable_v<T>
    = default;
    optional& operator=(optional const&)
        requires std::is_trivially_copyable_v<T>
    = default;

    ~optional()
        requires std::is_trivially_destructible_v<T>
    = default;

    // non-trivial copy/move/destroy
public:
    /// rhs is left empty afterwards.
    optional(optional&& rhs) noexcept
        requires(!std::is_trivially_copyable_v<T>)
      : _has_value(rhs._has_value)
    {
        if (_has_value)
        {
            new (om::placement_new, &_storage.value) T(om::move(rhs._storage.value));
            rhs._storage.value.~T();
            rhs._has_value = false;
        }
    }

    optional(optional const& rhs)
        requires(!std::is_trivially_copyable_v<T> && std::is_copy_constructible_v<T>)
      : _has_value(rhs._has_value)
    {
        if (_has_value)
            new (om::placement_new, &_storage.value) T(rhs._storage.value);
    }

    /// rhs is left empty afterwards.
    optional& operator=(optional&& rhs) noexcept
        requires(!std::is_trivially_copyable_v<T>)
    {
        if (this == &rhs)
            return *this;

        if (rhs._has_value)
        {
            if (_has_value)
                _storage.value = om::move(rhs._storage.value);
            else
                new (om::placement_new, &_storage.value) T(om::move(rhs._storage.value));

            _has_value = true;
            rhs._storage.value.~T();
            rhs._has_value = false;
        }
        else if (_has_value)
        {
            _storage.value.~T();
            _has_value = false;
        }

        return *this;
    }

    optional& operator=(optional const& rhs)
        requires(!std::is_trivially_copyable_v<T> && std::is_copy_constructible_v<T> && std::is_copy_assignable_v<T>)
    {
        if (this != &rhs)
        {
            if (rhs._has_value)
            {
                if (_has_value)
                    _storage.value = rhs._storage.value;
                else
                    new (om::placement_new, &_storage.value) T(rhs._storage.value);

                _has_value = true;
            }
            else if (_has_value)
            {
                _storage.value.~T();
                _has_value = false;
            }
        }

        return *this;
    }

    ~optional()
        requires(!std::is_trivially_destructible_v<T>)
    {
        if (_has_value)
            _storage.value.~T();
    }

    // access
public:
    [[nodiscard]] bool has_value() const { return _has_value; }

    /// Precondition: has_value() == true.
    [[nodiscard]] T& value() &
    {
        OM_ASSERT(_has_value, "attempted to access value of empty optional");
        return _storage.value;
    }
    [[nodiscard]] T const& value() const&
    {
        OM_ASSERT(_has_value, "attempted to access value of empty optional");
        return _storage.value;
    }
    [[nodiscard]] T&& value() &&
    {
        OM_ASSERT(_has_value, "attempted to access value of empty optional");
        return om::move(_storage.value);
    }

    /// Returns the held value, or `fallback` when empty.
    template <class U>
    [[nodiscard]] T value_or(U&& fallback) const&
    {
        return _has_value ? _storage.value : static_cast<T>(om::forward<U>(fallback));
    }
    template <class U>
    [[nodiscard]] T value_or(U&& fallback) &&
    {
        return _has_value ? om::move(_storage.value) : static_cast<T>(om::forward<U>(fallback));
    }

    // comparison
public:
    [[nodiscard]] friend bool operator==(optional const& lhs, optional const& rhs)
        requires requires(T v) { bool(v == v); }
    {
        if (lhs._has_value != rhs._has_value)
            return false;
        if (lhs._has_value)
            return lhs._storage.value == rhs._storage.value;
        return true;
    }

    /// An empty optional never equals a value.
    [[nodiscard]] friend bool operator==(optional const& lhs, T const& rhs)
        requires requires(T v) { bool(v == v); }
    {
        return lhs._has_value && lhs._storage.value == rhs;
    }

    [[nodiscard]] friend bool operator==(optional const& lhs, nullopt_t) { return !lhs._has_value; }

    /// Comparing a non-bool optional with true/false is almost always a bug.
    [[nodiscard]] bool operator==(bool) const
        requires(!std::is_same_v<T, bool>)
    = delete;

    // members
private:
    om::storage_for<T> _storage;
    bool _has_value = false;
};
