#pragma once

#include <ordered-map/fwd.hh>
#include <ordered-map/utility.hh>

#include <type_traits>
#include <utility> // for tuple_size

/// Key/value pair stored in the ordered sequence of om::basic_ordered_map
/// Aggregate type with no user-defined constructors, supports structured bindings:
///   for (auto const& [key, value] : map.items()) ...
/// The key of a stored entry never changes, only its value is overwritten in place.
template <class K, class V>
struct om::entry
{
    using key_t = K;
    using value_t = V;

    [[nodiscard]] friend constexpr bool operator==(entry const&, entry const&) = default;

    K key;
    V value;

    template <std::size_t I, class E>
    [[nodiscard]] friend constexpr decltype(auto) get(E&& e) noexcept
        requires(std::is_same_v<std::remove_cvref_t<E>, entry> && I < 2)
    {
        if constexpr (I == 0)
            return (om::forward<E>(e).key);
        else
            return (om::forward<E>(e).value);
    }
};

/// Position/value pair produced by indexed traversal
template <class V>
struct om::indexed_value
{
    [[nodiscard]] friend constexpr bool operator==(indexed_value const&, indexed_value const&) = default;

    isize index;
    V value;

    template <std::size_t I, class E>
    [[nodiscard]] friend constexpr decltype(auto) get(E&& e) noexcept
        requires(std::is_same_v<std::remove_cvref_t<E>, indexed_value> && I < 2)
    {
        if constexpr (I == 0)
            return (om::forward<E>(e).index);
        else
            return (om::forward<E>(e).value);
    }
};

namespace std
{
template <class K, class V>
struct tuple_size<om::entry<K, V>> : std::integral_constant<std::size_t, 2>
{
};

template <std::size_t I, class K, class V>
struct tuple_element<I, om::entry<K, V>>
{
    static_assert(I < 2);
    using type = std::conditional_t<I == 0, K, V>;
};

template <class V>
struct tuple_size<om::indexed_value<V>> : std::integral_constant<std::size_t, 2>
{
};

template <std::size_t I, class V>
struct tuple_element<I, om::indexed_value<V>>
{
    static_assert(I < 2);
    using type = std::conditional_t<I == 0, om::isize, V>;
};
} // namespace std
