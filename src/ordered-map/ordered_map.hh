#pragma once

#include <ordered-map/assert.hh>
#include <ordered-map/entry.hh>
#include <ordered-map/fwd.hh>
#include <ordered-map/optional.hh>
#include <ordered-map/rw_mutex.hh>
#include <ordered-map/unguarded.hh>
#include <ordered-map/utility.hh>
#include <ordered-map/vector.hh>

#include <concepts>
#include <cstddef>
#include <initializer_list>
#include <iterator>
#include <ranges>
#include <type_traits>
#include <unordered_map>

namespace om
{
/// Key types usable in om::basic_ordered_map: hashable, equality comparable, and copyable
/// (every key is stored twice, once in the ordered sequence and once in the index)
template <class K, class HashT = std::hash<K>, class EqualT = std::equal_to<K>>
concept hashable_key = std::is_copy_constructible_v<K> && requires(K const& k, HashT const& hash, EqualT const& eq) {
    { hash(k) } -> std::convertible_to<std::size_t>;
    { eq(k, k) } -> std::convertible_to<bool>;
};
} // namespace om

/// Associative container that remembers the order in which keys were first inserted.
///
/// Two structures are kept in lockstep:
///   - a dense om::vector<om::entry<K, V>> whose positions encode insertion order
///   - an index mapping each key to its current position in that vector
/// Lookups go through the index (O(1) expected), traversal walks the vector in order.
/// Overwriting a key keeps its position, only a new key consumes a new slot at the back.
///
/// Synchronization is a policy: GuardT<state> owns both structures together, so they can never be
/// locked (or observed) independently.
///   - om::ordered_map<K, V>           : GuardT = om::rw_mutex, readers share, writers are exclusive
///   - om::unguarded_ordered_map<K, V> : GuardT = om::unguarded, no synchronization at all
/// Every public operation takes the guard exactly once and never calls user code while holding it
/// (only K/V special members and HashT/EqualT run under the lock).
///
/// Deleting is the expensive operation: remove() compacts the vector and re-indexes every later entry,
/// O(n) in the worst case. This container is not meant for removal-heavy workloads.
///
/// Usage:
///   auto m = om::ordered_map<std::string, int>();
///   m.set("life", 42);
///   if (auto v = m.get("life"); v.has_value())
///       use(v.value());
///   for (auto const& [key, value] : m.items())
///       print(key, value);
template <class K, class V, template <class> class GuardT, class HashT, class EqualT>
struct om::basic_ordered_map
{
    static_assert(om::hashable_key<K, HashT, EqualT>, "K must be copyable and usable with HashT and EqualT");
    // remove() shifts later entries down by move assignment after the key has left the index
    static_assert(std::is_nothrow_move_assignable_v<K> && std::is_nothrow_move_assignable_v<V>,
                  "K and V must be nothrow move-assignable");

    using key_t = K;
    using value_t = V;
    using entry_t = om::entry<K, V>;

    template <class ItemT, class ProjectT>
    struct traversal;

    // construction
public:
    /// Creates an empty map without allocating.
    basic_ordered_map() = default;

    /// Creates an empty map with room for `initial_capacity` entries in both the sequence and the index.
    /// `resource` backs the ordered sequence for the lifetime of the map (nullptr = om::default_memory_resource).
    /// Throws std::bad_alloc if the initial allocation fails.
    [[nodiscard]] static basic_ordered_map create_with_capacity(isize initial_capacity, memory_resource const* resource = nullptr)
    {
        OM_ASSERT(initial_capacity >= 0, "capacity must be non-negative");
        return basic_ordered_map(capacity_tag{}, initial_capacity, resource);
    }

    // point queries
public:
    /// Returns a copy of the value stored for `key`, or nullopt if the key is absent.
    [[nodiscard]] optional<V> get(K const& key) const
    {
        return _state.read(
            [&](state const& s) -> optional<V>
            {
                auto const it = s.index.find(key);
                if (it == s.index.end())
                    return nullopt;
                return optional<V>(s.sequence[it->second].value);
            });
    }

    /// Returns the current position of `key` in insertion order, or nullopt if the key is absent.
    /// Positions of later keys shift down by one whenever an earlier key is removed.
    [[nodiscard]] optional<isize> index_of(K const& key) const
    {
        return _state.read(
            [&](state const& s) -> optional<isize>
            {
                auto const it = s.index.find(key);
                if (it == s.index.end())
                    return nullopt;
                return optional<isize>(it->second);
            });
    }

    [[nodiscard]] bool has(K const& key) const
    {
        return _state.read([&](state const& s) { return s.index.contains(key); });
    }

    [[nodiscard]] isize size() const
    {
        return _state.read([](state const& s) { return s.sequence.size(); });
    }

    [[nodiscard]] bool empty() const { return size() == 0; }

    // modification
public:
    /// Inserts or overwrites.
    /// Existing key: the value is replaced in place, the position is unchanged.
    /// New key: a new entry is appended at the back. O(1) amortized.
    /// If growing the storage fails, std::bad_alloc propagates and the map is unchanged.
    void set(K key, V value)
    {
        _state.write(
            [&](state& s)
            {
                auto const it = s.index.find(key);
                if (it != s.index.end())
                {
                    s.sequence[it->second].value = om::move(value);
                    return;
                }

                s.sequence.reserve_back(1);
                impl_append(s, om::move(key), om::move(value));
            });
    }

    /// Applies several entries under a single write lock, in argument order.
    /// Storage for the rest of the batch is reserved at the first new key, so a batch that only
    /// overwrites never allocates. An empty batch is a no-op.
    ///
    /// The batch stops at the first entry whose key is already present:
    ///   - key present before the call: its value is overwritten in place, then the call returns
    ///   - key appended earlier in this batch: the later duplicate is ignored (first occurrence wins),
    ///     then the call returns
    /// Entries after that point are not applied. Callers inserting many keys should pass distinct keys.
    ///
    /// Example on an empty map:
    ///   m.bulk_set({{"x", 10}, {"y", 20}, {"x", 30}}); // size 2, x -> 10, y -> 20
    ///
    /// If an allocation fails, std::bad_alloc propagates and every entry appended by this call is rolled back.
    void bulk_set(std::initializer_list<entry_t> entries) { impl_bulk_set(entries.begin(), entries.end()); }

    /// Range overload of bulk_set (e.g. an om::vector<entry_t> or a std::vector<entry_t>)
    /// The range is walked twice (once to size the reservation), so single-pass ranges are rejected.
    template <class RangeT>
        requires std::ranges::forward_range<RangeT const>
                 && std::convertible_to<std::ranges::range_reference_t<RangeT const>, entry_t const&>
    void bulk_set(RangeT const& entries)
    {
        impl_bulk_set(std::ranges::begin(entries), std::ranges::end(entries));
    }

    /// Removes `key` if present, no-op otherwise.
    /// Every entry after the removed one moves down one position and its index is updated before returning.
    /// O(n) in the number of entries after the removed one.
    void remove(K const& key)
    {
        _state.write(
            [&](state& s)
            {
                auto const it = s.index.find(key);
                if (it == s.index.end())
                    return;

                auto const pos = it->second;
                s.index.erase(it);
                s.sequence.remove_at(pos);

                for (auto i = pos; i < s.sequence.size(); ++i)
                {
                    auto const shifted = s.index.find(s.sequence[i].key);
                    OM_ASSERT(shifted != s.index.end() && shifted->second == i + 1, "key index out of sync with ordered storage");
                    shifted->second = i;
                }
            });
    }

    /// Makes room for `capacity` entries in total, so that the next inserts do not allocate.
    void reserve(isize capacity)
    {
        OM_ASSERT(capacity >= 0, "capacity must be non-negative");
        _state.write(
            [&](state& s)
            {
                s.sequence.reserve(capacity);
                s.index.reserve(std::size_t(capacity));
            });
    }

    // bulk access
public:
    /// Point-in-time copy of all entries in insertion order, taken under a single read lock.
    [[nodiscard]] vector<entry_t> entries() const
    {
        return _state.read([](state const& s) { return s.sequence; });
    }

    /// Verifies that the index and the ordered storage agree:
    /// same number of keys, every key maps to the position that holds it, and hence no duplicate keys.
    [[nodiscard]] bool check_invariants() const
    {
        return _state.read(
            [](state const& s)
            {
                if (isize(s.index.size()) != s.sequence.size())
                    return false;

                for (isize i = 0; i < s.sequence.size(); ++i)
                {
                    auto const it = s.index.find(s.sequence[i].key);
                    if (it == s.index.end() || it->second != i)
                        return false;
                }

                return true;
            });
    }

    // traversal
    //
    // Lazy, forward-only views in insertion order. Each call starts a new traversal.
    // Every step takes the read guard once, copies one element out, and releases it again,
    // so writers are never blocked for longer than one element copy.
    // Concurrent writers may change the map between steps: the traversal follows the live size and
    // stops the first time its position is past the end. There is no snapshot consistency across steps.
    // Stopping early is fine, no guard is held between steps.
    // The map must outlive the view.
public:
    struct project_key
    {
        K operator()(isize, entry_t const& e) const { return e.key; }
    };
    struct project_value
    {
        V operator()(isize, entry_t const& e) const { return e.value; }
    };
    struct project_entry
    {
        entry_t operator()(isize, entry_t const& e) const { return e; }
    };
    struct project_indexed_value
    {
        indexed_value<V> operator()(isize pos, entry_t const& e) const { return {pos, e.value}; }
    };

    /// Keys in insertion order
    [[nodiscard]] traversal<K, project_key> keys() const { return {this}; }

    /// Values in insertion order
    [[nodiscard]] traversal<V, project_value> values() const { return {this}; }

    /// Key/value entries in insertion order
    /// Usage: for (auto const& [key, value] : m.items())
    [[nodiscard]] traversal<entry_t, project_entry> items() const { return {this}; }

    /// Position/value pairs in insertion order
    /// Usage: for (auto const& [pos, value] : m.indexed_values())
    [[nodiscard]] traversal<indexed_value<V>, project_indexed_value> indexed_values() const { return {this}; }

    // state
private:
    struct state
    {
        vector<entry_t> sequence;
        std::unordered_map<K, isize, HashT, EqualT> index;

        state() = default;

        state(isize capacity, memory_resource const* resource)
          : sequence(vector<entry_t>::create_with_capacity(capacity, resource))
        {
            index.reserve(std::size_t(capacity));
        }
    };

    struct capacity_tag
    {
    };

    basic_ordered_map(capacity_tag, isize capacity, memory_resource const* resource) : _state(capacity, resource) {}

    // appends a new key at the back
    // precondition: key is not in the index and the sequence has capacity for one more entry
    // all-or-nothing: if the index insertion throws, the appended entry is removed again
    static void impl_append(state& s, K&& key, V&& value)
    {
        auto const pos = s.sequence.size();
        auto& e = s.sequence.emplace_back_stable(om::move(key), om::move(value));

        try
        {
            auto const [it, inserted] = s.index.emplace(e.key, pos);
            OM_ASSERT(inserted, "appended key was already indexed");
        }
        catch (...)
        {
            s.sequence.remove_back();
            throw;
        }
    }

    // removes every entry at position >= size_before together with its index entry
    static void impl_rollback_appends(state& s, isize size_before)
    {
        while (s.sequence.size() > size_before)
        {
            s.index.erase(s.sequence.back().key);
            s.sequence.remove_back();
        }
    }

    template <class It>
    void impl_bulk_set(It first, It last)
    {
        if (first == last)
            return;

        auto const count = isize(std::ranges::distance(first, last));

        _state.write(
            [&](state& s)
            {
                auto const size_before = s.sequence.size();
                auto remaining = count;
                auto reserved = false;

                try
                {
                    for (; first != last; ++first, --remaining)
                    {
                        entry_t const& e = *first;

                        auto const it = s.index.find(e.key);
                        if (it != s.index.end())
                        {
                            // first present key ends the batch, duplicates within the batch keep their first value
                            if (it->second < size_before)
                                s.sequence[it->second].value = e.value;
                            return;
                        }

                        // all growth happens at the first new key, for every entry still left in the batch
                        if (!reserved)
                        {
                            s.sequence.reserve_back(remaining);
                            s.index.reserve(s.index.size() + std::size_t(remaining));
                            reserved = true;
                        }

                        auto const pos = s.sequence.size();
                        s.sequence.emplace_back_stable(e.key, e.value);
                        s.index.emplace(e.key, pos);
                    }
                }
                catch (...)
                {
                    impl_rollback_appends(s, size_before);
                    throw;
                }
            });
    }

    // one traversal step: copies the projected element at `pos` out under the read guard
    template <class ItemT, class ProjectT>
    [[nodiscard]] optional<ItemT> impl_fetch_at(isize pos) const
    {
        return _state.read(
            [pos](state const& s) -> optional<ItemT>
            {
                if (pos >= s.sequence.size())
                    return nullopt;
                return optional<ItemT>(ProjectT{}(pos, s.sequence[pos]));
            });
    }

private:
    GuardT<state> _state;
};

/// Lazy range over a basic_ordered_map, see "traversal" above.
/// begin() performs the first step, every ++ performs one more; end() is om::sentinel.
template <class K, class V, template <class> class GuardT, class HashT, class EqualT>
template <class ItemT, class ProjectT>
struct om::basic_ordered_map<K, V, GuardT, HashT, EqualT>::traversal
{
    struct iterator
    {
        using value_type = ItemT;
        using difference_type = std::ptrdiff_t;

        iterator() = default;
        explicit iterator(basic_ordered_map const* map) : _map(map) { impl_fetch(); }

        /// Precondition: not at the end.
        [[nodiscard]] ItemT const& operator*() const { return _current.value(); }

        iterator& operator++()
        {
            ++_pos;
            impl_fetch();
            return *this;
        }
        void operator++(int) { ++*this; }

        [[nodiscard]] bool operator==(om::sentinel) const { return !_current.has_value(); }

    private:
        void impl_fetch()
        {
            _current = _map->template impl_fetch_at<ItemT, ProjectT>(_pos);
        }

        basic_ordered_map const* _map = nullptr;
        isize _pos = 0;
        optional<ItemT> _current;
    };

    [[nodiscard]] iterator begin() const { return iterator(_map); }
    [[nodiscard]] om::sentinel end() const { return {}; }

    basic_ordered_map const* _map = nullptr;
};
