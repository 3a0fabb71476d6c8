#pragma once

#include <cstddef>
#include <cstdint>

#include <functional>


namespace om
{

//
// Primitives
//

// Explicitly-sized primitive types
// Used wherever the range matters for correctness or memory layout.
// Plain "int" is fine for small counts and loop counters.

// signed integers
using i8 = int8_t;
using i16 = int16_t;
using i32 = int32_t;
using i64 = int64_t;

// unsigned integers
using u8 = uint8_t;
using u16 = uint16_t;
using u32 = uint32_t;
using u64 = uint64_t;

// generic bytes
using byte = std::byte;

// signed size type
// Sizes and positions are signed i64, never size_t:
// * "size - 1" on an empty container stays -1 instead of wrapping to a huge value
// * positions are compared and subtracted a lot (compaction, re-indexing), mixed signedness is a bug source
// * a position of -1 is a natural "before the first entry"
// * only 64-bit platforms are targeted, so the range is never the limiting factor
using isize = i64;

// pointer
using nullptr_t = std::nullptr_t;

//
// Memory
//

struct memory_resource;
template <class T>
struct allocation;

//
// Container
//

struct nullopt_t;
template <class T>
struct optional;

template <class T>
struct vector;

template <class K, class V>
struct entry;
template <class V>
struct indexed_value;

//
// Synchronization
//

template <class T>
struct rw_mutex;
template <class T>
struct unguarded;

//
// Ordered map
//

template <class K,
          class V,
          template <class> class GuardT = rw_mutex,
          class HashT = std::hash<K>,
          class EqualT = std::equal_to<K>>
struct basic_ordered_map;

/// Insertion-ordered map synchronized by a single reader/writer lock.
template <class K, class V>
using ordered_map = basic_ordered_map<K, V, rw_mutex>;

/// Insertion-ordered map without any synchronization.
/// The caller guarantees exclusive access for writes (single thread, read-only sharing, or an outer lock).
/// Concurrent writes without such a guarantee are undefined behavior and can break the map's invariants.
template <class K, class V>
using unguarded_ordered_map = basic_ordered_map<K, V, unguarded>;

} // namespace om
