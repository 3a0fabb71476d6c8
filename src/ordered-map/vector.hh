#pragma once

#include <ordered-map/allocation.hh>
#include <ordered-map/assert.hh>
#include <ordered-map/fwd.hh>
#include <ordered-map/utility.hh>

#include <new>


/// Dynamically allocated vector of T elements with value semantics, growing at the back only.
/// This is the dense ordered storage of om::basic_ordered_map: positions are indices into it.
/// Owns the underlying memory through om::allocation<T>.
///
/// Member functions with the `_stable` suffix never reallocate the buffer or move live objects.
/// They keep existing references, pointers, and iterators stable and assert that capacity is present.
///
/// === Exception & reference guarantees ===
///
/// Allocation failures leave the vector unchanged (size, contents, capacity).
/// Element construction failures leave size and live range unchanged.
/// Reallocation always relocates with move construction; T should be nothrow move constructible.
/// The old allocation stays valid until the new element is constructed,
/// so `v.push_back(v[0])` is safe during growth.
/// Any reallocation invalidates pointers, references, and iterators.
template <class T>
struct om::vector
{
    /// Minimum alignment used for heap allocations of this vector.
    /// At least one destructive-interference unit, so distinct vectors never share a cache line.
    static constexpr isize alloc_alignment = om::max(isize(alignof(T)), isize(std::hardware_destructive_interference_size));

    // element access
public:
    /// Returns a reference to the element at index i.
    /// Precondition: 0 <= i < size().
    [[nodiscard]] T& operator[](isize i)
    {
        OM_ASSERT(0 <= i && i < size(), "index out of bounds");
        return _data.obj_start[i];
    }
    [[nodiscard]] T const& operator[](isize i) const
    {
        OM_ASSERT(0 <= i && i < size(), "index out of bounds");
        return _data.obj_start[i];
    }

    /// Precondition: !empty().
    [[nodiscard]] T& front()
    {
        OM_ASSERT(!empty(), "vector is empty");
        return *_data.obj_start;
    }
    [[nodiscard]] T const& front() const
    {
        OM_ASSERT(!empty(), "vector is empty");
        return *_data.obj_start;
    }

    /// Precondition: !empty().
    [[nodiscard]] T& back()
    {
        OM_ASSERT(!empty(), "vector is empty");
        return *(_data.obj_end - 1);
    }
    [[nodiscard]] T const& back() const
    {
        OM_ASSERT(!empty(), "vector is empty");
        return *(_data.obj_end - 1);
    }

    /// May be nullptr if the vector never allocated.
    [[nodiscard]] T* data() { return _data.obj_start; }
    [[nodiscard]] T const* data() const { return _data.obj_start; }

    // iterators
public:
    [[nodiscard]] T* begin() { return _data.obj_start; }
    [[nodiscard]] T* end() { return _data.obj_end; }
    [[nodiscard]] T const* begin() const { return _data.obj_start; }
    [[nodiscard]] T const* end() const { return _data.obj_end; }

    // queries
public:
    [[nodiscard]] isize size() const { return _data.obj_size(); }
    [[nodiscard]] bool empty() const { return _data.obj_start == _data.obj_end; }

    /// How many elements can be appended without reallocation.
    [[nodiscard]] isize capacity_back() const { return _data.capacity_back(); }

    /// Total elements that fit without reallocation.
    [[nodiscard]] isize capacity() const { return size() + capacity_back(); }

    [[nodiscard]] bool has_capacity_back_for(isize count) const { return capacity_back() >= count; }

    // capacity management
public:
    /// Ensures capacity() >= new_capacity, relocating into a new allocation if needed.
    /// Strong guarantee for allocation failure: the vector is untouched if the resource throws.
    void reserve(isize new_capacity)
    {
        if (new_capacity <= capacity())
            return;

        auto const byte_size = om::align_up(new_capacity * isize(sizeof(T)), alloc_alignment);
        auto new_allocation = allocation<T>::create_empty_bytes(byte_size, alloc_alignment, _data.custom_resource);
        impl::move_create_objects_to(new_allocation.obj_end, _data.obj_start, _data.obj_end);
        _data = om::move(new_allocation);
    }

    /// Ensures `has_capacity_back_for(count)`, growing exponentially like emplace_back does.
    /// Lets callers do all allocation up front and then append with the `_stable` functions,
    /// which is how multi-step writes stay all-or-nothing.
    void reserve_back(isize count)
    {
        OM_ASSERT(count >= 0, "count must be non-negative");
        if (has_capacity_back_for(count))
            return;

        auto const min_bytes = (size() + count) * isize(sizeof(T));
        reserve(impl_grow_size_for(_data.alloc_size_bytes(), min_bytes) / isize(sizeof(T)));
    }

    /// destroys all elements, keeps the allocation
    void clear()
    {
        impl::destroy_objects_in_reverse(_data.obj_start, _data.obj_end);
        _data.obj_end = _data.obj_start;
    }

    // appends
public:
    /// Constructs a new element at the back using existing capacity.
    /// Requires `has_capacity_back_for(1)`; never allocates, never invalidates.
    /// Strong exception safety; O(1).
    template <class... Args>
    T& emplace_back_stable(Args&&... args)
    {
        static_assert(
            requires { T(om::forward<Args>(args)...); }, "emplace_back_stable: T is not constructible from "
                                                         "the provided argument types");
        OM_ASSERT(has_capacity_back_for(1), "not enough capacity for emplace_back_stable");
        auto const p = new (om::placement_new, _data.obj_end) T(om::forward<Args>(args)...);
        _data.obj_end++; // _after_ so exceptions in T(...) leave the state valid
        return *p;
    }

    T& push_back_stable(T const& value) { return emplace_back_stable(value); }
    T& push_back_stable(T&& value) { return emplace_back_stable(om::move(value)); }

    /// Appends a new element at the back, allocating if necessary.
    /// Amortized O(1) (doubling growth).
    template <class... Args>
    T& emplace_back(Args&&... args)
    {
        static_assert(
            requires { T(om::forward<Args>(args)...); }, "emplace_back: T is not constructible from "
                                                         "the provided argument types");

        allocation<T> new_allocation;
        auto p_obj_end = &_data.obj_end;

        if (!has_capacity_back_for(1)) [[unlikely]]
            p_obj_end = impl_grow_back_begin(new_allocation, 1);

        // construct BEFORE relocating: args may reference elements of this vector,
        // and a throwing T(...) only has to clean up the (still empty) new_allocation
        auto const p = new (om::placement_new, *p_obj_end) T(om::forward<Args>(args)...);
        (*p_obj_end)++; // _after_ so exceptions in T(...) leave state valid

        if (new_allocation.is_valid()) [[unlikely]]
            impl_grow_back_finalize(new_allocation);

        return *p;
    }

    T& push_back(T const& value) { return emplace_back(value); }
    T& push_back(T&& value) { return emplace_back(om::move(value)); }

    // removals
public:
    /// Removes the last element.
    /// Precondition: !empty().
    void remove_back()
    {
        OM_ASSERT(!empty(), "cannot remove from empty vector");
        _data.obj_end--;
        _data.obj_end->~T();
    }

    /// Removes the element at the given index, preserving the order of the remaining elements.
    /// Every element after idx moves down one slot.
    /// Precondition: 0 <= idx < size().
    /// O(n) complexity due to compaction.
    void remove_at(isize idx)
    {
        OM_ASSERT(0 <= idx && idx < size(), "index out of bounds");
        auto const p_obj = _data.obj_start + idx;

        // move-assigns over p_obj, the last slot ends up moved-from
        impl::compact_move_objects_backward(p_obj, p_obj + 1, _data.obj_end);

        _data.obj_end--;
        _data.obj_end->~T();
    }

    // factories
public:
    /// Creates an empty vector with room for at least `capacity` elements.
    /// `resource` == nullptr selects om::default_memory_resource; later growth uses the same resource.
    [[nodiscard]] static vector create_with_capacity(isize capacity, memory_resource const* resource = nullptr)
    {
        OM_ASSERT(capacity >= 0, "capacity must be non-negative");
        vector v;
        auto const byte_size = om::align_up(capacity * isize(sizeof(T)), alloc_alignment);
        v._data = allocation<T>::create_empty_bytes(byte_size, alloc_alignment, resource);
        return v;
    }

    // vector has deep-copy value semantics
public:
    vector() = default;
    ~vector() = default;
    vector(vector&&) = default;
    vector& operator=(vector&&) = default;

    vector(vector const& rhs)
    {
        auto const byte_size = om::align_up(rhs.size() * isize(sizeof(T)), alloc_alignment);
        _data = allocation<T>::create_empty_bytes(byte_size, alloc_alignment, rhs._data.custom_resource);
        impl::copy_create_objects_to(_data.obj_end, rhs._data.obj_start, rhs._data.obj_end);
    }
    vector& operator=(vector const& rhs)
    {
        if (this != &rhs)
        {
            auto const byte_size = om::align_up(rhs.size() * isize(sizeof(T)), alloc_alignment);
            auto new_data = allocation<T>::create_empty_bytes(byte_size, alloc_alignment, _data.custom_resource); // keep lhs resource
            impl::copy_create_objects_to(new_data.obj_end, rhs._data.obj_start, rhs._data.obj_end);
            _data = om::move(new_data);
        }
        return *this;
    }

    // growth
private:
    // exponential growth, rounded to the cache-line alignment used by this vector
    [[nodiscard]] static isize impl_grow_size_for(isize curr_bytes, isize min_bytes)
    {
        return om::align_up(om::max(curr_bytes << 1, min_bytes), alloc_alignment);
    }

    // Begin/finalize sandwich for appends that need a new allocation:
    // begin allocates and returns the obj_end to construct into (behind where the old elements will go),
    // finalize relocates the old elements in front of it and adopts the new allocation.
    // If the resource throws in begin, nothing has changed yet.
    [[nodiscard]] OM_COLD_FUNC T** impl_grow_back_begin(allocation<T>& new_allocation, isize count)
    {
        OM_ASSERT(!has_capacity_back_for(count), "only call this if we don't have enough capacity");

        auto const min_bytes = (size() + count) * isize(sizeof(T));
        auto const new_bytes = impl_grow_size_for(_data.alloc_size_bytes(), min_bytes);
        new_allocation = allocation<T>::create_empty_bytes(new_bytes, alloc_alignment, _data.custom_resource);

        // the live range of new_allocation only tracks the newly constructed elements until finalize
        new_allocation.obj_start = new_allocation.obj_start + size();
        new_allocation.obj_end = new_allocation.obj_start;
        return &new_allocation.obj_end;
    }

    OM_COLD_FUNC void impl_grow_back_finalize(allocation<T>& new_allocation)
    {
        OM_ASSERT(new_allocation.is_valid(), "only call this when we have a temporary alloc");

        // reverse order keeps new_allocation a valid contiguous live range even if a move throws
        impl::move_create_objects_to_reverse(new_allocation.obj_start, _data.obj_start, _data.obj_end);

        // destroys the moved-from old elements and releases the old block
        _data = om::move(new_allocation);
    }

private:
    allocation<T> _data;
};
