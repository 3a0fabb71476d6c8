#pragma once

#include <ordered-map/fwd.hh>
#include <ordered-map/impl/object_lifetime_util.hh>
#include <ordered-map/utility.hh>

// Memory underneath om::vector<T>, and therefore underneath the ordered sequence of every map.
//
// An allocation owns one block of bytes taken from an om::memory_resource and tracks the window of
// T objects that are currently alive inside it:
//   [alloc_start, alloc_end)  bytes owned by this handle
//   [obj_start, obj_end)      constructed objects, always inside the owned bytes
// The vector decides where objects go; the allocation only knows how to release them again.
//
// custom_resource == nullptr stands for om::default_memory_resource. The resource travels with the
// allocation, so a vector created on a custom resource keeps growing on it.

namespace om
{
/// posix_memalign / _aligned_malloc based, throws std::bad_alloc on exhaustion.
/// Constant-initialized, safe to use from static initializers of other translation units.
extern memory_resource const* const default_memory_resource;
} // namespace om

/// Byte allocator interface: a plain struct of function pointers plus a context pointer.
struct om::memory_resource
{
    /// Returns `bytes` bytes aligned to `alignment`.
    /// bytes == 0 returns nullptr. Otherwise the result is non-null, or the call throws (std::bad_alloc).
    /// Containers rely on the throw to leave themselves unchanged when growth fails.
    om::byte* (*allocate_bytes)(isize bytes, isize alignment, void* userdata) = nullptr;

    /// Releases a block from allocate_bytes, with the same size and alignment. Must not throw.
    void (*deallocate_bytes)(om::byte* p, isize bytes, isize alignment, void* userdata) = nullptr;

    /// Passed back to both functions, e.g. the address of a stateful allocator.
    void* userdata = nullptr;
};

/// Owning allocation handle for a contiguous byte block plus a typed live window inside it.
/// Move-only. Destroys live objects (in reverse) and releases the block on destruction.
template <class T>
struct om::allocation
{
    // members
public:
    T* obj_start = nullptr;
    T* obj_end = nullptr;
    om::byte* alloc_start = nullptr;
    om::byte* alloc_end = nullptr;
    isize alignment = 0;
    memory_resource const* custom_resource = nullptr;

    // queries
public:
    [[nodiscard]] bool is_valid() const { return alloc_start != nullptr; }

    [[nodiscard]] isize alloc_size_bytes() const { return alloc_end - alloc_start; }

    [[nodiscard]] isize obj_size() const { return obj_end - obj_start; }

    /// Number of whole T slots between obj_end and alloc_end.
    [[nodiscard]] isize capacity_back() const
    {
        // nullptr - nullptr == 0 is well-defined, so the empty allocation needs no special case
        auto const back_bytes = alloc_end - reinterpret_cast<om::byte const*>(obj_end);
        return back_bytes / isize(sizeof(T));
    }

    /// The resource that owns (or will own) the bytes, never nullptr.
    [[nodiscard]] memory_resource const& resource() const
    {
        return custom_resource != nullptr ? *custom_resource : *default_memory_resource;
    }

    // factories
public:
    /// Creates an allocation of `bytes` bytes without live objects.
    /// obj_start == obj_end == aligned start of the block.
    /// Throws whatever the resource throws on exhaustion; nothing is leaked in that case.
    [[nodiscard]] static allocation create_empty_bytes(isize bytes, isize alignment, memory_resource const* resource)
    {
        OM_ASSERT(bytes >= 0, "negative allocation size");
        OM_ASSERT(om::is_power_of_two(alignment), "alignment must be a power of 2");

        allocation a;
        a.alignment = alignment;
        a.custom_resource = resource;

        if (bytes == 0)
            return a;

        auto const& res = a.resource();
        auto const p = res.allocate_bytes(bytes, alignment, res.userdata);
        OM_ASSERT_ALWAYS(p != nullptr, "memory resource returned nullptr instead of throwing");

        a.alloc_start = p;
        a.alloc_end = p + bytes;
        a.obj_start = reinterpret_cast<T*>(p);
        a.obj_end = a.obj_start;
        return a;
    }

    // lifetime
public:
    allocation() = default;

    allocation(allocation const&) = delete;
    allocation& operator=(allocation const&) = delete;

    allocation(allocation&& rhs) noexcept
      : obj_start(om::exchange(rhs.obj_start, nullptr)),
        obj_end(om::exchange(rhs.obj_end, nullptr)),
        alloc_start(om::exchange(rhs.alloc_start, nullptr)),
        alloc_end(om::exchange(rhs.alloc_end, nullptr)),
        alignment(om::exchange(rhs.alignment, 0)),
        custom_resource(rhs.custom_resource) // rhs keeps its resource for future growth
    {
    }

    allocation& operator=(allocation&& rhs) noexcept
    {
        if (this != &rhs)
        {
            impl_release();
            obj_start = om::exchange(rhs.obj_start, nullptr);
            obj_end = om::exchange(rhs.obj_end, nullptr);
            alloc_start = om::exchange(rhs.alloc_start, nullptr);
            alloc_end = om::exchange(rhs.alloc_end, nullptr);
            alignment = om::exchange(rhs.alignment, 0);
            custom_resource = rhs.custom_resource;
        }
        return *this;
    }

    ~allocation() { impl_release(); }

private:
    void impl_release() noexcept
    {
        impl::destroy_objects_in_reverse(obj_start, obj_end);
        if (alloc_start != nullptr)
        {
            auto const& res = resource();
            res.deallocate_bytes(alloc_start, alloc_end - alloc_start, alignment, res.userdata);
        }
        obj_start = nullptr;
        obj_end = nullptr;
        alloc_start = nullptr;
        alloc_end = nullptr;
    }
};
