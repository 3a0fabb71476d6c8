#include "allocation.hh"

#include <ordered-map/macros.hh>
#include <ordered-map/utility.hh>

#include <cstdlib>
#include <new>

namespace
{
/// Static function implementations for the system memory resource.
/// These ignore the userdata parameter as the system allocator is stateless.

om::byte* system_allocate_bytes(om::isize bytes, om::isize alignment, void* userdata)
{
    OM_UNUSED(userdata);

    OM_ASSERT(alignment > 0 && om::is_power_of_two(alignment), "alignment must be a power of 2");

    // Contract: bytes == 0 always returns nullptr
    if (bytes == 0)
        return nullptr;

#ifdef OM_OS_WINDOWS
    auto const p = static_cast<om::byte*>(_aligned_malloc(bytes, alignment));
#else
    // posix_memalign has no bytes % alignment == 0 requirement (unlike std::aligned_alloc)
    // but needs alignment >= sizeof(void*)
    void* raw_ptr = nullptr;
    om::isize const effective_alignment = alignment < om::isize(sizeof(void*)) ? om::isize(sizeof(void*)) : alignment;
    int const result = posix_memalign(&raw_ptr, effective_alignment, bytes);
    auto const p = result == 0 ? static_cast<om::byte*>(raw_ptr) : nullptr;
#endif

    // exhaustion is exceptional, not a programmer error: containers unwind and stay unchanged
    if (p == nullptr)
        throw std::bad_alloc();

    return p;
}

void system_deallocate_bytes(om::byte* p, om::isize bytes, om::isize alignment, void* userdata)
{
    OM_UNUSED(bytes);
    OM_UNUSED(alignment);
    OM_UNUSED(userdata);

#ifdef OM_OS_WINDOWS
    _aligned_free(p);
#else
    std::free(p);
#endif
}

/// System memory resource instance stored in the data segment.
/// This is the default fallback when om::allocation<T>::custom_resource is nullptr.
constinit om::memory_resource const system_memory_resource = {
    .allocate_bytes = system_allocate_bytes,
    .deallocate_bytes = system_deallocate_bytes,
    .userdata = nullptr,
};

} // namespace

constinit om::memory_resource const* const om::default_memory_resource = &system_memory_resource;
