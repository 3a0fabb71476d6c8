#include <ordered-map/allocation.hh>
#include <ordered-map/utility.hh>

#include <nexus/test.hh>

#include <cstdint>
#include <vector>

namespace
{
struct Tracked
{
    int value = 0;
    static inline std::vector<int>* destruction_order = nullptr;

    explicit Tracked(int v) : value(v) {}

    ~Tracked()
    {
        if (destruction_order)
            destruction_order->push_back(value);
    }
};
} // namespace

TEST("allocation - default construction")
{
    om::allocation<int> alloc;

    CHECK(alloc.obj_start == nullptr);
    CHECK(alloc.obj_end == nullptr);
    CHECK(alloc.alloc_start == nullptr);
    CHECK(alloc.alloc_end == nullptr);
    CHECK(alloc.alignment == 0);
    CHECK(alloc.custom_resource == nullptr);
    CHECK(!alloc.is_valid());
    CHECK(alloc.obj_size() == 0);
    CHECK(alloc.capacity_back() == 0);
    CHECK(alloc.alloc_size_bytes() == 0);
}

TEST("allocation - create_empty_bytes")
{
    SECTION("non-empty")
    {
        auto alloc = om::allocation<int>::create_empty_bytes(40, 64, nullptr);

        CHECK(alloc.is_valid());
        CHECK(alloc.alloc_size_bytes() == 40);
        CHECK(alloc.obj_start == reinterpret_cast<int*>(alloc.alloc_start));
        CHECK(alloc.obj_end == alloc.obj_start);
        CHECK(alloc.capacity_back() == 10);
        CHECK(alloc.alignment == 64);
        CHECK(reinterpret_cast<std::uintptr_t>(alloc.alloc_start) % 64 == 0);
    }

    SECTION("zero bytes allocates nothing")
    {
        auto alloc = om::allocation<int>::create_empty_bytes(0, alignof(int), nullptr);

        CHECK(!alloc.is_valid());
        CHECK(alloc.alloc_start == nullptr);
        CHECK(alloc.obj_start == nullptr);
        CHECK(alloc.alloc_size_bytes() == 0);
    }
}

TEST("allocation - resource resolution")
{
    om::allocation<int> alloc;
    CHECK(&alloc.resource() == om::default_memory_resource);
}

TEST("allocation - move transfers ownership")
{
    auto a = om::allocation<int>::create_empty_bytes(16, alignof(int), nullptr);
    auto const start = a.alloc_start;

    auto b = om::move(a);
    CHECK(b.alloc_start == start);
    CHECK(!a.is_valid());

    om::allocation<int> c;
    c = om::move(b);
    CHECK(c.alloc_start == start);
    CHECK(!b.is_valid());
}

TEST("allocation - destroys live objects in reverse order")
{
    std::vector<int> order;
    {
        auto alloc = om::allocation<Tracked>::create_empty_bytes(om::isize(3 * sizeof(Tracked)), alignof(Tracked), nullptr);
        for (int i = 0; i < 3; ++i)
        {
            new (om::placement_new, alloc.obj_end) Tracked(i);
            ++alloc.obj_end;
        }
        CHECK(alloc.obj_size() == 3);
        Tracked::destruction_order = &order;
    }
    Tracked::destruction_order = nullptr;

    CHECK(order == std::vector<int>{2, 1, 0});
}
