#include <ordered-map/utility.hh>
#include <ordered-map/vector.hh>

#include <nexus/test.hh>

#include <cstdint>
#include <new>
#include <string>
#include <vector>

namespace
{
// Instrumented type that tracks construction and destruction
struct Tracked
{
    int value = 0;
    static inline int ctor_count = 0;
    static inline int copy_ctor_count = 0;
    static inline int move_ctor_count = 0;
    static inline int dtor_count = 0;
    static inline std::vector<int>* destruction_order = nullptr;

    static void reset_counters()
    {
        ctor_count = 0;
        copy_ctor_count = 0;
        move_ctor_count = 0;
        dtor_count = 0;
        destruction_order = nullptr;
    }

    explicit Tracked(int v) : value(v) { ++ctor_count; }

    Tracked(Tracked const& rhs) : value(rhs.value) { ++copy_ctor_count; }

    Tracked(Tracked&& rhs) noexcept : value(rhs.value) { ++move_ctor_count; }

    Tracked& operator=(Tracked const& rhs) = default;
    Tracked& operator=(Tracked&& rhs) noexcept = default;

    ~Tracked()
    {
        ++dtor_count;
        if (destruction_order)
            destruction_order->push_back(value);
    }
};

// Counting memory resource, optionally failing once the budget is used up
struct CountingResource : om::memory_resource
{
    int allocations = 0;
    int deallocations = 0;
    om::isize total_allocated_bytes = 0;
    om::isize total_deallocated_bytes = 0;
    int budget = -1; // < 0 means unlimited

    CountingResource()
    {
        allocate_bytes = [](om::isize bytes, om::isize alignment, void* userdata) -> om::byte*
        {
            auto* self = static_cast<CountingResource*>(userdata);
            if (bytes == 0)
                return nullptr;
            if (self->budget == 0)
                throw std::bad_alloc();
            if (self->budget > 0)
                --self->budget;

            ++self->allocations;
            self->total_allocated_bytes += bytes;
            return static_cast<om::byte*>(::operator new(bytes, std::align_val_t(alignment)));
        };

        deallocate_bytes = [](om::byte* p, om::isize bytes, om::isize alignment, void* userdata)
        {
            auto* self = static_cast<CountingResource*>(userdata);
            if (p == nullptr)
                return;
            ++self->deallocations;
            self->total_deallocated_bytes += bytes;
            ::operator delete(p, std::align_val_t(alignment));
        };

        userdata = this;
    }

    void reset()
    {
        allocations = 0;
        deallocations = 0;
        total_allocated_bytes = 0;
        total_deallocated_bytes = 0;
    }
};
} // namespace

TEST("vector - default construction invariants")
{
    om::vector<int> v;
    CHECK(v.size() == 0);
    CHECK(v.empty());
    CHECK(v.begin() == v.end());
    CHECK(v.capacity() == 0);
    CHECK(v.capacity_back() == 0);
    CHECK(v.data() == nullptr);
}

TEST("vector - create_with_capacity")
{
    SECTION("capacity 0 does not allocate")
    {
        CountingResource res;
        auto v = om::vector<int>::create_with_capacity(0, &res);
        CHECK(v.size() == 0);
        CHECK(v.capacity() == 0);
        CHECK(res.allocations == 0);
    }

    SECTION("capacity 10")
    {
        auto v = om::vector<int>::create_with_capacity(10);
        CHECK(v.size() == 0);
        CHECK(v.capacity() >= 10);
        CHECK(v.has_capacity_back_for(10));
    }

    SECTION("no element construction")
    {
        Tracked::reset_counters();
        {
            auto v = om::vector<Tracked>::create_with_capacity(20);
            CHECK(v.capacity() >= 20);
        }
        CHECK(Tracked::ctor_count == 0);
        CHECK(Tracked::dtor_count == 0);
    }

    SECTION("storage is aligned to the allocation alignment")
    {
        auto v = om::vector<char>::create_with_capacity(1);
        CHECK(reinterpret_cast<std::uintptr_t>(v.data()) % std::uintptr_t(om::vector<char>::alloc_alignment) == 0);
    }
}

TEST("vector - push_back and growth")
{
    SECTION("growth preserves existing elements")
    {
        CountingResource res;
        auto v = om::vector<int>::create_with_capacity(0, &res);

        for (int i = 0; i < 100; ++i)
            v.push_back(i);

        CHECK(v.size() == 100);
        for (int i = 0; i < 100; ++i)
            CHECK(v[i] == i);
        CHECK(res.allocations > 0);
    }

    SECTION("exponential growth keeps allocations logarithmic")
    {
        CountingResource res;
        auto v = om::vector<int>::create_with_capacity(0, &res);

        for (int i = 0; i < 1000; ++i)
            v.push_back(i);

        CHECK(v.size() == 1000);
        CHECK(res.allocations < 20);
    }

    SECTION("pushing an element of the vector itself during growth")
    {
        auto v = om::vector<std::string>();
        v.push_back("first element, long enough to live on the heap");
        while (v.size() < v.capacity())
            v.push_back("filler");

        REQUIRE(!v.has_capacity_back_for(1));
        v.push_back(v[0]);

        CHECK(v.back() == "first element, long enough to live on the heap");
        CHECK(v.front() == v.back());
    }

    SECTION("emplace_back constructs in place")
    {
        Tracked::reset_counters();
        {
            om::vector<Tracked> v;
            v.reserve(4);
            v.emplace_back(1);
            v.emplace_back(2);
            CHECK(v[1].value == 2);
            CHECK(Tracked::ctor_count == 2);
            CHECK(Tracked::copy_ctor_count == 0);
        }
    }
}

TEST("vector - stable appends")
{
    SECTION("with sufficient capacity")
    {
        auto v = om::vector<int>::create_with_capacity(10);
        v.push_back_stable(42);
        v.push_back_stable(99);

        CHECK(v.size() == 2);
        CHECK(v[0] == 42);
        CHECK(v[1] == 99);
    }

    SECTION("no reallocation")
    {
        CountingResource res;
        auto v = om::vector<int>::create_with_capacity(10, &res);
        auto const original_data = v.data();
        res.reset();

        v.push_back_stable(1);
        v.push_back_stable(2);
        v.push_back_stable(3);

        CHECK(v.data() == original_data);
        CHECK(res.allocations == 0);
    }

    SECTION("emplace_back_stable returns the new element")
    {
        auto v = om::vector<Tracked>::create_with_capacity(4);
        auto& e = v.emplace_back_stable(10);
        CHECK(&e == &v.back());
        CHECK(e.value == 10);
    }
}

TEST("vector - reserve and reserve_back")
{
    SECTION("reserve from empty")
    {
        om::vector<int> v;
        v.reserve(100);
        CHECK(v.size() == 0);
        CHECK(v.capacity() >= 100);
    }

    SECTION("reserve does not decrease capacity")
    {
        CountingResource res;
        auto v = om::vector<int>::create_with_capacity(100, &res);
        auto const old_capacity = v.capacity();
        res.reset();

        v.reserve(50);

        CHECK(v.capacity() == old_capacity);
        CHECK(res.allocations == 0);
    }

    SECTION("reserve_back keeps elements and makes room")
    {
        om::vector<int> v;
        for (int i = 0; i < 10; ++i)
            v.push_back(i);

        v.reserve_back(50);

        CHECK(v.size() == 10);
        CHECK(v.capacity_back() >= 50);
        for (int i = 0; i < 10; ++i)
            CHECK(v[i] == i);
    }

    SECTION("reserve_back grows exponentially")
    {
        CountingResource res;
        auto v = om::vector<int>::create_with_capacity(0, &res);
        for (int i = 0; i < 1000; ++i)
        {
            v.reserve_back(1);
            v.push_back_stable(i);
        }
        CHECK(res.allocations < 20);
    }
}

TEST("vector - allocation failure leaves the vector unchanged")
{
    CountingResource res;
    auto v = om::vector<std::string>::create_with_capacity(1, &res);
    while (v.has_capacity_back_for(1))
        v.push_back_stable("value " + std::to_string(v.size()));

    auto const size_before = v.size();
    auto const capacity_before = v.capacity();
    auto const data_before = v.data();

    res.budget = 0;

    SECTION("push_back")
    {
        auto threw = false;
        try
        {
            v.push_back("does not fit");
        }
        catch (std::bad_alloc const&)
        {
            threw = true;
        }
        CHECK(threw);
    }

    SECTION("reserve_back")
    {
        auto threw = false;
        try
        {
            v.reserve_back(100);
        }
        catch (std::bad_alloc const&)
        {
            threw = true;
        }
        CHECK(threw);
    }

    CHECK(v.size() == size_before);
    CHECK(v.capacity() == capacity_before);
    CHECK(v.data() == data_before);
    for (om::isize i = 0; i < v.size(); ++i)
        CHECK(v[i] == "value " + std::to_string(i));
}

TEST("vector - remove_at preserves order")
{
    SECTION("trivial elements")
    {
        om::vector<int> v;
        for (int i = 0; i < 6; ++i)
            v.push_back(i);

        v.remove_at(2);
        CHECK(v.size() == 5);
        CHECK(v[0] == 0);
        CHECK(v[1] == 1);
        CHECK(v[2] == 3);
        CHECK(v[3] == 4);
        CHECK(v[4] == 5);

        v.remove_at(0);
        CHECK(v.front() == 1);

        v.remove_at(v.size() - 1);
        CHECK(v.back() == 4);
        CHECK(v.size() == 3);
    }

    SECTION("non-trivial elements")
    {
        om::vector<std::string> v;
        v.push_back("a");
        v.push_back("b");
        v.push_back("c");
        v.push_back("d");

        v.remove_at(1);
        REQUIRE(v.size() == 3);
        CHECK(v[0] == "a");
        CHECK(v[1] == "c");
        CHECK(v[2] == "d");
    }

    SECTION("exactly one element is destroyed")
    {
        Tracked::reset_counters();
        om::vector<Tracked> v;
        v.reserve(4);
        v.emplace_back(1);
        v.emplace_back(2);
        v.emplace_back(3);

        v.remove_at(0);
        CHECK(Tracked::dtor_count == 1);
        CHECK(v[0].value == 2);
        CHECK(v[1].value == 3);
    }
}

TEST("vector - remove_back and clear")
{
    om::vector<std::string> v;
    v.push_back("x");
    v.push_back("y");

    v.remove_back();
    CHECK(v.size() == 1);
    CHECK(v.back() == "x");

    auto const capacity = v.capacity();
    v.clear();
    CHECK(v.empty());
    CHECK(v.capacity() == capacity);
}

TEST("vector - copy and move")
{
    SECTION("copy is deep")
    {
        om::vector<int> v1;
        for (int i = 0; i < 5; ++i)
            v1.push_back(42);

        auto v2(v1);
        CHECK(v2.size() == 5);
        CHECK(v2.data() != v1.data());

        v1[0] = 99;
        CHECK(v2[0] == 42);
    }

    SECTION("copy assignment keeps lhs resource")
    {
        CountingResource resA;
        CountingResource resB;

        auto lhs = om::vector<int>::create_with_capacity(3, &resA);
        auto rhs = om::vector<int>::create_with_capacity(5, &resB);
        for (int i = 0; i < 5; ++i)
            rhs.push_back_stable(i * 10);

        resA.reset();
        resB.reset();

        lhs = rhs;

        CHECK(lhs.size() == 5);
        CHECK(lhs[4] == 40);
        CHECK(resA.allocations == 1);
        CHECK(resA.deallocations == 1);
        CHECK(resB.allocations == 0);
    }

    SECTION("move transfers ownership")
    {
        om::vector<std::string> v1;
        v1.push_back("moved");
        auto const data = v1.data();

        auto v2 = om::move(v1);
        CHECK(v2.data() == data);
        CHECK(v2[0] == "moved");
        CHECK(v1.empty());
    }
}

TEST("vector - destruction")
{
    SECTION("reverse destruction order")
    {
        std::vector<int> destruction_sequence;
        Tracked::reset_counters();

        {
            om::vector<Tracked> v;
            v.reserve(5);
            for (int i = 0; i < 5; ++i)
                v.emplace_back(i);
            Tracked::destruction_order = &destruction_sequence;
        }

        CHECK(destruction_sequence == std::vector<int>{4, 3, 2, 1, 0});
        Tracked::destruction_order = nullptr;
    }

    SECTION("allocations balance deallocations")
    {
        CountingResource res;
        {
            auto v1 = om::vector<int>::create_with_capacity(10, &res);
            auto v2 = om::vector<std::string>::create_with_capacity(2, &res);

            for (int i = 0; i < 100; ++i)
                v1.push_back(i);
            for (int i = 0; i < 50; ++i)
                v2.push_back(std::to_string(i));

            auto v3 = v2;
            v3.remove_at(10);
        }

        CHECK(res.allocations == res.deallocations);
        CHECK(res.total_allocated_bytes == res.total_deallocated_bytes);
    }
}
