#include <ordered-map/utility.hh>

#include <nexus/test.hh>

#include <memory>
#include <string>
#include <type_traits>

static_assert(std::is_same_v<decltype(om::move(std::declval<int&>())), int&&>);
static_assert(std::is_trivially_copyable_v<om::storage_for<int>>);
static_assert(!std::is_trivially_destructible_v<om::storage_for<std::string>>);
static_assert(sizeof(om::storage_for<std::string>) == sizeof(std::string));
static_assert(alignof(om::storage_for<double>) == alignof(double));

TEST("utility - exchange replaces value and returns old")
{
    auto ptr = std::make_unique<int>(5);
    auto* raw = ptr.get();

    std::unique_ptr<int> taken = om::exchange(ptr, nullptr);
    CHECK(taken.get() == raw);
    CHECK(ptr == nullptr);

    int value = 1;
    CHECK(om::exchange(value, 2) == 1);
    CHECK(value == 2);
}

TEST("utility - max returns the larger value")
{
    CHECK(om::max(1, 2) == 2);
    CHECK(om::max(om::isize(64), om::isize(8)) == 64);

    // equal values return the first argument
    int a = 3;
    int b = 3;
    CHECK(&om::max(a, b) == &a);
}

TEST("utility - is_power_of_two truth table")
{
    CHECK(!om::is_power_of_two(0));
    CHECK(om::is_power_of_two(1));
    CHECK(om::is_power_of_two(2));
    CHECK(!om::is_power_of_two(3));
    CHECK(om::is_power_of_two(64));
    CHECK(!om::is_power_of_two(96));
    CHECK(!om::is_power_of_two(-4));
    CHECK(om::is_power_of_two(om::isize(1) << 40));
}

TEST("utility - align_up")
{
    SECTION("integers")
    {
        CHECK(om::align_up(om::isize(0), 64) == 0);
        CHECK(om::align_up(om::isize(1), 64) == 64);
        CHECK(om::align_up(om::isize(64), 64) == 64);
        CHECK(om::align_up(om::isize(65), 64) == 128);
        CHECK(om::align_up(om::isize(7), 1) == 7);
    }

    SECTION("pointers")
    {
        alignas(16) char buffer[64] = {};
        char* p = buffer + 1;
        char* aligned = om::align_up(p, 16);
        CHECK(aligned == buffer + 16);
        CHECK(om::align_up(buffer + 16, 16) == buffer + 16);
    }
}

TEST("utility - storage_for holds a manually managed object")
{
    om::storage_for<std::string> storage;
    new (om::placement_new, &storage.value) std::string("managed by hand");
    CHECK(storage.value == "managed by hand");
    storage.value.~basic_string();
}

TEST("utility - invoke calls functions and member pointers")
{
    struct point
    {
        int x = 0;
        int twice() const { return 2 * x; }
    };

    auto const p = point{21};
    CHECK(om::invoke([](int a, int b) { return a + b; }, 1, 2) == 3);
    CHECK(om::invoke(&point::twice, p) == 42);
    CHECK(om::invoke(&point::x, p) == 21);
}

TEST("utility - sentinel as end-of-range marker")
{
    struct counting_iterator
    {
        int count;
        int max;

        int operator*() const { return count; }
        counting_iterator& operator++()
        {
            ++count;
            return *this;
        }
        bool operator!=(om::sentinel) const { return count < max; }
    };

    struct counting_range
    {
        int max;
        counting_iterator begin() const { return {0, max}; }
        om::sentinel end() const { return {}; }
    };

    counting_range range{5};
    int sum = 0;
    for (int val : range)
        sum += val;
    CHECK(sum == 0 + 1 + 2 + 3 + 4);
}
