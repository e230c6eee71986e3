#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <VirtualTime/VirtualClock.hpp>

using droneinspector::time::VirtualClock;
using Catch::Approx;
using namespace std::chrono_literals;

TEST_CASE("VirtualClock maintains a deterministic fixed-step timeline", "[VirtualClock]")
{
    VirtualClock clock(8ms);

    SECTION("starts at the epoch and does not regress")
    {
        REQUIRE(clock.now() == VirtualClock::TimePoint{});
        REQUIRE(clock.seconds() == 0.0);
    }

    SECTION("tick advances by exactly one step")
    {
        clock.tick();
        clock.tick();
        REQUIRE(clock.now() - VirtualClock::TimePoint{} == 16ms);
        REQUIRE(clock.seconds() == Approx(0.016));
    }

    SECTION("advances forward while ignoring negative deltas")
    {
        clock.advance(10ms);
        auto afterPositive = clock.now();
        REQUIRE(afterPositive - VirtualClock::TimePoint{} == 10ms);

        clock.advance(-5ms);
        REQUIRE(clock.now() == afterPositive);
    }

    SECTION("reset returns the clock to the initial epoch")
    {
        clock.advance(7ms);
        REQUIRE(clock.now() > VirtualClock::TimePoint{});
        clock.reset();
        REQUIRE(clock.now() == VirtualClock::TimePoint{});
    }
}

TEST_CASE("VirtualClock rejects a non-positive step", "[VirtualClock]")
{
    VirtualClock clock(0ms);
    REQUIRE(clock.step() == 8ms);
}
