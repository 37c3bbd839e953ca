#include <devlink/util/event.hpp>
#include <devlink/util/state_machine.hpp>
#include <doctest/doctest.h>

using namespace devlink;

enum class Light { Off, On };

TEST_CASE("Event subscribe/emit") {
    SUBCASE("single listener") {
        Event<i32> event;
        i32 received = 0;
        event.subscribe([&](i32 val) { received = val; });
        event.emit(42);
        CHECK(received == 42);
    }

    SUBCASE("multiple listeners") {
        Event<i32> event;
        i32 sum = 0;
        event.subscribe([&](i32 val) { sum += val; });
        event.subscribe([&](i32 val) { sum += val * 2; });
        event.emit(10);
        CHECK(sum == 30); // 10 + 20
    }

    SUBCASE("multiple arguments") {
        Event<i32, f32> event;
        i32 i_val = 0;
        f32 f_val = 0;
        event.subscribe([&](i32 i, f32 f) { i_val = i; f_val = f; });
        event.emit(5, 3.14f);
        CHECK(i_val == 5);
        CHECK(f_val == doctest::Approx(3.14f));
    }

    SUBCASE("unsubscribe by token") {
        Event<i32> event;
        i32 a = 0, b = 0;
        auto token = event.subscribe([&](i32 v) { a = v; });
        event.subscribe([&](i32 v) { b = v; });
        CHECK(event.unsubscribe(token));
        CHECK_FALSE(event.unsubscribe(token));
        event.emit(3);
        CHECK(a == 0);
        CHECK(b == 3);
    }

    SUBCASE("subscribe from inside a listener") {
        Event<> event;
        i32 inner = 0;
        event.subscribe([&]() { event.subscribe([&]() { inner++; }); });
        event.emit();
        CHECK(inner == 0); // snapshot taken before the new listener
        CHECK(event.count() == 2);
        event.emit();
        CHECK(inner == 1);
    }

    SUBCASE("clear listeners") {
        Event<i32> event;
        i32 val = 0;
        event.subscribe([&](i32 v) { val = v; });
        event.clear();
        event.emit(99);
        CHECK(val == 0);
        CHECK(event.count() == 0);
    }

    SUBCASE("operator+=") {
        Event<i32> event;
        i32 val = 0;
        event += [&](i32 v) { val = v; };
        event.emit(7);
        CHECK(val == 7);
    }
}

TEST_CASE("StateMachine transitions") {
    StateMachine<Light> sm(Light::Off);
    dp::Vector<std::pair<Light, Light>> seen;
    sm.on_transition.subscribe([&](Light from, Light to) { seen.push_back({from, to}); });

    SUBCASE("emits on change and returns previous state") {
        CHECK(sm.transition(Light::On) == Light::Off);
        CHECK(sm.is(Light::On));
        REQUIRE(seen.size() == 1);
        CHECK(seen[0].first == Light::Off);
        CHECK(seen[0].second == Light::On);
    }

    SUBCASE("same state is silent") {
        sm.transition(Light::Off);
        CHECK(seen.empty());
    }
}
