#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <vector>

#include <morph/Logger.hpp>
#include <morph/MorphController.hpp>

using namespace morph;
using Catch::Matchers::WithinAbs;

namespace {

MorphConfig manual_config()
{
    return MorphConfig{.duration = 3.0f, .auto_advance_interval = 4.0f, .auto_advance = false};
}

} // anonymous namespace

TEST_CASE("MorphController starts idle on variant 0", "[morph_controller]")
{
    Logger::instance().set_level(spdlog::level::warn);
    MorphController controller(4);

    REQUIRE(controller.current_index() == 0);
    REQUIRE(controller.target_index() == 0);
    REQUIRE(controller.progress() == 0.0f);
    REQUIRE_FALSE(controller.is_transitioning());
    REQUIRE(controller.variant_count() == 4);
    REQUIRE(controller.auto_advance());
}

TEST_CASE("morph_to is applied by the next tick", "[morph_controller]")
{
    MorphController controller(4, manual_config());

    REQUIRE(controller.morph_to(2).has_value());
    REQUIRE(controller.pending_commands() == 1);
    REQUIRE(controller.target_index() == 0);

    controller.tick(0.0f);
    REQUIRE(controller.pending_commands() == 0);
    REQUIRE(controller.is_transitioning());
    REQUIRE(controller.current_index() == 0);
    REQUIRE(controller.target_index() == 2);
    REQUIRE(controller.progress() == 0.0f);

    SECTION("progress is linear in elapsed time")
    {
        controller.tick(1.5f);
        REQUIRE_THAT(controller.progress(), WithinAbs(0.5f, 1e-6));
        REQUIRE(controller.is_transitioning());
    }

    SECTION("completion makes the target current")
    {
        controller.tick(3.0f);
        REQUIRE_FALSE(controller.is_transitioning());
        REQUIRE(controller.current_index() == 2);
        REQUIRE(controller.target_index() == 2);
        REQUIRE(controller.progress() == 1.0f);
    }

    SECTION("overshooting dt clamps progress at 1")
    {
        controller.tick(10.0f);
        REQUIRE(controller.progress() == 1.0f);
        REQUIRE(controller.current_index() == 2);
    }
}

TEST_CASE("Requesting the same variant twice restarts the transition", "[morph_controller]")
{
    MorphController controller(4, manual_config());

    REQUIRE(controller.morph_to(2).has_value());
    controller.tick(0.0f);
    controller.tick(1.0f);
    REQUIRE(controller.progress() > 0.0f);

    REQUIRE(controller.morph_to(2).has_value());
    controller.tick(0.0f);

    REQUIRE(controller.target_index() == 2);
    REQUIRE(controller.current_index() == 0);
    REQUIRE(controller.progress() == 0.0f);
    REQUIRE(controller.is_transitioning());
}

TEST_CASE("A new request preempts the transition in flight", "[morph_controller]")
{
    MorphController controller(4, manual_config());

    REQUIRE(controller.morph_to(1).has_value());
    controller.tick(0.0f);
    controller.tick(2.0f);

    REQUIRE(controller.morph_to(3).has_value());
    controller.tick(0.0f);

    REQUIRE(controller.current_index() == 0);
    REQUIRE(controller.target_index() == 3);
    REQUIRE(controller.progress() == 0.0f);

    controller.tick(3.0f);
    REQUIRE(controller.current_index() == 3);
}

TEST_CASE("Queued requests are applied in FIFO order", "[morph_controller]")
{
    MorphController controller(4, manual_config());

    REQUIRE(controller.morph_to(1).has_value());
    REQUIRE(controller.morph_to(3).has_value());
    controller.tick(0.0f);

    REQUIRE(controller.target_index() == 3);
    REQUIRE(controller.pending_commands() == 0);
}

TEST_CASE("Out-of-range requests are rejected without touching state", "[morph_controller][error]")
{
    MorphController controller(4, manual_config());

    auto result = controller.morph_to(7);
    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().index == 7);
    REQUIRE(result.error().variant_count == 4);
    REQUIRE(controller.pending_commands() == 0);

    controller.tick(1.0f);
    REQUIRE(controller.current_index() == 0);
    REQUIRE(controller.target_index() == 0);
    REQUIRE_FALSE(controller.is_transitioning());

    SECTION("a controller without variants rejects everything")
    {
        MorphController empty(0);
        REQUIRE_FALSE(empty.morph_to(0).has_value());
        empty.tick(10.0f);
        REQUIRE(empty.pending_commands() == 0);
    }
}

TEST_CASE("Progress never decreases within a transition", "[morph_controller]")
{
    MorphController controller(3, manual_config());
    REQUIRE(controller.morph_to(1).has_value());
    controller.tick(0.0f);

    float previous = controller.progress();
    for (int i = 0; i < 100; ++i) {
        if (i == 40)
            controller.set_duration(1.0f);  // shortening mid-flight
        if (i == 60)
            controller.set_duration(8.0f);  // lengthening mid-flight must not rewind
        controller.tick(0.016f);
        REQUIRE(controller.progress() >= previous);
        previous = controller.progress();
    }
}

TEST_CASE("Auto-advance cycles through every variant", "[morph_controller][auto]")
{
    MorphController controller(4);
    std::vector<std::size_t> started;
    controller.add_listener([&](const MorphEvent& event) {
        if (const auto* s = std::get_if<TransitionStarted>(&event))
            started.push_back(s->to);
    });

    for (int i = 0; i < 32; ++i)
        controller.tick(0.5f);

    REQUIRE(started == std::vector<std::size_t>{1, 2, 3, 0});
    REQUIRE(controller.target_index() == 0);
    REQUIRE(controller.current_index() == 3);
}

TEST_CASE("Auto-advance keeps cycling when the tween outlasts the interval", "[morph_controller][auto]")
{
    MorphController controller(4, MorphConfig{.duration = 5.0f, .auto_advance_interval = 4.0f});
    std::vector<std::size_t> started;
    controller.add_listener([&](const MorphEvent& event) {
        if (const auto* s = std::get_if<TransitionStarted>(&event))
            started.push_back(s->to);
    });

    // four intervals, each fire preempts the previous transition before it completes
    for (int i = 0; i < 32; ++i)
        controller.tick(0.5f);

    REQUIRE(started == std::vector<std::size_t>{1, 2, 3, 0});
    REQUIRE(controller.target_index() == 0);

    controller.set_auto_advance(false);
    controller.tick(5.0f);
    REQUIRE_FALSE(controller.is_transitioning());
    REQUIRE(controller.current_index() == 0);
}

TEST_CASE("A tick spanning several intervals advances once", "[morph_controller][auto]")
{
    MorphController controller(4);
    std::vector<std::size_t> started;
    controller.add_listener([&](const MorphEvent& event) {
        if (const auto* s = std::get_if<TransitionStarted>(&event))
            started.push_back(s->to);
    });

    controller.tick(12.5f);
    REQUIRE(started == std::vector<std::size_t>{1});
    REQUIRE(controller.target_index() == 1);
    REQUIRE(controller.pending_commands() == 0);

    // the half interval left over is kept, the next fire lands 3.5 s later
    controller.tick(3.0f);
    REQUIRE(controller.current_index() == 1);
    REQUIRE(started.size() == 1);

    controller.tick(0.5f);
    REQUIRE(started == std::vector<std::size_t>{1, 2});
    REQUIRE(controller.target_index() == 2);
}

TEST_CASE("A timer that elapses during a tick is applied in that tick", "[morph_controller][auto]")
{
    MorphController controller(2);

    controller.tick(3.5f);
    REQUIRE_FALSE(controller.is_transitioning());

    controller.tick(0.5f);
    REQUIRE(controller.is_transitioning());
    REQUIRE(controller.target_index() == 1);
    REQUIRE(controller.pending_commands() == 0);
}

TEST_CASE("Auto-advance runs alongside manual requests", "[morph_controller][auto]")
{
    MorphController controller(4);

    REQUIRE(controller.morph_to(2).has_value());
    controller.tick(0.0f);
    controller.tick(3.0f);
    REQUIRE(controller.current_index() == 2);

    // timer fires at t = 4 and advances from the current variant
    controller.tick(1.0f);
    REQUIRE(controller.target_index() == 3);
}

TEST_CASE("Auto-advance can be switched off and on", "[morph_controller][auto]")
{
    MorphController controller(3);

    controller.tick(3.0f);
    controller.set_auto_advance(false);
    controller.tick(10.0f);
    REQUIRE_FALSE(controller.is_transitioning());
    REQUIRE(controller.current_index() == 0);

    SECTION("re-enabling restarts the timer phase")
    {
        controller.set_auto_advance(true);
        controller.tick(3.0f);
        REQUIRE_FALSE(controller.is_transitioning());
        controller.tick(1.0f);
        REQUIRE(controller.target_index() == 1);
    }

    SECTION("a non-positive interval never fires")
    {
        controller.set_auto_advance_interval(0.0f);
        controller.set_auto_advance(true);
        controller.tick(100.0f);
        REQUIRE_FALSE(controller.is_transitioning());
    }
}

TEST_CASE("Listeners see start and finish events", "[morph_controller][events]")
{
    MorphController controller(3, manual_config());
    std::vector<MorphEvent> events;
    controller.add_listener([&](const MorphEvent& event) { events.push_back(event); });

    REQUIRE(controller.morph_to(1).has_value());
    controller.tick(0.0f);
    controller.tick(3.0f);

    REQUIRE(events.size() == 2);
    const auto* started = std::get_if<TransitionStarted>(&events[0]);
    REQUIRE(started != nullptr);
    REQUIRE(started->from == 0);
    REQUIRE(started->to == 1);

    const auto* finished = std::get_if<TransitionFinished>(&events[1]);
    REQUIRE(finished != nullptr);
    REQUIRE(finished->index == 1);
}

TEST_CASE("Zero duration completes on the following tick", "[morph_controller]")
{
    MorphController controller(2, MorphConfig{.duration = 0.0f, .auto_advance = false});
    REQUIRE(controller.morph_to(1).has_value());
    controller.tick(0.0f);
    REQUIRE(controller.is_transitioning());
    controller.tick(0.0f);
    REQUIRE(controller.current_index() == 1);
    REQUIRE(controller.progress() == 1.0f);
}

TEST_CASE("Snapshot mirrors the accessors", "[morph_controller]")
{
    MorphController controller(3, manual_config());
    REQUIRE(controller.morph_to(2).has_value());
    controller.tick(0.0f);
    controller.tick(0.75f);

    auto snapshot = controller.snapshot();
    REQUIRE(snapshot.current_index == controller.current_index());
    REQUIRE(snapshot.target_index == controller.target_index());
    REQUIRE(snapshot.progress == controller.progress());
}
