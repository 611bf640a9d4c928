#include <catch2/catch_test_macros.hpp>
#include <string>
#include <vector>

#include <morph/Logger.hpp>
#include <morph/MorphController.hpp>
#include <morph/UICallback.hpp>

using namespace morph;

namespace {

const UICallback* find_callback(const std::vector<UICallback>& callbacks, const std::string& name)
{
    for (const auto& cb : callbacks) {
        if (cb.field_name == name)
            return &cb;
    }
    return nullptr;
}

} // anonymous namespace

TEST_CASE("UICallback reports its type", "[ui]")
{
    UICallback color("Colour", ColorCallback{
        .setter = [](glm::vec3) {},
        .getter = []() { return glm::vec3(1.0f); }
    });
    UICallback action("Go", ActionCallback{.trigger = []() {}});
    UICallback readout("Value", ReadoutCallback{.getter = []() { return 0.5f; }});

    REQUIRE(color.get_callback_type() == CallbackType::Color);
    REQUIRE(color.as_color() != nullptr);
    REQUIRE(color.as_continuous() == nullptr);
    REQUIRE(action.get_callback_type() == CallbackType::Action);
    REQUIRE(readout.get_callback_type() == CallbackType::Readout);
    REQUIRE(readout.as_readout()->getter() == 0.5f);
}

TEST_CASE("A controller without variants has no shape selector", "[ui][morph_controller]")
{
    MorphController controller(0);
    auto callbacks = controller.get_ui_callbacks();
    REQUIRE(find_callback(callbacks, "Shape") == nullptr);
    REQUIRE(callbacks.size() == 4);
}

TEST_CASE("MorphController exposes its tunables", "[ui][morph_controller]")
{
    Logger::instance().set_level(spdlog::level::warn);
    MorphController controller(3);
    std::vector<std::string> names = {"torus", "sphere", "disc"};
    auto callbacks = controller.get_ui_callbacks(names);

    REQUIRE(callbacks.size() == 5 + names.size());

    SECTION("progress readout follows the controller")
    {
        const auto* progress = find_callback(callbacks, "Progress");
        REQUIRE(progress != nullptr);
        REQUIRE(progress->get_callback_type() == CallbackType::Readout);
        REQUIRE(progress->as_readout()->getter() == controller.progress());
    }

    SECTION("auto-advance toggle")
    {
        const auto* toggle = find_callback(callbacks, "Auto advance");
        REQUIRE(toggle != nullptr);
        toggle->as_toggle()->setter(false);
        REQUIRE_FALSE(controller.auto_advance());
        REQUIRE_FALSE(toggle->as_toggle()->getter());
    }

    SECTION("duration slider")
    {
        const auto* duration = find_callback(callbacks, "Duration (s)");
        REQUIRE(duration != nullptr);
        duration->as_continuous()->setter(1.5f);
        REQUIRE(controller.duration() == 1.5f);
    }

    SECTION("shape selector spans the variants and follows the latest request")
    {
        const auto* shape = find_callback(callbacks, "Shape");
        REQUIRE(shape != nullptr);
        REQUIRE(shape->get_callback_type() == CallbackType::Discrete);
        REQUIRE(shape->as_discrete()->min == 0);
        REQUIRE(shape->as_discrete()->max == 2);
        REQUIRE(shape->as_discrete()->getter() == 0);

        shape->as_discrete()->setter(1);
        REQUIRE(controller.pending_commands() == 1);
        controller.tick(0.0f);
        REQUIRE(controller.target_index() == 1);
        REQUIRE(shape->as_discrete()->getter() == 1);

        // Re-selecting the shape already targeted does not restart it
        shape->as_discrete()->setter(1);
        REQUIRE(controller.pending_commands() == 0);
    }

    SECTION("variant buttons queue a morph")
    {
        const auto* button = find_callback(callbacks, "Morph to disc");
        REQUIRE(button != nullptr);
        button->as_action()->trigger();
        REQUIRE(controller.pending_commands() == 1);
        controller.tick(0.0f);
        REQUIRE(controller.target_index() == 2);
    }
}
