#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <cmath>

#include <morph/Camera3D.hpp>

using namespace morph;
using Catch::Matchers::WithinAbs;

TEST_CASE("Camera starts on +Z at distance 16", "[camera]")
{
    Camera3D camera(1280, 720);

    auto position = camera.position();
    REQUIRE_THAT(position.x, WithinAbs(0.0f, 1e-4));
    REQUIRE_THAT(position.y, WithinAbs(0.0f, 1e-4));
    REQUIRE_THAT(position.z, WithinAbs(16.0f, 1e-4));

    SECTION("the origin lies 16 units in front of it")
    {
        glm::vec4 origin_in_view = camera.view_matrix() * glm::vec4(0.0f, 0.0f, 0.0f, 1.0f);
        REQUIRE_THAT(origin_in_view.z, WithinAbs(-16.0f, 1e-4));
    }

    SECTION("projection uses the configured field of view")
    {
        // proj[1][1] = 1 / tan(fov / 2)
        float expected = 1.0f / std::tan(glm::radians(35.0f) * 0.5f);
        REQUIRE_THAT(camera.projection_matrix()[1][1], WithinAbs(expected, 1e-4));
    }
}

TEST_CASE("Camera orbit and zoom limits", "[camera]")
{
    Camera3D camera(800, 600);

    SECTION("elevation is clamped")
    {
        camera.handle_mouse_movement(0.0, 10000.0);
        REQUIRE(camera.elevation() == 89.0f);
    }

    SECTION("azimuth wraps")
    {
        camera.set_rotation(-30.0f, 0.0f);
        REQUIRE_THAT(camera.azimuth(), WithinAbs(330.0f, 1e-4));
    }

    SECTION("scroll clamps distance")
    {
        camera.handle_mouse_scroll(1000.0);
        REQUIRE(camera.distance() == camera.config().min_distance);
        camera.handle_mouse_scroll(-1000.0);
        REQUIRE(camera.distance() == camera.config().max_distance);
    }

    SECTION("reset restores the start position")
    {
        camera.set_rotation(10.0f, 20.0f);
        camera.set_distance(5.0f);
        camera.reset();
        REQUIRE(camera.distance() == 16.0f);
        REQUIRE(camera.azimuth() == 90.0f);
        REQUIRE(camera.elevation() == 0.0f);
    }

    SECTION("resize updates the aspect ratio and ignores zero sizes")
    {
        camera.handle_resize(1000, 500);
        REQUIRE(camera.aspect_ratio() == 2.0f);
        camera.handle_resize(0, 0);
        REQUIRE(camera.aspect_ratio() == 2.0f);
    }
}
