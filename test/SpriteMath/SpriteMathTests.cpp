#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include <morph/SpriteMath.hpp>

using namespace morph;
using Catch::Matchers::WithinAbs;

TEST_CASE("Sprite alpha falloff", "[sprite_math]")
{
    SECTION("zero on the inscribed circle")
    {
        REQUIRE(sprite_alpha(0.5f) == 0.0f);
    }

    SECTION("0.1 at quarter distance")
    {
        REQUIRE_THAT(sprite_alpha(0.25f), WithinAbs(0.1f, 1e-6));
    }

    SECTION("negative outside the circle, not clamped")
    {
        REQUIRE(sprite_alpha(0.7f) < 0.0f);
    }

    SECTION("grows without bound towards the centre")
    {
        REQUIRE(sprite_alpha(0.001f) > 1.0f);
        REQUIRE(sprite_alpha(0.0001f) > sprite_alpha(0.001f));
    }

    SECTION("point coordinate overload measures from (0.5, 0.5)")
    {
        REQUIRE(sprite_alpha(glm::vec2(0.5f, 0.0f)) == sprite_alpha(0.5f));
        REQUIRE_THAT(sprite_alpha(glm::vec2(0.75f, 0.5f)), WithinAbs(0.1f, 1e-6));
    }
}

TEST_CASE("Position interpolation", "[sprite_math]")
{
    glm::vec3 current(0.0f, 2.0f, -4.0f);
    glm::vec3 target(4.0f, 0.0f, 4.0f);

    REQUIRE(interpolate_position(current, target, 0.0f) == current);
    REQUIRE(interpolate_position(current, target, 1.0f) == target);

    glm::vec3 half = interpolate_position(current, target, 0.5f);
    REQUIRE_THAT(half.x, WithinAbs(2.0f, 1e-6));
    REQUIRE_THAT(half.y, WithinAbs(1.0f, 1e-6));
    REQUIRE_THAT(half.z, WithinAbs(0.0f, 1e-6));
}

TEST_CASE("Point size attenuates with depth", "[sprite_math]")
{
    // base 0.4, size 0.5, 720 pixel tall target, 16 units in front of the camera
    REQUIRE_THAT(point_size(0.4f, 0.5f, 720.0f, -16.0f), WithinAbs(9.0f, 1e-4));
    REQUIRE(point_size(0.4f, 0.5f, 720.0f, -8.0f) > point_size(0.4f, 0.5f, 720.0f, -16.0f));
    REQUIRE(point_size(0.4f, 0.0f, 720.0f, -16.0f) == 0.0f);
}

TEST_CASE("Particle colour blends by size", "[sprite_math]")
{
    glm::vec3 a = rgb_from_hex(0xff7300);
    glm::vec3 b = rgb_from_hex(0x0091ff);

    REQUIRE(particle_color(a, b, 0.0f) == a);
    REQUIRE(particle_color(a, b, 1.0f) == b);

    SECTION("hex decoding")
    {
        REQUIRE(a.r == 1.0f);
        REQUIRE_THAT(a.g, WithinAbs(115.0f / 255.0f, 1e-6));
        REQUIRE(a.b == 0.0f);
        REQUIRE(b.r == 0.0f);
    }

    SECTION("sRGB decoding keeps the end points and darkens mid tones")
    {
        glm::vec3 linear = srgb_to_linear(a);
        REQUIRE_THAT(linear.r, WithinAbs(1.0f, 1e-5));
        REQUIRE(linear.g < a.g);
        REQUIRE_THAT(linear.b, WithinAbs(0.0f, 1e-5));
    }
}
