#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <cmath>
#include <set>

#include <morph/Logger.hpp>
#include <morph/ShapeLibrary.hpp>

using namespace morph;
using Catch::Matchers::WithinAbs;

TEST_CASE("Default shapes", "[shapes]")
{
    Logger::instance().set_level(spdlog::level::warn);
    SeededRandomSource random(3);
    auto shapes = make_default_shapes(random);

    REQUIRE(shapes.size() == 4);
    REQUIRE(shapes[0].name == "torus");
    REQUIRE(shapes[1].name == "sphere");
    REQUIRE(shapes[2].name == "disc");
    REQUIRE(shapes[3].name == "helix");

    SECTION("counts differ so normalization has work to do")
    {
        std::set<std::size_t> counts;
        for (const auto& shape : shapes)
            counts.insert(shape.positions.size());
        REQUIRE(counts.size() == 4);
        REQUIRE(*counts.rbegin() == k_torus_points);
    }

    SECTION("everything fits in front of a camera at distance 16")
    {
        for (const auto& shape : shapes) {
            for (const auto& p : shape.positions)
                REQUIRE(glm::length(p) < 6.0f);
        }
    }
}

TEST_CASE("Shape generators honour their parameters", "[shapes]")
{
    SeededRandomSource random(11);

    SECTION("sphere points lie on the surface")
    {
        auto points = make_sphere(500, 2.0f, random);
        REQUIRE(points.size() == 500);
        for (const auto& p : points)
            REQUIRE_THAT(glm::length(p), WithinAbs(2.0f, 1e-4));
    }

    SECTION("disc points lie in the XY plane inside the radius")
    {
        auto points = make_disc(500, 1.5f, random);
        REQUIRE(points.size() == 500);
        for (const auto& p : points) {
            REQUIRE(p.z == 0.0f);
            REQUIRE(glm::length(glm::vec2(p)) <= 1.5f + 1e-5f);
        }
    }

    SECTION("torus points are at minor radius from the ring")
    {
        auto points = make_torus(500, 2.0f, 0.5f, random);
        REQUIRE(points.size() == 500);
        for (const auto& p : points) {
            float ring = glm::length(glm::vec2(p)) - 2.0f;
            REQUIRE_THAT(std::sqrt(ring * ring + p.z * p.z), WithinAbs(0.5f, 1e-4));
        }
    }

    SECTION("helix stays within its height")
    {
        auto points = make_helix(500, 1.0f, 4.0f, 2.0f, random);
        REQUIRE(points.size() == 500);
        for (const auto& p : points)
            REQUIRE(std::abs(p.y) <= 2.0f + 0.1f);
    }

    SECTION("zero count yields an empty cloud")
    {
        REQUIRE(make_sphere(0, 1.0f, random).empty());
    }
}
