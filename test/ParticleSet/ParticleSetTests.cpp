#include <catch2/catch_test_macros.hpp>
#include <algorithm>
#include <functional>

#include <morph/Logger.hpp>
#include <morph/ParticleSet.hpp>

using namespace morph;

namespace {

ShapeInput make_shape(const std::string& name, std::size_t count)
{
    PointArray points(count, glm::vec3(0.0f));
    for (std::size_t i = 0; i < count; ++i)
        points[i].x = static_cast<float>(i);
    return ShapeInput{name, std::move(points)};
}

std::vector<ShapeInput> make_shapes()
{
    return {make_shape("torus", 500), make_shape("suzanne", 1200), make_shape("circle", 300), make_shape("text", 800)};
}

} // anonymous namespace

TEST_CASE("ParticleSet normalizes shapes and draws sizes", "[particle_set]")
{
    Logger::instance().set_level(spdlog::level::warn);
    SeededRandomSource random(42);

    auto result = ParticleSet::create(make_shapes(), random);
    REQUIRE(result.has_value());
    const auto& set = result.value();

    SECTION("counts")
    {
        REQUIRE(set.variant_count() == 4);
        REQUIRE(set.max_count() == 1200);
        for (const auto& variant : set.variants())
            REQUIRE(variant.count() == 1200);
    }

    SECTION("one size per particle, all in [0,1)")
    {
        auto sizes = set.sizes();
        REQUIRE(sizes.size() == 1200);
        for (float size : sizes) {
            REQUIRE(size >= 0.0f);
            REQUIRE(size < 1.0f);
        }
        // not all identical
        REQUIRE(std::adjacent_find(sizes.begin(), sizes.end(), std::not_equal_to<>()) != sizes.end());
    }

    SECTION("sizes are stable across reads")
    {
        std::vector<float> first(set.sizes().begin(), set.sizes().end());
        std::vector<float> second(set.sizes().begin(), set.sizes().end());
        REQUIRE(first == second);
    }

    SECTION("lookup by index and name")
    {
        REQUIRE(set.variant(2).name == "circle");
        REQUIRE(set.find("suzanne") == 1u);
        REQUIRE(set.find("text") == 3u);
        REQUIRE_FALSE(set.find("teapot").has_value());
        REQUIRE(set.names() == std::vector<std::string>{"torus", "suzanne", "circle", "text"});
    }
}

TEST_CASE("ParticleSet is reproducible for a fixed seed", "[particle_set][random]")
{
    SeededRandomSource a(5);
    SeededRandomSource b(5);
    auto first = ParticleSet::create(make_shapes(), a);
    auto second = ParticleSet::create(make_shapes(), b);
    REQUIRE(first.has_value());
    REQUIRE(second.has_value());

    REQUIRE(std::ranges::equal(first->sizes(), second->sizes()));
    REQUIRE(std::ranges::equal(first->variant(0).positions(), second->variant(0).positions()));
}

TEST_CASE("ParticleSet creation propagates geometry errors", "[particle_set][error]")
{
    SeededRandomSource random(1);

    SECTION("no shapes")
    {
        auto result = ParticleSet::create(std::vector<ShapeInput>{}, random);
        REQUIRE_FALSE(result.has_value());
    }

    SECTION("empty shape")
    {
        std::vector<ShapeInput> shapes = {make_shape("torus", 10), ShapeInput{"empty", {}}};
        auto result = ParticleSet::create(std::move(shapes), random);
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().variant == "empty");
    }
}
