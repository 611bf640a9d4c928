#include <catch2/catch_test_macros.hpp>
#include <algorithm>
#include <numeric>

#include <morph/Logger.hpp>
#include <morph/PositionNormalizer.hpp>

using namespace morph;

namespace {

Variant make_variant(const std::string& name, std::size_t count)
{
    PointArray points(count);
    for (std::size_t i = 0; i < count; ++i)
        points[i] = glm::vec3(static_cast<float>(i), static_cast<float>(i) * 2.0f, -static_cast<float>(i));
    return Variant::from_points(name, std::move(points));
}

bool contains(const Variant& variant, const glm::vec3& point)
{
    auto positions = variant.positions();
    return std::find(positions.begin(), positions.end(), point) != positions.end();
}

} // anonymous namespace

TEST_CASE("Normalization pads every variant to the largest count", "[normalizer]")
{
    Logger::instance().set_level(spdlog::level::warn);
    SeededRandomSource random(1234);

    std::vector<Variant> inputs = {
        make_variant("a", 500),
        make_variant("b", 1200),
        make_variant("c", 300),
        make_variant("d", 800),
    };

    REQUIRE(max_point_count(inputs) == 1200);

    auto result = normalize_variants(inputs, random);
    REQUIRE(result.has_value());
    const auto& normalized = result.value();

    SECTION("every output has maxCount points")
    {
        REQUIRE(normalized.size() == 4);
        for (const auto& variant : normalized)
            REQUIRE(variant.count() == 1200);
    }

    SECTION("order and names are preserved")
    {
        REQUIRE(normalized[0].name == "a");
        REQUIRE(normalized[1].name == "b");
        REQUIRE(normalized[2].name == "c");
        REQUIRE(normalized[3].name == "d");
    }

    SECTION("original points come first, in order")
    {
        for (std::size_t v = 0; v < inputs.size(); ++v) {
            for (std::size_t i = 0; i < inputs[v].count(); ++i)
                REQUIRE(normalized[v][i] == inputs[v][i]);
        }
    }

    SECTION("padded slots come from the same variant")
    {
        // variant c: slots 300..1199 are copies of c's own points
        for (std::size_t i = 300; i < 1200; ++i)
            REQUIRE(contains(inputs[2], normalized[2][i]));

        // variant c has no point beyond index 299, so nothing from a longer variant sneaks in
        for (std::size_t i = 0; i < 1200; ++i)
            REQUIRE(normalized[2][i].x < 300.0f);
    }

    SECTION("the longest variant passes through sharing storage")
    {
        REQUIRE(normalized[1].shares_storage_with(inputs[1]));
        REQUIRE_FALSE(normalized[0].shares_storage_with(inputs[0]));
    }

    SECTION("inputs are not mutated")
    {
        REQUIRE(inputs[0].count() == 500);
        REQUIRE(inputs[2].count() == 300);
        REQUIRE(inputs[3].count() == 800);
    }
}

TEST_CASE("Normalization of equal-length variants is a pass-through", "[normalizer]")
{
    SeededRandomSource random(7);
    std::vector<Variant> inputs = {make_variant("x", 64), make_variant("y", 64)};

    auto result = normalize_variants(inputs, random);
    REQUIRE(result.has_value());

    for (std::size_t i = 0; i < inputs.size(); ++i)
        REQUIRE(result.value()[i].shares_storage_with(inputs[i]));
}

TEST_CASE("Single point variants are padded with that point", "[normalizer]")
{
    SeededRandomSource random(7);
    std::vector<Variant> inputs = {
        Variant::from_points("dot", {glm::vec3(1.0f, 2.0f, 3.0f)}),
        make_variant("line", 10),
    };

    auto result = normalize_variants(inputs, random);
    REQUIRE(result.has_value());

    for (const auto& point : result.value()[0].positions())
        REQUIRE(point == glm::vec3(1.0f, 2.0f, 3.0f));
}

TEST_CASE("Normalization rejects missing geometry", "[normalizer][error]")
{
    SeededRandomSource random(7);

    SECTION("empty variant set")
    {
        std::vector<Variant> inputs;
        auto result = normalize_variants(inputs, random);
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().variant.empty());
    }

    SECTION("a variant without points is named in the error")
    {
        std::vector<Variant> inputs = {make_variant("full", 10), Variant::from_points("hollow", {})};
        auto result = normalize_variants(inputs, random);
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().variant == "hollow");
        REQUIRE(result.error().describe().find("hollow") != std::string::npos);
    }

    SECTION("a variant without storage counts as empty")
    {
        std::vector<Variant> inputs = {make_variant("full", 10), Variant{"null", nullptr}};
        auto result = normalize_variants(inputs, random);
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().variant == "null");
    }
}

TEST_CASE("Normalization is reproducible for a fixed seed", "[normalizer][random]")
{
    std::vector<Variant> inputs = {make_variant("short", 37), make_variant("long", 400)};

    SeededRandomSource first(99);
    SeededRandomSource second(99);
    auto a = normalize_variants(inputs, first);
    auto b = normalize_variants(inputs, second);
    REQUIRE(a.has_value());
    REQUIRE(b.has_value());

    auto lhs = a.value()[0].positions();
    auto rhs = b.value()[0].positions();
    REQUIRE(std::equal(lhs.begin(), lhs.end(), rhs.begin(), rhs.end()));
}
