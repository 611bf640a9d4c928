#include <catch2/catch_test_macros.hpp>

#include <morph/Logger.hpp>

TEST_CASE("Console level can be lowered below the logger level", "[logger]")
{
	auto& logger = Logger::instance();
	logger.set_level(spdlog::level::info);

	logger.set_console_level(spdlog::level::debug);
	REQUIRE(logger.level() == spdlog::level::debug);
	REQUIRE(logger.should_log(spdlog::level::debug));

	SECTION("raising the console level keeps the file sink fed")
	{
		logger.set_console_level(spdlog::level::warn);
		REQUIRE(logger.level() == spdlog::level::debug);
	}

	logger.set_level(spdlog::level::warn);
}
