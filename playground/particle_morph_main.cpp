// Particle Morph
// A cloud of glowing points morphing between torus, sphere, disc and helix.
// Usage: particle_morph [seed]

#include <morph/MorphApplication.hpp>
#include <morph/Logger.hpp>
#include <spdlog/spdlog.h>

#include <charconv>
#include <cstring>
#include <system_error>

int main(int argc, char** argv) {
    // Everything goes to the log file, the console only shows info and above
    Logger::instance().set_level(spdlog::level::trace);
    Logger::instance().set_console_level(spdlog::level::info);
    Logger::instance().info("Starting Particle Morph...");

    try {
        morph::AppConfig config{
            .window = {
                .width = 1280,
                .height = 720,
                .title = "Particle Morph"
            }
        };

        if (argc > 1) {
            const char* arg = argv[1];
            auto [ptr, ec] = std::from_chars(arg, arg + std::strlen(arg), config.seed);
            if (ec != std::errc{} || *ptr != '\0') {
                Logger::instance().error("Invalid seed '{}', expected an unsigned integer", arg);
                return 1;
            }
        }

        auto app_result = morph::MorphApplication::create(config);
        if (!app_result) {
            Logger::instance().error("Failed to create application: {}", app_result.error());
            return 1;
        }
        auto& app = *app_result;

        if (auto result = app->load_default_shapes(); !result) {
            Logger::instance().error("Failed to load shapes: {}", result.error());
            return 1;
        }

        // Run main loop (blocks until window closes)
        if (auto result = app->run(); !result) {
            Logger::instance().error("Runtime error: {}", result.error());
            return 1;
        }

        Logger::instance().info("Application exited successfully");
        return 0;

    } catch (const std::exception& e) {
        Logger::instance().error("Unhandled exception: {}", e.what());
        return 1;
    }
}
