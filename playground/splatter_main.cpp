// Interactive ink splatter playground.
// Click to splat, C clears, R toggles seeded randomness.

#include <splat/Logger.hpp>
#include <splat/SplatterController.hpp>
#include <splat/SplatterEngine.hpp>

#include <CLI/CLI.hpp>
#include <fstream>
#include <optional>
#include <sstream>

using splat::Logger;

int main(int argc, char** argv) {
    CLI::App app{"InkSplatter playground"};

    std::optional<uint64_t> seed;
    std::string settings_path;
    splat::SplatterConfig config;

    app.add_option("--seed", seed, "Use the seeded generator with this seed");
    app.add_option("--settings", settings_path, "Settings document to import at startup")->check(CLI::ExistingFile);
    app.add_option("--width", config.window_width, "Window width")->check(CLI::Range(64u, 8192u));
    app.add_option("--height", config.window_height, "Window height")->check(CLI::Range(64u, 8192u));

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return app.exit(e);
    }

    Logger::instance().info("Starting InkSplatter...");

    splat::SplatterEngine engine;

    if (!settings_path.empty()) {
        std::ifstream file(settings_path);
        if (!file) {
            Logger::instance().error("Could not open settings file {}", settings_path);
            return 1;
        }
        std::stringstream contents;
        contents << file.rdbuf();
        if (auto result = engine.import_settings(contents.str()); !result) {
            Logger::instance().error("Could not import {}: {}", settings_path, result.error());
            return 1;
        }
        Logger::instance().info("Imported settings from {}", settings_path);
    }

    // The command line wins over the settings document
    if (seed) {
        engine.settings().use_seeded_rng = true;
        engine.settings().rng_seed = *seed;
    }

    auto controller_result = splat::SplatterController::create(engine, config);
    if (!controller_result) {
        Logger::instance().error("Failed to create controller: {}", controller_result.error());
        return 1;
    }
    auto& controller = *controller_result;

    if (auto result = controller->run(); !result) {
        Logger::instance().error("Runtime error: {}", result.error());
        return 1;
    }

    Logger::instance().info("Application exited successfully");
    return 0;
}
