#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <splat/Logger.hpp>
#include <splat/SettingsDocument.hpp>

using namespace splat;
using json = nlohmann::json;

TEST_CASE("Exported documents carry every section", "[settings]")
{
	const SplatterSettings settings;
	const auto layers = LayerStack::with_defaults();

	const auto document = settings_to_json(settings, layers);
	REQUIRE(document[SETTINGS_VERSION_KEY] == SETTINGS_SCHEMA_VERSION);
	REQUIRE(document["rendering"]["influenceThreshold"].get<float>() == Catch::Approx(0.001f));
	REQUIRE(document["randomisation"]["useSeededRNG"] == false);
	REQUIRE(document["randomisation"]["rngSeed"] == 12345);
	REQUIRE(document["dots"]["large"]["count"] == 25);
	REQUIRE_FALSE(document["dots"]["central"].contains("count"));
	REQUIRE(document["layers"]["foreground"]["blendMode"] == "multiply");
	REQUIRE(document["layers"]["foreground"]["dotTypes"]["small"] == false);
	REQUIRE(document["layers"]["dramatic"]["physics"]["force"].get<float>() == Catch::Approx(1.0f));

	REQUIRE(read_schema_version(export_settings(settings, layers)) == SETTINGS_SCHEMA_VERSION);
}

TEST_CASE("Settings survive a round trip", "[settings]")
{
	Logger::instance().set_console_level(spdlog::level::err);
	SplatterSettings settings;
	settings.use_seeded_rng = true;
	settings.rng_seed = 4'000'000'000ull;
	settings.influence_threshold = 0.05f;
	settings.dots[ParticleType::Small].count = 12;
	settings.dots[ParticleType::Micro].enabled = false;

	auto layers = LayerStack::with_defaults();
	layers.set_color("foreground", {0.1f, 0.2f, 0.3f});
	layers.set_blend_mode("foreground", BlendMode::Normal);
	layers.set_type_visible("background", ParticleType::Large, false);
	auto physics = layers.find("dramatic")->physics;
	physics.noise_frequency = 12.0f;
	layers.set_physics("dramatic", physics);
	layers.move_to("background", 2);

	SplatterSettings restored_settings;
	auto restored_layers = LayerStack::with_defaults();
	REQUIRE(import_settings(export_settings(settings, layers), restored_settings, restored_layers));

	REQUIRE(restored_settings.use_seeded_rng);
	REQUIRE(restored_settings.rng_seed == 4'000'000'000ull);
	REQUIRE(restored_settings.influence_threshold == Catch::Approx(0.05f));
	REQUIRE(restored_settings.dots[ParticleType::Small].count == 12);
	REQUIRE_FALSE(restored_settings.dots[ParticleType::Micro].enabled);

	const auto* foreground = restored_layers.find("foreground");
	REQUIRE(foreground->rendering.color.r == Catch::Approx(0.1f));
	REQUIRE(foreground->rendering.color.b == Catch::Approx(0.3f));
	REQUIRE(foreground->rendering.blend == BlendMode::Normal);
	REQUIRE_FALSE(restored_layers.find("background")->rendering.is_visible(ParticleType::Large));
	REQUIRE(restored_layers.find("dramatic")->physics.noise_frequency == Catch::Approx(12.0f));

	const auto order = restored_layers.by_z_order();
	REQUIRE(order.back()->name == "background");
	REQUIRE(restored_layers.find("background")->z_index == 2.0);
}

TEST_CASE("Partial documents only touch what they name", "[settings]")
{
	Logger::instance().set_console_level(spdlog::level::err);
	SplatterSettings settings;
	auto layers = LayerStack::with_defaults();

	REQUIRE(import_settings(R"({"rendering": {"influenceThreshold": 0.2}})", settings, layers));
	REQUIRE(settings.influence_threshold == Catch::Approx(0.2f));
	REQUIRE(settings.rng_seed == 12345);
	REQUIRE(settings.dots[ParticleType::Large].count == 25);
	REQUIRE(layers.find("foreground")->rendering.opacity == Catch::Approx(0.6f));

	REQUIRE(import_settings(R"({"layers": {"background": {"physics": {"force": 0.9}}}})", settings, layers));
	const auto& physics = layers.find("background")->physics;
	REQUIRE(physics.force == Catch::Approx(0.9f));
	REQUIRE(physics.velocity_x == Catch::Approx(0.1f));
}

TEST_CASE("Malformed documents leave everything untouched", "[settings]")
{
	Logger::instance().set_console_level(spdlog::level::off);
	SplatterSettings settings;
	settings.rng_seed = 7;
	auto layers = LayerStack::with_defaults();

	SECTION("not JSON")
	{
		const auto result = import_settings(R"({"randomisation": {"rngSeed": 1)", settings, layers);
		REQUIRE_FALSE(result);
		REQUIRE(result.error().find("JSON") != std::string::npos);
	}

	SECTION("not an object")
	{
		REQUIRE_FALSE(import_settings("[1, 2, 3]", settings, layers));
		REQUIRE_FALSE(read_schema_version("[1, 2, 3]").has_value());
	}

	REQUIRE(settings.rng_seed == 7);
	REQUIRE(layers.size() == 3);
}

TEST_CASE("Fields of the wrong type are ignored", "[settings]")
{
	Logger::instance().set_console_level(spdlog::level::off);
	SplatterSettings settings;
	auto layers = LayerStack::with_defaults();

	const auto document = R"({
		"randomisation": {"useSeededRNG": "yes", "rngSeed": -5},
		"dots": {"large": {"count": "many", "radiusMin": 0.01}, "small": 3},
		"layers": {
			"foreground": {"opacity": "half", "color": {"r": 0.5}, "blendMode": "screen"},
			"splodge": {"opacity": 0.1}
		}
	})";
	REQUIRE(import_settings(document, settings, layers));

	REQUIRE_FALSE(settings.use_seeded_rng);
	REQUIRE(settings.rng_seed == 12345);
	REQUIRE(settings.dots[ParticleType::Large].count == 25);
	REQUIRE(settings.dots[ParticleType::Large].radius_min == Catch::Approx(0.01f));
	REQUIRE(settings.dots[ParticleType::Small].count == 80);

	const auto* foreground = layers.find("foreground");
	REQUIRE(foreground->rendering.opacity == Catch::Approx(0.6f));
	REQUIRE(foreground->rendering.color.r == Catch::Approx(0.5f));
	REQUIRE(foreground->rendering.color.g == Catch::Approx(0.5f));
	REQUIRE(foreground->rendering.blend == BlendMode::Multiply);
	REQUIRE(layers.find("splodge") == nullptr);
	REQUIRE(layers.size() == 3);
}

TEST_CASE("Imported values are clamped", "[settings]")
{
	Logger::instance().set_console_level(spdlog::level::err);
	SplatterSettings settings;
	auto layers = LayerStack::with_defaults();

	const auto document = R"({
		"dots": {"medium": {"count": -4, "radiusMax": -1.0}},
		"layers": {"background": {"opacity": 3.5, "physics": {"force": -2}}}
	})";
	REQUIRE(import_settings(document, settings, layers));
	REQUIRE(settings.dots[ParticleType::Medium].count == 0);
	REQUIRE(settings.dots[ParticleType::Medium].radius_max == 0.0f);
	REQUIRE(layers.find("background")->rendering.opacity == 1.0f);
	REQUIRE(layers.find("background")->physics.force == 0.0f);
}

TEST_CASE("Newer schema versions are still read", "[settings]")
{
	Logger::instance().set_console_level(spdlog::level::off);
	SplatterSettings settings;
	auto layers = LayerStack::with_defaults();

	const auto document = R"({"schemaVersion": 9, "randomisation": {"rngSeed": 77}, "futureSection": {}})";
	REQUIRE(read_schema_version(document) == 9);
	REQUIRE(import_settings(document, settings, layers));
	REQUIRE(settings.rng_seed == 77);

	REQUIRE_FALSE(read_schema_version("{}").has_value());
}
