#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <splat/FieldModel.hpp>

#include <vector>

using namespace splat;

namespace
{

FieldUniforms quiet_uniforms(uint32_t count)
{
	return FieldUniforms{
		.color = {0.0f, 0.0f, 0.0f},
		.count = count,
		.visibility_mask = ALL_TYPES_MASK,
		.influence_threshold = 0.5f,
		.aspect_ratio = 1.0f,
		.opacity = 1.0f,
		.noise_amplitude = 0.0f,
		.velocity_roughness = 0.0f,
		.noise_frequency = 20.0f,
	};
}

Particle still_dot(glm::vec2 position, float radius, ParticleType type = ParticleType::Medium)
{
	return Particle{.position = position, .radius = radius, .type = type, .velocity = {0.0f, 0.0f}};
}

} // namespace

TEST_CASE("Alpha threshold", "[field]")
{
	REQUIRE(field::alpha(0.0f) == 0.0f);
	REQUIRE(field::alpha(0.7f) == 0.0f);
	REQUIRE(field::alpha(0.85f) == Catch::Approx(0.5f));
	REQUIRE(field::alpha(1.0f) == 1.0f);
	REQUIRE(field::alpha(3.0f) == 1.0f);
}

TEST_CASE("Noise stays in range", "[field]")
{
	for (int i = 0; i < 100; i++)
	{
		const glm::vec2 p(static_cast<float>(i) * 0.37f, static_cast<float>(i) * -1.13f);
		const float h = field::hash(p);
		REQUIRE(h >= 0.0f);
		REQUIRE(h < 1.0f);

		const float n = field::fbm(p);
		REQUIRE(n >= 0.0f);
		REQUIRE(n <= 0.9375f);
	}
}

TEST_CASE("A still dot is solid at its center and fades out", "[field]")
{
	const auto uniforms = quiet_uniforms(1);
	const auto dot = still_dot({0.5f, 0.5f}, 0.1f);

	REQUIRE(field::influence({0.5f, 0.5f}, dot, uniforms) == Catch::Approx(1.0f));
	// Half way to the feather edge
	REQUIRE(field::influence({0.54f, 0.5f}, dot, uniforms) == Catch::Approx(0.5f).margin(1e-4));
	REQUIRE(field::influence({0.58f, 0.5f}, dot, uniforms) == Catch::Approx(0.0f).margin(1e-4));
	REQUIRE(field::influence({0.9f, 0.9f}, dot, uniforms) == 0.0f);
}

TEST_CASE("Horizontal distance is aspect corrected", "[field]")
{
	auto uniforms = quiet_uniforms(1);
	const auto dot = still_dot({0.5f, 0.5f}, 0.1f);

	uniforms.aspect_ratio = 2.0f;
	REQUIRE(field::influence({0.54f, 0.5f}, dot, uniforms) == Catch::Approx(0.0f).margin(1e-4));
	REQUIRE(field::influence({0.5f, 0.54f}, dot, uniforms) == Catch::Approx(0.5f).margin(1e-4));
}

TEST_CASE("Masked and padding records contribute nothing", "[field]")
{
	auto uniforms = quiet_uniforms(1);
	const auto dot = still_dot({0.5f, 0.5f}, 0.1f, ParticleType::Small);

	uniforms.visibility_mask = ALL_TYPES_MASK & ~type_bit(ParticleType::Small);
	REQUIRE(field::influence({0.5f, 0.5f}, dot, uniforms) == 0.0f);

	const Particle padding{};
	REQUIRE(field::influence(padding.position, padding, quiet_uniforms(1)) == 0.0f);
}

TEST_CASE("Accumulation only reads live records", "[field]")
{
	const std::vector<Particle> particles = {
		still_dot({0.5f, 0.5f}, 0.1f),
		still_dot({0.5f, 0.5f}, 0.1f),
		Particle{},
	};

	REQUIRE(field::accumulate({0.5f, 0.5f}, particles, quiet_uniforms(0)) == 0.0f);
	REQUIRE(field::accumulate({0.5f, 0.5f}, particles, quiet_uniforms(1)) == Catch::Approx(1.0f));
	REQUIRE(field::accumulate({0.5f, 0.5f}, particles, quiet_uniforms(3)) == Catch::Approx(2.0f));

	// Two overlapping halves merge into a solid region
	const std::vector<Particle> pair = {
		still_dot({0.46f, 0.5f}, 0.1f),
		still_dot({0.54f, 0.5f}, 0.1f),
	};
	const float total = field::accumulate({0.5f, 0.5f}, pair, quiet_uniforms(2));
	REQUIRE(total == Catch::Approx(1.0f).margin(1e-4));
	REQUIRE(field::alpha(total) == Catch::Approx(1.0f).margin(1e-3));
}

TEST_CASE("Moving dots are stretched into streaks", "[field]")
{
	const auto uniforms = quiet_uniforms(1);
	Particle round = still_dot({0.5f, 0.5f}, 0.05f);
	round.velocity = {1.0f, 0.0f};

	Particle streak = round;
	streak.elongation = 3.0f;

	const glm::vec2 probe(0.5f, 0.5f + 0.075f);
	REQUIRE(field::influence(probe, round, uniforms) == 0.0f);
	REQUIRE(field::influence(probe, streak, uniforms) > 0.8f);
}

TEST_CASE("Edge noise roughens only moving dots", "[field]")
{
	auto uniforms = quiet_uniforms(1);
	uniforms.noise_amplitude = 0.4f;
	uniforms.velocity_roughness = 0.6f;

	const auto still = still_dot({0.5f, 0.5f}, 0.1f);
	REQUIRE(field::influence({0.54f, 0.5f}, still, uniforms) == Catch::Approx(0.5f).margin(1e-4));

	Particle moving = still;
	moving.velocity = {0.5f, 0.0f};
	const float smooth = field::influence({0.54f, 0.5f}, moving, quiet_uniforms(1));
	const float rough = field::influence({0.54f, 0.5f}, moving, uniforms);
	// fbm is never negative, so noise can only erode the edge
	REQUIRE(rough <= smooth);
}

TEST_CASE("Layer uniforms", "[field]")
{
	const auto layer = LayerTemplate::foreground();
	RenderSnapshot snapshot;
	snapshot.particles.resize(128);
	snapshot.count = 65;
	snapshot.visibility_mask = layer.rendering.visible_types;

	const auto uniforms = field::make_uniforms(layer, snapshot, 0.5f, 16.0f / 9.0f);
	REQUIRE(uniforms.count == 65);
	REQUIRE(uniforms.visibility_mask == layer.rendering.visible_types);
	REQUIRE(uniforms.color == layer.rendering.color);
	REQUIRE(uniforms.opacity == Catch::Approx(0.6f));
	REQUIRE(uniforms.noise_amplitude == Catch::Approx(0.4f));
	REQUIRE(uniforms.velocity_roughness == Catch::Approx(0.6f));
	REQUIRE(uniforms.noise_frequency == Catch::Approx(25.0f));
	REQUIRE(uniforms.influence_threshold == Catch::Approx(0.5f));
	REQUIRE(uniforms.aspect_ratio == Catch::Approx(16.0f / 9.0f));
}
