#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <splat/Logger.hpp>
#include <splat/SplatGenerator.hpp>

#include <glm/glm.hpp>
#include <glm/gtc/constants.hpp>

using namespace splat;
using Catch::Approx;

namespace
{

DotSettings only(ParticleType type, int count = 1)
{
	auto dots = DotSettings::defaults();
	for (auto other : ALL_PARTICLE_TYPES)
	{
		dots[other].enabled = other == type;
	}
	dots[type].count = count;
	return dots;
}

Impact impact_at(glm::vec2 position, const LayerTemplate& layer, glm::vec2 screen = {1000.0f, 1000.0f})
{
	return SplatGenerator::make_impact(position, screen, layer.physics);
}

} // namespace

TEST_CASE("Seed 42 central splat", "[generator]")
{
	Logger::instance().set_console_level(spdlog::level::err);

	const auto dots = only(ParticleType::Central);
	const SafetyLimits limits;
	SplatGenerator generator(dots, limits);
	const auto layer = LayerTemplate::background();

	SeededRandomSource rng(42);
	auto particles = generator.generate(impact_at({500.0f, 500.0f}, layer), layer, rng, 0);

	REQUIRE(particles.size() == 1);
	const auto& central = particles.front();
	REQUIRE(central.type == ParticleType::Central);
	REQUIRE(central.position.x == 0.5f);
	REQUIRE(central.position.y == 0.5f);

	SeededRandomSource reference(42);
	REQUIRE(central.radius == Approx(0.15f + reference.next_unit() * 0.15f).epsilon(1e-6));
	REQUIRE(central.radius >= 0.15f);
	REQUIRE(central.radius <= 0.3f);

	SECTION("velocity comes from the layer, elongation from speed and force")
	{
		REQUIRE(central.velocity == layer.physics.impact_velocity());
		const float speed = glm::length(layer.physics.impact_velocity());
		REQUIRE(central.elongation == Approx(1.0f + speed * layer.physics.force * layer.physics.central_elongation));
	}

	SECTION("exactly one draw was consumed")
	{
		SeededRandomSource one_draw(42);
		one_draw.next();
		REQUIRE(rng.state() == one_draw.state());
	}
}

TEST_CASE("Satellite draw order and trajectory", "[generator]")
{
	Logger::instance().set_console_level(spdlog::level::err);

	const auto dots = only(ParticleType::Large);
	const SafetyLimits limits;
	SplatGenerator generator(dots, limits);
	const auto layer = LayerTemplate::background();

	SeededRandomSource rng(7);
	auto particles = generator.generate(impact_at({400.0f, 300.0f}, layer), layer, rng, 0);
	REQUIRE(particles.size() == 1);
	const auto& satellite = particles.front();
	REQUIRE(satellite.type == ParticleType::Large);

	// angle, scale, jitter x, jitter y, flight time, radius
	SeededRandomSource reference(7);
	reference.uniform_float(0.0f, glm::two_pi<float>());
	const float scale = reference.uniform_float(0.5f, 1.2f);
	const float jitter_x = reference.uniform_float(-0.2f, 0.2f);
	const float jitter_y = reference.uniform_float(-0.1f, 0.1f);
	const float t = reference.uniform_float(0.1f, 0.5f);
	const float radius = reference.uniform_float(0.02f, 0.08f);

	const glm::vec2 launch = layer.physics.impact_velocity() * scale + glm::vec2(jitter_x, jitter_y);
	const glm::vec2 gravity = glm::vec2(0.0f, 0.3f) * t * t * 0.5f;
	const glm::vec2 position = glm::clamp(glm::vec2(0.4f, 0.3f) + launch * t + gravity, 0.0f, 1.0f);

	REQUIRE(satellite.position.x == Approx(position.x));
	REQUIRE(satellite.position.y == Approx(position.y));
	REQUIRE(satellite.radius == Approx(radius * (1.0f + (1.0f - radius / 0.08f) * 0.3f * 0.2f)));

	const glm::vec2 final_velocity = launch + gravity * 2.0f;
	REQUIRE(satellite.velocity.x == Approx(final_velocity.x));
	REQUIRE(satellite.velocity.y == Approx(final_velocity.y));

	const float elongation = 1.0f + glm::length(final_velocity) * layer.physics.force * layer.physics.particle_elongation
						   + t * layer.physics.time_elongation;
	REQUIRE(satellite.elongation == Approx(elongation));
	REQUIRE(rng.state() == reference.state());

	SECTION("seed 7 lands where the reference generator puts it")
	{
		REQUIRE(satellite.position.x == Approx(0.41903f).margin(1e-4));
		REQUIRE(satellite.position.y == Approx(0.32602f).margin(1e-4));
		REQUIRE(t == Approx(0.11974f).margin(1e-4));
		REQUIRE(radius == Approx(0.07135f).margin(1e-4));
	}
}

TEST_CASE("Generation is deterministic for a seed", "[generator]")
{
	Logger::instance().set_console_level(spdlog::level::err);

	const auto dots = DotSettings::defaults();
	const SafetyLimits limits;
	SplatGenerator generator(dots, limits);
	const auto layer = LayerTemplate::background();
	const auto impact = impact_at({123.0f, 456.0f}, layer, {800.0f, 600.0f});

	SeededRandomSource first(12345);
	SeededRandomSource second(12345);
	const auto a = generator.generate(impact, layer, first, 0);
	const auto b = generator.generate(impact, layer, second, 0);

	REQUIRE(a.size() == generator.planned_count(layer));
	REQUIRE(a == b);

	SeededRandomSource other(54321);
	REQUIRE(generator.generate(impact, layer, other, 0) != a);
}

TEST_CASE("Particles stay inside the unit square", "[generator]")
{
	Logger::instance().set_console_level(spdlog::level::err);

	const auto dots = DotSettings::defaults();
	const SafetyLimits limits;
	SplatGenerator generator(dots, limits);
	auto layer = LayerTemplate::dramatic();

	SeededRandomSource rng(99);
	// Corner impact with the fastest default layer pushes satellites off screen
	const auto particles = generator.generate(impact_at({1000.0f, 1000.0f}, layer), layer, rng, 0);
	REQUIRE_FALSE(particles.empty());
	for (const auto& particle : particles)
	{
		REQUIRE(particle.position.x >= 0.0f);
		REQUIRE(particle.position.x <= 1.0f);
		REQUIRE(particle.position.y >= 0.0f);
		REQUIRE(particle.position.y <= 1.0f);
		REQUIRE(particle.elongation >= 1.0f);
		REQUIRE(particle.radius > 0.0f);
	}
}

TEST_CASE("Only globally enabled and visible types are generated", "[generator]")
{
	Logger::instance().set_console_level(spdlog::level::err);

	auto dots = DotSettings::defaults();
	dots[ParticleType::Micro].enabled = false;
	const SafetyLimits limits;
	SplatGenerator generator(dots, limits);

	// Foreground hides central and small
	const auto layer = LayerTemplate::foreground();
	SeededRandomSource rng(1);
	const auto particles = generator.generate(impact_at({500.0f, 500.0f}, layer), layer, rng, 0);

	REQUIRE(particles.size() == static_cast<std::size_t>(dots[ParticleType::Large].count +
														 dots[ParticleType::Medium].count));
	for (const auto& particle : particles)
	{
		REQUIRE((particle.type == ParticleType::Large || particle.type == ParticleType::Medium));
	}
}

TEST_CASE("Ceilings are checked before generating", "[generator]")
{
	Logger::instance().set_console_level(spdlog::level::off);

	const auto dots = DotSettings::defaults();
	SafetyLimits limits;
	SplatGenerator generator(dots, limits);
	const auto layer = LayerTemplate::background();
	const auto planned = generator.planned_count(layer);
	REQUIRE(planned == 266);

	SECTION("global ceiling")
	{
		SeededRandomSource rng(42);
		REQUIRE(generator.generate(impact_at({10.0f, 10.0f}, layer), layer, rng, limits.max_total_particles - planned + 1)
					.empty());
		// Nothing was drawn from the generator
		REQUIRE(rng.state() == 42u);

		REQUIRE(generator.generate(impact_at({10.0f, 10.0f}, layer), layer, rng, limits.max_total_particles - planned)
					.size() == planned);
	}

	SECTION("per splat ceiling")
	{
		limits.max_particles_per_splat = planned - 1;
		SeededRandomSource rng(42);
		REQUIRE(generator.generate(impact_at({10.0f, 10.0f}, layer), layer, rng, 0).empty());
	}

	SECTION("empty surface")
	{
		SeededRandomSource rng(42);
		REQUIRE(generator.generate(impact_at({10.0f, 10.0f}, layer, {0.0f, 600.0f}), layer, rng, 0).empty());
	}
}

TEST_CASE("Elongation does not decrease with particle elongation", "[generator]")
{
	Logger::instance().set_console_level(spdlog::level::err);

	const auto dots = DotSettings::defaults();
	const SafetyLimits limits;
	SplatGenerator generator(dots, limits);

	auto low = LayerTemplate::background();
	auto high = low;
	high.physics.particle_elongation = low.physics.particle_elongation * 2.0f;

	for (uint64_t seed : {1ull, 42ull, 777ull})
	{
		SeededRandomSource rng_low(seed);
		SeededRandomSource rng_high(seed);
		const auto a = generator.generate(impact_at({300.0f, 700.0f}, low), low, rng_low, 0);
		const auto b = generator.generate(impact_at({300.0f, 700.0f}, high), high, rng_high, 0);

		REQUIRE(a.size() == b.size());
		for (std::size_t i = 0; i < a.size(); i++)
		{
			REQUIRE(b[i].elongation >= a[i].elongation);
			REQUIRE(b[i].position == a[i].position);
		}
	}
}
