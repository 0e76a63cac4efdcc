#include <catch2/catch_test_macros.hpp>

#include <splat/LayerStack.hpp>
#include <splat/Logger.hpp>

#include <string>
#include <vector>

using namespace splat;

namespace
{

LayerTemplate named(std::string name)
{
	LayerTemplate layer = LayerTemplate::background();
	layer.name = name;
	layer.display_name = std::move(name);
	return layer;
}

std::vector<std::string> names_by_z(const LayerStack& stack)
{
	std::vector<std::string> names;
	for (const auto* layer : stack.by_z_order())
	{
		names.push_back(layer->name);
	}
	return names;
}

} // namespace

TEST_CASE("Default layers", "[layers]")
{
	Logger::instance().set_console_level(spdlog::level::err);
	auto stack = LayerStack::with_defaults();

	REQUIRE(stack.size() == 3);
	REQUIRE(names_by_z(stack) == std::vector<std::string>{"background", "foreground", "dramatic"});

	SECTION("background shows every type with multiply blend")
	{
		const auto* background = stack.find("background");
		REQUIRE(background != nullptr);
		REQUIRE(background->rendering.enabled);
		REQUIRE(background->rendering.visible_types == ALL_TYPES_MASK);
		REQUIRE(background->rendering.blend == BlendMode::Multiply);
		REQUIRE(background->physics.force == 0.5f);
	}

	SECTION("foreground hides central and small dots")
	{
		const auto* foreground = stack.find("foreground");
		REQUIRE(foreground != nullptr);
		REQUIRE_FALSE(foreground->rendering.is_visible(ParticleType::Central));
		REQUIRE_FALSE(foreground->rendering.is_visible(ParticleType::Small));
		REQUIRE(foreground->rendering.is_visible(ParticleType::Large));
		REQUIRE(foreground->rendering.is_visible(ParticleType::Medium));
		REQUIRE(foreground->rendering.is_visible(ParticleType::Micro));
		REQUIRE(foreground->rendering.opacity == 0.6f);
	}

	SECTION("dramatic starts disabled")
	{
		const auto* dramatic = stack.find("dramatic");
		REQUIRE(dramatic != nullptr);
		REQUIRE_FALSE(dramatic->rendering.enabled);
		REQUIRE(dramatic->physics.velocity_x == 1.5f);
	}
}

TEST_CASE("Removing a layer re-sequences z indices", "[layers]")
{
	Logger::instance().set_console_level(spdlog::level::err);

	for (std::size_t removed = 0; removed < 5; removed++)
	{
		LayerStack stack;
		for (int i = 0; i < 5; i++)
		{
			REQUIRE(stack.add(named("layer" + std::to_string(i))));
		}

		const auto removed_name = "layer" + std::to_string(removed);
		REQUIRE(stack.remove(removed_name));
		REQUIRE(stack.size() == 4);

		std::vector<std::string> expected;
		for (int i = 0; i < 5; i++)
		{
			if (static_cast<std::size_t>(i) != removed)
			{
				expected.push_back("layer" + std::to_string(i));
			}
		}

		INFO("removed " << removed_name);
		const auto ordered = stack.by_z_order();
		REQUIRE(names_by_z(stack) == expected);
		for (std::size_t z = 0; z < ordered.size(); z++)
		{
			REQUIRE(ordered[z]->z_index == static_cast<double>(z));
		}
	}
}

TEST_CASE("Adding and removing", "[layers]")
{
	Logger::instance().set_console_level(spdlog::level::err);
	auto stack = LayerStack::with_defaults();

	SECTION("duplicate names are rejected")
	{
		REQUIRE_FALSE(stack.add(named("foreground")));
		REQUIRE(stack.size() == 3);
	}

	SECTION("new layers go on top regardless of their z index")
	{
		auto layer = named("wash");
		layer.z_index = -10.0;
		REQUIRE(stack.add(layer));
		REQUIRE(stack.find("wash")->z_index == 3.0);
	}

	SECTION("removing an unknown layer fails")
	{
		REQUIRE_FALSE(stack.remove("nope"));
		REQUIRE(stack.size() == 3);
	}
}

TEST_CASE("Moving layers", "[layers]")
{
	Logger::instance().set_console_level(spdlog::level::err);
	auto stack = LayerStack::with_defaults();

	SECTION("to the bottom")
	{
		REQUIRE(stack.move_to("dramatic", 0));
		REQUIRE(names_by_z(stack) == std::vector<std::string>{"dramatic", "background", "foreground"});
	}

	SECTION("past the top is clamped")
	{
		REQUIRE(stack.move_to("background", 99));
		REQUIRE(names_by_z(stack) == std::vector<std::string>{"foreground", "dramatic", "background"});
		REQUIRE(stack.find("background")->z_index == 2.0);
	}

	SECTION("unknown layer")
	{
		REQUIRE_FALSE(stack.move_to("nope", 0));
	}

	SECTION("explicit z values")
	{
		stack.apply_z_order({{"background", 5.0}, {"dramatic", -1.0}});
		REQUIRE(names_by_z(stack) == std::vector<std::string>{"dramatic", "foreground", "background"});
		REQUIRE(stack.find("foreground")->z_index == 1.0);
	}
}

TEST_CASE("Setters report snapshot invalidation", "[layers]")
{
	Logger::instance().set_console_level(spdlog::level::err);
	auto stack = LayerStack::with_defaults();

	int notifications = 0;
	int rebuilds = 0;
	stack.set_change_listener([&](const LayerTemplate&, bool needs_rebuild) {
		notifications++;
		if (needs_rebuild)
		{
			rebuilds++;
		}
	});

	SECTION("visibility changes need a rebuild")
	{
		REQUIRE(stack.set_type_visible("background", ParticleType::Micro, false));
		REQUIRE_FALSE(stack.find("background")->rendering.is_visible(ParticleType::Micro));
		REQUIRE(notifications == 1);
		REQUIRE(rebuilds == 1);

		// Same value again is not a change
		REQUIRE_FALSE(stack.set_type_visible("background", ParticleType::Micro, false));
		REQUIRE(notifications == 1);
	}

	SECTION("visual edits notify without a rebuild")
	{
		REQUIRE_FALSE(stack.set_color("background", {0.1f, 0.2f, 0.3f}));
		REQUIRE_FALSE(stack.set_opacity("background", 0.5f));
		REQUIRE_FALSE(stack.set_blend_mode("background", BlendMode::Normal));
		REQUIRE_FALSE(stack.set_enabled("background", false));
		REQUIRE(notifications == 4);
		REQUIRE(rebuilds == 0);
	}

	SECTION("values are clamped")
	{
		stack.set_opacity("background", 3.0f);
		REQUIRE(stack.find("background")->rendering.opacity == 1.0f);

		auto physics = stack.find("background")->physics;
		physics.force = -2.0f;
		stack.set_physics("background", physics);
		REQUIRE(stack.find("background")->physics.force == 0.0f);

		REQUIRE_FALSE(stack.set_visible_types("background", 0xFFFFFFFFu));
		REQUIRE(stack.find("background")->rendering.visible_types == ALL_TYPES_MASK);
	}

	SECTION("unknown layers are ignored")
	{
		REQUIRE_FALSE(stack.set_type_visible("nope", ParticleType::Central, false));
		REQUIRE_FALSE(stack.set_color("nope", {1.0f, 1.0f, 1.0f}));
		REQUIRE(notifications == 0);
	}
}

TEST_CASE("Blend mode names", "[layers]")
{
	REQUIRE(to_string(BlendMode::Multiply) == "multiply");
	REQUIRE(to_string(BlendMode::Normal) == "normal");
	REQUIRE(blend_mode_from_string("normal") == BlendMode::Normal);
	REQUIRE_FALSE(blend_mode_from_string("screen").has_value());
}
