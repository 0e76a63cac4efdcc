#include <catch2/catch_test_macros.hpp>
#include <splat/Logger.hpp>
#include <splat/VulkanContext.hpp>

using namespace splat;

namespace
{

std::unique_ptr<VulkanContext> headless_context()
{
	auto ctx = VulkanContext::create(ContextConfig{.application_name = "Context Test", .presentation = false});
	if (!ctx)
	{
		FAIL("Could not create a headless context: " << ctx.error());
	}
	return std::move(ctx.value());
}

} // namespace

TEST_CASE("Headless VulkanContext creation", "[vulkan]")
{
	Logger::instance().set_console_level(spdlog::level::warn);
	auto ctx = VulkanContext::create(ContextConfig{.presentation = false});
	REQUIRE(ctx.has_value());
	REQUIRE_FALSE(ctx.value()->supports_presentation());
}

TEST_CASE("VulkanContext provides valid handles", "[vulkan]")
{
	auto ctx = headless_context();

	SECTION("instance is valid")
	{
		REQUIRE(ctx->instance());
	}

	SECTION("physical device is valid")
	{
		REQUIRE(ctx->physical_device());
	}

	SECTION("device is valid")
	{
		REQUIRE(ctx->device());
	}

	SECTION("graphics queue is valid")
	{
		REQUIRE(ctx->graphics_queue());
	}
}

TEST_CASE("VulkanContext graphics family supports graphics", "[vulkan]")
{
	auto ctx = headless_context();
	auto queue_families = ctx->physical_device().getQueueFamilyProperties();

	REQUIRE(ctx->graphics_family() < queue_families.size());
	auto flags = queue_families[ctx->graphics_family()].queueFlags;
	REQUIRE((flags & vk::QueueFlagBits::eGraphics));
}

TEST_CASE("VulkanContext physical device properties", "[vulkan]")
{
	auto ctx = headless_context();
	const auto& props = ctx->properties();

	SECTION("device has a name")
	{
		INFO("Device: " << props.deviceName.data());
		REQUIRE(std::string_view(props.deviceName.data()).size() > 0);
	}

	SECTION("API version is at least 1.3")
	{
		uint32_t major = VK_VERSION_MAJOR(props.apiVersion);
		uint32_t minor = VK_VERSION_MINOR(props.apiVersion);
		INFO("API Version: " << major << "." << minor);

		bool sufficient = (major > 1) || (major == 1 && minor >= 3);
		REQUIRE(sufficient);
	}
}

TEST_CASE("VulkanContext finds host visible memory", "[vulkan]")
{
	auto ctx = headless_context();
	const auto flags = vk::MemoryPropertyFlagBits::eHostVisible | vk::MemoryPropertyFlagBits::eHostCoherent;

	auto index = ctx->find_memory_type(~0u, flags);
	REQUIRE(index.has_value());

	REQUIRE_FALSE(ctx->find_memory_type(0u, flags).has_value());
}
