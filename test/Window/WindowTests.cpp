#include <catch2/catch_test_macros.hpp>
#include <splat/Window.hpp>

using namespace splat;

TEST_CASE("Swapchain results split into retry and failure", "[window]")
{
	SECTION("success and suboptimal still deliver an image")
	{
		REQUIRE(classify_swapchain_result(vk::Result::eSuccess) == SwapchainStatus::Ready);
		REQUIRE(classify_swapchain_result(vk::Result::eSuboptimalKHR) == SwapchainStatus::Suboptimal);
	}

	SECTION("an out of date swapchain is rebuilt and retried")
	{
		REQUIRE(classify_swapchain_result(vk::Result::eErrorOutOfDateKHR) == SwapchainStatus::OutOfDate);
	}

	SECTION("device and surface loss end the loop")
	{
		REQUIRE(classify_swapchain_result(vk::Result::eErrorDeviceLost) == SwapchainStatus::Failed);
		REQUIRE(classify_swapchain_result(vk::Result::eErrorSurfaceLostKHR) == SwapchainStatus::Failed);
		REQUIRE(classify_swapchain_result(vk::Result::eTimeout) == SwapchainStatus::Failed);
		REQUIRE(classify_swapchain_result(vk::Result::eNotReady) == SwapchainStatus::Failed);
	}
}
