#ifndef INKSPLATTER_VULKANCONTEXT_HPP
#define INKSPLATTER_VULKANCONTEXT_HPP

#include "Common.hpp"
#include <expected>
#include <memory>
#include <string>
#include <string_view>

namespace splat
{

struct ContextConfig
{
	std::string application_name = "InkSplatter";
	bool presentation = true;   ///< Request GLFW surface and swapchain extensions
	bool validation = true;     ///< Only honoured in debug builds
};

/**
 * @brief Instance, device and graphics queue shared by the renderer and its host
 *
 * Constructed explicitly and passed by reference; there is no global device.
 * A headless context (presentation = false) does not touch GLFW and is what
 * the GPU tests use.
 */
class VulkanContext
{
public:
	static std::expected<std::unique_ptr<VulkanContext>, std::string> create(const ContextConfig& config);
	~VulkanContext();

	VulkanContext(const VulkanContext&) = delete;
	VulkanContext& operator=(const VulkanContext&) = delete;
	VulkanContext(VulkanContext&&) = delete;
	VulkanContext& operator=(VulkanContext&&) = delete;

	[[nodiscard]] vk::Instance instance() const { return m_instance; }
	[[nodiscard]] vk::PhysicalDevice physical_device() const { return m_physical_device; }
	[[nodiscard]] vk::Device device() const { return m_device; }
	[[nodiscard]] uint32_t graphics_family() const { return m_graphics_family; }
	[[nodiscard]] vk::Queue graphics_queue() const { return m_graphics_queue; }
	[[nodiscard]] bool supports_presentation() const { return m_presentation; }
	[[nodiscard]] const vk::PhysicalDeviceProperties& properties() const { return m_properties; }

	/// Index of a memory type matching filter and properties
	[[nodiscard]] std::expected<uint32_t, std::string> find_memory_type(
		uint32_t type_filter, vk::MemoryPropertyFlags properties) const;

private:
	VulkanContext() = default;
	std::expected<void, std::string> initialize(const ContextConfig& config);

	vk::Instance m_instance;
	vk::DebugUtilsMessengerEXT m_debug_messenger;
	vk::PhysicalDevice m_physical_device;
	vk::PhysicalDeviceProperties m_properties;
	uint32_t m_graphics_family = 0;
	vk::Device m_device;
	vk::Queue m_graphics_queue;
	bool m_presentation = false;
};

} // namespace splat

#endif // INKSPLATTER_VULKANCONTEXT_HPP
