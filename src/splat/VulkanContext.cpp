#include <splat/VulkanContext.hpp>
#include <splat/Logger.hpp>

#include <GLFW/glfw3.h>
#include <array>
#include <cstring>
#include <optional>
#include <vector>

VULKAN_HPP_DEFAULT_DISPATCH_LOADER_DYNAMIC_STORAGE

namespace splat
{

namespace
{

#ifdef NDEBUG
constexpr bool VALIDATION_BUILD = false;
#else
constexpr bool VALIDATION_BUILD = true;
#endif

constexpr std::array VALIDATION_LAYERS = {"VK_LAYER_KHRONOS_validation"};

vk::Bool32 debug_callback(vk::DebugUtilsMessageSeverityFlagBitsEXT severity,
	[[maybe_unused]] vk::DebugUtilsMessageTypeFlagsEXT type,
	const vk::DebugUtilsMessengerCallbackDataEXT* callback_data,
	[[maybe_unused]] void* user_data)
{
	auto& logger = Logger::instance();
	logger.set_pattern(fmt::format("[InkSplatter]{:<32}[%^%5l%$] %v", "[VulkanDebug]"));
	switch (severity)
	{
	case vk::DebugUtilsMessageSeverityFlagBitsEXT::eVerbose:
		logger.trace("{}", callback_data->pMessage);
		break;
	case vk::DebugUtilsMessageSeverityFlagBitsEXT::eInfo:
		logger.debug("{}", callback_data->pMessage);
		break;
	case vk::DebugUtilsMessageSeverityFlagBitsEXT::eWarning:
		logger.warn("{}", callback_data->pMessage);
		break;
	case vk::DebugUtilsMessageSeverityFlagBitsEXT::eError:
		logger.error("{}", callback_data->pMessage);
		break;
	default:
		logger.info("{}", callback_data->pMessage);
		break;
	}
	return vk::False;
}

bool validation_layers_available()
{
	auto available = vk::enumerateInstanceLayerProperties();
	if (available.result != vk::Result::eSuccess)
	{
		Logger::instance().warn("Could not query instance layers: {}", vk::to_string(available.result));
		return false;
	}
	for (const char* wanted : VALIDATION_LAYERS)
	{
		bool found = false;
		for (const auto& layer : available.value)
		{
			if (std::strcmp(wanted, layer.layerName) == 0)
			{
				found = true;
				break;
			}
		}
		if (!found)
		{
			Logger::instance().warn("Validation layer {} not available", wanted);
			return false;
		}
	}
	return true;
}

vk::DebugUtilsMessengerCreateInfoEXT debug_messenger_info()
{
	return vk::DebugUtilsMessengerCreateInfoEXT()
		.setMessageSeverity(vk::DebugUtilsMessageSeverityFlagBitsEXT::eWarning |
			vk::DebugUtilsMessageSeverityFlagBitsEXT::eError)
		.setMessageType(vk::DebugUtilsMessageTypeFlagBitsEXT::eGeneral |
			vk::DebugUtilsMessageTypeFlagBitsEXT::eValidation |
			vk::DebugUtilsMessageTypeFlagBitsEXT::ePerformance)
		.setPfnUserCallback(debug_callback);
}

int device_rank(vk::PhysicalDeviceType type)
{
	switch (type)
	{
	case vk::PhysicalDeviceType::eDiscreteGpu: return 0;
	case vk::PhysicalDeviceType::eIntegratedGpu: return 1;
	case vk::PhysicalDeviceType::eVirtualGpu: return 2;
	case vk::PhysicalDeviceType::eCpu: return 3;
	default: return 4;
	}
}

std::optional<uint32_t> find_graphics_family(vk::PhysicalDevice device)
{
	auto families = device.getQueueFamilyProperties();
	for (uint32_t i = 0; i < families.size(); i++)
	{
		if (families[i].queueFlags & vk::QueueFlagBits::eGraphics)
		{
			return i;
		}
	}
	return std::nullopt;
}

} // anonymous namespace

std::expected<std::unique_ptr<VulkanContext>, std::string> VulkanContext::create(const ContextConfig& config)
{
	auto context = std::unique_ptr<VulkanContext>(new VulkanContext());
	if (auto res = context->initialize(config); !res)
	{
		return std::unexpected(res.error());
	}
	return context;
}

std::expected<void, std::string> VulkanContext::initialize(const ContextConfig& config)
{
	static vk::detail::DynamicLoader loader;
	if (!loader.success())
	{
		return std::unexpected("Vulkan loader library not found");
	}
	VULKAN_HPP_DEFAULT_DISPATCHER.init(loader.getProcAddress<PFN_vkGetInstanceProcAddr>("vkGetInstanceProcAddr"));

	m_presentation = config.presentation;

	auto app_info = vk::ApplicationInfo()
		.setPApplicationName(config.application_name.c_str())
		.setApplicationVersion(VK_MAKE_VERSION(1, 0, 0))
		.setPEngineName("InkSplatter")
		.setEngineVersion(VK_MAKE_VERSION(1, 0, 0))
		.setApiVersion(VK_API_VERSION_1_3);

	std::vector<const char*> extensions;
	if (m_presentation)
	{
		uint32_t glfw_count = 0;
		const char** glfw_extensions = glfwGetRequiredInstanceExtensions(&glfw_count);
		if (glfw_extensions == nullptr)
		{
			return std::unexpected("GLFW reports no Vulkan presentation support");
		}
		extensions.assign(glfw_extensions, glfw_extensions + glfw_count);
	}

	const bool validation = VALIDATION_BUILD && config.validation && validation_layers_available();
	if (validation)
	{
		extensions.push_back(VK_EXT_DEBUG_UTILS_EXTENSION_NAME);
	}

	auto create_info = vk::InstanceCreateInfo()
		.setPApplicationInfo(&app_info)
		.setPEnabledExtensionNames(extensions);

	auto debug_info = debug_messenger_info();
	if (validation)
	{
		create_info.setPEnabledLayerNames(VALIDATION_LAYERS);
		create_info.setPNext(&debug_info);
	}

	auto instance_res = vk::createInstance(create_info);
	CHECK_VK_RESULT(instance_res, "Failed to create instance: {}");
	m_instance = instance_res.value;
	VULKAN_HPP_DEFAULT_DISPATCHER.init(m_instance);

	if (validation)
	{
		auto messenger_res = m_instance.createDebugUtilsMessengerEXT(debug_info);
		CHECK_VK_RESULT(messenger_res, "Failed to create debug messenger: {}");
		m_debug_messenger = messenger_res.value;
		Logger::instance().info("Validation layers enabled");
	}

	auto devices_res = m_instance.enumeratePhysicalDevices();
	CHECK_VK_RESULT(devices_res, "Failed to enumerate physical devices: {}");

	std::optional<vk::PhysicalDevice> best;
	std::optional<uint32_t> best_family;
	for (const auto& candidate : devices_res.value)
	{
		auto family = find_graphics_family(candidate);
		if (!family)
		{
			continue;
		}
		if (!best || device_rank(candidate.getProperties().deviceType) < device_rank(best->getProperties().deviceType))
		{
			best = candidate;
			best_family = family;
		}
	}
	if (!best)
	{
		return std::unexpected("No Vulkan device with a graphics queue found");
	}
	m_physical_device = *best;
	m_graphics_family = *best_family;
	m_properties = m_physical_device.getProperties();
	Logger::instance().info("Selected {} ({})", m_properties.deviceName.data(), vk::to_string(m_properties.deviceType));

	float priority = 1.0f;
	auto queue_info = vk::DeviceQueueCreateInfo()
		.setQueueFamilyIndex(m_graphics_family)
		.setQueueCount(1)
		.setPQueuePriorities(&priority);

	std::vector<const char*> device_extensions;
	if (m_presentation)
	{
		device_extensions.push_back(VK_KHR_SWAPCHAIN_EXTENSION_NAME);
	}

	auto device_info = vk::DeviceCreateInfo()
		.setQueueCreateInfos(queue_info)
		.setPEnabledExtensionNames(device_extensions);

	auto device_res = m_physical_device.createDevice(device_info);
	CHECK_VK_RESULT(device_res, "Failed to create logical device: {}");
	m_device = device_res.value;
	VULKAN_HPP_DEFAULT_DISPATCHER.init(m_device);
	m_graphics_queue = m_device.getQueue(m_graphics_family, 0);

	Logger::instance().info("VulkanContext initialized (VK_HEADER_VERSION {})", VK_HEADER_VERSION);
	return {};
}

std::expected<uint32_t, std::string> VulkanContext::find_memory_type(
	uint32_t type_filter, vk::MemoryPropertyFlags properties) const
{
	auto memory = m_physical_device.getMemoryProperties();
	for (uint32_t i = 0; i < memory.memoryTypeCount; i++)
	{
		if ((type_filter & (1u << i)) && (memory.memoryTypes[i].propertyFlags & properties) == properties)
		{
			return i;
		}
	}
	return std::unexpected("No suitable memory type");
}

VulkanContext::~VulkanContext()
{
	if (m_device)
	{
		if (auto res = m_device.waitIdle(); res != vk::Result::eSuccess)
		{
			Logger::instance().warn("waitIdle failed during shutdown: {}", vk::to_string(res));
		}
		m_device.destroy();
		Logger::instance().trace("Destroyed logical device");
	}
	if (m_debug_messenger)
	{
		m_instance.destroyDebugUtilsMessengerEXT(m_debug_messenger);
	}
	if (m_instance)
	{
		m_instance.destroy();
		Logger::instance().trace("Destroyed instance");
	}
}

} // namespace splat
