#include <splat/Window.hpp>
#include <splat/Logger.hpp>

#include <algorithm>
#include <array>

namespace splat {

std::expected<void, std::string> Window::initialize_glfw() {
    static bool initialized = false;
    if (!initialized) {
        if (glfwInit() != GLFW_TRUE) {
            const char* description = nullptr;
            glfwGetError(&description);
            return std::unexpected(fmt::format("glfwInit failed: {}", description ? description : "unknown error"));
        }
        initialized = true;
    }
    return {};
}

std::expected<std::unique_ptr<Window>, std::string> Window::create(
    const VulkanContext& context,
    int width,
    int height,
    std::string_view title
) {
    if (auto res = initialize_glfw(); !res) {
        return std::unexpected(res.error());
    }

    glfwWindowHint(GLFW_CLIENT_API, GLFW_NO_API);
    glfwWindowHint(GLFW_RESIZABLE, GLFW_TRUE);

    const std::string title_string{title};
    GLFWwindow* handle = glfwCreateWindow(width, height, title_string.c_str(), nullptr, nullptr);
    if (handle == nullptr) {
        return std::unexpected("Failed to create GLFW window");
    }

    auto window = std::unique_ptr<Window>(new Window(context, handle, width, height));
    if (auto result = window->initialize(); !result) {
        return std::unexpected(result.error());
    }
    return window;
}

Window::Window(const VulkanContext& context, GLFWwindow* handle, int width, int height)
    : m_window_handle(handle)
    , m_width(width)
    , m_height(height)
    , m_context(context)
    , m_device(context.device())
{
}

Window::~Window() {
    cleanup_swapchain();
    if (m_render_pass) {
        m_device.destroyRenderPass(m_render_pass);
    }
    if (m_surface) {
        m_context.instance().destroySurfaceKHR(m_surface);
    }
    if (m_window_handle) {
        glfwDestroyWindow(m_window_handle);
    }
}

bool Window::should_close() const {
    return glfwWindowShouldClose(m_window_handle);
}

std::expected<void, std::string> Window::initialize() {
    if (auto result = create_surface(); !result) {
        return result;
    }
    if (auto result = create_swapchain(); !result) {
        return result;
    }
    if (auto result = create_render_pass(); !result) {
        return result;
    }
    return create_framebuffers();
}

std::expected<void, std::string> Window::create_surface() {
    VkSurfaceKHR surface_c;
    VkResult result = glfwCreateWindowSurface(
        static_cast<VkInstance>(m_context.instance()),
        m_window_handle,
        nullptr,
        &surface_c
    );
    if (result != VK_SUCCESS) {
        return std::unexpected(fmt::format("Failed to create window surface: {}",
                                           vk::to_string(static_cast<vk::Result>(result))));
    }
    m_surface = vk::SurfaceKHR(surface_c);

    auto support = m_context.physical_device().getSurfaceSupportKHR(m_context.graphics_family(), m_surface);
    CHECK_VK_RESULT(support, "Could not query surface support: {}");
    if (!support.value) {
        return std::unexpected("Graphics queue cannot present to this surface");
    }
    return {};
}

std::expected<void, std::string> Window::create_swapchain() {
    auto physical_device = m_context.physical_device();

    auto capabilities_res = physical_device.getSurfaceCapabilitiesKHR(m_surface);
    CHECK_VK_RESULT(capabilities_res, "Could not query surface capabilities: {}");
    auto formats_res = physical_device.getSurfaceFormatsKHR(m_surface);
    CHECK_VK_RESULT(formats_res, "Could not query surface formats: {}");
    if (formats_res.value.empty()) {
        return std::unexpected("Surface reports no formats");
    }

    const auto& capabilities = capabilities_res.value;
    m_surface_format = choose_surface_format(formats_res.value);
    m_extent = choose_extent(capabilities);

    uint32_t image_count = capabilities.minImageCount + 1;
    if (capabilities.maxImageCount > 0 && image_count > capabilities.maxImageCount) {
        image_count = capabilities.maxImageCount;
    }

    auto swapchain_info = vk::SwapchainCreateInfoKHR()
        .setSurface(m_surface)
        .setMinImageCount(image_count)
        .setImageFormat(m_surface_format.format)
        .setImageColorSpace(m_surface_format.colorSpace)
        .setImageExtent(m_extent)
        .setImageArrayLayers(1)
        .setImageUsage(vk::ImageUsageFlagBits::eColorAttachment)
        .setImageSharingMode(vk::SharingMode::eExclusive)
        .setPreTransform(capabilities.currentTransform)
        .setCompositeAlpha(vk::CompositeAlphaFlagBitsKHR::eOpaque)
        .setPresentMode(vk::PresentModeKHR::eFifo)
        .setClipped(true);

    auto swapchain_res = m_device.createSwapchainKHR(swapchain_info);
    CHECK_VK_RESULT(swapchain_res, "Could not create swapchain: {}");
    m_swapchain = swapchain_res.value;

    auto images_res = m_device.getSwapchainImagesKHR(m_swapchain);
    CHECK_VK_RESULT(images_res, "Could not get swapchain images: {}");
    m_swapchain_images = std::move(images_res.value);

    m_image_views.clear();
    for (const auto& image : m_swapchain_images) {
        auto view_info = vk::ImageViewCreateInfo()
            .setImage(image)
            .setViewType(vk::ImageViewType::e2D)
            .setFormat(m_surface_format.format)
            .setSubresourceRange(vk::ImageSubresourceRange()
                .setAspectMask(vk::ImageAspectFlagBits::eColor)
                .setLevelCount(1)
                .setLayerCount(1));
        auto view_res = m_device.createImageView(view_info);
        CHECK_VK_RESULT(view_res, "Could not create swapchain image view: {}");
        m_image_views.push_back(view_res.value);
    }
    return {};
}

std::expected<void, std::string> Window::create_render_pass() {
    auto color_attachment = vk::AttachmentDescription()
        .setFormat(m_surface_format.format)
        .setSamples(vk::SampleCountFlagBits::e1)
        .setLoadOp(vk::AttachmentLoadOp::eClear)
        .setStoreOp(vk::AttachmentStoreOp::eStore)
        .setStencilLoadOp(vk::AttachmentLoadOp::eDontCare)
        .setStencilStoreOp(vk::AttachmentStoreOp::eDontCare)
        .setInitialLayout(vk::ImageLayout::eUndefined)
        .setFinalLayout(vk::ImageLayout::ePresentSrcKHR);

    auto color_ref = vk::AttachmentReference()
        .setAttachment(0)
        .setLayout(vk::ImageLayout::eColorAttachmentOptimal);

    auto subpass = vk::SubpassDescription()
        .setPipelineBindPoint(vk::PipelineBindPoint::eGraphics)
        .setColorAttachments(color_ref);

    auto dependency = vk::SubpassDependency()
        .setSrcSubpass(VK_SUBPASS_EXTERNAL)
        .setDstSubpass(0)
        .setSrcStageMask(vk::PipelineStageFlagBits::eColorAttachmentOutput)
        .setDstStageMask(vk::PipelineStageFlagBits::eColorAttachmentOutput)
        .setDstAccessMask(vk::AccessFlagBits::eColorAttachmentWrite | vk::AccessFlagBits::eColorAttachmentRead);

    auto render_pass_info = vk::RenderPassCreateInfo()
        .setAttachments(color_attachment)
        .setSubpasses(subpass)
        .setDependencies(dependency);

    auto render_pass_res = m_device.createRenderPass(render_pass_info);
    CHECK_VK_RESULT(render_pass_res, "Could not create render pass: {}");
    m_render_pass = render_pass_res.value;
    return {};
}

std::expected<void, std::string> Window::create_framebuffers() {
    m_framebuffers.clear();
    for (const auto& view : m_image_views) {
        auto framebuffer_info = vk::FramebufferCreateInfo()
            .setRenderPass(m_render_pass)
            .setAttachments(view)
            .setWidth(m_extent.width)
            .setHeight(m_extent.height)
            .setLayers(1);
        auto framebuffer_res = m_device.createFramebuffer(framebuffer_info);
        CHECK_VK_RESULT(framebuffer_res, "Could not create framebuffer: {}");
        m_framebuffers.push_back(framebuffer_res.value);
    }
    return {};
}

SwapchainStatus classify_swapchain_result(vk::Result result) {
    switch (result) {
        case vk::Result::eSuccess:
            return SwapchainStatus::Ready;
        case vk::Result::eSuboptimalKHR:
            return SwapchainStatus::Suboptimal;
        case vk::Result::eErrorOutOfDateKHR:
            return SwapchainStatus::OutOfDate;
        default:
            return SwapchainStatus::Failed;
    }
}

std::expected<std::optional<uint32_t>, std::string> Window::acquire_next_image(vk::Semaphore signal_semaphore,
                                                                               uint64_t timeout) {
    if (m_needs_resize) {
        if (auto result = recreate_swapchain(); !result) {
            return std::unexpected(fmt::format("Failed to recreate swapchain: {}", result.error()));
        }
        m_needs_resize = false;
        return std::nullopt;
    }

    auto next_res = m_device.acquireNextImageKHR(m_swapchain, timeout, signal_semaphore, nullptr);
    switch (classify_swapchain_result(next_res.result)) {
        case SwapchainStatus::Ready:
            return next_res.value;
        case SwapchainStatus::Suboptimal:
            // The semaphore is signaled, so this image has to be used
            m_needs_resize = true;
            return next_res.value;
        case SwapchainStatus::OutOfDate:
            m_needs_resize = true;
            return std::nullopt;
        case SwapchainStatus::Failed:
            break;
    }
    return std::unexpected(fmt::format("acquireNextImageKHR failed: {}", vk::to_string(next_res.result)));
}

std::expected<bool, std::string> Window::present(vk::Queue present_queue, vk::Semaphore wait_semaphore,
                                                 uint32_t image_index) {
    auto present_info = vk::PresentInfoKHR()
        .setWaitSemaphores(wait_semaphore)
        .setSwapchains(m_swapchain)
        .setImageIndices(image_index);

    // The C entry point, vk::Queue::presentKHR treats eErrorOutOfDateKHR as fatal
    auto result = static_cast<vk::Result>(
        vkQueuePresentKHR(present_queue, reinterpret_cast<const VkPresentInfoKHR*>(&present_info)));

    switch (classify_swapchain_result(result)) {
        case SwapchainStatus::Ready:
            return true;
        case SwapchainStatus::Suboptimal:
            m_needs_resize = true;
            return true;
        case SwapchainStatus::OutOfDate:
            m_needs_resize = true;
            return false;
        case SwapchainStatus::Failed:
            break;
    }
    return std::unexpected(fmt::format("vkQueuePresentKHR failed: {}", vk::to_string(result)));
}

std::expected<void, std::string> Window::recreate_swapchain() {
    int width = 0;
    int height = 0;
    glfwGetFramebufferSize(m_window_handle, &width, &height);
    while (width == 0 || height == 0) {
        // Minimized
        glfwWaitEvents();
        glfwGetFramebufferSize(m_window_handle, &width, &height);
    }
    m_width = width;
    m_height = height;

    CHECK_VK_RESULT_VOID(m_device.waitIdle(), "waitIdle before swapchain recreation failed: {}");
    cleanup_swapchain();

    if (auto result = create_swapchain(); !result) {
        return result;
    }
    if (auto result = create_framebuffers(); !result) {
        return result;
    }

    Logger::instance().info("Swapchain recreated: {}x{}", width, height);
    return {};
}

void Window::cleanup_swapchain() {
    for (auto& framebuffer : m_framebuffers) {
        m_device.destroyFramebuffer(framebuffer);
    }
    m_framebuffers.clear();

    for (auto& view : m_image_views) {
        m_device.destroyImageView(view);
    }
    m_image_views.clear();

    if (m_swapchain) {
        m_device.destroySwapchainKHR(m_swapchain);
        m_swapchain = nullptr;
    }
}

vk::SurfaceFormatKHR Window::choose_surface_format(const std::vector<vk::SurfaceFormatKHR>& formats) {
    // UNORM: the multiply blend is tuned for gamma encoded paper and ink colors
    for (const auto& format : formats) {
        if (format.format == vk::Format::eB8G8R8A8Unorm && format.colorSpace == vk::ColorSpaceKHR::eSrgbNonlinear) {
            return format;
        }
    }
    return formats.front();
}

vk::Extent2D Window::choose_extent(const vk::SurfaceCapabilitiesKHR& capabilities) const {
    if (capabilities.currentExtent.width != UINT32_MAX) {
        return capabilities.currentExtent;
    }

    return {
        std::clamp(static_cast<uint32_t>(m_width), capabilities.minImageExtent.width, capabilities.maxImageExtent.width),
        std::clamp(static_cast<uint32_t>(m_height), capabilities.minImageExtent.height,
                   capabilities.maxImageExtent.height),
    };
}

} // namespace splat
