#pragma once

#include <splat/Common.hpp>
#include <splat/VulkanContext.hpp>

#include <GLFW/glfw3.h>
#include <expected>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace splat {

/// How a swapchain call left the swapchain
enum class SwapchainStatus {
    Ready,       ///< Image usable, swapchain matches the surface
    Suboptimal,  ///< Image usable, swapchain should be rebuilt afterwards
    OutOfDate,   ///< No image, swapchain must be rebuilt before retrying
    Failed       ///< Unrecoverable
};

[[nodiscard]] SwapchainStatus classify_swapchain_result(vk::Result result);

/**
 * @brief GLFW window with its Vulkan presentation stack
 *
 * Owns surface, swapchain, image views, a single color render pass and the
 * framebuffers. The render pass clears to the paper color and has no depth
 * attachment. Presentation uses FIFO so redraw requests are coalesced to the
 * display refresh rate.
 */
class Window {
public:
    /// glfwInit(); must succeed before a presentable VulkanContext is created
    static std::expected<void, std::string> initialize_glfw();

    static std::expected<std::unique_ptr<Window>, std::string> create(
        const VulkanContext& context,
        int width,
        int height,
        std::string_view title
    );

    ~Window();

    Window(const Window&) = delete;
    Window& operator=(const Window&) = delete;
    Window(Window&&) = delete;
    Window& operator=(Window&&) = delete;

    [[nodiscard]] bool should_close() const;

    [[nodiscard]] GLFWwindow* handle() const { return m_window_handle; }
    [[nodiscard]] vk::RenderPass render_pass() const { return m_render_pass; }
    [[nodiscard]] vk::Extent2D extent() const { return m_extent; }
    [[nodiscard]] uint32_t image_count() const { return static_cast<uint32_t>(m_swapchain_images.size()); }
    [[nodiscard]] vk::Framebuffer framebuffer(uint32_t index) const { return m_framebuffers[index]; }

    /**
     * @brief Acquires the next swapchain image
     *
     * @return Image index, nullopt if the swapchain was out of date or has just
     *         been recreated and the caller should try again next frame, or an
     *         error if acquisition or recreation failed for good
     */
    [[nodiscard]] std::expected<std::optional<uint32_t>, std::string> acquire_next_image(
        vk::Semaphore signal_semaphore, uint64_t timeout = UINT64_MAX);

    /**
     * @brief Queues the image for presentation
     * @return false if the swapchain went out of date and will be rebuilt on the next acquire
     */
    [[nodiscard]] std::expected<bool, std::string> present(vk::Queue present_queue, vk::Semaphore wait_semaphore,
                                                           uint32_t image_index);

    void mark_resize_needed() { m_needs_resize = true; }

private:
    Window(const VulkanContext& context, GLFWwindow* handle, int width, int height);

    std::expected<void, std::string> initialize();
    std::expected<void, std::string> create_surface();
    std::expected<void, std::string> create_swapchain();
    std::expected<void, std::string> create_render_pass();
    std::expected<void, std::string> create_framebuffers();
    std::expected<void, std::string> recreate_swapchain();
    void cleanup_swapchain();

    [[nodiscard]] static vk::SurfaceFormatKHR choose_surface_format(const std::vector<vk::SurfaceFormatKHR>& formats);
    [[nodiscard]] vk::Extent2D choose_extent(const vk::SurfaceCapabilitiesKHR& capabilities) const;

    GLFWwindow* m_window_handle;
    int m_width;
    int m_height;

    const VulkanContext& m_context;
    vk::Device m_device;

    vk::SurfaceKHR m_surface;
    vk::SurfaceFormatKHR m_surface_format;
    vk::SwapchainKHR m_swapchain;
    vk::Extent2D m_extent;

    std::vector<vk::Image> m_swapchain_images;
    std::vector<vk::ImageView> m_image_views;
    std::vector<vk::Framebuffer> m_framebuffers;
    vk::RenderPass m_render_pass;

    bool m_needs_resize = false;
};

} // namespace splat
