#pragma once

#include "BufferPool.hpp"
#include "FrameMonitor.hpp"
#include "SplatterEngine.hpp"
#include "UICallback.hpp"
#include "VulkanBufferAllocator.hpp"
#include "VulkanContext.hpp"
#include "Window.hpp"
#include "renderer/FieldRenderer.hpp"

#include <GLFW/glfw3.h>
#include <atomic>
#include <chrono>
#include <expected>
#include <memory>
#include <string>
#include <vector>

namespace splat {

struct SplatterConfig {
    uint32_t window_width = 1280;
    uint32_t window_height = 720;
    const char* window_title = "InkSplatter";
    glm::vec3 paper_color{0.96f, 0.94f, 0.89f};
};

/**
 * @brief Interactive host around a SplatterEngine
 *
 * Owns the window, the Vulkan context, the buffer pool and the field renderer,
 * and turns input into engine calls:
 * - mouse release: impact at the cursor
 * - C: clear every layer
 * - R: toggle between seeded and system randomness
 *
 * The loop is demand driven. It sleeps in glfwWaitEvents until the engine
 * requests a redraw or the UI is being interacted with.
 */
class SplatterController {
public:
    static constexpr uint32_t PRESSURE_SAMPLE_INTERVAL = 60; ///< Frames between pool footprint checks
    static constexpr std::chrono::milliseconds VISIBILITY_DEBOUNCE{16};

    /// The engine must outlive the controller
    static std::expected<std::unique_ptr<SplatterController>, std::string> create(
        SplatterEngine& engine,
        const SplatterConfig& config = {}
    );

    ~SplatterController();

    SplatterController(const SplatterController&) = delete;
    SplatterController& operator=(const SplatterController&) = delete;

    /// Blocks until the window is closed
    std::expected<void, std::string> run();

private:
    SplatterController(SplatterEngine& engine, const SplatterConfig& config);

    std::expected<void, std::string> initialize();
    std::expected<void, std::string> setup_imgui();

    void handle_impact(double cursor_x, double cursor_y);
    void toggle_seeded_mode();

    void render_ui();
    void render_layer_panel(const LayerTemplate& layer);
    void render_ui_callbacks(const std::vector<UICallback>& callbacks);
    std::vector<UICallback> layer_callbacks(const std::string& layer_name);

    [[nodiscard]] std::vector<LayerDraw> collect_layer_draws() const;
    [[nodiscard]] bool visibility_settled() const;
    void sample_memory_pressure();
    void request_redraw();

    void cleanup();

    friend void glfw_key_callback(GLFWwindow* window, int key, int scancode, int action, int mods);
    friend void glfw_mouse_button_callback(GLFWwindow* window, int button, int action, int mods);
    friend void glfw_framebuffer_size_callback(GLFWwindow* window, int width, int height);

    SplatterConfig m_config;
    SplatterEngine& m_engine;

    std::unique_ptr<VulkanContext> m_context;
    std::unique_ptr<Window> m_window;
    std::unique_ptr<VulkanBufferAllocator> m_allocator;
    std::unique_ptr<BufferPool> m_pool;
    std::unique_ptr<FieldRenderer> m_renderer;

    vk::DescriptorPool m_imgui_descriptor_pool;
    bool m_imgui_initialized = false;

    std::atomic<bool> m_redraw_pending{true};
    std::chrono::steady_clock::time_point m_visibility_edit_time{};
    uint32_t m_frame_counter = 0;
    FrameMonitor m_frame_monitor;
};

} // namespace splat
