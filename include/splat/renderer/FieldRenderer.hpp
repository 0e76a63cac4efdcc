#pragma once

#include "../BufferPool.hpp"
#include "../FieldModel.hpp"
#include "../FrameCoordinator.hpp"
#include "../LayerStack.hpp"
#include "../Shader.hpp"
#include "../VulkanBufferAllocator.hpp"
#include "../VulkanContext.hpp"

#include <array>
#include <expected>
#include <memory>
#include <span>
#include <string>
#include <vector>

namespace splat {

/**
 * @brief One layer pass of a frame
 */
struct LayerDraw {
    std::shared_ptr<const RenderSnapshot> snapshot;
    FieldUniforms uniforms;
    BlendMode blend = BlendMode::Multiply;
};

/**
 * @brief Swapchain side inputs of a frame
 */
struct FrameTarget {
    uint32_t image_index;
    vk::Semaphore image_available_semaphore; ///< May be null for offscreen targets
    vk::Framebuffer framebuffer;
    vk::Extent2D extent;
    vk::RenderPass render_pass;
    vk::ClearColorValue clear_color;
    void* imgui_draw_data = nullptr; ///< ImDrawData*, recorded after the layers
};

/**
 * @brief Draws layer snapshots as metaball fields
 *
 * Each layer is one fullscreen quad. The fragment shader sums the influence of
 * every particle in the layer's storage buffer and writes premultiplied color,
 * which is composited with the layer's blend mode. Layers are drawn in the
 * order given, so callers pass them by ascending z index.
 *
 * Storage and uniform buffers are borrowed from the BufferPool per frame and
 * handed back once that frame's fence has been waited on.
 */
class FieldRenderer {
public:
    static constexpr uint32_t MAX_FRAMES_IN_FLIGHT = 2;
    static constexpr uint32_t MAX_LAYERS = 8;

    static std::expected<std::unique_ptr<FieldRenderer>, std::string> create(
        const VulkanContext& context,
        vk::RenderPass render_pass,
        uint32_t image_count,
        BufferPool& pool,
        VulkanBufferAllocator& allocator
    );

    ~FieldRenderer();

    FieldRenderer(const FieldRenderer&) = delete;
    FieldRenderer& operator=(const FieldRenderer&) = delete;

    /**
     * @brief Records and submits one frame
     *
     * @return Semaphore signaled when rendering finished, for presentation
     */
    [[nodiscard]] std::expected<vk::Semaphore, std::string> render_frame(
        const FrameTarget& target,
        std::span<const LayerDraw> layers
    );

    /// Re-creates the per image semaphores after the swapchain changed
    std::expected<void, std::string> handle_swapchain_recreation(uint32_t new_image_count);

    /// Waits for all frames in flight and returns their buffers to the pool
    void wait_idle();

    [[nodiscard]] uint32_t current_frame() const { return m_current_frame; }

    /// false when the field shader or its pipelines failed to build; frames only clear
    [[nodiscard]] bool field_available() const { return m_field_available; }

private:
    FieldRenderer(const VulkanContext& context, vk::RenderPass render_pass, BufferPool& pool,
                  VulkanBufferAllocator& allocator);

    std::expected<void, std::string> initialize(uint32_t image_count);
    std::expected<void, std::string> create_field_pipelines();
    std::expected<void, std::string> create_descriptors();
    std::expected<vk::Pipeline, std::string> create_pipeline(BlendMode blend) const;
    std::expected<void, std::string> create_frame_resources();
    std::expected<void, std::string> create_image_semaphores(uint32_t image_count);
    void destroy_image_semaphores();

    /// Borrows and fills the buffers of one layer; false if the layer must be skipped
    bool prepare_layer(uint32_t layer_slot, const LayerDraw& draw);

    void cleanup();

    struct FrameResources {
        vk::CommandBuffer command_buffer;
        vk::Fence in_flight;
        std::array<vk::DescriptorSet, MAX_LAYERS> descriptor_sets;
        std::vector<PooledBuffer> leases; ///< Returned when in_flight is waited on
    };

    const VulkanContext& m_context;
    vk::Device m_device;
    vk::RenderPass m_render_pass;
    BufferPool& m_pool;
    VulkanBufferAllocator& m_allocator;

    std::unique_ptr<Shader> m_vertex_shader;
    std::unique_ptr<Shader> m_fragment_shader;

    vk::DescriptorSetLayout m_descriptor_layout;
    vk::DescriptorPool m_descriptor_pool;
    vk::PipelineLayout m_pipeline_layout;
    vk::Pipeline m_multiply_pipeline;
    vk::Pipeline m_normal_pipeline;

    vk::CommandPool m_command_pool;
    std::array<FrameResources, MAX_FRAMES_IN_FLIGHT> m_frames;
    uint32_t m_current_frame = 0;
    bool m_field_available = false;

    std::vector<vk::Semaphore> m_render_finished_semaphores; ///< One per swapchain image
    std::vector<vk::Fence> m_images_in_flight;               ///< Not owned
};

} // namespace splat
