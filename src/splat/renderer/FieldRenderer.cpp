#include <splat/renderer/FieldRenderer.hpp>
#include <splat/Logger.hpp>

#include <imgui.h>
#include <imgui_impl_vulkan.h>
#include <algorithm>
#include <cstring>

namespace splat {

namespace {

constexpr uint32_t QUAD_VERTEX_COUNT = 4;

vk::PipelineColorBlendAttachmentState blend_state(BlendMode blend) {
    // Sources are premultiplied. Multiply: dst * (1 - a) + dst * color * a
    auto state = vk::PipelineColorBlendAttachmentState()
        .setColorWriteMask(vk::ColorComponentFlagBits::eR |
                           vk::ColorComponentFlagBits::eG |
                           vk::ColorComponentFlagBits::eB |
                           vk::ColorComponentFlagBits::eA)
        .setBlendEnable(true)
        .setDstColorBlendFactor(vk::BlendFactor::eOneMinusSrcAlpha)
        .setColorBlendOp(vk::BlendOp::eAdd)
        .setSrcAlphaBlendFactor(vk::BlendFactor::eOne)
        .setDstAlphaBlendFactor(vk::BlendFactor::eOneMinusSrcAlpha)
        .setAlphaBlendOp(vk::BlendOp::eAdd);

    switch (blend) {
        case BlendMode::Multiply:
            state.setSrcColorBlendFactor(vk::BlendFactor::eDstColor);
            break;
        case BlendMode::Normal:
            state.setSrcColorBlendFactor(vk::BlendFactor::eOne);
            break;
    }
    return state;
}

} // namespace

FieldRenderer::FieldRenderer(
    const VulkanContext& context,
    vk::RenderPass render_pass,
    BufferPool& pool,
    VulkanBufferAllocator& allocator
)
    : m_context(context)
    , m_device(context.device())
    , m_render_pass(render_pass)
    , m_pool(pool)
    , m_allocator(allocator)
{}

std::expected<std::unique_ptr<FieldRenderer>, std::string> FieldRenderer::create(
    const VulkanContext& context,
    vk::RenderPass render_pass,
    uint32_t image_count,
    BufferPool& pool,
    VulkanBufferAllocator& allocator
) {
    auto renderer = std::unique_ptr<FieldRenderer>(new FieldRenderer(context, render_pass, pool, allocator));

    if (auto result = renderer->initialize(image_count); !result) {
        return std::unexpected(result.error());
    }

    Logger::instance().info("Created field renderer ({} frames in flight, up to {} layers)",
                            MAX_FRAMES_IN_FLIGHT, MAX_LAYERS);
    return renderer;
}

FieldRenderer::~FieldRenderer() {
    cleanup();
}

std::expected<void, std::string> FieldRenderer::initialize(uint32_t image_count) {
    if (auto result = create_frame_resources(); !result) {
        return result;
    }
    if (auto result = create_image_semaphores(image_count); !result) {
        return result;
    }

    // Without the field pipelines frames still clear and show the UI
    if (auto result = create_field_pipelines(); !result) {
        Logger::instance().warn("Field rendering unavailable, drawing paper only: {}", result.error());
        m_field_available = false;
    } else {
        m_field_available = true;
    }
    return {};
}

std::expected<void, std::string> FieldRenderer::create_field_pipelines() {
    auto vert_result = Shader::create_shader(m_device, "splat/field", "vertex_main");
    if (!vert_result) {
        return std::unexpected(fmt::format("Failed to load field vertex shader: {}", vert_result.error()));
    }
    m_vertex_shader = std::make_unique<Shader>(std::move(*vert_result));

    auto frag_result = Shader::create_shader(m_device, "splat/field", "fragment_main");
    if (!frag_result) {
        return std::unexpected(fmt::format("Failed to load field fragment shader: {}", frag_result.error()));
    }
    m_fragment_shader = std::make_unique<Shader>(std::move(*frag_result));

    if (auto result = create_descriptors(); !result) {
        return result;
    }

    auto multiply = create_pipeline(BlendMode::Multiply);
    if (!multiply) {
        return std::unexpected(multiply.error());
    }
    m_multiply_pipeline = *multiply;

    auto normal = create_pipeline(BlendMode::Normal);
    if (!normal) {
        return std::unexpected(normal.error());
    }
    m_normal_pipeline = *normal;
    return {};
}

std::expected<void, std::string> FieldRenderer::create_descriptors() {
    const std::array<const Shader*, 2> stages = {m_vertex_shader.get(), m_fragment_shader.get()};
    auto bindings = merge_set_layout(stages);
    if (!bindings) {
        return std::unexpected(bindings.error());
    }

    auto layout_info = vk::DescriptorSetLayoutCreateInfo().setBindings(*bindings);
    auto layout_res = m_device.createDescriptorSetLayout(layout_info);
    CHECK_VK_RESULT(layout_res, "Failed to create descriptor set layout: {}");
    m_descriptor_layout = layout_res.value;

    auto pipeline_layout_res = m_device.createPipelineLayout(
        vk::PipelineLayoutCreateInfo().setSetLayouts(m_descriptor_layout));
    CHECK_VK_RESULT(pipeline_layout_res, "Failed to create pipeline layout: {}");
    m_pipeline_layout = pipeline_layout_res.value;

    constexpr uint32_t set_count = MAX_FRAMES_IN_FLIGHT * MAX_LAYERS;
    std::vector<vk::DescriptorPoolSize> pool_sizes = {
        vk::DescriptorPoolSize(vk::DescriptorType::eStorageBuffer, set_count),
        vk::DescriptorPoolSize(vk::DescriptorType::eUniformBuffer, set_count)
    };

    auto pool_info = vk::DescriptorPoolCreateInfo()
        .setMaxSets(set_count)
        .setPoolSizes(pool_sizes);

    auto pool_res = m_device.createDescriptorPool(pool_info);
    CHECK_VK_RESULT(pool_res, "Failed to create descriptor pool: {}");
    m_descriptor_pool = pool_res.value;

    const std::vector<vk::DescriptorSetLayout> layouts(MAX_LAYERS, m_descriptor_layout);
    for (auto& frame : m_frames) {
        auto alloc_info = vk::DescriptorSetAllocateInfo()
            .setDescriptorPool(m_descriptor_pool)
            .setSetLayouts(layouts);
        auto sets_res = m_device.allocateDescriptorSets(alloc_info);
        CHECK_VK_RESULT(sets_res, "Failed to allocate descriptor sets: {}");
        std::copy(sets_res.value.begin(), sets_res.value.end(), frame.descriptor_sets.begin());
    }
    return {};
}

std::expected<vk::Pipeline, std::string> FieldRenderer::create_pipeline(BlendMode blend) const {
    if (!m_pipeline_layout) {
        return std::unexpected("Pipeline layout not created");
    }

    const std::array shader_stages = {
        m_vertex_shader->pipeline_stage_info(),
        m_fragment_shader->pipeline_stage_info()
    };

    // Corners come from the vertex index
    auto vertex_input_info = vk::PipelineVertexInputStateCreateInfo();

    auto input_assembly = vk::PipelineInputAssemblyStateCreateInfo()
        .setTopology(vk::PrimitiveTopology::eTriangleStrip)
        .setPrimitiveRestartEnable(false);

    auto viewport_state = vk::PipelineViewportStateCreateInfo()
        .setViewportCount(1)
        .setScissorCount(1);

    auto rasterizer = vk::PipelineRasterizationStateCreateInfo()
        .setPolygonMode(vk::PolygonMode::eFill)
        .setLineWidth(1.0f)
        .setCullMode(vk::CullModeFlagBits::eNone)
        .setFrontFace(vk::FrontFace::eCounterClockwise);

    auto multisampling = vk::PipelineMultisampleStateCreateInfo()
        .setRasterizationSamples(vk::SampleCountFlagBits::e1);

    auto color_blend_attachment = blend_state(blend);
    auto color_blending = vk::PipelineColorBlendStateCreateInfo()
        .setLogicOpEnable(false)
        .setAttachments(color_blend_attachment);

    const std::array dynamic_states = {vk::DynamicState::eViewport, vk::DynamicState::eScissor};
    auto dynamic_state = vk::PipelineDynamicStateCreateInfo().setDynamicStates(dynamic_states);

    auto pipeline_info = vk::GraphicsPipelineCreateInfo()
        .setStages(shader_stages)
        .setPVertexInputState(&vertex_input_info)
        .setPInputAssemblyState(&input_assembly)
        .setPViewportState(&viewport_state)
        .setPRasterizationState(&rasterizer)
        .setPMultisampleState(&multisampling)
        .setPColorBlendState(&color_blending)
        .setPDynamicState(&dynamic_state)
        .setLayout(m_pipeline_layout)
        .setRenderPass(m_render_pass)
        .setSubpass(0);

    auto pipeline_res = m_device.createGraphicsPipeline(nullptr, pipeline_info);
    CHECK_VK_RESULT(pipeline_res, "Failed to create field pipeline: {}");
    Logger::instance().info("Built {} blend field pipeline", to_string(blend));
    return pipeline_res.value;
}

std::expected<void, std::string> FieldRenderer::create_frame_resources() {
    auto cmd_pool_info = vk::CommandPoolCreateInfo()
        .setQueueFamilyIndex(m_context.graphics_family())
        .setFlags(vk::CommandPoolCreateFlagBits::eResetCommandBuffer);
    auto pool_res = m_device.createCommandPool(cmd_pool_info);
    CHECK_VK_RESULT(pool_res, "Failed to create command pool: {}");
    m_command_pool = pool_res.value;

    auto alloc_info = vk::CommandBufferAllocateInfo()
        .setCommandPool(m_command_pool)
        .setLevel(vk::CommandBufferLevel::ePrimary)
        .setCommandBufferCount(MAX_FRAMES_IN_FLIGHT);
    auto buffers_res = m_device.allocateCommandBuffers(alloc_info);
    CHECK_VK_RESULT(buffers_res, "Failed to allocate command buffers: {}");

    for (uint32_t i = 0; i < MAX_FRAMES_IN_FLIGHT; i++) {
        m_frames[i].command_buffer = buffers_res.value[i];

        // Signaled so the first wait on each slot returns immediately
        auto fence_res = m_device.createFence(vk::FenceCreateInfo().setFlags(vk::FenceCreateFlagBits::eSignaled));
        CHECK_VK_RESULT(fence_res, "Failed to create in-flight fence: {}");
        m_frames[i].in_flight = fence_res.value;
    }
    return {};
}

std::expected<void, std::string> FieldRenderer::create_image_semaphores(uint32_t image_count) {
    m_render_finished_semaphores.reserve(image_count);
    for (uint32_t i = 0; i < image_count; i++) {
        auto semaphore_res = m_device.createSemaphore({});
        CHECK_VK_RESULT(semaphore_res, "Failed to create render finished semaphore: {}");
        m_render_finished_semaphores.push_back(semaphore_res.value);
    }
    m_images_in_flight.assign(image_count, nullptr);
    return {};
}

void FieldRenderer::destroy_image_semaphores() {
    for (auto& semaphore : m_render_finished_semaphores) {
        m_device.destroySemaphore(semaphore);
    }
    m_render_finished_semaphores.clear();
    m_images_in_flight.clear();
}

std::expected<void, std::string> FieldRenderer::handle_swapchain_recreation(uint32_t new_image_count) {
    CHECK_VK_RESULT_VOID(m_device.waitIdle(), "waitIdle before semaphore recreation failed: {}");
    destroy_image_semaphores();
    return create_image_semaphores(new_image_count);
}

bool FieldRenderer::prepare_layer(uint32_t layer_slot, const LayerDraw& draw) {
    auto& frame = m_frames[m_current_frame];
    const auto& snapshot = *draw.snapshot;

    auto dots = m_pool.borrow(snapshot.byte_size(), BufferUsage::Dots);
    auto uniforms = m_pool.borrow(sizeof(FieldUniforms), BufferUsage::Uniforms);
    if (!dots || !uniforms) {
        Logger::instance().warn("Skipping layer pass, pool could not provide buffers ({} dots bytes)",
                                snapshot.byte_size());
        return false;
    }

    const vk::Buffer dots_buffer = m_allocator.vk_buffer(*dots.get());
    const vk::Buffer uniform_buffer = m_allocator.vk_buffer(*uniforms.get());
    if (!dots_buffer || !uniform_buffer) {
        Logger::instance().warn("Skipping layer pass, pooled buffer has no Vulkan handle");
        return false;
    }

    std::memcpy(dots->mapped, snapshot.particles.data(), snapshot.byte_size());
    std::memcpy(uniforms->mapped, &draw.uniforms, sizeof(FieldUniforms));

    auto dots_info = vk::DescriptorBufferInfo()
        .setBuffer(dots_buffer)
        .setOffset(0)
        .setRange(snapshot.byte_size());
    auto uniform_info = vk::DescriptorBufferInfo()
        .setBuffer(uniform_buffer)
        .setOffset(0)
        .setRange(sizeof(FieldUniforms));

    const auto descriptor_set = frame.descriptor_sets[layer_slot];
    const std::array writes = {
        vk::WriteDescriptorSet()
            .setDstSet(descriptor_set)
            .setDstBinding(0)
            .setDescriptorType(vk::DescriptorType::eStorageBuffer)
            .setBufferInfo(dots_info),
        vk::WriteDescriptorSet()
            .setDstSet(descriptor_set)
            .setDstBinding(1)
            .setDescriptorType(vk::DescriptorType::eUniformBuffer)
            .setBufferInfo(uniform_info)
    };
    m_device.updateDescriptorSets(writes, {});

    frame.leases.push_back(std::move(dots));
    frame.leases.push_back(std::move(uniforms));
    return true;
}

std::expected<vk::Semaphore, std::string> FieldRenderer::render_frame(
    const FrameTarget& target,
    std::span<const LayerDraw> layers
) {
    auto& frame = m_frames[m_current_frame];

    CHECK_VK_RESULT_VOID(m_device.waitForFences(frame.in_flight, true, UINT64_MAX),
                         "Waiting for frame fence failed: {}");
    // The GPU is done with this slot's buffers
    frame.leases.clear();

    if (target.image_index >= m_images_in_flight.size()) {
        return std::unexpected(fmt::format("Image index {} out of range", target.image_index));
    }
    if (auto image_fence = m_images_in_flight[target.image_index]; image_fence && image_fence != frame.in_flight) {
        CHECK_VK_RESULT_VOID(m_device.waitForFences(image_fence, true, UINT64_MAX),
                             "Waiting for image fence failed: {}");
    }
    m_images_in_flight[target.image_index] = frame.in_flight;

    if (layers.size() > MAX_LAYERS) {
        Logger::instance().warn("{} layers requested, only the lowest {} are drawn", layers.size(), MAX_LAYERS);
        layers = layers.first(MAX_LAYERS);
    }

    std::vector<std::pair<uint32_t, BlendMode>> passes;
    for (uint32_t i = 0; m_field_available && i < layers.size(); i++) {
        const auto& draw = layers[i];
        if (!draw.snapshot || draw.snapshot->count == 0 || draw.uniforms.opacity <= 0.0f) {
            continue;
        }
        if (prepare_layer(i, draw)) {
            passes.emplace_back(i, draw.blend);
        }
    }

    auto& cmd = frame.command_buffer;
    CHECK_VK_RESULT_VOID(cmd.reset(), "Failed to reset command buffer: {}");
    CHECK_VK_RESULT_VOID(cmd.begin(vk::CommandBufferBeginInfo()), "Failed to begin command buffer: {}");

    auto render_pass_begin = vk::RenderPassBeginInfo()
        .setRenderPass(target.render_pass)
        .setFramebuffer(target.framebuffer)
        .setRenderArea(vk::Rect2D({0, 0}, target.extent));
    const vk::ClearValue clear_value(target.clear_color);
    render_pass_begin.setClearValues(clear_value);

    cmd.beginRenderPass(render_pass_begin, vk::SubpassContents::eInline);

    auto viewport = vk::Viewport()
        .setWidth(static_cast<float>(target.extent.width))
        .setHeight(static_cast<float>(target.extent.height))
        .setMinDepth(0.0f)
        .setMaxDepth(1.0f);
    cmd.setViewport(0, viewport);
    cmd.setScissor(0, vk::Rect2D({0, 0}, target.extent));

    for (const auto& [slot, blend] : passes) {
        cmd.bindPipeline(vk::PipelineBindPoint::eGraphics,
                         blend == BlendMode::Multiply ? m_multiply_pipeline : m_normal_pipeline);
        cmd.bindDescriptorSets(vk::PipelineBindPoint::eGraphics, m_pipeline_layout, 0,
                               frame.descriptor_sets[slot], {});
        cmd.draw(QUAD_VERTEX_COUNT, 1, 0, 0);
    }

    if (target.imgui_draw_data) {
        ImGui_ImplVulkan_RenderDrawData(
            static_cast<ImDrawData*>(target.imgui_draw_data),
            static_cast<VkCommandBuffer>(cmd)
        );
    }

    cmd.endRenderPass();
    CHECK_VK_RESULT_VOID(cmd.end(), "Failed to end command buffer: {}");

    CHECK_VK_RESULT_VOID(m_device.resetFences(frame.in_flight), "Failed to reset frame fence: {}");

    const auto render_finished = m_render_finished_semaphores[target.image_index];
    vk::PipelineStageFlags wait_stage = vk::PipelineStageFlagBits::eColorAttachmentOutput;
    auto submit_info = vk::SubmitInfo()
        .setCommandBuffers(cmd)
        .setSignalSemaphores(render_finished);
    // Offscreen targets have no acquire to wait for
    if (target.image_available_semaphore) {
        submit_info.setWaitSemaphores(target.image_available_semaphore)
            .setWaitDstStageMask(wait_stage);
    }

    CHECK_VK_RESULT_VOID(m_context.graphics_queue().submit(submit_info, frame.in_flight),
                         "Failed to submit frame: {}");

    m_current_frame = (m_current_frame + 1) % MAX_FRAMES_IN_FLIGHT;
    return render_finished;
}

void FieldRenderer::wait_idle() {
    for (auto& frame : m_frames) {
        if (!frame.in_flight) {
            continue;
        }
        if (auto result = m_device.waitForFences(frame.in_flight, true, UINT64_MAX); result != vk::Result::eSuccess) {
            Logger::instance().warn("Waiting for frame fence failed: {}", vk::to_string(result));
        }
        frame.leases.clear();
    }
}

void FieldRenderer::cleanup() {
    if (!m_device) {
        return;
    }
    wait_idle();

    destroy_image_semaphores();
    for (auto& frame : m_frames) {
        if (frame.in_flight) {
            m_device.destroyFence(frame.in_flight);
            frame.in_flight = nullptr;
        }
    }
    if (m_command_pool) {
        m_device.destroyCommandPool(m_command_pool);
    }
    if (m_multiply_pipeline) {
        m_device.destroyPipeline(m_multiply_pipeline);
    }
    if (m_normal_pipeline) {
        m_device.destroyPipeline(m_normal_pipeline);
    }
    if (m_pipeline_layout) {
        m_device.destroyPipelineLayout(m_pipeline_layout);
    }
    if (m_descriptor_pool) {
        m_device.destroyDescriptorPool(m_descriptor_pool);
    }
    if (m_descriptor_layout) {
        m_device.destroyDescriptorSetLayout(m_descriptor_layout);
    }
    m_device = nullptr;
}

} // namespace splat
