#include <splat/SplatterController.hpp>
#include <splat/Logger.hpp>

#include <imgui.h>
#include <imgui_impl_glfw.h>
#include <imgui_impl_vulkan.h>
#include <algorithm>
#include <utility>

namespace splat {

void glfw_key_callback(GLFWwindow* window, int key, [[maybe_unused]] int scancode, int action,
                       [[maybe_unused]] int mods) {
    auto* controller = static_cast<SplatterController*>(glfwGetWindowUserPointer(window));
    if (!controller || action != GLFW_PRESS) return;
    if (controller->m_imgui_initialized && ImGui::GetIO().WantCaptureKeyboard) return;

    switch (key) {
        case GLFW_KEY_C:
            controller->m_engine.clear();
            break;
        case GLFW_KEY_R:
            controller->toggle_seeded_mode();
            break;
        default:
            break;
    }
}

void glfw_mouse_button_callback(GLFWwindow* window, int button, int action, [[maybe_unused]] int mods) {
    auto* controller = static_cast<SplatterController*>(glfwGetWindowUserPointer(window));
    if (!controller || button != GLFW_MOUSE_BUTTON_LEFT || action != GLFW_RELEASE) return;
    if (controller->m_imgui_initialized && ImGui::GetIO().WantCaptureMouse) return;

    double x = 0.0;
    double y = 0.0;
    glfwGetCursorPos(window, &x, &y);
    controller->handle_impact(x, y);
}

void glfw_framebuffer_size_callback(GLFWwindow* window, [[maybe_unused]] int width, [[maybe_unused]] int height) {
    auto* controller = static_cast<SplatterController*>(glfwGetWindowUserPointer(window));
    if (!controller || !controller->m_window) return;

    controller->m_window->mark_resize_needed();
    controller->request_redraw();
}

SplatterController::SplatterController(SplatterEngine& engine, const SplatterConfig& config)
    : m_config(config)
    , m_engine(engine)
    , m_imgui_descriptor_pool(nullptr)
{}

SplatterController::~SplatterController() {
    cleanup();
}

std::expected<std::unique_ptr<SplatterController>, std::string> SplatterController::create(
    SplatterEngine& engine,
    const SplatterConfig& config
) {
    auto controller = std::unique_ptr<SplatterController>(new SplatterController(engine, config));

    if (auto result = controller->initialize(); !result) {
        return std::unexpected(result.error());
    }

    return controller;
}

std::expected<void, std::string> SplatterController::initialize() {
    Logger::instance().info("Initializing splatter controller...");

    // GLFW has to be up before the context asks it for instance extensions
    if (auto result = Window::initialize_glfw(); !result) {
        return result;
    }

    auto context_result = VulkanContext::create(ContextConfig{.application_name = m_config.window_title});
    if (!context_result) {
        return std::unexpected(fmt::format("Failed to create Vulkan context: {}", context_result.error()));
    }
    m_context = std::move(*context_result);

    auto window_result = Window::create(
        *m_context,
        static_cast<int>(m_config.window_width),
        static_cast<int>(m_config.window_height),
        m_config.window_title
    );
    if (!window_result) {
        return std::unexpected(fmt::format("Failed to create window: {}", window_result.error()));
    }
    m_window = std::move(*window_result);

    m_allocator = std::make_unique<VulkanBufferAllocator>(*m_context);
    m_pool = std::make_unique<BufferPool>(*m_allocator);
    m_pool->prewarm();

    auto renderer_result = FieldRenderer::create(
        *m_context,
        m_window->render_pass(),
        m_window->image_count(),
        *m_pool,
        *m_allocator
    );
    if (!renderer_result) {
        return std::unexpected(fmt::format("Failed to create field renderer: {}", renderer_result.error()));
    }
    m_renderer = std::move(*renderer_result);

    m_engine.set_redraw_request([this] { request_redraw(); });

    // Installed before ImGui so its GLFW backend chains to them
    glfwSetWindowUserPointer(m_window->handle(), this);
    glfwSetKeyCallback(m_window->handle(), glfw_key_callback);
    glfwSetMouseButtonCallback(m_window->handle(), glfw_mouse_button_callback);
    glfwSetFramebufferSizeCallback(m_window->handle(), glfw_framebuffer_size_callback);

    if (auto result = setup_imgui(); !result) {
        return std::unexpected(result.error());
    }

    Logger::instance().info("Splatter controller initialized");
    return {};
}

std::expected<void, std::string> SplatterController::setup_imgui() {
    IMGUI_CHECKVERSION();
    ImGui::CreateContext();
    ImGui::StyleColorsLight();

    std::vector<vk::DescriptorPoolSize> pool_sizes = {
        {vk::DescriptorType::eCombinedImageSampler, 16},
        {vk::DescriptorType::eUniformBuffer, 16},
    };

    auto imgui_pool_info = vk::DescriptorPoolCreateInfo()
        .setFlags(vk::DescriptorPoolCreateFlagBits::eFreeDescriptorSet)
        .setMaxSets(16)
        .setPoolSizes(pool_sizes);

    auto pool_res = m_context->device().createDescriptorPool(imgui_pool_info);
    CHECK_VK_RESULT(pool_res, "Failed to create ImGui descriptor pool: {}");
    m_imgui_descriptor_pool = pool_res.value;

    ImGui_ImplGlfw_InitForVulkan(m_window->handle(), true);

    ImGui_ImplVulkan_InitInfo init_info{};
    init_info.Instance = static_cast<VkInstance>(m_context->instance());
    init_info.PhysicalDevice = static_cast<VkPhysicalDevice>(m_context->physical_device());
    init_info.Device = static_cast<VkDevice>(m_context->device());
    init_info.QueueFamily = m_context->graphics_family();
    init_info.Queue = static_cast<VkQueue>(m_context->graphics_queue());
    init_info.DescriptorPool = static_cast<VkDescriptorPool>(m_imgui_descriptor_pool);
    init_info.MinImageCount = 2;
    init_info.ImageCount = m_window->image_count();
    init_info.MSAASamples = VK_SAMPLE_COUNT_1_BIT;
    init_info.RenderPass = static_cast<VkRenderPass>(m_window->render_pass());
    init_info.Allocator = nullptr;
    init_info.CheckVkResultFn = nullptr;

    if (!ImGui_ImplVulkan_Init(&init_info)) {
        return std::unexpected("Failed to initialize ImGui Vulkan backend");
    }
    ImGui_ImplVulkan_CreateFontsTexture();
    m_imgui_initialized = true;

    return {};
}

void SplatterController::request_redraw() {
    m_redraw_pending.store(true, std::memory_order_release);
    glfwPostEmptyEvent();
}

void SplatterController::handle_impact(double cursor_x, double cursor_y) {
    int width = 0;
    int height = 0;
    glfwGetWindowSize(m_window->handle(), &width, &height);
    m_engine.add_impact(glm::vec2(static_cast<float>(cursor_x), static_cast<float>(cursor_y)),
                        static_cast<float>(width), static_cast<float>(height));
}

void SplatterController::toggle_seeded_mode() {
    auto& settings = m_engine.settings();
    settings.use_seeded_rng = !settings.use_seeded_rng;
    Logger::instance().info("Random source: {}", settings.use_seeded_rng
        ? fmt::format("seeded ({})", settings.rng_seed)
        : std::string("system"));
    request_redraw();
}

bool SplatterController::visibility_settled() const {
    return std::chrono::steady_clock::now() - m_visibility_edit_time >= VISIBILITY_DEBOUNCE;
}

std::vector<UICallback> SplatterController::layer_callbacks(const std::string& layer_name) {
    auto& layers = m_engine.layers();
    auto physics_field = [this, layer_name](float LayerPhysics::* field, float min, float max, bool logarithmic = false) {
        return ContinuousCallback{
            .setter = [this, layer_name, field](float value) {
                if (const auto* layer = m_engine.layers().find(layer_name)) {
                    auto physics = layer->physics;
                    physics.*field = value;
                    m_engine.layers().set_physics(layer_name, physics);
                }
            },
            .getter = [this, layer_name, field] {
                const auto* layer = std::as_const(m_engine).layers().find(layer_name);
                return layer ? layer->physics.*field : 0.0f;
            },
            .min = min,
            .max = max,
            .logarithmic = logarithmic,
        };
    };

    std::vector<UICallback> callbacks;
    callbacks.emplace_back("Enabled", ToggleCallback{
        .setter = [&layers, layer_name](bool value) { layers.set_enabled(layer_name, value); },
        .getter = [&layers, layer_name] {
            const auto* layer = std::as_const(layers).find(layer_name);
            return layer && layer->rendering.enabled;
        },
    });
    callbacks.emplace_back("Color", ColorCallback{
        .setter = [&layers, layer_name](glm::vec3 value) { layers.set_color(layer_name, value); },
        .getter = [&layers, layer_name] {
            const auto* layer = std::as_const(layers).find(layer_name);
            return layer ? layer->rendering.color : glm::vec3(0.0f);
        },
    });
    callbacks.emplace_back("Opacity", ContinuousCallback{
        .setter = [&layers, layer_name](float value) { layers.set_opacity(layer_name, value); },
        .getter = [&layers, layer_name] {
            const auto* layer = std::as_const(layers).find(layer_name);
            return layer ? layer->rendering.opacity : 0.0f;
        },
        .min = 0.0f,
        .max = 1.0f,
    });
    callbacks.emplace_back("Blend", ChoiceCallback{
        .setter = [&layers, layer_name](int value) {
            layers.set_blend_mode(layer_name, value == 0 ? BlendMode::Multiply : BlendMode::Normal);
        },
        .getter = [&layers, layer_name] {
            const auto* layer = std::as_const(layers).find(layer_name);
            return layer && layer->rendering.blend == BlendMode::Normal ? 1 : 0;
        },
        .options = {std::string(to_string(BlendMode::Multiply)), std::string(to_string(BlendMode::Normal))},
    });

    for (auto type : ALL_PARTICLE_TYPES) {
        callbacks.emplace_back(fmt::format("Show {}", to_string(type)), ToggleCallback{
            .setter = [this, layer_name, type](bool value) {
                if (m_engine.layers().set_type_visible(layer_name, type, value)) {
                    m_visibility_edit_time = std::chrono::steady_clock::now();
                }
            },
            .getter = [this, layer_name, type] {
                const auto* layer = std::as_const(m_engine).layers().find(layer_name);
                return layer && layer->rendering.is_visible(type);
            },
        });
    }

    callbacks.emplace_back("Velocity X", physics_field(&LayerPhysics::velocity_x, -2.0f, 2.0f));
    callbacks.emplace_back("Velocity Y", physics_field(&LayerPhysics::velocity_y, -2.0f, 2.0f));
    callbacks.emplace_back("Force", physics_field(&LayerPhysics::force, 0.0f, 1.0f));
    callbacks.emplace_back("Central Elongation", physics_field(&LayerPhysics::central_elongation, 0.0f, 6.0f));
    callbacks.emplace_back("Particle Elongation", physics_field(&LayerPhysics::particle_elongation, 0.0f, 6.0f));
    callbacks.emplace_back("Time Elongation", physics_field(&LayerPhysics::time_elongation, 0.0f, 6.0f));
    callbacks.emplace_back("Noise Amplitude", physics_field(&LayerPhysics::noise_amplitude, 0.0f, 1.0f));
    callbacks.emplace_back("Velocity Roughness", physics_field(&LayerPhysics::velocity_roughness, 0.0f, 2.0f));
    callbacks.emplace_back("Noise Frequency", physics_field(&LayerPhysics::noise_frequency, 1.0f, 60.0f, true));
    return callbacks;
}

void SplatterController::render_ui_callbacks(const std::vector<UICallback>& callbacks) {
    for (const auto& callback : callbacks) {
        const char* label = callback.field_name.c_str();
        switch (callback.get_callback_type()) {
            case CallbackType::Continuous: {
                if (auto* cb = callback.as<ContinuousCallback>()) {
                    float value = cb->getter();
                    int flags = cb->logarithmic ? ImGuiSliderFlags_Logarithmic : 0;
                    if (ImGui::SliderFloat(label, &value, cb->min, cb->max, "%.3f", flags)) {
                        cb->setter(value);
                    }
                }
                break;
            }
            case CallbackType::Discrete: {
                if (auto* cb = callback.as<DiscreteCallback>()) {
                    int value = cb->getter();
                    if (ImGui::SliderInt(label, &value, cb->min, cb->max)) {
                        cb->setter(value);
                    }
                }
                break;
            }
            case CallbackType::Toggle: {
                if (auto* cb = callback.as<ToggleCallback>()) {
                    bool value = cb->getter();
                    if (ImGui::Checkbox(label, &value)) {
                        cb->setter(value);
                    }
                }
                break;
            }
            case CallbackType::Color: {
                if (auto* cb = callback.as<ColorCallback>()) {
                    glm::vec3 value = cb->getter();
                    if (ImGui::ColorEdit3(label, &value.x)) {
                        cb->setter(value);
                    }
                }
                break;
            }
            case CallbackType::Choice: {
                if (auto* cb = callback.as<ChoiceCallback>()) {
                    int value = cb->getter();
                    const int count = static_cast<int>(cb->options.size());
                    const char* preview = value >= 0 && value < count ? cb->options[value].c_str() : "";
                    if (ImGui::BeginCombo(label, preview)) {
                        for (int i = 0; i < count; i++) {
                            if (ImGui::Selectable(cb->options[i].c_str(), i == value)) {
                                cb->setter(i);
                            }
                        }
                        ImGui::EndCombo();
                    }
                }
                break;
            }
        }
    }
}

void SplatterController::render_layer_panel(const LayerTemplate& layer) {
    const auto& name = layer.name;
    const auto label = fmt::format("{} (z {}, {} dots)###layer_{}", layer.display_name,
                                   static_cast<int>(layer.z_index), m_engine.store().count(name), name);
    if (!ImGui::CollapsingHeader(label.c_str())) {
        return;
    }

    ImGui::PushID(name.c_str());
    render_ui_callbacks(layer_callbacks(name));

    if (ImGui::Button("Lower")) {
        const auto z = static_cast<std::size_t>(layer.z_index);
        m_engine.layers().move_to(name, z == 0 ? 0 : z - 1);
    }
    ImGui::SameLine();
    if (ImGui::Button("Raise")) {
        m_engine.layers().move_to(name, static_cast<std::size_t>(layer.z_index) + 1);
    }
    ImGui::PopID();
}

void SplatterController::render_ui() {
    ImGui::Begin("Ink Splatter");

    ImGui::Text("Particles: %zu / %zu", m_engine.store().total_count(),
                m_engine.settings().limits.max_total_particles);
    ImGui::Text("Click: splat   C: clear   R: toggle seeded");
    if (!m_renderer->field_available()) {
        ImGui::TextColored(ImVec4(0.8f, 0.1f, 0.1f, 1.0f), "Field shader unavailable, see log");
    }

    if (ImGui::Button("Clear")) {
        m_engine.clear();
    }
    ImGui::SameLine();
    if (ImGui::Button("Copy Settings")) {
        ImGui::SetClipboardText(m_engine.export_settings().c_str());
    }
    ImGui::SameLine();
    if (ImGui::Button("Paste Settings")) {
        if (const char* text = ImGui::GetClipboardText()) {
            // Failures are logged by the engine and leave the settings untouched
            [[maybe_unused]] auto result = m_engine.import_settings(text);
        }
    }

    ImGui::Separator();
    auto& settings = m_engine.settings();
    if (ImGui::Checkbox("Seeded Randomness", &settings.use_seeded_rng)) {
        request_redraw();
    }
    int seed = static_cast<int>(std::min<uint64_t>(settings.rng_seed, INT32_MAX));
    if (ImGui::InputInt("Seed", &seed)) {
        settings.rng_seed = static_cast<uint64_t>(std::max(seed, 0));
    }

    if (ImGui::TreeNode("Dot Types")) {
        for (auto type : ALL_PARTICLE_TYPES) {
            auto& params = settings.dots[type];
            ImGui::PushID(static_cast<int>(type));
            ImGui::Checkbox(std::string(to_string(type)).c_str(), &params.enabled);
            render_ui_callbacks(m_engine.dot_type_callbacks(type));
            ImGui::DragFloatRange2("Radius", &params.radius_min, &params.radius_max, 0.0005f, 0.0f, 0.5f, "%.4f");
            ImGui::PopID();
        }
        ImGui::TreePop();
    }

    ImGui::Separator();
    for (const auto* layer : m_engine.layers().by_z_order()) {
        render_layer_panel(*layer);
    }

    if (ImGui::TreeNode("Buffer Pool")) {
        const auto metrics = m_pool->metrics();
        ImGui::Text("Borrows: %llu  Hit rate: %.1f%%", static_cast<unsigned long long>(metrics.total_borrows),
                    metrics.hit_rate() * 100.0);
        ImGui::Text("Pooled: %zu buffers, %.2f MiB", metrics.pooled_buffers,
                    static_cast<double>(metrics.memory_footprint) / (1024.0 * 1024.0));
        ImGui::Text("Outstanding: %zu  Failed: %llu", metrics.outstanding,
                    static_cast<unsigned long long>(metrics.failed_allocations));
        ImGui::Text("Pressure: %s", std::string(to_string(metrics.pressure)).c_str());
        const auto frames = m_frame_monitor.stats();
        ImGui::Text("Frame: %.2f ms  Render: %.2f ms", frames.frame_time * 1000.0, frames.render_time * 1000.0);
        ImGui::Text("Dropped frames: %llu / %llu", static_cast<unsigned long long>(frames.dropped_frames),
                    static_cast<unsigned long long>(frames.frames));
        ImGui::TreePop();
    }

    ImGui::End();
}

std::vector<LayerDraw> SplatterController::collect_layer_draws() const {
    const auto extent = m_window->extent();
    const float aspect = extent.height > 0
        ? static_cast<float>(extent.width) / static_cast<float>(extent.height)
        : 1.0f;

    std::vector<LayerDraw> draws;
    for (const auto* layer : m_engine.layers().by_z_order()) {
        if (!layer->rendering.enabled) {
            continue;
        }
        auto snapshot = m_engine.render_snapshot(layer->name);
        auto uniforms = field::make_uniforms(*layer, *snapshot, m_engine.settings().influence_threshold, aspect);
        draws.push_back(LayerDraw{
            .snapshot = std::move(snapshot),
            .uniforms = uniforms,
            .blend = layer->rendering.blend,
        });
    }
    return draws;
}

void SplatterController::sample_memory_pressure() {
    if (++m_frame_counter % PRESSURE_SAMPLE_INTERVAL != 0) {
        return;
    }
    const auto metrics = m_pool->metrics();
    const auto frames = m_frame_monitor.stats();
    Logger::instance().debug("Frame {:.2f} ms, render {:.2f} ms, {} of {} frames dropped, pool hit rate {:.1f}%",
                             frames.frame_time * 1000.0, frames.render_time * 1000.0, frames.dropped_frames,
                             frames.frames, metrics.hit_rate() * 100.0);
    const auto level = BufferPool::classify_footprint(metrics.memory_footprint);
    if (level != metrics.pressure) {
        m_pool->adapt_to_memory_pressure(level);
    }
}

std::expected<void, std::string> SplatterController::run() {
    Logger::instance().info("Starting main loop...");

    auto device = m_context->device();
    std::vector<vk::Semaphore> image_available_sems;
    auto create_acquire_semaphores = [&]() -> std::expected<void, std::string> {
        for (auto& sem : image_available_sems) {
            device.destroySemaphore(sem);
        }
        image_available_sems.clear();
        for (uint32_t i = 0; i < m_window->image_count(); i++) {
            auto sem_res = device.createSemaphore({});
            CHECK_VK_RESULT(sem_res, "Failed to create image available semaphore: {}");
            image_available_sems.push_back(sem_res.value);
        }
        return {};
    };
    if (auto result = create_acquire_semaphores(); !result) {
        return result;
    }

    const auto& paper = m_config.paper_color;
    const vk::ClearColorValue clear_color(std::array<float, 4>{paper.r, paper.g, paper.b, 1.0f});

    uint32_t semaphore_index = 0;
    bool ui_active = false;
    std::expected<void, std::string> outcome;

    while (!m_window->should_close()) {
        const bool debounce_pending = m_engine.snapshot_dirty() && !visibility_settled();
        if (debounce_pending) {
            const auto remaining = VISIBILITY_DEBOUNCE - (std::chrono::steady_clock::now() - m_visibility_edit_time);
            glfwWaitEventsTimeout(std::max(std::chrono::duration<double>(remaining).count(), 0.001));
            m_frame_monitor.resume();
        } else if (!m_redraw_pending.load(std::memory_order_acquire) && !ui_active) {
            glfwWaitEvents();
            m_frame_monitor.resume();
        } else {
            glfwPollEvents();
        }
        m_redraw_pending.store(false, std::memory_order_release);

        if (visibility_settled()) {
            m_engine.rebuild_snapshot();
        }

        ImGui_ImplVulkan_NewFrame();
        ImGui_ImplGlfw_NewFrame();
        ImGui::NewFrame();
        render_ui();
        ImGui::Render();
        ui_active = ImGui::IsAnyItemActive();

        auto acquire_result = m_window->acquire_next_image(image_available_sems[semaphore_index]);
        if (!acquire_result) {
            outcome = std::unexpected(acquire_result.error());
            break;
        }
        if (!acquire_result->has_value()) {
            // Swapchain is stale or was just recreated, the image count may have changed
            if (auto result = m_renderer->handle_swapchain_recreation(m_window->image_count()); !result) {
                outcome = std::unexpected(result.error());
                break;
            }
            if (auto result = create_acquire_semaphores(); !result) {
                outcome = std::unexpected(result.error());
                break;
            }
            semaphore_index = 0;
            m_redraw_pending.store(true, std::memory_order_release);
            continue;
        }
        const uint32_t image_index = **acquire_result;

        const auto draws = collect_layer_draws();
        FrameTarget target{
            .image_index = image_index,
            .image_available_semaphore = image_available_sems[semaphore_index],
            .framebuffer = m_window->framebuffer(image_index),
            .extent = m_window->extent(),
            .render_pass = m_window->render_pass(),
            .clear_color = clear_color,
            .imgui_draw_data = ImGui::GetDrawData(),
        };

        m_frame_monitor.begin_render(FrameMonitor::Clock::now());
        auto render_result = m_renderer->render_frame(target, draws);
        if (!render_result) {
            outcome = std::unexpected(fmt::format("Frame failed: {}", render_result.error()));
            break;
        }
        m_frame_monitor.end_render(FrameMonitor::Clock::now());

        auto present_result = m_window->present(m_context->graphics_queue(), *render_result, image_index);
        if (!present_result) {
            outcome = std::unexpected(present_result.error());
            break;
        }
        if (!*present_result) {
            m_redraw_pending.store(true, std::memory_order_release);
        }
        m_frame_monitor.frame_tick(FrameMonitor::Clock::now());

        sample_memory_pressure();
        semaphore_index = (semaphore_index + 1) % image_available_sems.size();
    }

    if (auto result = device.waitIdle(); result != vk::Result::eSuccess) {
        Logger::instance().warn("waitIdle at shutdown failed: {}", vk::to_string(result));
    }
    for (auto& sem : image_available_sems) {
        device.destroySemaphore(sem);
    }

    Logger::instance().info("Shutdown complete");
    return outcome;
}

void SplatterController::cleanup() {
    m_engine.set_redraw_request(nullptr);

    if (m_context && m_context->device()) {
        if (auto result = m_context->device().waitIdle(); result != vk::Result::eSuccess) {
            Logger::instance().warn("waitIdle during cleanup failed: {}", vk::to_string(result));
        }
    }

    if (m_imgui_initialized) {
        ImGui_ImplVulkan_Shutdown();
        ImGui_ImplGlfw_Shutdown();
        ImGui::DestroyContext();
        m_imgui_initialized = false;
    }
    if (m_imgui_descriptor_pool) {
        m_context->device().destroyDescriptorPool(m_imgui_descriptor_pool);
        m_imgui_descriptor_pool = nullptr;
    }

    // Leases go back to the pool before the pool and the allocator go away
    m_renderer.reset();
    m_pool.reset();
    m_allocator.reset();
    m_window.reset();
    m_context.reset();
    glfwTerminate();
}

} // namespace splat
