#include <morph/MorphApplication.hpp>
#include <morph/Logger.hpp>
#include <morph/ShapeLibrary.hpp>
#include <imgui.h>
#include <imgui_impl_glfw.h>
#include <imgui_impl_vulkan.h>
#include <chrono>
#include <format>

namespace morph {

// GLFW callback wrappers
void glfw_key_callback(GLFWwindow* window, int key, [[maybe_unused]] int scancode, int action, [[maybe_unused]] int mods) {
    auto* app = static_cast<MorphApplication*>(glfwGetWindowUserPointer(window));
    if (!app || action != GLFW_PRESS) return;

    // Let ImGui have the keyboard while a widget is being edited
    if (ImGui::GetCurrentContext() && ImGui::GetIO().WantCaptureKeyboard) return;

    if (key == GLFW_KEY_TAB) {
        app->toggle_mouse_capture();
    } else if (key == GLFW_KEY_SPACE) {
        if (app->m_controller) {
            app->m_controller->set_auto_advance(!app->m_controller->auto_advance());
        }
    } else if (key >= GLFW_KEY_1 && key <= GLFW_KEY_9) {
        auto index = static_cast<std::size_t>(key - GLFW_KEY_1);
        if (auto result = app->morph_to(index); !result) {
            Logger::instance().warn("Ignoring key {}: {}", index + 1, result.error().describe());
        }
    }
}

void glfw_mouse_callback(GLFWwindow* window, double xpos, double ypos) {
    auto* app = static_cast<MorphApplication*>(glfwGetWindowUserPointer(window));
    if (!app || !app->m_camera) return;

    if (!app->m_mouse_captured) return;

    if (app->m_first_mouse) {
        app->m_last_mouse_x = xpos;
        app->m_last_mouse_y = ypos;
        app->m_first_mouse = false;
        return;
    }

    double xoffset = xpos - app->m_last_mouse_x;
    double yoffset = ypos - app->m_last_mouse_y;
    app->m_last_mouse_x = xpos;
    app->m_last_mouse_y = ypos;

    app->m_camera->handle_mouse_movement(xoffset, yoffset);
}

void glfw_scroll_callback(GLFWwindow* window, [[maybe_unused]] double xoffset, double yoffset) {
    auto* app = static_cast<MorphApplication*>(glfwGetWindowUserPointer(window));
    if (!app || !app->m_camera) return;

    if (ImGui::GetCurrentContext() && ImGui::GetIO().WantCaptureMouse) return;

    app->m_camera->handle_mouse_scroll(yoffset);
}

void glfw_framebuffer_size_callback(GLFWwindow* window, [[maybe_unused]] int width, [[maybe_unused]] int height) {
    auto* app = static_cast<MorphApplication*>(glfwGetWindowUserPointer(window));
    if (!app || !app->m_window) return;

    // The swapchain is rebuilt on the next acquire, the camera follows it there
    app->m_window->mark_resize_needed();
}

MorphApplication::MorphApplication(const AppConfig& config)
    : m_config(config)
    , m_random(config.seed)
    , m_imgui_descriptor_pool(nullptr)
{}

MorphApplication::~MorphApplication() {
    cleanup();
}

std::expected<std::unique_ptr<MorphApplication>, std::string> MorphApplication::create(const AppConfig& config) {
    auto app = std::unique_ptr<MorphApplication>(new MorphApplication(config));

    if (auto result = app->initialize(); !result) {
        return std::unexpected(result.error());
    }

    return app;
}

std::expected<void, std::string> MorphApplication::initialize() {
    Logger::instance().info("Initializing ParticleMorph (seed {})...", m_random.seed());

    // GLFW must be up before the instance asks it for surface extensions
    if (auto result = Window::init_glfw(); !result) {
        return std::unexpected(std::format("Failed to initialize GLFW: {}", result.error()));
    }

    auto context_result = VulkanContext::create(m_config.window.title);
    if (!context_result) {
        return std::unexpected(std::format("Failed to create Vulkan context: {}", context_result.error()));
    }
    m_context = std::move(*context_result);

    auto window_result = Window::create(*m_context, m_config.window);
    if (!window_result) {
        return std::unexpected(std::format("Failed to create window: {}", window_result.error()));
    }
    m_window = std::move(*window_result);

    auto extent = m_window->extent();
    m_camera = std::make_unique<Camera3D>(extent.width, extent.height, m_config.camera);

    // Input callbacks go in before ImGui so its GLFW backend chains to them
    glfwSetWindowUserPointer(m_window->handle(), this);
    glfwSetKeyCallback(m_window->handle(), glfw_key_callback);
    glfwSetCursorPosCallback(m_window->handle(), glfw_mouse_callback);
    glfwSetScrollCallback(m_window->handle(), glfw_scroll_callback);
    glfwSetFramebufferSizeCallback(m_window->handle(), glfw_framebuffer_size_callback);

    if (auto result = setup_imgui(); !result) {
        return std::unexpected(result.error());
    }

    if (auto result = create_image_available_semaphores(); !result) {
        return std::unexpected(result.error());
    }

    Logger::instance().info("ParticleMorph initialized successfully");
    return {};
}

std::expected<void, std::string> MorphApplication::setup_imgui() {
    IMGUI_CHECKVERSION();
    ImGui::CreateContext();
    ImGui::GetIO();
    ImGui::StyleColorsDark();

    std::vector<vk::DescriptorPoolSize> pool_sizes = {
        {vk::DescriptorType::eSampler, 1000},
        {vk::DescriptorType::eCombinedImageSampler, 1000},
        {vk::DescriptorType::eSampledImage, 1000},
        {vk::DescriptorType::eUniformBuffer, 1000},
        {vk::DescriptorType::eStorageBuffer, 1000}
    };

    auto imgui_pool_info = vk::DescriptorPoolCreateInfo()
        .setFlags(vk::DescriptorPoolCreateFlagBits::eFreeDescriptorSet)
        .setMaxSets(1000)
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
    init_info.CheckVkResultFn = [](VkResult result) {
        if (result != VK_SUCCESS)
            Logger::instance().error("ImGui Vulkan backend: {}", vk::to_string(static_cast<vk::Result>(result)));
    };

    ImGui_ImplVulkan_Init(&init_info);
    ImGui_ImplVulkan_CreateFontsTexture();

    return {};
}

std::expected<void, std::string> MorphApplication::create_image_available_semaphores() {
    for (uint32_t i = 0; i < m_window->image_count(); i++) {
        auto sem_res = m_context->device().createSemaphore({});
        CHECK_VK_RESULT(sem_res, "Failed to create image available semaphore: {}");
        m_image_available_semaphores.push_back(sem_res.value);
    }
    return {};
}

void MorphApplication::destroy_image_available_semaphores() {
    for (auto& sem : m_image_available_semaphores) {
        m_context->device().destroySemaphore(sem);
    }
    m_image_available_semaphores.clear();
}

std::expected<void, std::string> MorphApplication::load_shapes(std::vector<ShapeInput> shapes) {
    auto particles = ParticleSet::create(std::move(shapes), m_random);
    if (!particles) {
        return std::unexpected(particles.error().describe());
    }

    // Nothing in flight may still read the buffers that are about to go away
    auto idle_res = m_context->device().waitIdle();
    CHECK_VK_RESULT_VOID(idle_res, "Failed to wait for device idle: {}");

    auto buffers = VariantBuffers::create(*m_context, *particles);
    if (!buffers) {
        return std::unexpected(std::format("Failed to upload particles: {}", buffers.error()));
    }

    if (m_renderer) {
        m_renderer->set_variant_buffers(**buffers);
    } else {
        auto renderer = ParticleMorphRenderer::create(*m_context, m_window->render_pass(), **buffers, m_config.render);
        if (!renderer) {
            return std::unexpected(std::format("Failed to create renderer: {}", renderer.error()));
        }
        if (auto result = (*renderer)->handle_swapchain_recreation(m_window->image_count()); !result) {
            return std::unexpected(result.error());
        }
        m_renderer = std::move(*renderer);
    }
    m_buffers = std::move(*buffers);

    // Keep whatever timing the user dialled in for the previous set
    MorphConfig morph_config = m_controller
        ? MorphConfig{m_controller->duration(), m_controller->auto_advance_interval(), m_controller->auto_advance()}
        : m_config.morph;
    m_controller = std::make_unique<MorphController>(particles->variant_count(), morph_config);
    m_controller->add_listener([names = particles->names()](const MorphEvent& event) {
        std::visit(overloaded{
            [&](const TransitionStarted& e) {
                Logger::instance().debug("Morphing '{}' -> '{}'", names[e.from], names[e.to]);
            },
            [&](const TransitionFinished& e) {
                Logger::instance().debug("Morph to '{}' finished", names[e.index]);
            }
        }, event);
    });

    m_particles.emplace(std::move(*particles));
    Logger::instance().info("Loaded {} shapes, {} particles each", m_particles->variant_count(), m_particles->max_count());
    return {};
}

std::expected<void, std::string> MorphApplication::load_default_shapes() {
    return load_shapes(make_default_shapes(m_random, m_config.particle_scale));
}

std::expected<void, InvalidVariantIndexError> MorphApplication::morph_to(std::size_t index) {
    if (!m_controller) {
        return std::unexpected(InvalidVariantIndexError{index, 0});
    }
    return m_controller->morph_to(index);
}

std::expected<void, std::string> MorphApplication::morph_to(std::string_view name) {
    auto index = m_particles ? m_particles->find(name) : std::nullopt;
    if (!index) {
        return std::unexpected(std::format("No shape named '{}'", name));
    }
    if (auto result = morph_to(*index); !result) {
        return std::unexpected(result.error().describe());
    }
    return {};
}

void MorphApplication::toggle_mouse_capture() {
    m_mouse_captured = !m_mouse_captured;
    if (m_mouse_captured) {
        glfwSetInputMode(m_window->handle(), GLFW_CURSOR, GLFW_CURSOR_DISABLED);
        m_first_mouse = true;  // Reset to avoid jump
    } else {
        glfwSetInputMode(m_window->handle(), GLFW_CURSOR, GLFW_CURSOR_NORMAL);
    }
}

glm::mat4 MorphApplication::model_matrix() const {
    float angle = m_elapsed * m_renderer->config().rotation_speed;
    glm::mat4 model(1.0f);
    model = glm::rotate(model, angle, glm::vec3(1.0f, 0.0f, 0.0f));
    model = glm::rotate(model, angle, glm::vec3(0.0f, 1.0f, 0.0f));
    model = glm::rotate(model, angle, glm::vec3(0.0f, 0.0f, 1.0f));
    return model;
}

void MorphApplication::render_ui_callbacks(const std::vector<UICallback>& callbacks) {
    for (const auto& callback : callbacks) {
        switch (callback.get_callback_type()) {
            case CallbackType::Continuous: {
                if (auto* cb = callback.as_continuous()) {
                    float value = cb->getter();
                    int flags = cb->logarithmic ? ImGuiSliderFlags_Logarithmic : 0;
                    if (ImGui::SliderFloat(callback.field_name.c_str(), &value, cb->min, cb->max, "%.3f", flags)) {
                        cb->setter(value);
                    }
                }
                break;
            }
            case CallbackType::Discrete: {
                if (auto* cb = callback.as_discrete()) {
                    int value = cb->getter();
                    if (ImGui::SliderInt(callback.field_name.c_str(), &value, cb->min, cb->max)) {
                        cb->setter(value);
                    }
                }
                break;
            }
            case CallbackType::Toggle: {
                if (auto* cb = callback.as_toggle()) {
                    bool value = cb->getter();
                    if (ImGui::Checkbox(callback.field_name.c_str(), &value)) {
                        cb->setter(value);
                    }
                }
                break;
            }
            case CallbackType::Color: {
                if (auto* cb = callback.as_color()) {
                    glm::vec3 value = cb->getter();
                    if (ImGui::ColorEdit3(callback.field_name.c_str(), &value.x)) {
                        cb->setter(value);
                    }
                }
                break;
            }
            case CallbackType::Readout: {
                if (auto* cb = callback.as_readout()) {
                    float value = cb->getter();
                    if (cb->max > cb->min) {
                        float fraction = (value - cb->min) / (cb->max - cb->min);
                        ImGui::ProgressBar(fraction, ImVec2(-1.0f, 0.0f), std::format("{}: {:.2f}", callback.field_name, value).c_str());
                    } else {
                        ImGui::Text("%s: %.3f", callback.field_name.c_str(), value);
                    }
                }
                break;
            }
            case CallbackType::Action: {
                if (auto* cb = callback.as_action()) {
                    if (ImGui::Button(callback.field_name.c_str())) {
                        cb->trigger();
                    }
                }
                break;
            }
        }
    }
}

void MorphApplication::render_ui() {
    ImGui::Begin("Particle Morph");

    ImGui::Text("Particles: %zu", m_particles->max_count());
    ImGui::Text("Seed: %u", m_random.seed());

    ImGui::Separator();
    ImGui::Text("Shapes:");
    for (std::size_t i = 0; i < m_particles->variant_count(); i++) {
        const auto& variant = m_particles->variant(i);
        bool shown = i == m_controller->current_index() || i == m_controller->target_index();
        if (shown) {
            ImGui::Text("  %zu: %s", i + 1, variant.name.c_str());
        } else {
            ImGui::TextDisabled("  %zu: %s", i + 1, variant.name.c_str());
        }
    }

    ImGui::Separator();
    ImGui::Text("Morph:");
    auto names = m_particles->names();
    render_ui_callbacks(m_controller->get_ui_callbacks(names));

    ImGui::Separator();
    ImGui::Text("Rendering:");
    render_ui_callbacks(m_renderer->get_ui_callbacks());

    ImGui::Separator();
    ImGui::Text("Controls:");
    ImGui::Text("  1-9: Morph to shape");
    ImGui::Text("  SPACE: Toggle auto advance");
    ImGui::Text("  TAB: Toggle mouse capture");
    ImGui::Text("  Mouse: Orbit (when captured)");
    ImGui::Text("  Scroll: Zoom in/out");

    ImGui::Separator();
    ImGui::Text("Distance: %.2f", m_camera->distance());
    ImGui::Text("Azimuth: %.1f  Elevation: %.1f", m_camera->azimuth(), m_camera->elevation());
    ImGui::Text("Mouse: %s", m_mouse_captured ? "Captured" : "Free");
    if (ImGui::Button("Reset Camera")) {
        m_camera->reset();
    }

    ImGui::Text("FPS: %.1f", ImGui::GetIO().Framerate);
    ImGui::End();
}

std::expected<void, std::string> MorphApplication::handle_swapchain_recreation() {
    if (auto result = m_renderer->handle_swapchain_recreation(m_window->image_count()); !result) {
        return result;
    }

    // The renderer waited for the device, so the semaphores are free
    destroy_image_available_semaphores();
    if (auto result = create_image_available_semaphores(); !result) {
        return result;
    }

    auto extent = m_window->extent();
    m_camera->handle_resize(extent.width, extent.height);
    return {};
}

std::expected<void, std::string> MorphApplication::run() {
    if (!m_controller || !m_renderer) {
        return std::unexpected("No shapes loaded - call load_shapes() before run()");
    }

    Logger::instance().info("Starting main loop...");

    auto last_frame_time = std::chrono::high_resolution_clock::now();
    uint32_t semaphore_index = 0;

    while (!m_window->should_close()) {
        auto current_frame_time = std::chrono::high_resolution_clock::now();
        float delta_time = std::chrono::duration<float>(current_frame_time - last_frame_time).count();
        last_frame_time = current_frame_time;

        glfwPollEvents();

        ImGui_ImplVulkan_NewFrame();
        ImGui_ImplGlfw_NewFrame();
        ImGui::NewFrame();

        render_ui();

        ImGui::Render();

        // Requests from keys and the panel are applied here, once per frame
        m_controller->tick(delta_time);
        m_elapsed += delta_time;

        semaphore_index %= static_cast<uint32_t>(m_image_available_semaphores.size());
        auto image_available = m_image_available_semaphores[semaphore_index];
        auto acquire_result = m_window->acquire_next_image(image_available);

        if (!acquire_result) {
            // Swapchain was recreated
            if (auto result = handle_swapchain_recreation(); !result) {
                return result;
            }
            semaphore_index = 0;
            continue;
        }

        uint32_t image_index = *acquire_result;

        FrameRenderInfo render_info{
            .image_index = image_index,
            .current_frame = m_current_frame,
            .image_available_semaphore = image_available,
            .framebuffer = m_window->framebuffer(image_index),
            .extent = m_window->extent(),
            .camera = *m_camera,
            .morph = m_controller->snapshot(),
            .model = model_matrix(),
            .imgui_draw_data = ImGui::GetDrawData()
        };

        auto render_finished_sem = m_renderer->render_frame(render_info, m_context->graphics_queue());
        if (!render_finished_sem) {
            return std::unexpected(std::format("Failed to render frame: {}", render_finished_sem.error()));
        }

        if (!m_window->present(m_context->graphics_queue(), *render_finished_sem, image_index)) {
            Logger::instance().debug("Present reported an outdated swapchain, recreating on next acquire");
        }

        m_current_frame = (m_current_frame + 1) % ParticleMorphRenderer::MAX_FRAMES_IN_FLIGHT;
        semaphore_index = (semaphore_index + 1) % static_cast<uint32_t>(m_image_available_semaphores.size());
    }

    auto idle_res = m_context->device().waitIdle();
    CHECK_VK_RESULT_VOID(idle_res, "Failed to wait for device idle: {}");

    Logger::instance().info("Shutdown complete");
    return {};
}

void MorphApplication::cleanup() {
    if (m_context && m_context->device()) {
        if (auto result = m_context->device().waitIdle(); result != vk::Result::eSuccess)
            Logger::instance().error("waitIdle failed during cleanup: {}", vk::to_string(result));
    }

    // Renderer and buffers use the device, release them before the window and context
    m_renderer.reset();
    m_buffers.reset();
    m_controller.reset();

    if (m_imgui_descriptor_pool) {
        ImGui_ImplVulkan_Shutdown();
        ImGui_ImplGlfw_Shutdown();
        ImGui::DestroyContext();

        m_context->device().destroyDescriptorPool(m_imgui_descriptor_pool);
        m_imgui_descriptor_pool = nullptr;
    }

    if (m_context) {
        destroy_image_available_semaphores();
    }

    m_window.reset();
    m_context.reset();
    glfwTerminate();
}

} // namespace morph
