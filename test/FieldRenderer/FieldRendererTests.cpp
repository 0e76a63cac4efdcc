#include <catch2/catch_test_macros.hpp>

#include <splat/BufferPool.hpp>
#include <splat/Logger.hpp>
#include <splat/VulkanBufferAllocator.hpp>
#include <splat/VulkanContext.hpp>
#include <splat/renderer/FieldRenderer.hpp>

#include <array>
#include <atomic>

using namespace splat;

namespace
{

constexpr vk::Format TARGET_FORMAT = vk::Format::eR8G8B8A8Unorm;
constexpr vk::Extent2D TARGET_EXTENT{64, 64};

std::unique_ptr<VulkanContext> headless_context()
{
	auto ctx = VulkanContext::create(ContextConfig{.application_name = "Renderer Test", .presentation = false});
	if (!ctx)
	{
		FAIL("Could not create a headless context: " << ctx.error());
	}
	return std::move(ctx.value());
}

/// Device that has run out of memory
class ExhaustedAllocator : public BufferAllocator
{
public:
	std::optional<GpuBuffer> allocate(std::size_t, BufferUsage) override
	{
		attempts.fetch_add(1);
		return std::nullopt;
	}

	void release(const GpuBuffer&) override {}

	std::atomic<int> attempts{0};
};

/// Color image, render pass and framebuffer standing in for a swapchain image
struct OffscreenTarget
{
	vk::Device device;
	vk::Image image;
	vk::DeviceMemory memory;
	vk::ImageView view;
	vk::RenderPass render_pass;
	vk::Framebuffer framebuffer;

	~OffscreenTarget()
	{
		device.destroyFramebuffer(framebuffer);
		device.destroyRenderPass(render_pass);
		device.destroyImageView(view);
		device.destroyImage(image);
		device.freeMemory(memory);
	}
};

std::unique_ptr<OffscreenTarget> make_offscreen_target(const VulkanContext& ctx)
{
	auto target = std::make_unique<OffscreenTarget>();
	target->device = ctx.device();
	auto device = ctx.device();

	auto image_info = vk::ImageCreateInfo()
		.setImageType(vk::ImageType::e2D)
		.setFormat(TARGET_FORMAT)
		.setExtent(vk::Extent3D(TARGET_EXTENT.width, TARGET_EXTENT.height, 1))
		.setMipLevels(1)
		.setArrayLayers(1)
		.setSamples(vk::SampleCountFlagBits::e1)
		.setTiling(vk::ImageTiling::eOptimal)
		.setUsage(vk::ImageUsageFlagBits::eColorAttachment)
		.setInitialLayout(vk::ImageLayout::eUndefined);
	auto image_res = device.createImage(image_info);
	REQUIRE(image_res.result == vk::Result::eSuccess);
	target->image = image_res.value;

	const auto requirements = device.getImageMemoryRequirements(target->image);
	auto memory_type = ctx.find_memory_type(requirements.memoryTypeBits, vk::MemoryPropertyFlagBits::eDeviceLocal);
	REQUIRE(memory_type.has_value());
	auto memory_res = device.allocateMemory(
		vk::MemoryAllocateInfo().setAllocationSize(requirements.size).setMemoryTypeIndex(*memory_type));
	REQUIRE(memory_res.result == vk::Result::eSuccess);
	target->memory = memory_res.value;
	REQUIRE(device.bindImageMemory(target->image, target->memory, 0) == vk::Result::eSuccess);

	auto view_info = vk::ImageViewCreateInfo()
		.setImage(target->image)
		.setViewType(vk::ImageViewType::e2D)
		.setFormat(TARGET_FORMAT)
		.setSubresourceRange(vk::ImageSubresourceRange(vk::ImageAspectFlagBits::eColor, 0, 1, 0, 1));
	auto view_res = device.createImageView(view_info);
	REQUIRE(view_res.result == vk::Result::eSuccess);
	target->view = view_res.value;

	auto attachment = vk::AttachmentDescription()
		.setFormat(TARGET_FORMAT)
		.setSamples(vk::SampleCountFlagBits::e1)
		.setLoadOp(vk::AttachmentLoadOp::eClear)
		.setStoreOp(vk::AttachmentStoreOp::eStore)
		.setStencilLoadOp(vk::AttachmentLoadOp::eDontCare)
		.setStencilStoreOp(vk::AttachmentStoreOp::eDontCare)
		.setInitialLayout(vk::ImageLayout::eUndefined)
		.setFinalLayout(vk::ImageLayout::eColorAttachmentOptimal);
	auto color_ref = vk::AttachmentReference(0, vk::ImageLayout::eColorAttachmentOptimal);
	auto subpass = vk::SubpassDescription()
		.setPipelineBindPoint(vk::PipelineBindPoint::eGraphics)
		.setColorAttachments(color_ref);
	auto render_pass_res = device.createRenderPass(
		vk::RenderPassCreateInfo().setAttachments(attachment).setSubpasses(subpass));
	REQUIRE(render_pass_res.result == vk::Result::eSuccess);
	target->render_pass = render_pass_res.value;

	auto framebuffer_info = vk::FramebufferCreateInfo()
		.setRenderPass(target->render_pass)
		.setAttachments(target->view)
		.setWidth(TARGET_EXTENT.width)
		.setHeight(TARGET_EXTENT.height)
		.setLayers(1);
	auto framebuffer_res = device.createFramebuffer(framebuffer_info);
	REQUIRE(framebuffer_res.result == vk::Result::eSuccess);
	target->framebuffer = framebuffer_res.value;

	return target;
}

LayerDraw visible_layer(uint32_t particle_count)
{
	auto snapshot = std::make_shared<RenderSnapshot>();
	snapshot->particles.resize(particle_count);
	snapshot->count = particle_count;
	snapshot->visibility_mask = 0xF;

	LayerDraw draw;
	draw.snapshot = std::move(snapshot);
	draw.uniforms = FieldUniforms{
		.color = glm::vec3(0.1f, 0.1f, 0.1f),
		.count = particle_count,
		.visibility_mask = 0xF,
		.influence_threshold = 1.0f,
		.aspect_ratio = 1.0f,
		.opacity = 1.0f,
		.noise_amplitude = 0.0f,
		.velocity_roughness = 0.0f,
		.noise_frequency = 10.0f,
	};
	return draw;
}

} // namespace

TEST_CASE("Frames still render when the pool cannot allocate", "[renderer][vulkan]")
{
	Logger::instance().set_console_level(spdlog::level::err);
	auto ctx = headless_context();
	auto target = make_offscreen_target(*ctx);

	ExhaustedAllocator exhausted;
	BufferPool pool(exhausted);
	VulkanBufferAllocator vulkan_allocator(*ctx);

	auto renderer = FieldRenderer::create(*ctx, target->render_pass, 1, pool, vulkan_allocator);
	REQUIRE(renderer.has_value());
	REQUIRE((*renderer)->field_available());

	const std::array layers = {visible_layer(16), visible_layer(4)};
	const FrameTarget frame{
		.image_index = 0,
		.image_available_semaphore = nullptr,
		.framebuffer = target->framebuffer,
		.extent = TARGET_EXTENT,
		.render_pass = target->render_pass,
		.clear_color = vk::ClearColorValue(std::array<float, 4>{0.96f, 0.94f, 0.89f, 1.0f}),
	};

	auto result = (*renderer)->render_frame(frame, layers);
	REQUIRE(result.has_value());
	REQUIRE(*result);
	(*renderer)->wait_idle();

	const auto metrics = pool.metrics();
	REQUIRE(exhausted.attempts.load() > 0);
	REQUIRE(metrics.failed_allocations > 0);
	REQUIRE(metrics.outstanding == 0);
	REQUIRE(vulkan_allocator.live_buffers() == 0);
}
