#include <splat/Logger.hpp>
#include <splat/Shader.hpp>

#include <algorithm>
#include <optional>
#include <slang-com-ptr.h>
#include <slang.h>
#include <utility>

namespace splat
{

// ============================================================================
// Slang session
// ============================================================================
// One global session and one SPIR-V session for the whole process, created on
// first use.
// ============================================================================

namespace
{

Slang::ComPtr<slang::IGlobalSession> create_global_session()
{
	Slang::ComPtr<slang::IGlobalSession> session;
	SlangGlobalSessionDesc desc = {};
	if (SLANG_FAILED(slang::createGlobalSession(&desc, session.writeRef())))
	{
		Logger::instance().error("Could not create Slang global session");
		return {};
	}
	return session;
}

Slang::ComPtr<slang::ISession> create_spirv_session(slang::IGlobalSession* global)
{
	if (global == nullptr)
	{
		return {};
	}

	slang::TargetDesc target_desc = {};
	target_desc.format = SLANG_SPIRV;
	target_desc.profile = global->findProfile("spirv_1_5");

	const char* search_paths[] = {SHADER_DIR};

	slang::SessionDesc session_desc = {};
	session_desc.targets = &target_desc;
	session_desc.targetCount = 1;
	session_desc.searchPaths = search_paths;
	session_desc.searchPathCount = 1;

	Slang::ComPtr<slang::ISession> session;
	if (SLANG_FAILED(global->createSession(session_desc, session.writeRef())))
	{
		Logger::instance().error("Could not create Slang SPIR-V session");
		return {};
	}
	Logger::instance().debug("Slang SPIR-V session searching {}", SHADER_DIR);
	return session;
}

slang::ISession* get_session()
{
	static Slang::ComPtr<slang::IGlobalSession> global = create_global_session();
	static Slang::ComPtr<slang::ISession> session = create_spirv_session(global);
	return session.get();
}

/// Diagnostics text if the blob holds any
std::optional<std::string> diagnostics_text(slang::IBlob* diagnostics)
{
	if (!diagnostics || diagnostics->getBufferSize() == 0)
	{
		return std::nullopt;
	}
	return std::string{static_cast<const char*>(diagnostics->getBufferPointer()), diagnostics->getBufferSize()};
}

// ============================================================================
// Compilation
// ============================================================================

std::expected<Slang::ComPtr<slang::IComponentType>, std::string> compile_entry_point(std::string_view name,
	std::string_view entry_point)
{
	auto* session = get_session();
	if (session == nullptr)
	{
		return std::unexpected("Slang is not available");
	}

	const std::string module_name{name};
	const std::string entry_name{entry_point};
	Slang::ComPtr<slang::IBlob> diagnostics;

	Slang::ComPtr<slang::IModule> module(session->loadModule(module_name.c_str(), diagnostics.writeRef()));
	if (!module)
	{
		return std::unexpected(fmt::format("Failed to load module '{}': {}", name,
			diagnostics_text(diagnostics.get()).value_or("no diagnostics")));
	}

	Slang::ComPtr<slang::IEntryPoint> entry;
	module->findEntryPointByName(entry_name.c_str(), entry.writeRef());
	if (!entry)
	{
		return std::unexpected(fmt::format("Entry point '{}' not found in '{}'", entry_point, name));
	}

	slang::IComponentType* components[] = {module, entry};
	Slang::ComPtr<slang::IComponentType> program;
	if (SLANG_FAILED(session->createCompositeComponentType(components, 2, program.writeRef(), diagnostics.writeRef())))
	{
		return std::unexpected(diagnostics_text(diagnostics.get()).value_or("Failed to compose program"));
	}

	Slang::ComPtr<slang::IComponentType> linked;
	if (SLANG_FAILED(program->link(linked.writeRef(), diagnostics.writeRef())))
	{
		return std::unexpected(diagnostics_text(diagnostics.get()).value_or("Failed to link program"));
	}
	return linked;
}

std::expected<vk::ShaderModule, std::string> create_shader_module(vk::Device device, slang::IComponentType* linked)
{
	Slang::ComPtr<slang::IBlob> code;
	Slang::ComPtr<slang::IBlob> diagnostics;
	if (SLANG_FAILED(linked->getEntryPointCode(0, 0, code.writeRef(), diagnostics.writeRef())) || !code)
	{
		return std::unexpected(diagnostics_text(diagnostics.get()).value_or("SPIR-V generation failed"));
	}

	auto create_info = vk::ShaderModuleCreateInfo()
		.setCodeSize(code->getBufferSize())
		.setPCode(static_cast<const uint32_t*>(code->getBufferPointer()));

	auto module_res = device.createShaderModule(create_info);
	CHECK_VK_RESULT(module_res, "Failed to create shader module: {}");
	Logger::instance().debug("Created shader module ({} bytes of SPIR-V)", code->getBufferSize());
	return module_res.value;
}

// ============================================================================
// Reflection
// ============================================================================

std::optional<vk::ShaderStageFlagBits> to_vk_shader_stage(SlangStage stage)
{
	switch (stage)
	{
	case SLANG_STAGE_VERTEX: return vk::ShaderStageFlagBits::eVertex;
	case SLANG_STAGE_FRAGMENT: return vk::ShaderStageFlagBits::eFragment;
	case SLANG_STAGE_COMPUTE: return vk::ShaderStageFlagBits::eCompute;
	default: return std::nullopt;
	}
}

slang::BindingType base_binding_type(slang::BindingType binding_type)
{
	return static_cast<slang::BindingType>(static_cast<uint32_t>(binding_type) &
		static_cast<uint32_t>(slang::BindingType::BaseMask));
}

std::optional<vk::DescriptorType> to_vk_descriptor_type(slang::BindingType binding_type)
{
	using enum slang::BindingType;
	const bool is_mutable =
		(static_cast<uint32_t>(binding_type) & static_cast<uint32_t>(MutableFlag)) != 0;

	switch (base_binding_type(binding_type))
	{
	case ConstantBuffer: return vk::DescriptorType::eUniformBuffer;
	case RawBuffer: return vk::DescriptorType::eStorageBuffer;
	case Sampler: return vk::DescriptorType::eSampler;
	case Texture: return is_mutable ? vk::DescriptorType::eStorageImage : vk::DescriptorType::eSampledImage;
	case CombinedTextureSampler: return vk::DescriptorType::eCombinedImageSampler;
	default: return std::nullopt;
	}
}

/// Size of a type, looking through buffer wrappers to their element type
std::size_t element_size(slang::TypeLayoutReflection* type_layout)
{
	if (type_layout == nullptr)
	{
		return 0;
	}
	if (auto size = type_layout->getSize(); size > 0)
	{
		return size;
	}
	auto* element = type_layout->getElementTypeLayout();
	return element != type_layout ? element_size(element) : 0;
}

std::vector<DescriptorInfo> reflect_descriptors(slang::IComponentType* linked, vk::ShaderStageFlagBits stage)
{
	std::vector<DescriptorInfo> descriptors;
	slang::ProgramLayout* layout = linked->getLayout();

	for (unsigned i = 0; i < layout->getParameterCount(); i++)
	{
		auto* param = layout->getParameterByIndex(i);
		auto* type_layout = param->getTypeLayout();

		for (SlangInt r = 0; r < type_layout->getBindingRangeCount(); r++)
		{
			auto binding_type = type_layout->getBindingRangeType(r);
			auto vk_type = to_vk_descriptor_type(binding_type);
			if (!vk_type)
			{
				continue;
			}

			DescriptorInfo info{
				.name = param->getName(),
				.size = element_size(type_layout->getBindingRangeLeafTypeLayout(r)),
				.binding = static_cast<uint32_t>(param->getBindingIndex() + r),
				.set = static_cast<uint32_t>(param->getBindingSpace()),
				.descriptor_count = static_cast<uint32_t>(type_layout->getBindingRangeBindingCount(r)),
				.type = *vk_type,
				.stages = stage,
			};
			Logger::instance().trace("  set={} binding={} '{}' {} size={}", info.set, info.binding, info.name,
				vk::to_string(info.type), info.size);
			descriptors.push_back(std::move(info));
		}
	}
	return descriptors;
}

} // anonymous namespace

std::expected<Shader, std::string> Shader::create_shader(vk::Device device, std::string_view name,
	std::string_view entry_point)
{
	Logger::instance().debug("Compiling '{}':'{}'", name, entry_point);

	auto linked = compile_entry_point(name, entry_point);
	if (!linked)
	{
		Logger::instance().error("{}", linked.error());
		return std::unexpected(linked.error());
	}

	slang::ProgramLayout* layout = linked.value()->getLayout();
	if (layout == nullptr || layout->getEntryPointCount() == 0)
	{
		return std::unexpected(fmt::format("'{}' has no reflected entry point", name));
	}
	auto stage = to_vk_shader_stage(layout->getEntryPointByIndex(0)->getStage());
	if (!stage)
	{
		return std::unexpected(fmt::format("'{}':'{}' is not a vertex, fragment or compute entry point", name,
			entry_point));
	}

	auto module = create_shader_module(device, linked.value().get());
	if (!module)
	{
		return std::unexpected(module.error());
	}

	auto descriptors = reflect_descriptors(linked.value().get(), *stage);
	Logger::instance().info("Shader '{}':'{}' ready ({} descriptors)", name, entry_point, descriptors.size());
	return Shader{device, *module, *stage, std::move(descriptors), std::string{entry_point}};
}

vk::PipelineShaderStageCreateInfo Shader::pipeline_stage_info() const
{
	return vk::PipelineShaderStageCreateInfo{}
		.setStage(m_stage)
		.setModule(m_shader_module)
		.setPName(m_entry_point.c_str());
}

std::expected<std::vector<vk::DescriptorSetLayoutBinding>, std::string> merge_set_layout(
	std::span<const Shader* const> shaders)
{
	std::vector<vk::DescriptorSetLayoutBinding> bindings;
	for (const auto* shader : shaders)
	{
		for (const auto& info : shader->descriptor_infos())
		{
			if (info.set != 0)
			{
				return std::unexpected(fmt::format("Descriptor '{}' uses set {}, only set 0 is supported",
					info.name, info.set));
			}
			auto existing = std::ranges::find(bindings, info.binding, &vk::DescriptorSetLayoutBinding::binding);
			if (existing == bindings.end())
			{
				bindings.push_back(vk::DescriptorSetLayoutBinding()
					.setBinding(info.binding)
					.setDescriptorType(info.type)
					.setDescriptorCount(info.descriptor_count)
					.setStageFlags(info.stages));
				continue;
			}
			if (existing->descriptorType != info.type)
			{
				return std::unexpected(fmt::format("Binding {} has conflicting types across stages", info.binding));
			}
			existing->stageFlags |= info.stages;
		}
	}
	std::ranges::sort(bindings, {}, &vk::DescriptorSetLayoutBinding::binding);
	return bindings;
}

Shader::Shader(vk::Device device, vk::ShaderModule module, vk::ShaderStageFlagBits stage,
	std::vector<DescriptorInfo> descriptor_infos, std::string entry_point)
	: m_device(device)
	, m_shader_module(module)
	, m_stage(stage)
	, m_descriptor_infos(std::move(descriptor_infos))
	, m_entry_point(std::move(entry_point))
{
}

Shader::~Shader()
{
	if (m_shader_module)
	{
		m_device.destroyShaderModule(m_shader_module);
		Logger::instance().trace("Destroyed shader module '{}'", m_entry_point);
	}
}

Shader::Shader(Shader&& other) noexcept
	: m_device(other.m_device)
	, m_shader_module(std::exchange(other.m_shader_module, nullptr))
	, m_stage(other.m_stage)
	, m_descriptor_infos(std::move(other.m_descriptor_infos))
	, m_entry_point(std::move(other.m_entry_point))
{
}

Shader& Shader::operator=(Shader&& other) noexcept
{
	if (this != &other)
	{
		if (m_shader_module)
		{
			m_device.destroyShaderModule(m_shader_module);
		}
		m_device = other.m_device;
		m_shader_module = std::exchange(other.m_shader_module, nullptr);
		m_stage = other.m_stage;
		m_descriptor_infos = std::move(other.m_descriptor_infos);
		m_entry_point = std::move(other.m_entry_point);
	}
	return *this;
}

} // namespace splat
