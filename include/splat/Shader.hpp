#ifndef INKSPLATTER_SHADER_HPP
#define INKSPLATTER_SHADER_HPP
#include <expected>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "Common.hpp"

namespace splat
{

struct DescriptorInfo
{
	std::string name;
	std::size_t size;             ///< Bytes per element, 0 if unknown
	uint32_t binding;
	uint32_t set;
	uint32_t descriptor_count;    ///< 1 if not an array
	vk::DescriptorType type;
	vk::ShaderStageFlags stages;
};

/**
 * @brief One entry point compiled to SPIR-V with Slang, plus its reflected bindings
 *
 * Modules are looked up by name in SHADER_DIR, e.g. "splat/field" resolves to
 * SHADER_DIR/splat/field.slang.
 */
class Shader
{
public:
	static std::expected<Shader, std::string> create_shader(vk::Device device, std::string_view name,
		std::string_view entry_point);

	[[nodiscard]] const std::vector<DescriptorInfo>& descriptor_infos() const { return m_descriptor_infos; }
	[[nodiscard]] vk::ShaderModule shader_module() const { return m_shader_module; }
	[[nodiscard]] vk::ShaderStageFlagBits stage() const { return m_stage; }
	[[nodiscard]] const std::string& entry_point() const { return m_entry_point; }
	[[nodiscard]] vk::PipelineShaderStageCreateInfo pipeline_stage_info() const;

	Shader(const Shader&) = delete;
	Shader& operator=(const Shader&) = delete;
	Shader(Shader&& other) noexcept;
	Shader& operator=(Shader&& other) noexcept;
	~Shader();

private:
	Shader(vk::Device device, vk::ShaderModule module, vk::ShaderStageFlagBits stage,
		std::vector<DescriptorInfo> descriptor_infos, std::string entry_point);

	vk::Device m_device;
	vk::ShaderModule m_shader_module;
	vk::ShaderStageFlagBits m_stage;
	std::vector<DescriptorInfo> m_descriptor_infos;
	std::string m_entry_point;
};

/**
 * @brief Set 0 layout bindings used by any of the given stages
 *
 * Bindings reflected by several stages are merged and their stage flags combined.
 */
std::expected<std::vector<vk::DescriptorSetLayoutBinding>, std::string> merge_set_layout(
	std::span<const Shader* const> shaders);

} // namespace splat

#endif // INKSPLATTER_SHADER_HPP
