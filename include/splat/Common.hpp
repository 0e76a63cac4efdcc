#ifndef INKSPLATTER_COMMON_HPP
#define INKSPLATTER_COMMON_HPP
#include <expected>
#include <string>
#include <vulkan/vulkan.hpp>
#include <spdlog/fmt/fmt.h>

// Early-return helpers for functions returning std::expected<T, std::string>.
// msg must contain a single {} which receives the vk::Result name.
#define CHECK_VK_RESULT(res, msg) \
if ((res).result != vk::Result::eSuccess) \
{ \
	return std::unexpected(fmt::format(msg, vk::to_string((res).result))); \
}

#define CHECK_VK_RESULT_VOID(res, msg) \
if ((res) != vk::Result::eSuccess) \
{ \
	return std::unexpected(fmt::format(msg, vk::to_string(res))); \
}

#endif // INKSPLATTER_COMMON_HPP
