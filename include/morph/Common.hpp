#ifndef PARTICLEMORPH_COMMON_HPP
#define PARTICLEMORPH_COMMON_HPP
#include <glm/glm.hpp>
#include <glm/gtc/matrix_transform.hpp>
#include <vulkan/vulkan.hpp>
#include <GLFW/glfw3.h>
#include <format>
#include <string_view>
#include <utility>

#include "Overloaded.hpp"

#define CHECK_VK_RESULT(res, msg) \
if (res.result != vk::Result::eSuccess) \
{ \
	return std::unexpected(std::format(msg, to_string(res.result))); \
} \

#define CHECK_VK_RESULT_VOID(res, msg) \
if (res != vk::Result::eSuccess) \
{ \
return std::unexpected(std::format(msg, to_string(res))); \
} \

#endif // PARTICLEMORPH_COMMON_HPP
