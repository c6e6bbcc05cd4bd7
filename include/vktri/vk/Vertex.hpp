#pragma once

#include <array>
#include <cstddef>
#include <vector>
#include <vulkan/vulkan.h>

namespace vktri::vk
{

	struct Vertex
	{
		float position[2];

		static VkVertexInputBindingDescription bindingDescription()
		{
			VkVertexInputBindingDescription b{};
			b.binding = 0;
			b.stride = sizeof(Vertex);
			b.inputRate = VK_VERTEX_INPUT_RATE_VERTEX;
			return b;
		}

		static std::array<VkVertexInputAttributeDescription, 1> attributeDescriptions()
		{
			std::array<VkVertexInputAttributeDescription, 1> a{};

			a[0].binding = 0;
			a[0].location = 0;
			a[0].format = VK_FORMAT_R32G32_SFLOAT;
			a[0].offset = static_cast<uint32_t>(offsetof(Vertex, position));

			return a;
		}
	};

	// The one mesh this program draws.
	inline std::vector<Vertex> triangleVertices()
	{
		return {
			{{-0.5f, -0.5f}},
			{{0.0f, 0.5f}},
			{{0.5f, -0.25f}},
		};
	}

}
