#pragma once

#include <utility>
#include <vector>
#include <vulkan/vulkan.h>
#include "vktri/vk/Vertex.hpp"

namespace vktri::vk
{

	// The triangle's vertices in host-visible, coherent memory. Written once
	// at creation and never mapped again.
	class VertexBuffer
	{
	public:
		VertexBuffer() = default;

		VertexBuffer(VkDevice device, VkPhysicalDevice physicalDevice, const std::vector<Vertex> &vertices)
		{
			create(device, physicalDevice, vertices);
		}

		~VertexBuffer() noexcept { reset(); }

		VertexBuffer(const VertexBuffer &) = delete;
		VertexBuffer &operator=(const VertexBuffer &) = delete;

		VertexBuffer(VertexBuffer &&other) noexcept { *this = std::move(other); }
		VertexBuffer &operator=(VertexBuffer &&other) noexcept
		{
			if (this != &other)
			{
				reset();
				device_ = std::exchange(other.device_, VK_NULL_HANDLE);
				buffer_ = std::exchange(other.buffer_, VK_NULL_HANDLE);
				memory_ = std::exchange(other.memory_, VK_NULL_HANDLE);
				count_ = std::exchange(other.count_, 0u);
			}
			return *this;
		}

		void create(VkDevice device, VkPhysicalDevice physicalDevice, const std::vector<Vertex> &vertices);

		void reset() noexcept;

		VkBuffer buffer() const { return buffer_; }
		uint32_t count() const { return count_; }

	private:
		VkDevice device_ = VK_NULL_HANDLE;
		VkBuffer buffer_ = VK_NULL_HANDLE;
		VkDeviceMemory memory_ = VK_NULL_HANDLE;
		uint32_t count_ = 0;
	};

} // namespace vktri::vk
