#include "vktri/vk/Buffer.hpp"
#include <cstring>
#include <stdexcept>

namespace vktri::vk
{

	static uint32_t findMemoryType(VkPhysicalDevice phys, uint32_t typeFilter, VkMemoryPropertyFlags props)
	{
		VkPhysicalDeviceMemoryProperties mem{};
		vkGetPhysicalDeviceMemoryProperties(phys, &mem);
		for (uint32_t i = 0; i < mem.memoryTypeCount; ++i)
		{
			if ((typeFilter & (1u << i)) && (mem.memoryTypes[i].propertyFlags & props) == props)
				return i;
		}
		throw std::runtime_error("findMemoryType failed");
	}

	void VertexBuffer::create(VkDevice device, VkPhysicalDevice physicalDevice, const std::vector<Vertex> &vertices)
	{
		reset();

		if (vertices.empty())
			throw std::runtime_error("VertexBuffer: no vertices");

		device_ = device;
		count_ = static_cast<uint32_t>(vertices.size());

		const VkDeviceSize size = sizeof(Vertex) * static_cast<VkDeviceSize>(vertices.size());

		VkBufferCreateInfo bci{};
		bci.sType = VK_STRUCTURE_TYPE_BUFFER_CREATE_INFO;
		bci.size = size;
		bci.usage = VK_BUFFER_USAGE_VERTEX_BUFFER_BIT;
		bci.sharingMode = VK_SHARING_MODE_EXCLUSIVE;

		if (vkCreateBuffer(device_, &bci, nullptr, &buffer_) != VK_SUCCESS)
			throw std::runtime_error("VertexBuffer: vkCreateBuffer failed");

		VkMemoryRequirements req{};
		vkGetBufferMemoryRequirements(device_, buffer_, &req);

		VkMemoryAllocateInfo mai{};
		mai.sType = VK_STRUCTURE_TYPE_MEMORY_ALLOCATE_INFO;
		mai.allocationSize = req.size;
		mai.memoryTypeIndex = findMemoryType(
			physicalDevice,
			req.memoryTypeBits,
			VK_MEMORY_PROPERTY_HOST_VISIBLE_BIT | VK_MEMORY_PROPERTY_HOST_COHERENT_BIT);

		if (vkAllocateMemory(device_, &mai, nullptr, &memory_) != VK_SUCCESS)
			throw std::runtime_error("VertexBuffer: vkAllocateMemory failed");

		if (vkBindBufferMemory(device_, buffer_, memory_, 0) != VK_SUCCESS)
			throw std::runtime_error("VertexBuffer: vkBindBufferMemory failed");

		void *mapped = nullptr;
		if (vkMapMemory(device_, memory_, 0, size, 0, &mapped) != VK_SUCCESS)
			throw std::runtime_error("VertexBuffer: vkMapMemory failed");
		std::memcpy(mapped, vertices.data(), static_cast<size_t>(size));
		vkUnmapMemory(device_, memory_);
	}

	void VertexBuffer::reset() noexcept
	{
		if (device_ != VK_NULL_HANDLE)
		{
			if (buffer_)
				vkDestroyBuffer(device_, buffer_, nullptr);
			if (memory_)
				vkFreeMemory(device_, memory_, nullptr);
		}
		device_ = VK_NULL_HANDLE;
		buffer_ = VK_NULL_HANDLE;
		memory_ = VK_NULL_HANDLE;
		count_ = 0;
	}

} // namespace vktri::vk
