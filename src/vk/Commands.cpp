#include "vktri/vk/Commands.hpp"
#include <stdexcept>

namespace vktri::vk
{

	void Commands::create(VkDevice device, uint32_t queueFamilyIndex, size_t count)
	{
		reset();
		device_ = device;

		VkCommandPoolCreateInfo pci{};
		pci.sType = VK_STRUCTURE_TYPE_COMMAND_POOL_CREATE_INFO;
		pci.queueFamilyIndex = queueFamilyIndex;
		pci.flags = VK_COMMAND_POOL_CREATE_RESET_COMMAND_BUFFER_BIT;

		if (vkCreateCommandPool(device_, &pci, nullptr, &pool_) != VK_SUCCESS)
			throw std::runtime_error("Commands: vkCreateCommandPool failed");

		buffers_.resize(count);

		VkCommandBufferAllocateInfo ai{};
		ai.sType = VK_STRUCTURE_TYPE_COMMAND_BUFFER_ALLOCATE_INFO;
		ai.commandPool = pool_;
		ai.level = VK_COMMAND_BUFFER_LEVEL_PRIMARY;
		ai.commandBufferCount = static_cast<uint32_t>(buffers_.size());

		if (vkAllocateCommandBuffers(device_, &ai, buffers_.data()) != VK_SUCCESS)
		{
			buffers_.clear();
			throw std::runtime_error("Commands: vkAllocateCommandBuffers failed");
		}
	}

	void Commands::reset() noexcept
	{
		if (device_ != VK_NULL_HANDLE)
		{
			if (!buffers_.empty() && pool_ != VK_NULL_HANDLE)
				vkFreeCommandBuffers(device_, pool_, static_cast<uint32_t>(buffers_.size()), buffers_.data());
			if (pool_ != VK_NULL_HANDLE)
				vkDestroyCommandPool(device_, pool_, nullptr);
		}
		buffers_.clear();
		pool_ = VK_NULL_HANDLE;
		device_ = VK_NULL_HANDLE;
	}

	void Commands::recordTriangle(VkRenderPass renderPass,
								  const std::vector<VkFramebuffer> &framebuffers,
								  VkExtent2D extent,
								  VkPipeline pipeline,
								  VkBuffer vertexBuffer,
								  uint32_t vertexCount)
	{
		if (framebuffers.size() != buffers_.size())
			throw std::runtime_error("Commands::recordTriangle: framebuffer/buffer count mismatch");

		for (size_t i = 0; i < buffers_.size(); ++i)
		{
			VkCommandBuffer cmd = buffers_[i];

			if (vkResetCommandBuffer(cmd, 0) != VK_SUCCESS)
				throw std::runtime_error("Commands: vkResetCommandBuffer failed");

			VkCommandBufferBeginInfo bi{};
			bi.sType = VK_STRUCTURE_TYPE_COMMAND_BUFFER_BEGIN_INFO;

			if (vkBeginCommandBuffer(cmd, &bi) != VK_SUCCESS)
				throw std::runtime_error("Commands: vkBeginCommandBuffer failed");

			VkClearValue clear{};
			clear.color = {{0.0f, 0.0f, 0.0f, 1.0f}};

			VkRenderPassBeginInfo rbi{};
			rbi.sType = VK_STRUCTURE_TYPE_RENDER_PASS_BEGIN_INFO;
			rbi.renderPass = renderPass;
			rbi.framebuffer = framebuffers[i];
			rbi.renderArea.offset = {0, 0};
			rbi.renderArea.extent = extent;
			rbi.clearValueCount = 1;
			rbi.pClearValues = &clear;

			vkCmdBeginRenderPass(cmd, &rbi, VK_SUBPASS_CONTENTS_INLINE);

			vkCmdBindPipeline(cmd, VK_PIPELINE_BIND_POINT_GRAPHICS, pipeline);
			VkDeviceSize offset = 0;
			vkCmdBindVertexBuffers(cmd, 0, 1, &vertexBuffer, &offset);
			vkCmdDraw(cmd, vertexCount, 1, 0, 0);

			vkCmdEndRenderPass(cmd);

			if (vkEndCommandBuffer(cmd) != VK_SUCCESS)
				throw std::runtime_error("Commands: vkEndCommandBuffer failed");
		}
	}

}
