#include "vktri/vk/Framebuffers.hpp"
#include <stdexcept>
#include <string>

namespace vktri::vk
{

	void Framebuffers::create(VkDevice device, const RenderPass &renderPass, const Swapchain &swapchain)
	{
		reset();

		if (swapchain.size() == 0)
			throw std::runtime_error("Framebuffers: swapchain has no image views");
		if (swapchain.imageFormat() != renderPass.colorFormat())
			throw std::runtime_error("Framebuffers: render pass format does not match swapchain");

		device_ = device;
		handles_.reserve(swapchain.size());

		const VkExtent2D extent = swapchain.extent();
		for (VkImageView view : swapchain.imageViews())
		{
			VkFramebufferCreateInfo ci{};
			ci.sType = VK_STRUCTURE_TYPE_FRAMEBUFFER_CREATE_INFO;
			ci.renderPass = renderPass.handle();
			ci.attachmentCount = 1;
			ci.pAttachments = &view;
			ci.width = extent.width;
			ci.height = extent.height;
			ci.layers = 1;

			VkFramebuffer fb = VK_NULL_HANDLE;
			if (vkCreateFramebuffer(device_, &ci, nullptr, &fb) != VK_SUCCESS)
				throw std::runtime_error("vkCreateFramebuffer failed for image " + std::to_string(handles_.size()));
			handles_.push_back(fb);
		}
	}

	void Framebuffers::reset() noexcept
	{
		if (device_ != VK_NULL_HANDLE)
		{
			for (VkFramebuffer fb : handles_)
				vkDestroyFramebuffer(device_, fb, nullptr);
		}
		handles_.clear();
		device_ = VK_NULL_HANDLE;
	}

}
