#include "vktri/vk/RenderPass.hpp"
#include <stdexcept>

namespace vktri::vk
{

	void RenderPass::create(VkDevice device, VkFormat colorFormat)
	{
		reset();
		device_ = device;
		colorFormat_ = colorFormat;

		VkAttachmentDescription color{};
		color.format = colorFormat_;
		color.samples = VK_SAMPLE_COUNT_1_BIT;
		color.loadOp = VK_ATTACHMENT_LOAD_OP_CLEAR;
		color.storeOp = VK_ATTACHMENT_STORE_OP_STORE;
		color.stencilLoadOp = VK_ATTACHMENT_LOAD_OP_DONT_CARE;
		color.stencilStoreOp = VK_ATTACHMENT_STORE_OP_DONT_CARE;
		color.initialLayout = VK_IMAGE_LAYOUT_UNDEFINED;
		color.finalLayout = VK_IMAGE_LAYOUT_PRESENT_SRC_KHR;

		VkAttachmentReference colorRef{0, VK_IMAGE_LAYOUT_COLOR_ATTACHMENT_OPTIMAL};

		VkSubpassDescription sub{};
		sub.pipelineBindPoint = VK_PIPELINE_BIND_POINT_GRAPHICS;
		sub.colorAttachmentCount = 1;
		sub.pColorAttachments = &colorRef;

		// the acquire semaphore is waited at COLOR_ATTACHMENT_OUTPUT, so the
		// layout transition must not start before that stage
		VkSubpassDependency dep{};
		dep.srcSubpass = VK_SUBPASS_EXTERNAL;
		dep.dstSubpass = 0;
		dep.srcStageMask = VK_PIPELINE_STAGE_COLOR_ATTACHMENT_OUTPUT_BIT;
		dep.dstStageMask = VK_PIPELINE_STAGE_COLOR_ATTACHMENT_OUTPUT_BIT;
		dep.dstAccessMask = VK_ACCESS_COLOR_ATTACHMENT_WRITE_BIT;

		VkRenderPassCreateInfo rpci{};
		rpci.sType = VK_STRUCTURE_TYPE_RENDER_PASS_CREATE_INFO;
		rpci.attachmentCount = 1;
		rpci.pAttachments = &color;
		rpci.subpassCount = 1;
		rpci.pSubpasses = &sub;
		rpci.dependencyCount = 1;
		rpci.pDependencies = &dep;

		if (vkCreateRenderPass(device_, &rpci, nullptr, &renderPass_) != VK_SUCCESS)
			throw std::runtime_error("vkCreateRenderPass failed");
	}

	void RenderPass::reset() noexcept
	{
		if (device_ != VK_NULL_HANDLE && renderPass_ != VK_NULL_HANDLE)
			vkDestroyRenderPass(device_, renderPass_, nullptr);

		renderPass_ = VK_NULL_HANDLE;
		device_ = VK_NULL_HANDLE;
		colorFormat_ = VkFormat{};
	}

}
