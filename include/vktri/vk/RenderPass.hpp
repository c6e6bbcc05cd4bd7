#pragma once

#include <utility>
#include <vulkan/vulkan.h>

namespace vktri::vk
{

	// Single subpass, one color attachment cleared on load and left in
	// PRESENT_SRC layout.
	class RenderPass
	{
	public:
		RenderPass() = default;
		RenderPass(VkDevice device, VkFormat colorFormat) { create(device, colorFormat); }
		~RenderPass() noexcept { reset(); }

		RenderPass(const RenderPass &) = delete;
		RenderPass &operator=(const RenderPass &) = delete;

		RenderPass(RenderPass &&other) noexcept { *this = std::move(other); }
		RenderPass &operator=(RenderPass &&other) noexcept
		{
			if (this != &other)
			{
				reset();
				device_ = other.device_;
				renderPass_ = other.renderPass_;
				colorFormat_ = other.colorFormat_;

				other.device_ = VK_NULL_HANDLE;
				other.renderPass_ = VK_NULL_HANDLE;
				other.colorFormat_ = VkFormat{};
			}
			return *this;
		}

		void create(VkDevice device, VkFormat colorFormat);
		void reset() noexcept;

		VkRenderPass handle() const { return renderPass_; }
		VkFormat colorFormat() const { return colorFormat_; }

	private:
		VkDevice device_ = VK_NULL_HANDLE;
		VkRenderPass renderPass_ = VK_NULL_HANDLE;
		VkFormat colorFormat_{};
	};

}
