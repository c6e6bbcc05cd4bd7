#pragma once

#include <utility>
#include <vector>
#include <vulkan/vulkan.h>

#include "vktri/vk/RenderPass.hpp"
#include "vktri/vk/Swapchain.hpp"

namespace vktri::vk
{

	// Color framebuffers over every image view of one swapchain.
	class Framebuffers
	{
	public:
		Framebuffers() = default;
		Framebuffers(VkDevice device, const RenderPass &renderPass, const Swapchain &swapchain)
		{
			create(device, renderPass, swapchain);
		}

		~Framebuffers() noexcept { reset(); }

		Framebuffers(const Framebuffers &) = delete;
		Framebuffers &operator=(const Framebuffers &) = delete;

		Framebuffers(Framebuffers &&other) noexcept { *this = std::move(other); }
		Framebuffers &operator=(Framebuffers &&other) noexcept
		{
			if (this != &other)
			{
				reset();
				device_ = std::exchange(other.device_, VK_NULL_HANDLE);
				handles_ = std::move(other.handles_);
				other.handles_.clear();
			}
			return *this;
		}

		void create(VkDevice device, const RenderPass &renderPass, const Swapchain &swapchain);
		void reset() noexcept;

		const std::vector<VkFramebuffer> &handles() const { return handles_; }
		size_t size() const { return handles_.size(); }

	private:
		VkDevice device_ = VK_NULL_HANDLE;
		std::vector<VkFramebuffer> handles_;
	};

}
