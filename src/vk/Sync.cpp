#include "vktri/vk/Sync.hpp"
#include <stdexcept>

namespace vktri::vk
{

	VkSemaphore createSemaphore(VkDevice device)
	{
		VkSemaphoreCreateInfo sci{};
		sci.sType = VK_STRUCTURE_TYPE_SEMAPHORE_CREATE_INFO;

		VkSemaphore s = VK_NULL_HANDLE;
		if (vkCreateSemaphore(device, &sci, nullptr, &s) != VK_SUCCESS)
			throw std::runtime_error("vkCreateSemaphore failed");
		return s;
	}

	void FrameSync::create(VkDevice device)
	{
		reset();
		device_ = device;

		imageAvailable_ = createSemaphore(device_);
		renderFinished_ = createSemaphore(device_);

		VkFenceCreateInfo fci{};
		fci.sType = VK_STRUCTURE_TYPE_FENCE_CREATE_INFO;
		fci.flags = VK_FENCE_CREATE_SIGNALED_BIT;

		if (vkCreateFence(device_, &fci, nullptr, &inFlight_) != VK_SUCCESS)
			throw std::runtime_error("FrameSync: vkCreateFence failed");
	}

	void FrameSync::reset() noexcept
	{
		if (device_ != VK_NULL_HANDLE)
		{
			if (inFlight_)
				vkDestroyFence(device_, inFlight_, nullptr);
			if (renderFinished_)
				vkDestroySemaphore(device_, renderFinished_, nullptr);
			if (imageAvailable_)
				vkDestroySemaphore(device_, imageAvailable_, nullptr);
		}

		imageAvailable_ = VK_NULL_HANDLE;
		renderFinished_ = VK_NULL_HANDLE;
		inFlight_ = VK_NULL_HANDLE;
		device_ = VK_NULL_HANDLE;
	}

}
