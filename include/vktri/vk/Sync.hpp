#pragma once

#include <vulkan/vulkan.h>
#include <utility>

namespace vktri::vk
{

	VkSemaphore createSemaphore(VkDevice device);

	// Synchronization objects owned by one frame slot (swapchain image).
	// The fence starts signaled so a never-submitted slot waits for nothing.
	class FrameSync
	{
	public:
		FrameSync() = default;
		explicit FrameSync(VkDevice device) { create(device); }

		~FrameSync() noexcept { reset(); }

		FrameSync(const FrameSync &) = delete;
		FrameSync &operator=(const FrameSync &) = delete;

		FrameSync(FrameSync &&other) noexcept { *this = std::move(other); }
		FrameSync &operator=(FrameSync &&other) noexcept
		{
			if (this != &other)
			{
				reset();
				device_ = other.device_;
				imageAvailable_ = other.imageAvailable_;
				renderFinished_ = other.renderFinished_;
				inFlight_ = other.inFlight_;

				other.device_ = VK_NULL_HANDLE;
				other.imageAvailable_ = VK_NULL_HANDLE;
				other.renderFinished_ = VK_NULL_HANDLE;
				other.inFlight_ = VK_NULL_HANDLE;
			}
			return *this;
		}

		void create(VkDevice device);
		void reset() noexcept;

		// Trades this slot's acquire semaphore for `semaphore`. Only valid once
		// the slot's previous submission has completed.
		void swapImageAvailable(VkSemaphore &semaphore) { std::swap(imageAvailable_, semaphore); }

		VkSemaphore imageAvailable() const { return imageAvailable_; }
		VkSemaphore renderFinished() const { return renderFinished_; }

		VkFence inFlight() const { return inFlight_; }
		VkFence *inFlightPtr() { return &inFlight_; }
		const VkFence *inFlightPtr() const { return &inFlight_; }

	private:
		VkDevice device_ = VK_NULL_HANDLE;
		VkSemaphore imageAvailable_ = VK_NULL_HANDLE;
		VkSemaphore renderFinished_ = VK_NULL_HANDLE;
		VkFence inFlight_ = VK_NULL_HANDLE;
	};

}
