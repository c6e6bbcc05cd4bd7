#pragma once

#include <vulkan/vulkan.h>
#include <optional>
#include <utility>
#include <vector>

#include "vktri/frame/FrameTarget.hpp"
#include "vktri/vk/Swapchain.hpp"
#include "vktri/vk/Commands.hpp"
#include "vktri/vk/Sync.hpp"

namespace vktri::vk
{

	// Vulkan side of the frame loop for one swapchain generation.
	//
	// Frame slots are swapchain images: slot i owns the fence that is the
	// CompletionSignal for image i, the semaphore its present waits on, and
	// the semaphore its last acquire signaled. Acquires always signal the
	// spare semaphore, which is traded into the slot at submit time once the
	// slot's previous work is known to be finished.
	class FramePresenter : public frame::FrameTarget
	{
	public:
		FramePresenter() = default;

		FramePresenter(VkDevice device,
					   VkQueue graphicsQueue,
					   VkQueue presentQueue,
					   const Swapchain &swapchain,
					   const Commands &commands)
		{
			create(device, graphicsQueue, presentQueue, swapchain, commands);
		}

		~FramePresenter() noexcept override { reset(); }

		FramePresenter(const FramePresenter &) = delete;
		FramePresenter &operator=(const FramePresenter &) = delete;

		FramePresenter(FramePresenter &&other) noexcept { *this = std::move(other); }
		FramePresenter &operator=(FramePresenter &&other) noexcept
		{
			if (this != &other)
			{
				reset();

				device_ = other.device_;
				graphicsQueue_ = other.graphicsQueue_;
				presentQueue_ = other.presentQueue_;
				swapchain_ = other.swapchain_;
				commands_ = other.commands_;
				frames_ = std::move(other.frames_);
				spareImageAvailable_ = other.spareImageAvailable_;
				acquired_ = other.acquired_;
				generation_ = other.generation_;

				other.device_ = VK_NULL_HANDLE;
				other.graphicsQueue_ = VK_NULL_HANDLE;
				other.presentQueue_ = VK_NULL_HANDLE;
				other.swapchain_ = VK_NULL_HANDLE;
				other.commands_ = nullptr;
				other.spareImageAvailable_ = VK_NULL_HANDLE;
				other.acquired_.reset();
				other.generation_ = 0;
			}
			return *this;
		}

		void create(VkDevice device,
					VkQueue graphicsQueue,
					VkQueue presentQueue,
					const Swapchain &swapchain,
					const Commands &commands);

		void reset() noexcept;

		size_t imageCount() const override { return frames_.size(); }
		frame::AcquireResult acquireNextImage() override;
		void waitForSignal(const frame::CompletionSignal &signal) override;
		frame::SubmitStatus submit(const frame::Submission &submission) override;
		frame::PresentResult present(uint32_t imageIndex) override;

	private:
		frame::CompletionSignal signalFor_(uint32_t slot) const;
		std::optional<uint32_t> slotOf_(const frame::CompletionSignal &signal) const;
		void replaceSlot_(uint32_t slot);

	private:
		VkDevice device_ = VK_NULL_HANDLE;
		VkQueue graphicsQueue_ = VK_NULL_HANDLE;
		VkQueue presentQueue_ = VK_NULL_HANDLE;

		VkSwapchainKHR swapchain_ = VK_NULL_HANDLE;
		const Commands *commands_ = nullptr;

		std::vector<FrameSync> frames_;
		VkSemaphore spareImageAvailable_ = VK_NULL_HANDLE;

		// image acquired but not yet submitted
		std::optional<uint32_t> acquired_;

		uint32_t generation_ = 0;
	};

}
