#include "vktri/vk/FramePresenter.hpp"
#include "vktri/vk/ResultMapping.hpp"

#include <vulkan/vk_enum_string_helper.h>

#include <iostream>
#include <limits>
#include <stdexcept>
#include <string>

namespace
{

	uint32_t nextGeneration = 1;

}

namespace vktri::vk
{

	void FramePresenter::create(VkDevice device,
								VkQueue graphicsQueue,
								VkQueue presentQueue,
								const Swapchain &swapchain,
								const Commands &commands)
	{
		reset();

		if (swapchain.size() == 0)
			throw std::runtime_error("FramePresenter: swapchain has no images");
		if (commands.size() != swapchain.size())
			throw std::runtime_error("FramePresenter: command buffer count != swapchain image count");

		device_ = device;
		graphicsQueue_ = graphicsQueue;
		presentQueue_ = presentQueue;
		swapchain_ = swapchain.handle();
		commands_ = &commands;

		frames_.resize(swapchain.size());
		for (auto &f : frames_)
			f.create(device_);

		spareImageAvailable_ = createSemaphore(device_);
		acquired_.reset();
		generation_ = nextGeneration++;
	}

	void FramePresenter::reset() noexcept
	{
		if (device_ != VK_NULL_HANDLE)
		{
			(void)vkDeviceWaitIdle(device_);

			if (spareImageAvailable_ != VK_NULL_HANDLE)
				vkDestroySemaphore(device_, spareImageAvailable_, nullptr);
		}

		for (auto &f : frames_)
			f.reset();
		frames_.clear();

		device_ = VK_NULL_HANDLE;
		graphicsQueue_ = VK_NULL_HANDLE;
		presentQueue_ = VK_NULL_HANDLE;
		swapchain_ = VK_NULL_HANDLE;
		commands_ = nullptr;
		spareImageAvailable_ = VK_NULL_HANDLE;
		acquired_.reset();
		generation_ = 0;
	}

	frame::CompletionSignal FramePresenter::signalFor_(uint32_t slot) const
	{
		frame::CompletionSignal s{};
		s.id = (static_cast<uint64_t>(generation_) << 32) | slot;
		return s;
	}

	std::optional<uint32_t> FramePresenter::slotOf_(const frame::CompletionSignal &signal) const
	{
		if (static_cast<uint32_t>(signal.id >> 32) != generation_)
			return std::nullopt;

		const uint32_t slot = static_cast<uint32_t>(signal.id & 0xffffffffu);
		if (slot >= frames_.size())
			return std::nullopt;
		return slot;
	}

	frame::AcquireResult FramePresenter::acquireNextImage()
	{
		if (!commands_)
			throw std::runtime_error("FramePresenter::acquireNextImage: not created");
		if (acquired_)
			throw std::runtime_error("FramePresenter::acquireNextImage: previous image was never submitted");

		frame::AcquireResult out{};
		const VkResult res = vkAcquireNextImageKHR(
			device_, swapchain_, std::numeric_limits<uint64_t>::max(),
			spareImageAvailable_, VK_NULL_HANDLE,
			&out.imageIndex);

		out.status = toAcquireStatus(res);
		if (out.status == frame::AcquireStatus::Success || out.status == frame::AcquireStatus::Suboptimal)
		{
			if (out.imageIndex >= frames_.size())
				throw std::runtime_error("FramePresenter: acquired imageIndex out of range");
			acquired_ = out.imageIndex;
		}
		else if (out.status != frame::AcquireStatus::OutOfDate)
		{
			std::cerr << "vkAcquireNextImageKHR: " << string_VkResult(res) << "\n";
		}
		return out;
	}

	void FramePresenter::waitForSignal(const frame::CompletionSignal &signal)
	{
		const auto slot = slotOf_(signal);
		if (!slot)
			return; // from an older generation; its fence is gone and its work finished

		const VkResult res = vkWaitForFences(device_, 1, frames_[*slot].inFlightPtr(), VK_TRUE,
											 std::numeric_limits<uint64_t>::max());
		if (res != VK_SUCCESS)
			std::cerr << "vkWaitForFences: " << string_VkResult(res) << "\n";
	}

	frame::SubmitStatus FramePresenter::submit(const frame::Submission &submission)
	{
		if (!commands_)
			throw std::runtime_error("FramePresenter::submit: not created");

		const uint32_t imageIndex = submission.imageIndex;
		if (!acquired_ || *acquired_ != imageIndex)
			throw std::runtime_error("FramePresenter::submit: image " + std::to_string(imageIndex) + " was not acquired");
		acquired_.reset();

		FrameSync &sync = frames_[imageIndex];

		// A slot whose signal was dropped after a failed present still has a
		// pending fence; it must finish before the fence can be reset.
		if (vkGetFenceStatus(device_, sync.inFlight()) == VK_NOT_READY)
		{
			const VkResult waited = vkWaitForFences(device_, 1, sync.inFlightPtr(), VK_TRUE,
													std::numeric_limits<uint64_t>::max());
			if (waited != VK_SUCCESS)
				std::cerr << "vkWaitForFences: " << string_VkResult(waited) << "\n";
		}

		sync.swapImageAvailable(spareImageAvailable_);

		std::vector<VkSemaphore> waitSems;
		std::vector<VkPipelineStageFlags> waitStages;
		for (const auto &dep : submission.waitFor)
		{
			switch (dep.kind)
			{
			case frame::Dependency::Kind::ImageAcquired:
				waitSems.push_back(sync.imageAvailable());
				waitStages.push_back(VK_PIPELINE_STAGE_COLOR_ATTACHMENT_OUTPUT_BIT);
				break;
			case frame::Dependency::Kind::Completion:
				// Advisory here: only submission order on the single graphics
				// queue, which does not order completion. The loop's fence wait
				// before slot reuse is what bounds frames in flight.
				break;
			}
		}

		const auto &bufs = commands_->buffers();
		VkSemaphore signalSems[] = {sync.renderFinished()};

		VkSubmitInfo info{};
		info.sType = VK_STRUCTURE_TYPE_SUBMIT_INFO;
		info.waitSemaphoreCount = static_cast<uint32_t>(waitSems.size());
		info.pWaitSemaphores = waitSems.data();
		info.pWaitDstStageMask = waitStages.data();
		info.commandBufferCount = 1;
		info.pCommandBuffers = &bufs[imageIndex];
		info.signalSemaphoreCount = 1;
		info.pSignalSemaphores = signalSems;

		if (vkResetFences(device_, 1, sync.inFlightPtr()) != VK_SUCCESS)
		{
			replaceSlot_(imageIndex);
			return frame::SubmitStatus::Failed;
		}

		const VkResult res = vkQueueSubmit(graphicsQueue_, 1, &info, sync.inFlight());
		if (res != VK_SUCCESS)
		{
			std::cerr << "vkQueueSubmit: " << string_VkResult(res) << "\n";
			replaceSlot_(imageIndex);
		}
		return toSubmitStatus(res);
	}

	frame::PresentResult FramePresenter::present(uint32_t imageIndex)
	{
		if (!commands_)
			throw std::runtime_error("FramePresenter::present: not created");
		if (imageIndex >= frames_.size())
			throw std::runtime_error("FramePresenter::present: imageIndex out of range");

		VkSemaphore waitSems[] = {frames_[imageIndex].renderFinished()};

		VkPresentInfoKHR info{};
		info.sType = VK_STRUCTURE_TYPE_PRESENT_INFO_KHR;
		info.waitSemaphoreCount = 1;
		info.pWaitSemaphores = waitSems;
		info.swapchainCount = 1;
		info.pSwapchains = &swapchain_;
		info.pImageIndices = &imageIndex;

		const VkResult res = vkQueuePresentKHR(presentQueue_, &info);

		frame::PresentResult out{};
		out.status = toPresentStatus(res);
		if (presentQueued(out.status))
			out.signal = signalFor_(imageIndex);
		else if (out.status != frame::PresentStatus::OutOfDate)
			std::cerr << "vkQueuePresentKHR: " << string_VkResult(res) << "\n";

		// renderFinished may still be signaled; the next submit would signal it again
		if (!presentConsumedWait(res))
			replaceSlot_(imageIndex);
		return out;
	}

	// After a failed submit or present the slot's fence or semaphores are in a
	// state nothing will resolve, so the whole set is recreated.
	void FramePresenter::replaceSlot_(uint32_t slot)
	{
		(void)vkDeviceWaitIdle(device_);
		frames_[slot].create(device_);
	}

}
