#pragma once

#include <vulkan/vulkan.h>

#include "vktri/frame/FrameTarget.hpp"

namespace vktri::vk
{

	inline frame::AcquireStatus toAcquireStatus(VkResult r)
	{
		switch (r)
		{
		case VK_SUCCESS:
			return frame::AcquireStatus::Success;
		case VK_SUBOPTIMAL_KHR:
			return frame::AcquireStatus::Suboptimal;
		case VK_ERROR_OUT_OF_DATE_KHR:
			return frame::AcquireStatus::OutOfDate;
		case VK_ERROR_DEVICE_LOST:
			return frame::AcquireStatus::DeviceLost;
		default:
			return frame::AcquireStatus::Failed;
		}
	}

	inline frame::SubmitStatus toSubmitStatus(VkResult r)
	{
		switch (r)
		{
		case VK_SUCCESS:
			return frame::SubmitStatus::Ok;
		case VK_ERROR_OUT_OF_DATE_KHR:
			return frame::SubmitStatus::OutOfDate;
		case VK_ERROR_DEVICE_LOST:
			return frame::SubmitStatus::DeviceLost;
		default:
			return frame::SubmitStatus::Failed;
		}
	}

	inline frame::PresentStatus toPresentStatus(VkResult r)
	{
		switch (r)
		{
		case VK_SUCCESS:
			return frame::PresentStatus::Ok;
		case VK_SUBOPTIMAL_KHR:
			return frame::PresentStatus::Suboptimal;
		case VK_ERROR_OUT_OF_DATE_KHR:
			return frame::PresentStatus::OutOfDate;
		case VK_ERROR_DEVICE_LOST:
			return frame::PresentStatus::DeviceLost;
		default:
			return frame::PresentStatus::Failed;
		}
	}

	// Presentation was queued, so the submitted work has a completion signal.
	inline bool presentQueued(frame::PresentStatus s)
	{
		return s == frame::PresentStatus::Ok || s == frame::PresentStatus::Suboptimal;
	}

	// Whether vkQueuePresentKHR still executed its semaphore wait. For any
	// other result the render-finished semaphore may be left signaled.
	inline bool presentConsumedWait(VkResult r)
	{
		switch (r)
		{
		case VK_SUCCESS:
		case VK_SUBOPTIMAL_KHR:
		case VK_ERROR_OUT_OF_DATE_KHR:
		case VK_ERROR_SURFACE_LOST_KHR:
			return true;
		default:
			return false;
		}
	}

	// vkCreateSwapchainKHR failures that mean "not now" rather than "broken".
	inline bool swapchainCreationDeferred(VkResult r)
	{
		return r == VK_ERROR_OUT_OF_DATE_KHR || r == VK_ERROR_NATIVE_WINDOW_IN_USE_KHR;
	}

}
