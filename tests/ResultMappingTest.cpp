#include <gtest/gtest.h>

#include "vktri/frame/FrameLoop.hpp"
#include "vktri/vk/ResultMapping.hpp"

#include <sstream>

using namespace vktri;

TEST(ResultMapping, Acquire)
{
	EXPECT_EQ(vk::toAcquireStatus(VK_SUCCESS), frame::AcquireStatus::Success);
	EXPECT_EQ(vk::toAcquireStatus(VK_SUBOPTIMAL_KHR), frame::AcquireStatus::Suboptimal);
	EXPECT_EQ(vk::toAcquireStatus(VK_ERROR_OUT_OF_DATE_KHR), frame::AcquireStatus::OutOfDate);
	EXPECT_EQ(vk::toAcquireStatus(VK_ERROR_DEVICE_LOST), frame::AcquireStatus::DeviceLost);
	EXPECT_EQ(vk::toAcquireStatus(VK_TIMEOUT), frame::AcquireStatus::Failed);
	EXPECT_EQ(vk::toAcquireStatus(VK_NOT_READY), frame::AcquireStatus::Failed);
	EXPECT_EQ(vk::toAcquireStatus(VK_ERROR_SURFACE_LOST_KHR), frame::AcquireStatus::Failed);
	EXPECT_EQ(vk::toAcquireStatus(VK_ERROR_OUT_OF_HOST_MEMORY), frame::AcquireStatus::Failed);
}

TEST(ResultMapping, Submit)
{
	EXPECT_EQ(vk::toSubmitStatus(VK_SUCCESS), frame::SubmitStatus::Ok);
	EXPECT_EQ(vk::toSubmitStatus(VK_ERROR_OUT_OF_DATE_KHR), frame::SubmitStatus::OutOfDate);
	EXPECT_EQ(vk::toSubmitStatus(VK_ERROR_DEVICE_LOST), frame::SubmitStatus::DeviceLost);
	EXPECT_EQ(vk::toSubmitStatus(VK_ERROR_OUT_OF_DEVICE_MEMORY), frame::SubmitStatus::Failed);
}

TEST(ResultMapping, Present)
{
	EXPECT_EQ(vk::toPresentStatus(VK_SUCCESS), frame::PresentStatus::Ok);
	EXPECT_EQ(vk::toPresentStatus(VK_SUBOPTIMAL_KHR), frame::PresentStatus::Suboptimal);
	EXPECT_EQ(vk::toPresentStatus(VK_ERROR_OUT_OF_DATE_KHR), frame::PresentStatus::OutOfDate);
	EXPECT_EQ(vk::toPresentStatus(VK_ERROR_DEVICE_LOST), frame::PresentStatus::DeviceLost);
	EXPECT_EQ(vk::toPresentStatus(VK_ERROR_SURFACE_LOST_KHR), frame::PresentStatus::Failed);
}

TEST(ResultMapping, OnlyQueuedPresentsCarryASignal)
{
	EXPECT_TRUE(vk::presentQueued(vk::toPresentStatus(VK_SUCCESS)));
	EXPECT_TRUE(vk::presentQueued(vk::toPresentStatus(VK_SUBOPTIMAL_KHR)));
	EXPECT_FALSE(vk::presentQueued(vk::toPresentStatus(VK_ERROR_OUT_OF_DATE_KHR)));
	EXPECT_FALSE(vk::presentQueued(vk::toPresentStatus(VK_ERROR_DEVICE_LOST)));
}

TEST(ResultMapping, PresentFailuresThatSkipTheSemaphoreWait)
{
	EXPECT_TRUE(vk::presentConsumedWait(VK_SUCCESS));
	EXPECT_TRUE(vk::presentConsumedWait(VK_SUBOPTIMAL_KHR));
	EXPECT_TRUE(vk::presentConsumedWait(VK_ERROR_OUT_OF_DATE_KHR));
	EXPECT_TRUE(vk::presentConsumedWait(VK_ERROR_SURFACE_LOST_KHR));

	EXPECT_FALSE(vk::presentConsumedWait(VK_ERROR_DEVICE_LOST));
	EXPECT_FALSE(vk::presentConsumedWait(VK_ERROR_OUT_OF_HOST_MEMORY));
}

TEST(ResultMapping, SwapchainCreationFailuresThatKeepTheOldOne)
{
	EXPECT_TRUE(vk::swapchainCreationDeferred(VK_ERROR_OUT_OF_DATE_KHR));
	EXPECT_TRUE(vk::swapchainCreationDeferred(VK_ERROR_NATIVE_WINDOW_IN_USE_KHR));

	EXPECT_FALSE(vk::swapchainCreationDeferred(VK_SUCCESS));
	EXPECT_FALSE(vk::swapchainCreationDeferred(VK_ERROR_DEVICE_LOST));
	EXPECT_FALSE(vk::swapchainCreationDeferred(VK_ERROR_SURFACE_LOST_KHR));
	EXPECT_FALSE(vk::swapchainCreationDeferred(VK_ERROR_OUT_OF_DEVICE_MEMORY));
}

namespace
{

	// Answers every call with one fixed VkResult per stage, mapped the way
	// the Vulkan presenter maps them.
	class VkResultTarget : public frame::FrameTarget
	{
	public:
		VkResult acquireResult = VK_SUCCESS;
		VkResult presentResult = VK_SUCCESS;
		int submits = 0;

		size_t imageCount() const override { return 2; }

		frame::AcquireResult acquireNextImage() override
		{
			frame::AcquireResult r{};
			r.status = vk::toAcquireStatus(acquireResult);
			r.imageIndex = 0;
			return r;
		}

		void waitForSignal(const frame::CompletionSignal &) override {}

		frame::SubmitStatus submit(const frame::Submission &) override
		{
			++submits;
			return frame::SubmitStatus::Ok;
		}

		frame::PresentResult present(uint32_t imageIndex) override
		{
			frame::PresentResult r{};
			r.status = vk::toPresentStatus(presentResult);
			if (vk::presentQueued(r.status))
				r.signal = frame::CompletionSignal{imageIndex + 1u};
			return r;
		}
	};

	class NoRebuild : public frame::SwapchainRebuilder
	{
	public:
		frame::RebuildResult rebuild() override { return frame::RebuildResult::Skipped; }
	};

}

TEST(ResultMapping, SuboptimalAcquireStillSubmits)
{
	VkResultTarget target;
	NoRebuild rebuilder;
	std::ostringstream log;
	frame::FrameLoop loop(target, rebuilder, nullptr, log);

	target.acquireResult = VK_SUBOPTIMAL_KHR;
	EXPECT_EQ(loop.tick(), frame::FrameLoop::TickOutcome::Presented);
	EXPECT_EQ(target.submits, 1);
	EXPECT_TRUE(loop.resizeRequested());
}

TEST(ResultMapping, SuboptimalPresentStoresSignal)
{
	VkResultTarget target;
	NoRebuild rebuilder;
	std::ostringstream log;
	frame::FrameLoop loop(target, rebuilder, nullptr, log);

	target.presentResult = VK_SUBOPTIMAL_KHR;
	EXPECT_EQ(loop.tick(), frame::FrameLoop::TickOutcome::Presented);
	EXPECT_TRUE(loop.hasSignal(0));
	EXPECT_TRUE(loop.resizeRequested());
}

TEST(ResultMapping, SurfaceLostPresentIsAnOrdinaryFailure)
{
	VkResultTarget target;
	NoRebuild rebuilder;
	std::ostringstream log;
	frame::FrameLoop loop(target, rebuilder, nullptr, log);

	target.presentResult = VK_ERROR_SURFACE_LOST_KHR;
	EXPECT_EQ(loop.tick(), frame::FrameLoop::TickOutcome::PresentFailed);
	EXPECT_FALSE(loop.hasSignal(0));
	EXPECT_EQ(loop.stats().deviceLost, 0u);
	EXPECT_TRUE(loop.running());
}
