#include <gtest/gtest.h>

#include "vktri/frame/FrameLoop.hpp"

#include <algorithm>
#include <deque>
#include <map>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace vktri::frame;

namespace
{

	// Scripted FrameTarget. Unscripted acquires hand out images round-robin,
	// unscripted submits and presents succeed.
	class FakeTarget : public FrameTarget
	{
	public:
		explicit FakeTarget(size_t images) { setImageCount(images); }

		void setImageCount(size_t images)
		{
			images_ = images;
			inFlight_.assign(images, 0);
			nextImage_ = 0;
		}

		size_t imageCount() const override { return images_; }

		AcquireResult acquireNextImage() override
		{
			calls.push_back("acquire");
			if (!acquireScript.empty())
			{
				AcquireResult r = acquireScript.front();
				acquireScript.pop_front();
				return r;
			}
			AcquireResult r{};
			r.status = AcquireStatus::Success;
			r.imageIndex = static_cast<uint32_t>(nextImage_);
			nextImage_ = (nextImage_ + 1) % images_;
			return r;
		}

		void waitForSignal(const CompletionSignal &signal) override
		{
			calls.push_back("wait");
			waited.push_back(signal);
			auto it = signalSlot_.find(signal.id);
			if (it != signalSlot_.end() && it->second < inFlight_.size())
				inFlight_[it->second] = 0;
		}

		SubmitStatus submit(const Submission &submission) override
		{
			calls.push_back("submit");
			submissions.push_back(submission);

			SubmitStatus s = SubmitStatus::Ok;
			if (!submitScript.empty())
			{
				s = submitScript.front();
				submitScript.pop_front();
			}
			if (s == SubmitStatus::Ok)
			{
				int &n = inFlight_.at(submission.imageIndex);
				++n;
				maxInFlightPerSlot = std::max(maxInFlightPerSlot, n);
			}
			return s;
		}

		PresentResult present(uint32_t imageIndex) override
		{
			calls.push_back("present");
			presented.push_back(imageIndex);

			PresentStatus s = PresentStatus::Ok;
			if (!presentScript.empty())
			{
				s = presentScript.front();
				presentScript.pop_front();
			}

			PresentResult r{};
			r.status = s;
			if (s == PresentStatus::Ok || s == PresentStatus::Suboptimal)
			{
				CompletionSignal sig{};
				sig.id = nextSignal_++;
				signalSlot_[sig.id] = imageIndex;
				r.signal = sig;
			}
			else
			{
				// no signal to wait on; treat the work as retired
				inFlight_.at(imageIndex) = 0;
			}
			return r;
		}

		static AcquireResult acquired(AcquireStatus status, uint32_t index = 0)
		{
			AcquireResult r{};
			r.status = status;
			r.imageIndex = index;
			return r;
		}

		std::deque<AcquireResult> acquireScript;
		std::deque<SubmitStatus> submitScript;
		std::deque<PresentStatus> presentScript;

		std::vector<std::string> calls;
		std::vector<CompletionSignal> waited;
		std::vector<Submission> submissions;
		std::vector<uint32_t> presented;
		int maxInFlightPerSlot = 0;

	private:
		size_t images_ = 0;
		size_t nextImage_ = 0;
		uint64_t nextSignal_ = 1;
		std::vector<int> inFlight_;
		std::map<uint64_t, uint32_t> signalSlot_;
	};

	// Each scripted entry is the image count of the new generation, or
	// nullopt for a degenerate extent. Unscripted rebuilds keep the count.
	class FakeRebuilder : public SwapchainRebuilder
	{
	public:
		explicit FakeRebuilder(FakeTarget &target) : target_(target) {}

		RebuildResult rebuild() override
		{
			++calls;
			if (loop)
				observedStates.push_back(loop->state());
			if (failNext)
			{
				failNext = false;
				throw std::runtime_error("vkCreateSwapchainKHR failed");
			}

			std::optional<size_t> next = target_.imageCount();
			if (!script.empty())
			{
				next = script.front();
				script.pop_front();
			}
			if (!next)
			{
				++skipped;
				return RebuildResult::Skipped;
			}

			target_.setImageCount(*next);
			++rebuilt;
			return RebuildResult::Rebuilt;
		}

		std::deque<std::optional<size_t>> script;
		const FrameLoop *loop = nullptr;
		bool failNext = false;
		std::vector<FrameLoop::State> observedStates;
		int calls = 0;
		int rebuilt = 0;
		int skipped = 0;

	private:
		FakeTarget &target_;
	};

	WindowEvent resized(int w, int h)
	{
		WindowEvent e{};
		e.kind = WindowEvent::Kind::Resized;
		e.width = w;
		e.height = h;
		return e;
	}

	WindowEvent closed(const void *window)
	{
		WindowEvent e{};
		e.kind = WindowEvent::Kind::CloseRequested;
		e.window = window;
		return e;
	}

	size_t count(const std::vector<std::string> &calls, const std::string &what)
	{
		size_t n = 0;
		for (const auto &c : calls)
			if (c == what)
				++n;
		return n;
	}

	struct FrameLoopTest : ::testing::Test
	{
		FakeTarget target{3};
		FakeRebuilder rebuilder{target};
		std::ostringstream log;
		FrameLoop loop{target, rebuilder, nullptr, log};

		void SetUp() override { rebuilder.loop = &loop; }
	};

}

TEST_F(FrameLoopTest, StartsStableWithOneEmptySlotPerImage)
{
	EXPECT_TRUE(loop.running());
	EXPECT_EQ(loop.state(), FrameLoop::State::Stable);
	EXPECT_FALSE(loop.resizeRequested());
	ASSERT_EQ(loop.slotCount(), 3u);
	for (uint32_t i = 0; i < 3; ++i)
		EXPECT_FALSE(loop.hasSignal(i));
	EXPECT_FALSE(loop.previousSlot().has_value());
}

TEST_F(FrameLoopTest, SteadyStateWaitsOnEachSlotBeforeReuse)
{
	for (int i = 0; i < 9; ++i)
		EXPECT_EQ(loop.tick(), FrameLoop::TickOutcome::Presented);

	EXPECT_EQ(target.submissions.size(), 9u);
	EXPECT_EQ(target.maxInFlightPerSlot, 1);

	// first lap fills the slots, the next two laps wait once per tick
	EXPECT_EQ(target.waited.size(), 6u);
	EXPECT_EQ(count(target.calls, "wait"), 6u);
	EXPECT_EQ(loop.stats().backPressureWaits, 6u);
	EXPECT_EQ(loop.stats().presented, 9u);
	EXPECT_EQ(rebuilder.calls, 0);

	// the signal waited on is the one that slot's present returned
	EXPECT_EQ(target.waited[0].id, 1u);
	EXPECT_EQ(target.waited[1].id, 2u);
	EXPECT_EQ(target.waited[2].id, 3u);
}

TEST_F(FrameLoopTest, WaitHappensBetweenAcquireAndSubmit)
{
	for (int i = 0; i < 4; ++i)
		loop.tick();

	const std::vector<std::string> fourth(target.calls.end() - 4, target.calls.end());
	EXPECT_EQ(fourth, (std::vector<std::string>{"acquire", "wait", "submit", "present"}));
}

TEST_F(FrameLoopTest, FirstSubmissionWaitsOnlyForImage)
{
	loop.tick();

	ASSERT_EQ(target.submissions.size(), 1u);
	const auto &deps = target.submissions[0].waitFor;
	ASSERT_EQ(deps.size(), 1u);
	EXPECT_EQ(deps[0].kind, Dependency::Kind::ImageAcquired);
}

TEST_F(FrameLoopTest, SubmissionChainsPreviousCompletionBeforeImage)
{
	loop.tick();
	loop.tick();

	ASSERT_EQ(target.submissions.size(), 2u);
	const auto &deps = target.submissions[1].waitFor;
	ASSERT_EQ(deps.size(), 2u);
	EXPECT_EQ(deps[0].kind, Dependency::Kind::Completion);
	EXPECT_EQ(deps[0].signal.id, 1u);
	EXPECT_EQ(deps[1].kind, Dependency::Kind::ImageAcquired);
	EXPECT_EQ(loop.previousSlot(), std::optional<uint32_t>(1u));
}

TEST_F(FrameLoopTest, ResizeRebuildsOnceAndAdoptsNewImageCount)
{
	loop.tick();
	loop.tick();

	rebuilder.script.push_back(size_t{4});
	loop.handleEvent(resized(1024, 768));
	EXPECT_TRUE(loop.resizeRequested());

	loop.tick();
	EXPECT_EQ(rebuilder.rebuilt, 1);
	EXPECT_FALSE(loop.resizeRequested());
	EXPECT_EQ(loop.state(), FrameLoop::State::Stable);
	EXPECT_EQ(loop.slotCount(), 4u);

	for (int i = 0; i < 8; ++i)
		loop.tick();

	EXPECT_EQ(rebuilder.calls, 1);
	EXPECT_EQ(loop.stats().rebuilds, 1u);
	EXPECT_EQ(target.maxInFlightPerSlot, 1);
	EXPECT_NE(log.str().find("swapchain rebuilt, images=4"), std::string::npos);
}

TEST_F(FrameLoopTest, RebuildDropsOldGenerationSignals)
{
	for (int i = 0; i < 3; ++i)
		loop.tick();

	loop.requestResize();
	loop.tick();

	// signals from the old swapchain are never waited on
	EXPECT_TRUE(target.waited.empty());

	const auto &deps = target.submissions.back().waitFor;
	ASSERT_EQ(deps.size(), 1u);
	EXPECT_EQ(deps[0].kind, Dependency::Kind::ImageAcquired);
}

TEST_F(FrameLoopTest, StateIsResizingWhileRebuilding)
{
	loop.requestResize();
	loop.tick();

	ASSERT_EQ(rebuilder.observedStates.size(), 1u);
	EXPECT_EQ(rebuilder.observedStates[0], FrameLoop::State::Resizing);
	EXPECT_EQ(loop.state(), FrameLoop::State::Stable);
}

TEST_F(FrameLoopTest, FailedRebuildLeavesLoopStableWithFlagRaised)
{
	loop.tick();

	rebuilder.failNext = true;
	loop.requestResize();
	EXPECT_THROW(loop.tick(), std::runtime_error);

	EXPECT_EQ(loop.state(), FrameLoop::State::Stable);
	EXPECT_TRUE(loop.resizeRequested());
	EXPECT_EQ(loop.slotCount(), 3u);
	EXPECT_TRUE(loop.hasSignal(0));
	EXPECT_EQ(loop.stats().rebuilds, 0u);

	// a later attempt goes through
	EXPECT_EQ(loop.tick(), FrameLoop::TickOutcome::Presented);
	EXPECT_EQ(rebuilder.rebuilt, 1);
	EXPECT_FALSE(loop.resizeRequested());
}

TEST_F(FrameLoopTest, SeveralResizeEventsCollapseIntoOneRebuild)
{
	loop.handleEvent(resized(640, 480));
	loop.handleEvent(resized(800, 600));
	loop.handleEvent(resized(1024, 768));

	loop.tick();
	loop.tick();

	EXPECT_EQ(rebuilder.calls, 1);
}

TEST_F(FrameLoopTest, DegenerateExtentSkipsRebuildAndKeepsGeneration)
{
	loop.tick();
	ASSERT_TRUE(loop.hasSignal(0));

	rebuilder.script.push_back(std::nullopt);
	loop.handleEvent(resized(0, 0));
	EXPECT_EQ(loop.tick(), FrameLoop::TickOutcome::Presented);

	EXPECT_EQ(rebuilder.skipped, 1);
	EXPECT_FALSE(loop.resizeRequested());
	EXPECT_EQ(loop.slotCount(), 3u);
	EXPECT_TRUE(loop.hasSignal(0));
	EXPECT_EQ(loop.previousSlot(), std::optional<uint32_t>(1u));
	EXPECT_EQ(loop.stats().skippedRebuilds, 1u);
	EXPECT_NE(log.str().find("rebuild skipped"), std::string::npos);
}

TEST_F(FrameLoopTest, RepeatedDegenerateResizesAreIdempotent)
{
	loop.tick();

	for (int i = 0; i < 3; ++i)
	{
		rebuilder.script.push_back(std::nullopt);
		loop.handleEvent(resized(0, 0));
		loop.tick();
		EXPECT_EQ(loop.slotCount(), 3u);
	}

	EXPECT_EQ(rebuilder.skipped, 3);
	EXPECT_EQ(rebuilder.rebuilt, 0);
	EXPECT_EQ(loop.stats().presented, 4u);
}

TEST_F(FrameLoopTest, RestoredWindowRebuildsAfterSkip)
{
	rebuilder.script.push_back(std::nullopt);
	loop.handleEvent(resized(0, 0));
	loop.tick();

	rebuilder.script.push_back(size_t{2});
	loop.handleEvent(resized(800, 600));
	loop.tick();

	EXPECT_EQ(rebuilder.skipped, 1);
	EXPECT_EQ(rebuilder.rebuilt, 1);
	EXPECT_EQ(loop.slotCount(), 2u);
}

TEST_F(FrameLoopTest, OutOfDateAcquireSubmitsNothingAndRebuildsNextTick)
{
	target.acquireScript.push_back(FakeTarget::acquired(AcquireStatus::OutOfDate));

	EXPECT_EQ(loop.tick(), FrameLoop::TickOutcome::Dropped);
	EXPECT_TRUE(target.submissions.empty());
	EXPECT_TRUE(loop.resizeRequested());
	EXPECT_EQ(rebuilder.calls, 0);

	EXPECT_EQ(loop.tick(), FrameLoop::TickOutcome::Presented);
	EXPECT_EQ(rebuilder.calls, 1);
	EXPECT_FALSE(loop.resizeRequested());
	EXPECT_EQ(loop.stats().dropped, 1u);
}

TEST_F(FrameLoopTest, SuboptimalAcquireStillPresentsAndRaisesFlag)
{
	target.acquireScript.push_back(FakeTarget::acquired(AcquireStatus::Suboptimal, 0));

	EXPECT_EQ(loop.tick(), FrameLoop::TickOutcome::Presented);
	EXPECT_EQ(target.submissions.size(), 1u);
	EXPECT_TRUE(loop.resizeRequested());
	EXPECT_TRUE(loop.hasSignal(0));
}

TEST_F(FrameLoopTest, FailedAcquireDropsFrameWithoutRaisingFlag)
{
	target.acquireScript.push_back(FakeTarget::acquired(AcquireStatus::Failed));

	EXPECT_EQ(loop.tick(), FrameLoop::TickOutcome::Dropped);
	EXPECT_TRUE(target.submissions.empty());
	EXPECT_FALSE(loop.resizeRequested());
	EXPECT_TRUE(loop.running());
	EXPECT_NE(log.str().find("acquire failed (Failed)"), std::string::npos);
}

TEST_F(FrameLoopTest, DeviceLostIsReportedDistinctlyAndLoopContinues)
{
	target.acquireScript.push_back(FakeTarget::acquired(AcquireStatus::DeviceLost));

	EXPECT_EQ(loop.tick(), FrameLoop::TickOutcome::Dropped);
	EXPECT_EQ(loop.stats().deviceLost, 1u);
	EXPECT_NE(log.str().find("DEVICE LOST during acquire"), std::string::npos);

	EXPECT_TRUE(loop.running());
	EXPECT_EQ(loop.tick(), FrameLoop::TickOutcome::Presented);
}

TEST_F(FrameLoopTest, SubmitFailureRaisesFlagAndKeepsPreviousSlot)
{
	loop.tick();
	ASSERT_EQ(loop.previousSlot(), std::optional<uint32_t>(0u));

	target.submitScript.push_back(SubmitStatus::Failed);
	EXPECT_EQ(loop.tick(), FrameLoop::TickOutcome::Dropped);

	EXPECT_TRUE(loop.resizeRequested());
	EXPECT_EQ(loop.previousSlot(), std::optional<uint32_t>(0u));
	EXPECT_FALSE(loop.hasSignal(1));
	EXPECT_EQ(target.presented.size(), 1u);
}

TEST_F(FrameLoopTest, OutOfDatePresentStoresNoSignal)
{
	target.presentScript.push_back(PresentStatus::OutOfDate);

	EXPECT_EQ(loop.tick(), FrameLoop::TickOutcome::PresentFailed);
	EXPECT_FALSE(loop.hasSignal(0));
	EXPECT_TRUE(loop.resizeRequested());
	EXPECT_EQ(loop.previousSlot(), std::optional<uint32_t>(0u));
	EXPECT_EQ(loop.stats().presented, 0u);

	// nothing to chain on: the previous slot has no signal
	loop.tick();
	const auto &deps = target.submissions.back().waitFor;
	ASSERT_EQ(deps.size(), 1u);
	EXPECT_EQ(deps[0].kind, Dependency::Kind::ImageAcquired);
}

TEST_F(FrameLoopTest, SuboptimalPresentStoresSignalAndRaisesFlag)
{
	target.presentScript.push_back(PresentStatus::Suboptimal);

	EXPECT_EQ(loop.tick(), FrameLoop::TickOutcome::Presented);
	EXPECT_TRUE(loop.hasSignal(0));
	EXPECT_TRUE(loop.resizeRequested());
}

TEST_F(FrameLoopTest, FailedPresentContinuesWithoutSignal)
{
	target.presentScript.push_back(PresentStatus::DeviceLost);

	EXPECT_EQ(loop.tick(), FrameLoop::TickOutcome::PresentFailed);
	EXPECT_FALSE(loop.hasSignal(0));
	EXPECT_FALSE(loop.resizeRequested());
	EXPECT_EQ(loop.stats().deviceLost, 1u);
	EXPECT_NE(log.str().find("DEVICE LOST during present"), std::string::npos);
}

TEST_F(FrameLoopTest, ResizeFlagSettlesOnceExtentIsValid)
{
	rebuilder.script.push_back(std::nullopt);
	rebuilder.script.push_back(std::nullopt);
	target.acquireScript.push_back(FakeTarget::acquired(AcquireStatus::OutOfDate));
	target.acquireScript.push_back(FakeTarget::acquired(AcquireStatus::OutOfDate));

	for (int i = 0; i < 6; ++i)
		loop.tick();

	EXPECT_FALSE(loop.resizeRequested());
	EXPECT_EQ(rebuilder.skipped, 2);
	EXPECT_EQ(rebuilder.rebuilt, 0);
	EXPECT_EQ(loop.stats().presented, 4u);
}

TEST_F(FrameLoopTest, AcquiredIndexOutsideGenerationThrows)
{
	target.acquireScript.push_back(FakeTarget::acquired(AcquireStatus::Success, 7));
	EXPECT_THROW(loop.tick(), std::runtime_error);
}

TEST(FrameLoopEvents, CloseFromWatchedWindowStopsLoop)
{
	FakeTarget target(2);
	FakeRebuilder rebuilder(target);
	std::ostringstream log;
	int window = 0;
	int other = 0;
	FrameLoop loop(target, rebuilder, &window, log);

	loop.handleEvent(closed(&other));
	EXPECT_TRUE(loop.running());

	WindowEvent ignored{};
	ignored.kind = WindowEvent::Kind::Other;
	loop.handleEvent(ignored);
	EXPECT_TRUE(loop.running());
	EXPECT_FALSE(loop.resizeRequested());

	loop.handleEvent(closed(&window));
	EXPECT_FALSE(loop.running());
}

TEST(FrameLoopEvents, ResizeFromAnyWindowRaisesFlag)
{
	FakeTarget target(2);
	FakeRebuilder rebuilder(target);
	std::ostringstream log;
	int window = 0;
	int other = 0;
	FrameLoop loop(target, rebuilder, &window, log);

	WindowEvent e = resized(10, 10);
	e.window = &other;
	loop.handleEvent(e);
	EXPECT_TRUE(loop.resizeRequested());
}

TEST(FrameLoopEvents, StopEndsLoop)
{
	FakeTarget target(2);
	FakeRebuilder rebuilder(target);
	std::ostringstream log;
	FrameLoop loop(target, rebuilder, nullptr, log);

	loop.stop();
	EXPECT_FALSE(loop.running());
}

TEST(FrameStatus, NamesAreReadable)
{
	EXPECT_STREQ(toString(AcquireStatus::OutOfDate), "OutOfDate");
	EXPECT_STREQ(toString(SubmitStatus::DeviceLost), "DeviceLost");
	EXPECT_STREQ(toString(PresentStatus::Suboptimal), "Suboptimal");
}
