#include "vktri/frame/FrameLoop.hpp"

#include <stdexcept>
#include <string>

namespace vktri::frame
{

	const char *toString(AcquireStatus s)
	{
		switch (s)
		{
		case AcquireStatus::Success:
			return "Success";
		case AcquireStatus::Suboptimal:
			return "Suboptimal";
		case AcquireStatus::OutOfDate:
			return "OutOfDate";
		case AcquireStatus::DeviceLost:
			return "DeviceLost";
		case AcquireStatus::Failed:
			return "Failed";
		}
		return "Unknown";
	}

	const char *toString(SubmitStatus s)
	{
		switch (s)
		{
		case SubmitStatus::Ok:
			return "Ok";
		case SubmitStatus::OutOfDate:
			return "OutOfDate";
		case SubmitStatus::DeviceLost:
			return "DeviceLost";
		case SubmitStatus::Failed:
			return "Failed";
		}
		return "Unknown";
	}

	const char *toString(PresentStatus s)
	{
		switch (s)
		{
		case PresentStatus::Ok:
			return "Ok";
		case PresentStatus::Suboptimal:
			return "Suboptimal";
		case PresentStatus::OutOfDate:
			return "OutOfDate";
		case PresentStatus::DeviceLost:
			return "DeviceLost";
		case PresentStatus::Failed:
			return "Failed";
		}
		return "Unknown";
	}

	FrameLoop::FrameLoop(FrameTarget &target,
						 SwapchainRebuilder &rebuilder,
						 const void *window,
						 std::ostream &log)
		: target_(target), rebuilder_(rebuilder), window_(window), log_(log)
	{
		signals_.assign(target_.imageCount(), std::nullopt);
	}

	void FrameLoop::handleEvent(const WindowEvent &event)
	{
		switch (event.kind)
		{
		case WindowEvent::Kind::CloseRequested:
			if (window_ == nullptr || event.window == window_)
				running_ = false;
			break;
		case WindowEvent::Kind::Resized:
			resizeRequested_ = true;
			break;
		case WindowEvent::Kind::Other:
			break;
		}
	}

	FrameLoop::TickOutcome FrameLoop::tick()
	{
		++stats_.ticks;

		if (resizeRequested_)
			rebuildSwapchain_();

		// 1. acquire
		const AcquireResult acquired = target_.acquireNextImage();
		switch (acquired.status)
		{
		case AcquireStatus::Success:
			break;
		case AcquireStatus::Suboptimal:
			resizeRequested_ = true;
			break;
		case AcquireStatus::OutOfDate:
			resizeRequested_ = true;
			++stats_.dropped;
			return TickOutcome::Dropped;
		case AcquireStatus::DeviceLost:
		case AcquireStatus::Failed:
			reportFailure_("acquire", toString(acquired.status), acquired.status == AcquireStatus::DeviceLost);
			++stats_.dropped;
			return TickOutcome::Dropped;
		}

		const uint32_t imageIndex = acquired.imageIndex;
		if (imageIndex >= signals_.size())
			throw std::runtime_error("FrameLoop: acquired imageIndex " + std::to_string(imageIndex) +
									 " out of range (" + std::to_string(signals_.size()) + " slots)");

		// 2. back-pressure
		auto &slot = signals_[imageIndex];
		if (slot)
		{
			target_.waitForSignal(*slot);
			slot.reset();
			++stats_.backPressureWaits;
		}

		// 3. submit
		const SubmitStatus submitted = target_.submit(buildSubmission_(imageIndex));
		if (submitted != SubmitStatus::Ok)
		{
			reportFailure_("submit", toString(submitted), submitted == SubmitStatus::DeviceLost);
			resizeRequested_ = true;
			++stats_.dropped;
			return TickOutcome::Dropped;
		}

		// 4. present
		PresentResult presented = target_.present(imageIndex);
		TickOutcome outcome = TickOutcome::Presented;
		switch (presented.status)
		{
		case PresentStatus::Ok:
			slot = presented.signal;
			break;
		case PresentStatus::Suboptimal:
			slot = presented.signal;
			resizeRequested_ = true;
			break;
		case PresentStatus::OutOfDate:
			resizeRequested_ = true;
			outcome = TickOutcome::PresentFailed;
			break;
		case PresentStatus::DeviceLost:
		case PresentStatus::Failed:
			reportFailure_("present", toString(presented.status), presented.status == PresentStatus::DeviceLost);
			outcome = TickOutcome::PresentFailed;
			break;
		}

		if (outcome == TickOutcome::Presented)
			++stats_.presented;

		// 5. bookkeeping
		previous_ = imageIndex;
		return outcome;
	}

	void FrameLoop::rebuildSwapchain_()
	{
		state_ = State::Resizing;

		// cleared before rebuilding: a resize arriving meanwhile raises it again
		resizeRequested_ = false;

		RebuildResult result = RebuildResult::Skipped;
		try
		{
			result = rebuilder_.rebuild();
		}
		catch (...)
		{
			// leave the loop as it was before the attempt
			state_ = State::Stable;
			resizeRequested_ = true;
			throw;
		}

		if (result == RebuildResult::Rebuilt)
		{
			signals_.assign(target_.imageCount(), std::nullopt);
			previous_.reset();
			++stats_.rebuilds;
			log_ << "FrameLoop: swapchain rebuilt, images=" << signals_.size() << "\n";
		}
		else
		{
			++stats_.skippedRebuilds;
			log_ << "FrameLoop: swapchain rebuild skipped (extent unsupported)\n";
		}

		state_ = State::Stable;
	}

	Submission FrameLoop::buildSubmission_(uint32_t imageIndex) const
	{
		Submission s{};
		s.imageIndex = imageIndex;

		if (previous_ && *previous_ < signals_.size() && signals_[*previous_])
			s.waitFor.push_back(Dependency::completion(*signals_[*previous_]));

		s.waitFor.push_back(Dependency::imageAcquired());
		return s;
	}

	void FrameLoop::reportFailure_(const char *stage, const char *status, bool deviceLost)
	{
		if (deviceLost)
		{
			++stats_.deviceLost;
			log_ << "FrameLoop: DEVICE LOST during " << stage << ", dropping frame\n";
			return;
		}
		log_ << "FrameLoop: " << stage << " failed (" << status << "), dropping frame\n";
	}

}
