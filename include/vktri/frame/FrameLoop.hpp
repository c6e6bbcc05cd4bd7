#pragma once

#include <cstddef>
#include <cstdint>
#include <iostream>
#include <optional>
#include <vector>

#include "vktri/frame/FrameTarget.hpp"
#include "vktri/frame/WindowEvent.hpp"

namespace vktri::frame
{

	struct FrameStats
	{
		uint64_t ticks = 0;
		uint64_t presented = 0;
		uint64_t dropped = 0;
		uint64_t rebuilds = 0;
		uint64_t skippedRebuilds = 0;
		uint64_t backPressureWaits = 0;
		uint64_t deviceLost = 0;
	};

	// Drives acquire -> wait -> submit -> present for one swapchain at a time
	// and rebuilds the swapchain when the resize flag is raised.
	//
	// Holds one optional CompletionSignal per image of the current generation.
	// A slot's signal is always waited on before the slot is submitted again,
	// so at most imageCount() frames are in flight.
	class FrameLoop
	{
	public:
		enum class State
		{
			Stable,
			Resizing
		};

		enum class TickOutcome
		{
			Presented,
			Dropped,
			PresentFailed
		};

		FrameLoop(FrameTarget &target,
				  SwapchainRebuilder &rebuilder,
				  const void *window = nullptr,
				  std::ostream &log = std::cerr);

		FrameLoop(const FrameLoop &) = delete;
		FrameLoop &operator=(const FrameLoop &) = delete;
		FrameLoop(FrameLoop &&) = delete;
		FrameLoop &operator=(FrameLoop &&) = delete;

		// Close from the watched window stops the loop; a resize from any
		// window raises the resize flag. Everything else is ignored.
		void handleEvent(const WindowEvent &event);

		TickOutcome tick();

		bool running() const { return running_; }
		void stop() { running_ = false; }

		void requestResize() { resizeRequested_ = true; }
		bool resizeRequested() const { return resizeRequested_; }

		State state() const { return state_; }
		const FrameStats &stats() const { return stats_; }

		size_t slotCount() const { return signals_.size(); }
		bool hasSignal(uint32_t slot) const { return slot < signals_.size() && signals_[slot].has_value(); }
		std::optional<uint32_t> previousSlot() const { return previous_; }

	private:
		void rebuildSwapchain_();
		Submission buildSubmission_(uint32_t imageIndex) const;
		void reportFailure_(const char *stage, const char *status, bool deviceLost);

	private:
		FrameTarget &target_;
		SwapchainRebuilder &rebuilder_;
		const void *window_ = nullptr;
		std::ostream &log_;

		bool running_ = true;
		bool resizeRequested_ = false;
		State state_ = State::Stable;

		std::vector<std::optional<CompletionSignal>> signals_;
		std::optional<uint32_t> previous_;

		FrameStats stats_{};
	};

}
