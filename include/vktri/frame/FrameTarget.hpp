#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace vktri::frame
{

	// Opaque token for "the GPU finished the work submitted for a slot".
	// Only the FrameTarget that issued it can interpret `id`.
	struct CompletionSignal
	{
		uint64_t id = 0;

		bool operator==(const CompletionSignal &o) const { return id == o.id; }
		bool operator!=(const CompletionSignal &o) const { return id != o.id; }
	};

	enum class AcquireStatus
	{
		Success,
		Suboptimal,
		OutOfDate,
		DeviceLost,
		Failed
	};

	struct AcquireResult
	{
		AcquireStatus status = AcquireStatus::Failed;
		uint32_t imageIndex = 0;
	};

	enum class SubmitStatus
	{
		Ok,
		OutOfDate,
		DeviceLost,
		Failed
	};

	enum class PresentStatus
	{
		Ok,
		Suboptimal,
		OutOfDate,
		DeviceLost,
		Failed
	};

	struct PresentResult
	{
		PresentStatus status = PresentStatus::Failed;
		std::optional<CompletionSignal> signal;
	};

	struct Dependency
	{
		enum class Kind
		{
			Completion,	// a previous submission must have finished
			ImageAcquired // the presentation engine released the image
		};

		Kind kind = Kind::ImageAcquired;
		CompletionSignal signal{}; // meaningful for Completion only

		static Dependency completion(CompletionSignal s) { return Dependency{Kind::Completion, s}; }
		static Dependency imageAcquired() { return Dependency{Kind::ImageAcquired, {}}; }
	};

	// One request to execute the prerecorded command buffer of a slot.
	// Dependencies are ordered: predecessors first, then the acquire.
	struct Submission
	{
		uint32_t imageIndex = 0;
		std::vector<Dependency> waitFor;
	};

	// The per-frame surface of the device layer. Implementations hand out
	// image indices of the current swapchain generation only.
	class FrameTarget
	{
	public:
		virtual ~FrameTarget() = default;

		virtual size_t imageCount() const = 0;

		// No timeout.
		virtual AcquireResult acquireNextImage() = 0;

		// Blocks until the signal resolves.
		virtual void waitForSignal(const CompletionSignal &signal) = 0;

		// ImageAcquired dependencies must be honored. Completion dependencies
		// may be advisory: a backend can satisfy them by submission order
		// alone, which does not guarantee completion order. Callers must not
		// rely on them for anything but ordering; reuse of a slot is guarded
		// by waitForSignal().
		virtual SubmitStatus submit(const Submission &submission) = 0;

		// Presents `imageIndex` after its submission and returns the signal
		// for that submission when presentation was queued.
		virtual PresentResult present(uint32_t imageIndex) = 0;
	};

	enum class RebuildResult
	{
		Rebuilt,
		Skipped // extent currently unsupported, previous generation untouched
	};

	class SwapchainRebuilder
	{
	public:
		virtual ~SwapchainRebuilder() = default;

		virtual RebuildResult rebuild() = 0;
	};

	const char *toString(AcquireStatus s);
	const char *toString(SubmitStatus s);
	const char *toString(PresentStatus s);

}
