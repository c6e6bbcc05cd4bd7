#pragma once

#include <optional>
#include <stdexcept>
#include <utility>
#include <vector>
#include <vulkan/vulkan.h>
#include "vktri/vk/VkContext.hpp"

namespace vktri::vk
{

	// The surface cannot take a swapchain of the requested extent right now.
	// Nothing was created; the caller's current swapchain is still usable.
	class SwapchainUnavailable : public std::runtime_error
	{
	public:
		using std::runtime_error::runtime_error;
	};

	class Swapchain
	{
	public:
		Swapchain() = default;
		Swapchain(VkContext &ctx, VkExtent2D extent, VkSwapchainKHR oldSwapchain = VK_NULL_HANDLE)
		{
			create(ctx, extent, oldSwapchain);
		}
		~Swapchain() noexcept { reset(); }

		Swapchain(const Swapchain &) = delete;
		Swapchain &operator=(const Swapchain &) = delete;

		Swapchain(Swapchain &&other) noexcept { *this = std::move(other); }
		Swapchain &operator=(Swapchain &&other) noexcept
		{
			if (this != &other)
			{
				reset();
				device_ = other.device_;
				swapchain_ = other.swapchain_;
				images_ = std::move(other.images_);
				imageViews_ = std::move(other.imageViews_);
				imageFormat_ = other.imageFormat_;
				extent_ = other.extent_;

				other.device_ = VK_NULL_HANDLE;
				other.swapchain_ = VK_NULL_HANDLE;
				other.imageFormat_ = VkFormat{};
				other.extent_ = VkExtent2D{};
			}
			return *this;
		}

		// Extent a swapchain for the surface would have right now, or nothing
		// when the surface has no drawable area (minimized window).
		static std::optional<VkExtent2D> surfaceExtent(const VkContext &ctx);

		// Surface format a swapchain would be created with; the render pass
		// is built against it once.
		static VkSurfaceFormatKHR surfaceFormat(const VkContext &ctx);

		// Throws SwapchainUnavailable when the surface rejects `extent`, any
		// other std::runtime_error on driver failure.
		void create(VkContext &ctx, VkExtent2D extent, VkSwapchainKHR oldSwapchain = VK_NULL_HANDLE);
		void reset() noexcept;

		VkSwapchainKHR handle() const { return swapchain_; }
		VkFormat imageFormat() const { return imageFormat_; }
		VkExtent2D extent() const { return extent_; }
		const std::vector<VkImageView> &imageViews() const { return imageViews_; }
		size_t size() const { return imageViews_.size(); }

	private:
		VkDevice device_ = VK_NULL_HANDLE;

		VkSwapchainKHR swapchain_ = VK_NULL_HANDLE;
		std::vector<VkImage> images_;
		std::vector<VkImageView> imageViews_;
		VkFormat imageFormat_{};
		VkExtent2D extent_{};
	};

} // namespace vktri::vk
