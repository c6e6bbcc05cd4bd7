#pragma once

#include <vulkan/vulkan.h>
#include <algorithm>
#include <cstdint>
#include <limits>
#include <optional>

namespace vktri::vk
{

	// Extent for a new swapchain given the surface capabilities and the
	// window's framebuffer size, or nullopt while the surface cannot hold
	// one (minimized, zero sized).
	inline std::optional<VkExtent2D> pickSurfaceExtent(const VkSurfaceCapabilitiesKHR &caps, VkExtent2D framebuffer)
	{
		if (framebuffer.width == 0 || framebuffer.height == 0)
			return std::nullopt;

		// some platforms report a zero max extent while minimized
		if (caps.maxImageExtent.width == 0 || caps.maxImageExtent.height == 0)
			return std::nullopt;

		VkExtent2D extent = caps.currentExtent;
		if (caps.currentExtent.width == std::numeric_limits<uint32_t>::max())
		{
			extent.width = std::max(caps.minImageExtent.width, std::min(caps.maxImageExtent.width, framebuffer.width));
			extent.height = std::max(caps.minImageExtent.height, std::min(caps.maxImageExtent.height, framebuffer.height));
		}

		if (extent.width == 0 || extent.height == 0)
			return std::nullopt;
		return extent;
	}

	inline bool extentFits(const VkSurfaceCapabilitiesKHR &caps, VkExtent2D extent)
	{
		return extent.width > 0 && extent.height > 0 &&
			   extent.width >= caps.minImageExtent.width && extent.width <= caps.maxImageExtent.width &&
			   extent.height >= caps.minImageExtent.height && extent.height <= caps.maxImageExtent.height;
	}

}
