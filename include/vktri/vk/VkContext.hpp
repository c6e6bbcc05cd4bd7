#pragma once

#include <optional>
#include <vector>
#include <vulkan/vulkan.h>

#include "vktri/frame/WindowEvent.hpp"

struct GLFWwindow;

namespace vktri::vk
{

	struct QueueFamilyIndices
	{
		std::optional<uint32_t> graphicsFamily;
		std::optional<uint32_t> presentFamily;
		bool isComplete() const { return graphicsFamily.has_value() && presentFamily.has_value(); }
	};

	class VkContext
	{
	public:
		VkContext() = default;
		~VkContext() noexcept { destroy(); }

		VkContext(const VkContext &) = delete;
		VkContext &operator=(const VkContext &) = delete;

		VkContext(VkContext &&) = delete;
		VkContext &operator=(VkContext &&) = delete;

		void init(int width, int height, const char *title, bool enableValidation);
		void destroy() noexcept;

		// Getters
		GLFWwindow *window() const { return window_; }
		VkInstance instance() const { return instance_; }
		VkSurfaceKHR surface() const { return surface_; }
		VkPhysicalDevice physicalDevice() const { return physicalDevice_; }
		VkDevice device() const { return device_; }
		VkQueue graphicsQueue() const { return graphicsQueue_; }
		VkQueue presentQueue() const { return presentQueue_; }
		QueueFamilyIndices indices() const { return indices_; }

		QueueFamilyIndices findQueueFamilies(VkPhysicalDevice dev) const;

		// Pumps GLFW and returns the close/resize events seen since the last call.
		std::vector<frame::WindowEvent> pollEvents();

		VkExtent2D framebufferExtent() const;

	private:
		void initWindow_(int width, int height, const char *title);
		void initInstanceAndSurface_(bool enableValidation);
		void pickPhysicalDevice_();
		void createLogicalDevice_();

		static void onFramebufferSize_(GLFWwindow *window, int width, int height);
		static void onClose_(GLFWwindow *window);

	private:
		bool glfwInited_ = false;
		GLFWwindow *window_ = nullptr;

		VkInstance instance_ = VK_NULL_HANDLE;
		VkSurfaceKHR surface_ = VK_NULL_HANDLE;

		VkPhysicalDevice physicalDevice_ = VK_NULL_HANDLE;
		VkDevice device_ = VK_NULL_HANDLE;

		VkQueue graphicsQueue_ = VK_NULL_HANDLE;
		VkQueue presentQueue_ = VK_NULL_HANDLE;

		QueueFamilyIndices indices_{};

		std::vector<frame::WindowEvent> pendingEvents_;
	};

} // namespace vktri::vk
