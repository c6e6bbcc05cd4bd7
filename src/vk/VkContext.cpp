#define GLFW_INCLUDE_VULKAN
#include <GLFW/glfw3.h>

#include "vktri/vk/VkContext.hpp"

#include <algorithm>
#include <cstring>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace
{

	const std::vector<const char *> kValidationLayers = {
		"VK_LAYER_KHRONOS_validation"};

	const std::vector<const char *> kRequiredDeviceExtensions = {
		VK_KHR_SWAPCHAIN_EXTENSION_NAME};

#ifdef __APPLE__
	constexpr const char *kPortabilitySubsetExtName = "VK_KHR_portability_subset";
	constexpr const char *kPhysDevProps2ExtName = "VK_KHR_get_physical_device_properties2";
#endif

	static bool hasLayer(const char *name)
	{
		uint32_t count = 0;
		vkEnumerateInstanceLayerProperties(&count, nullptr);
		std::vector<VkLayerProperties> props(count);
		vkEnumerateInstanceLayerProperties(&count, props.data());
		for (const auto &p : props)
		{
			if (std::strcmp(p.layerName, name) == 0)
				return true;
		}
		return false;
	}

	static uint32_t bestApiVersionUpTo13()
	{
		uint32_t version = VK_API_VERSION_1_0;
		auto fn = reinterpret_cast<PFN_vkEnumerateInstanceVersion>(
			vkGetInstanceProcAddr(nullptr, "vkEnumerateInstanceVersion"));
		if (fn)
			fn(&version);
		if (version > VK_API_VERSION_1_3)
			version = VK_API_VERSION_1_3;
		return version;
	}

	static std::vector<VkExtensionProperties> enumerateInstanceExtensions()
	{
		uint32_t count = 0;
		if (vkEnumerateInstanceExtensionProperties(nullptr, &count, nullptr) != VK_SUCCESS)
			throw std::runtime_error("vkEnumerateInstanceExtensionProperties failed");
		std::vector<VkExtensionProperties> props(count);
		if (vkEnumerateInstanceExtensionProperties(nullptr, &count, props.data()) != VK_SUCCESS)
			throw std::runtime_error("vkEnumerateInstanceExtensionProperties failed");
		return props;
	}

	static bool isSupported(const std::vector<VkExtensionProperties> &props, const char *name)
	{
		for (const auto &p : props)
		{
			if (std::strcmp(p.extensionName, name) == 0)
				return true;
		}
		return false;
	}

	static std::vector<std::string> getInstanceExtensionStrings(bool enableValidation)
	{
		uint32_t glfwCount = 0;
		const char **glfwExt = glfwGetRequiredInstanceExtensions(&glfwCount);
		if (!glfwExt || glfwCount == 0)
			throw std::runtime_error("glfwGetRequiredInstanceExtensions returned nothing");

		const auto props = enumerateInstanceExtensions();

		std::vector<std::string> exts;
		exts.reserve(glfwCount + 2);

		for (uint32_t i = 0; i < glfwCount; ++i)
		{
			if (!isSupported(props, glfwExt[i]))
			{
				std::string msg = "Required GLFW instance extension not supported: ";
				msg += glfwExt[i];
				throw std::runtime_error(msg);
			}
			exts.emplace_back(glfwExt[i]);
		}

#ifdef __APPLE__
		if (!isSupported(props, VK_KHR_PORTABILITY_ENUMERATION_EXTENSION_NAME))
			throw std::runtime_error("VK_KHR_portability_enumeration not supported");
		exts.emplace_back(VK_KHR_PORTABILITY_ENUMERATION_EXTENSION_NAME);
#endif

		if (enableValidation && isSupported(props, VK_EXT_DEBUG_UTILS_EXTENSION_NAME))
			exts.emplace_back(VK_EXT_DEBUG_UTILS_EXTENSION_NAME);

		std::sort(exts.begin(), exts.end());
		exts.erase(std::unique(exts.begin(), exts.end()), exts.end());
		return exts;
	}

	static bool deviceSupportsExtension(VkPhysicalDevice device, const char *extName)
	{
		uint32_t count = 0;
		vkEnumerateDeviceExtensionProperties(device, nullptr, &count, nullptr);
		std::vector<VkExtensionProperties> available(count);
		vkEnumerateDeviceExtensionProperties(device, nullptr, &count, available.data());
		for (const auto &ext : available)
		{
			if (std::strcmp(extName, ext.extensionName) == 0)
				return true;
		}
		return false;
	}

	static bool checkDeviceExtensionSupport(VkPhysicalDevice device)
	{
		for (const char *req : kRequiredDeviceExtensions)
		{
			if (!deviceSupportsExtension(device, req))
				return false;
		}
		return true;
	}

	static bool hasSurfaceSupport(VkPhysicalDevice dev, VkSurfaceKHR surface)
	{
		uint32_t formatCount = 0;
		vkGetPhysicalDeviceSurfaceFormatsKHR(dev, surface, &formatCount, nullptr);

		uint32_t presentCount = 0;
		vkGetPhysicalDeviceSurfacePresentModesKHR(dev, surface, &presentCount, nullptr);

		return formatCount > 0 && presentCount > 0;
	}

	// lower is better
	static int deviceTypeRank(VkPhysicalDeviceType type)
	{
		switch (type)
		{
		case VK_PHYSICAL_DEVICE_TYPE_DISCRETE_GPU:
			return 0;
		case VK_PHYSICAL_DEVICE_TYPE_INTEGRATED_GPU:
			return 1;
		case VK_PHYSICAL_DEVICE_TYPE_VIRTUAL_GPU:
			return 2;
		case VK_PHYSICAL_DEVICE_TYPE_CPU:
			return 3;
		default:
			return 4;
		}
	}

	static vktri::vk::VkContext *contextOf(GLFWwindow *window)
	{
		return static_cast<vktri::vk::VkContext *>(glfwGetWindowUserPointer(window));
	}

}
namespace vktri::vk
{

	void VkContext::init(int width, int height, const char *title, bool enableValidation)
	{
		initWindow_(width, height, title);
		initInstanceAndSurface_(enableValidation);
		pickPhysicalDevice_();
		createLogicalDevice_();
	}

	void VkContext::initWindow_(int width, int height, const char *title)
	{
		if (!glfwInit())
			throw std::runtime_error("glfwInit failed");
		glfwInited_ = true;

		glfwWindowHint(GLFW_CLIENT_API, GLFW_NO_API);
		glfwWindowHint(GLFW_RESIZABLE, GLFW_TRUE);
		glfwWindowHint(GLFW_COCOA_RETINA_FRAMEBUFFER, GLFW_FALSE);

		window_ = glfwCreateWindow(width, height, title, nullptr, nullptr);
		if (!window_)
			throw std::runtime_error("glfwCreateWindow failed");

		glfwSetWindowUserPointer(window_, this);
		glfwSetFramebufferSizeCallback(window_, &VkContext::onFramebufferSize_);
		glfwSetWindowCloseCallback(window_, &VkContext::onClose_);
	}

	void VkContext::onFramebufferSize_(GLFWwindow *window, int width, int height)
	{
		VkContext *self = contextOf(window);
		if (!self)
			return;

		frame::WindowEvent e{};
		e.kind = frame::WindowEvent::Kind::Resized;
		e.window = window;
		e.width = width;
		e.height = height;
		self->pendingEvents_.push_back(e);
	}

	void VkContext::onClose_(GLFWwindow *window)
	{
		VkContext *self = contextOf(window);
		if (!self)
			return;

		frame::WindowEvent e{};
		e.kind = frame::WindowEvent::Kind::CloseRequested;
		e.window = window;
		self->pendingEvents_.push_back(e);
	}

	std::vector<frame::WindowEvent> VkContext::pollEvents()
	{
		glfwPollEvents();

		std::vector<frame::WindowEvent> out;
		out.swap(pendingEvents_);
		return out;
	}

	VkExtent2D VkContext::framebufferExtent() const
	{
		int w = 0, h = 0;
		glfwGetFramebufferSize(window_, &w, &h);

		VkExtent2D extent{};
		extent.width = static_cast<uint32_t>(std::max(w, 0));
		extent.height = static_cast<uint32_t>(std::max(h, 0));
		return extent;
	}

	void VkContext::initInstanceAndSurface_(bool enableValidationRequested)
	{
		const bool enableValidation = enableValidationRequested && hasLayer(kValidationLayers[0]);
		if (enableValidationRequested && !enableValidation)
			std::cerr << "Validation requested but " << kValidationLayers[0] << " is not installed\n";

		const uint32_t api = bestApiVersionUpTo13();
		std::cout << "Requesting Vulkan API: "
				  << VK_VERSION_MAJOR(api) << "."
				  << VK_VERSION_MINOR(api) << "."
				  << VK_VERSION_PATCH(api) << "\n";

		VkApplicationInfo appInfo{};
		appInfo.sType = VK_STRUCTURE_TYPE_APPLICATION_INFO;
		appInfo.pApplicationName = "vktri";
		appInfo.applicationVersion = VK_MAKE_VERSION(0, 1, 0);
		appInfo.pEngineName = "no_engine";
		appInfo.engineVersion = VK_MAKE_VERSION(0, 1, 0);
		appInfo.apiVersion = api;

		auto extStrs = getInstanceExtensionStrings(enableValidation);
		std::vector<const char *> extPtrs;
		extPtrs.reserve(extStrs.size());
		for (auto &s : extStrs)
			extPtrs.push_back(s.c_str());

		VkInstanceCreateInfo ci{};
		ci.sType = VK_STRUCTURE_TYPE_INSTANCE_CREATE_INFO;
		ci.pApplicationInfo = &appInfo;
		ci.enabledExtensionCount = static_cast<uint32_t>(extPtrs.size());
		ci.ppEnabledExtensionNames = extPtrs.data();

#ifdef __APPLE__
		ci.flags |= VK_INSTANCE_CREATE_ENUMERATE_PORTABILITY_BIT_KHR;
#endif

		if (enableValidation)
		{
			ci.enabledLayerCount = static_cast<uint32_t>(kValidationLayers.size());
			ci.ppEnabledLayerNames = kValidationLayers.data();
		}

		if (vkCreateInstance(&ci, nullptr, &instance_) != VK_SUCCESS)
			throw std::runtime_error("vkCreateInstance failed");

		if (glfwCreateWindowSurface(instance_, window_, nullptr, &surface_) != VK_SUCCESS)
			throw std::runtime_error("glfwCreateWindowSurface failed");
	}

	QueueFamilyIndices VkContext::findQueueFamilies(VkPhysicalDevice dev) const
	{
		QueueFamilyIndices out;

		uint32_t count = 0;
		vkGetPhysicalDeviceQueueFamilyProperties(dev, &count, nullptr);
		std::vector<VkQueueFamilyProperties> families(count);
		vkGetPhysicalDeviceQueueFamilyProperties(dev, &count, families.data());

		for (uint32_t i = 0; i < count; ++i)
		{
			const bool graphics = (families[i].queueFlags & VK_QUEUE_GRAPHICS_BIT) != 0;

			VkBool32 presentSupport = VK_FALSE;
			vkGetPhysicalDeviceSurfaceSupportKHR(dev, i, surface_, &presentSupport);

			// one family doing both keeps every submission on a single queue
			if (graphics && presentSupport == VK_TRUE)
			{
				out.graphicsFamily = i;
				out.presentFamily = i;
				break;
			}

			if (graphics && !out.graphicsFamily)
				out.graphicsFamily = i;
			if (presentSupport == VK_TRUE && !out.presentFamily)
				out.presentFamily = i;
		}

		return out;
	}

	void VkContext::pickPhysicalDevice_()
	{
		uint32_t count = 0;
		vkEnumeratePhysicalDevices(instance_, &count, nullptr);
		if (count == 0)
			throw std::runtime_error("No Vulkan physical devices found");

		std::vector<VkPhysicalDevice> devices(count);
		vkEnumeratePhysicalDevices(instance_, &count, devices.data());

		int bestRank = -1;
		for (auto dev : devices)
		{
			if (!findQueueFamilies(dev).isComplete())
				continue;
			if (!checkDeviceExtensionSupport(dev))
				continue;
			if (!hasSurfaceSupport(dev, surface_))
				continue;

			VkPhysicalDeviceProperties props{};
			vkGetPhysicalDeviceProperties(dev, &props);
			const int rank = deviceTypeRank(props.deviceType);
			if (bestRank < 0 || rank < bestRank)
			{
				bestRank = rank;
				physicalDevice_ = dev;
			}
		}

		if (physicalDevice_ == VK_NULL_HANDLE)
			throw std::runtime_error("No suitable GPU found");

		VkPhysicalDeviceProperties props{};
		vkGetPhysicalDeviceProperties(physicalDevice_, &props);
		std::cout << "Selected GPU: " << props.deviceName << "\n";

		indices_ = findQueueFamilies(physicalDevice_);
		std::cout << "Queue families: graphics=" << indices_.graphicsFamily.value()
				  << " present=" << indices_.presentFamily.value() << "\n";
	}

	void VkContext::createLogicalDevice_()
	{
		std::vector<uint32_t> uniqueFamilies;
		uniqueFamilies.push_back(indices_.graphicsFamily.value());
		if (indices_.presentFamily.value() != indices_.graphicsFamily.value())
			uniqueFamilies.push_back(indices_.presentFamily.value());

		float priority = 1.0f;
		std::vector<VkDeviceQueueCreateInfo> queueInfos;
		queueInfos.reserve(uniqueFamilies.size());

		for (uint32_t family : uniqueFamilies)
		{
			VkDeviceQueueCreateInfo qci{};
			qci.sType = VK_STRUCTURE_TYPE_DEVICE_QUEUE_CREATE_INFO;
			qci.queueFamilyIndex = family;
			qci.queueCount = 1;
			qci.pQueuePriorities = &priority;
			queueInfos.push_back(qci);
		}

		std::vector<const char *> deviceExts = kRequiredDeviceExtensions;

#ifdef __APPLE__
		if (deviceSupportsExtension(physicalDevice_, kPortabilitySubsetExtName))
		{
			if (deviceSupportsExtension(physicalDevice_, kPhysDevProps2ExtName))
				deviceExts.push_back(kPhysDevProps2ExtName);
			deviceExts.push_back(kPortabilitySubsetExtName);
		}
#endif

		VkPhysicalDeviceFeatures features{};

		VkDeviceCreateInfo ci{};
		ci.sType = VK_STRUCTURE_TYPE_DEVICE_CREATE_INFO;
		ci.queueCreateInfoCount = static_cast<uint32_t>(queueInfos.size());
		ci.pQueueCreateInfos = queueInfos.data();
		ci.pEnabledFeatures = &features;
		ci.enabledExtensionCount = static_cast<uint32_t>(deviceExts.size());
		ci.ppEnabledExtensionNames = deviceExts.data();

		if (vkCreateDevice(physicalDevice_, &ci, nullptr, &device_) != VK_SUCCESS)
			throw std::runtime_error("vkCreateDevice failed");

		vkGetDeviceQueue(device_, indices_.graphicsFamily.value(), 0, &graphicsQueue_);
		vkGetDeviceQueue(device_, indices_.presentFamily.value(), 0, &presentQueue_);

		std::cout << "Logical device + queues created.\n";
	}

	void VkContext::destroy() noexcept
	{
		if (device_ != VK_NULL_HANDLE)
		{
			vkDeviceWaitIdle(device_);
			vkDestroyDevice(device_, nullptr);
			device_ = VK_NULL_HANDLE;
		}

		if (surface_ != VK_NULL_HANDLE)
		{
			vkDestroySurfaceKHR(instance_, surface_, nullptr);
			surface_ = VK_NULL_HANDLE;
		}

		if (instance_ != VK_NULL_HANDLE)
		{
			vkDestroyInstance(instance_, nullptr);
			instance_ = VK_NULL_HANDLE;
		}

		if (window_)
		{
			glfwDestroyWindow(window_);
			window_ = nullptr;
		}

		if (glfwInited_)
		{
			glfwTerminate();
			glfwInited_ = false;
		}

		physicalDevice_ = VK_NULL_HANDLE;
		graphicsQueue_ = VK_NULL_HANDLE;
		presentQueue_ = VK_NULL_HANDLE;
		indices_ = QueueFamilyIndices{};
		pendingEvents_.clear();
	}

}
