#include "vktri/vk/Renderer.hpp"
#include "vktri/vk/Vertex.hpp"

#include <vulkan/vk_enum_string_helper.h>

#include <iostream>
#include <stdexcept>
#include <string>
#include <utility>

namespace vktri::vk
{

	Renderer::~Renderer() noexcept
	{
		// GPU must be idle before the generation objects are destroyed.
		if (ctx_.device() != VK_NULL_HANDLE)
		{
			const VkResult r = vkDeviceWaitIdle(ctx_.device());
			if (r != VK_SUCCESS)
				std::cerr << "Renderer: vkDeviceWaitIdle: " << string_VkResult(r) << "\n";
		}
	}

	void Renderer::init(const AppConfig &config)
	{
		ctx_.init(config.width, config.height, config.title.c_str(), config.enableValidation);

		const auto extent = Swapchain::surfaceExtent(ctx_);
		if (!extent)
			throw std::runtime_error("Renderer: window surface has no usable extent");

		const VkSurfaceFormatKHR format = Swapchain::surfaceFormat(ctx_);
		renderPass_ = RenderPass(ctx_.device(), format.format);

		vertShader_ = ShaderModule(ctx_.device(), config.vertShaderPath);
		fragShader_ = ShaderModule(ctx_.device(), config.fragShaderPath);

		vertices_ = VertexBuffer(ctx_.device(), ctx_.physicalDevice(), triangleVertices());

		replaceGeneration_(Swapchain(ctx_, *extent));
	}

	frame::RebuildResult Renderer::rebuild()
	{
		const auto extent = Swapchain::surfaceExtent(ctx_);
		if (!extent)
			return frame::RebuildResult::Skipped;

		const VkResult r = vkDeviceWaitIdle(ctx_.device());
		if (r != VK_SUCCESS)
			throw std::runtime_error(std::string("Renderer::rebuild: vkDeviceWaitIdle: ") + string_VkResult(r));

		// The current generation stays untouched until its replacement exists.
		Swapchain next;
		try
		{
			next.create(ctx_, *extent, swap_.handle());
		}
		catch (const SwapchainUnavailable &e)
		{
			std::cerr << "Renderer: " << e.what() << ", keeping current swapchain\n";
			return frame::RebuildResult::Skipped;
		}

		replaceGeneration_(std::move(next));
		return frame::RebuildResult::Rebuilt;
	}

	void Renderer::replaceGeneration_(Swapchain &&next)
	{
		if (next.imageFormat() != renderPass_.colorFormat())
			throw std::runtime_error("Renderer: swapchain format changed; render pass is incompatible");

		// Everything below refers to the old swapchain images.
		presenter_.reset();
		cmds_.reset();
		fbs_.reset();

		swap_ = std::move(next);

		fbs_ = Framebuffers(ctx_.device(), renderPass_, swap_);

		pipeline_ = Pipeline(ctx_.device(),
							 renderPass_.handle(),
							 vertShader_.handle(),
							 fragShader_.handle(),
							 swap_.extent());

		cmds_ = Commands(ctx_.device(), ctx_.indices().graphicsFamily.value(), fbs_.size());
		cmds_.recordTriangle(renderPass_.handle(),
							 fbs_.handles(),
							 swap_.extent(),
							 pipeline_.pipeline(),
							 vertices_.buffer(),
							 vertices_.count());

		if (fbs_.size() != swap_.size() || cmds_.size() != swap_.size())
			throw std::runtime_error("Renderer: framebuffer/command buffer count does not match swapchain");

		presenter_.create(ctx_.device(), ctx_.graphicsQueue(), ctx_.presentQueue(), swap_, cmds_);
	}

} // namespace vktri::vk
