#pragma once

#include <vector>

#include "vktri/Config.hpp"
#include "vktri/frame/FrameTarget.hpp"
#include "vktri/frame/WindowEvent.hpp"
#include "vktri/vk/VkContext.hpp"
#include "vktri/vk/Swapchain.hpp"
#include "vktri/vk/RenderPass.hpp"
#include "vktri/vk/ShaderModule.hpp"
#include "vktri/vk/Pipeline.hpp"
#include "vktri/vk/Framebuffers.hpp"
#include "vktri/vk/Commands.hpp"
#include "vktri/vk/Buffer.hpp"
#include "vktri/vk/FramePresenter.hpp"

struct GLFWwindow;

namespace vktri::vk
{

	// Owns every GPU object of the triangle renderer.
	//
	// The render pass, shader modules and vertex buffer live for the whole
	// session. Swapchain, framebuffers, pipeline, command buffers and the
	// presenter form one generation and are replaced together by rebuild().
	class Renderer : public frame::SwapchainRebuilder
	{
	public:
		Renderer() = default;
		explicit Renderer(const AppConfig &config) { init(config); }

		~Renderer() noexcept override;

		Renderer(const Renderer &) = delete;
		Renderer &operator=(const Renderer &) = delete;
		Renderer(Renderer &&) = delete;
		Renderer &operator=(Renderer &&) = delete;

		void init(const AppConfig &config);

		frame::RebuildResult rebuild() override;

		// Stays the same object across rebuilds.
		frame::FrameTarget &presenter() { return presenter_; }

		GLFWwindow *window() const { return ctx_.window(); }
		std::vector<frame::WindowEvent> pollEvents() { return ctx_.pollEvents(); }

	private:
		void replaceGeneration_(Swapchain &&next);

		VkContext ctx_{};

		RenderPass renderPass_{};
		ShaderModule vertShader_{};
		ShaderModule fragShader_{};
		VertexBuffer vertices_{};

		Swapchain swap_{};
		Framebuffers fbs_{};
		Pipeline pipeline_{};
		Commands cmds_{};
		FramePresenter presenter_{};
	};

} // namespace vktri::vk
