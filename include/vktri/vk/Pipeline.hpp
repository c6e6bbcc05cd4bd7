#pragma once

#include <utility>
#include <vulkan/vulkan.h>

namespace vktri::vk
{

	// Graphics pipeline with the viewport baked in, so it is rebuilt with
	// every swapchain generation. Shader modules and the render pass are
	// borrowed and must outlive it.
	class Pipeline
	{
	public:
		Pipeline() = default;

		Pipeline(VkDevice device,
				 VkRenderPass renderPass,
				 VkShaderModule vertShader,
				 VkShaderModule fragShader,
				 VkExtent2D extent)
		{
			create(device, renderPass, vertShader, fragShader, extent);
		}

		~Pipeline() noexcept { reset(); }

		Pipeline(const Pipeline &) = delete;
		Pipeline &operator=(const Pipeline &) = delete;

		Pipeline(Pipeline &&other) noexcept { *this = std::move(other); }
		Pipeline &operator=(Pipeline &&other) noexcept
		{
			if (this != &other)
			{
				reset();

				device_ = other.device_;
				layout_ = other.layout_;
				pipeline_ = other.pipeline_;
				extent_ = other.extent_;

				other.device_ = VK_NULL_HANDLE;
				other.layout_ = VK_NULL_HANDLE;
				other.pipeline_ = VK_NULL_HANDLE;
				other.extent_ = VkExtent2D{};
			}
			return *this;
		}

		void create(VkDevice device,
					VkRenderPass renderPass,
					VkShaderModule vertShader,
					VkShaderModule fragShader,
					VkExtent2D extent);

		void reset() noexcept;

		VkPipelineLayout layout() const { return layout_; }
		VkPipeline pipeline() const { return pipeline_; }
		VkExtent2D extent() const { return extent_; }

	private:
		VkDevice device_ = VK_NULL_HANDLE;

		VkPipelineLayout layout_ = VK_NULL_HANDLE;
		VkPipeline pipeline_ = VK_NULL_HANDLE;

		VkExtent2D extent_{};
	};

}
