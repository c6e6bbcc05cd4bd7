#include "vktri/vk/Pipeline.hpp"
#include "vktri/vk/Vertex.hpp"

#include <stdexcept>

namespace vktri::vk
{

	void Pipeline::create(VkDevice device,
						  VkRenderPass renderPass,
						  VkShaderModule vertShader,
						  VkShaderModule fragShader,
						  VkExtent2D extent)
	{
		reset();
		device_ = device;
		extent_ = extent;

		VkPipelineLayoutCreateInfo lci{};
		lci.sType = VK_STRUCTURE_TYPE_PIPELINE_LAYOUT_CREATE_INFO;

		if (vkCreatePipelineLayout(device_, &lci, nullptr, &layout_) != VK_SUCCESS)
			throw std::runtime_error("vkCreatePipelineLayout failed");

		VkPipelineShaderStageCreateInfo stages[2]{};
		stages[0].sType = VK_STRUCTURE_TYPE_PIPELINE_SHADER_STAGE_CREATE_INFO;
		stages[0].stage = VK_SHADER_STAGE_VERTEX_BIT;
		stages[0].module = vertShader;
		stages[0].pName = "main";

		stages[1].sType = VK_STRUCTURE_TYPE_PIPELINE_SHADER_STAGE_CREATE_INFO;
		stages[1].stage = VK_SHADER_STAGE_FRAGMENT_BIT;
		stages[1].module = fragShader;
		stages[1].pName = "main";

		const auto bind = Vertex::bindingDescription();
		const auto attrs = Vertex::attributeDescriptions();

		VkPipelineVertexInputStateCreateInfo vin{};
		vin.sType = VK_STRUCTURE_TYPE_PIPELINE_VERTEX_INPUT_STATE_CREATE_INFO;
		vin.vertexBindingDescriptionCount = 1;
		vin.pVertexBindingDescriptions = &bind;
		vin.vertexAttributeDescriptionCount = static_cast<uint32_t>(attrs.size());
		vin.pVertexAttributeDescriptions = attrs.data();

		VkPipelineInputAssemblyStateCreateInfo ia{};
		ia.sType = VK_STRUCTURE_TYPE_PIPELINE_INPUT_ASSEMBLY_STATE_CREATE_INFO;
		ia.topology = VK_PRIMITIVE_TOPOLOGY_TRIANGLE_LIST;

		VkViewport vp{};
		vp.x = 0.f;
		vp.y = 0.f;
		vp.width = static_cast<float>(extent.width);
		vp.height = static_cast<float>(extent.height);
		vp.minDepth = 0.f;
		vp.maxDepth = 1.f;

		VkRect2D sc{};
		sc.extent = extent;

		VkPipelineViewportStateCreateInfo vps{};
		vps.sType = VK_STRUCTURE_TYPE_PIPELINE_VIEWPORT_STATE_CREATE_INFO;
		vps.viewportCount = 1;
		vps.pViewports = &vp;
		vps.scissorCount = 1;
		vps.pScissors = &sc;

		VkPipelineRasterizationStateCreateInfo rs{};
		rs.sType = VK_STRUCTURE_TYPE_PIPELINE_RASTERIZATION_STATE_CREATE_INFO;
		rs.polygonMode = VK_POLYGON_MODE_FILL;
		rs.cullMode = VK_CULL_MODE_NONE;
		rs.frontFace = VK_FRONT_FACE_COUNTER_CLOCKWISE;
		rs.lineWidth = 1.f;

		VkPipelineMultisampleStateCreateInfo ms{};
		ms.sType = VK_STRUCTURE_TYPE_PIPELINE_MULTISAMPLE_STATE_CREATE_INFO;
		ms.rasterizationSamples = VK_SAMPLE_COUNT_1_BIT;

		VkPipelineColorBlendAttachmentState cba{};
		cba.colorWriteMask = VK_COLOR_COMPONENT_R_BIT | VK_COLOR_COMPONENT_G_BIT | VK_COLOR_COMPONENT_B_BIT | VK_COLOR_COMPONENT_A_BIT;

		VkPipelineColorBlendStateCreateInfo cb{};
		cb.sType = VK_STRUCTURE_TYPE_PIPELINE_COLOR_BLEND_STATE_CREATE_INFO;
		cb.attachmentCount = 1;
		cb.pAttachments = &cba;

		VkGraphicsPipelineCreateInfo pci{};
		pci.sType = VK_STRUCTURE_TYPE_GRAPHICS_PIPELINE_CREATE_INFO;
		pci.stageCount = 2;
		pci.pStages = stages;
		pci.pVertexInputState = &vin;
		pci.pInputAssemblyState = &ia;
		pci.pViewportState = &vps;
		pci.pRasterizationState = &rs;
		pci.pMultisampleState = &ms;
		pci.pColorBlendState = &cb;
		pci.layout = layout_;
		pci.renderPass = renderPass;
		pci.subpass = 0;

		if (vkCreateGraphicsPipelines(device_, VK_NULL_HANDLE, 1, &pci, nullptr, &pipeline_) != VK_SUCCESS)
			throw std::runtime_error("vkCreateGraphicsPipelines failed");
	}

	void Pipeline::reset() noexcept
	{
		if (device_ != VK_NULL_HANDLE)
		{
			if (pipeline_)
				vkDestroyPipeline(device_, pipeline_, nullptr);
			if (layout_)
				vkDestroyPipelineLayout(device_, layout_, nullptr);
		}
		device_ = VK_NULL_HANDLE;
		pipeline_ = VK_NULL_HANDLE;
		layout_ = VK_NULL_HANDLE;
		extent_ = VkExtent2D{};
	}

} // namespace vktri::vk
