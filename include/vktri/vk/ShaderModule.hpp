#pragma once

#include <string>
#include <utility>
#include <vector>
#include <vulkan/vulkan.h>

namespace vktri::vk
{

	std::vector<char> readFile(const std::string &path);

	// SPIR-V module loaded once and reused by every pipeline rebuild.
	class ShaderModule
	{
	public:
		ShaderModule() = default;
		ShaderModule(VkDevice device, const std::string &spvPath) { create(device, spvPath); }
		~ShaderModule() noexcept { reset(); }

		ShaderModule(const ShaderModule &) = delete;
		ShaderModule &operator=(const ShaderModule &) = delete;

		ShaderModule(ShaderModule &&other) noexcept { *this = std::move(other); }
		ShaderModule &operator=(ShaderModule &&other) noexcept
		{
			if (this != &other)
			{
				reset();
				device_ = other.device_;
				module_ = other.module_;
				path_ = std::move(other.path_);

				other.device_ = VK_NULL_HANDLE;
				other.module_ = VK_NULL_HANDLE;
			}
			return *this;
		}

		void create(VkDevice device, const std::string &spvPath);
		void reset() noexcept;

		VkShaderModule handle() const { return module_; }
		const std::string &path() const { return path_; }

	private:
		VkDevice device_ = VK_NULL_HANDLE;
		VkShaderModule module_ = VK_NULL_HANDLE;
		std::string path_;
	};

}
