#include "vktri/vk/ShaderModule.hpp"

#include <algorithm>
#include <fstream>
#include <stdexcept>

namespace vktri::vk
{

	std::vector<char> readFile(const std::string &path)
	{
		std::ifstream f(path, std::ios::binary | std::ios::ate);
		if (!f)
			throw std::runtime_error("readFile failed: " + path);

		const std::streamsize n = f.tellg();
		if (n < 0)
			throw std::runtime_error("readFile: cannot size " + path);

		std::vector<char> out(static_cast<size_t>(n));
		f.seekg(0, std::ios::beg);
		if (!f.read(out.data(), n))
			throw std::runtime_error("readFile: short read " + path);
		return out;
	}

	void ShaderModule::create(VkDevice device, const std::string &spvPath)
	{
		reset();

		const auto bytes = readFile(spvPath);
		if (bytes.empty() || bytes.size() % 4 != 0)
			throw std::runtime_error("ShaderModule: not a SPIR-V binary: " + spvPath);

		// copy into words so pCode is suitably aligned
		std::vector<uint32_t> words(bytes.size() / 4);
		std::copy(bytes.begin(), bytes.end(), reinterpret_cast<char *>(words.data()));

		VkShaderModuleCreateInfo ci{};
		ci.sType = VK_STRUCTURE_TYPE_SHADER_MODULE_CREATE_INFO;
		ci.codeSize = bytes.size();
		ci.pCode = words.data();

		if (vkCreateShaderModule(device, &ci, nullptr, &module_) != VK_SUCCESS)
			throw std::runtime_error("vkCreateShaderModule failed: " + spvPath);

		device_ = device;
		path_ = spvPath;
	}

	void ShaderModule::reset() noexcept
	{
		if (device_ != VK_NULL_HANDLE && module_ != VK_NULL_HANDLE)
			vkDestroyShaderModule(device_, module_, nullptr);

		module_ = VK_NULL_HANDLE;
		device_ = VK_NULL_HANDLE;
		path_.clear();
	}

}
