#pragma once

#include "vktri/Config.hpp"

#include <utility>

namespace vktri
{

	class VulkanApp
	{
	public:
		explicit VulkanApp(AppConfig config) : config_(std::move(config)) {}

		// Opens the window and renders until it is closed.
		void run();

	private:
		AppConfig config_;
	};

}
