#pragma once

#include <string>

namespace vktri
{

	struct AppConfig
	{
		int width = 800;
		int height = 600;
		std::string title = "vktri";

		std::string vertShaderPath;
		std::string fragShaderPath;

#ifdef NDEBUG
		bool enableValidation = false;
#else
		bool enableValidation = true;
#endif

		bool showHelp = false;
	};

	// Directory the build compiles the SPIR-V shaders into.
	const char *defaultShaderDir();

	AppConfig defaultConfig();

	// Throws std::invalid_argument on unknown flags, missing values or
	// non-positive window dimensions.
	AppConfig parseArgs(int argc, const char *const *argv);

	const char *usage();

}
