#include "vktri/Config.hpp"

#include <stdexcept>
#include <string>

#ifndef VKTRI_SHADER_DIR
#define VKTRI_SHADER_DIR "shaders"
#endif

namespace
{

	int parseDimension(const std::string &flag, const std::string &value)
	{
		size_t used = 0;
		int v = 0;
		try
		{
			v = std::stoi(value, &used);
		}
		catch (const std::exception &)
		{
			throw std::invalid_argument(flag + ": not a number: " + value);
		}
		if (used != value.size())
			throw std::invalid_argument(flag + ": not a number: " + value);
		if (v <= 0)
			throw std::invalid_argument(flag + " must be > 0");
		return v;
	}

}

namespace vktri
{

	const char *defaultShaderDir() { return VKTRI_SHADER_DIR; }

	AppConfig defaultConfig()
	{
		AppConfig cfg;
		const std::string dir = defaultShaderDir();
		cfg.vertShaderPath = dir + "/triangle.vert.spv";
		cfg.fragShaderPath = dir + "/triangle.frag.spv";
		return cfg;
	}

	AppConfig parseArgs(int argc, const char *const *argv)
	{
		AppConfig cfg = defaultConfig();

		for (int i = 1; i < argc; ++i)
		{
			const std::string arg = argv[i];

			auto next = [&]() -> std::string
			{
				if (i + 1 >= argc)
					throw std::invalid_argument(arg + " expects a value");
				return argv[++i];
			};

			if (arg == "--width")
				cfg.width = parseDimension(arg, next());
			else if (arg == "--height")
				cfg.height = parseDimension(arg, next());
			else if (arg == "--title")
				cfg.title = next();
			else if (arg == "--vert")
				cfg.vertShaderPath = next();
			else if (arg == "--frag")
				cfg.fragShaderPath = next();
			else if (arg == "--no-validation")
				cfg.enableValidation = false;
			else if (arg == "--help" || arg == "-h")
				cfg.showHelp = true;
			else
				throw std::invalid_argument("unknown argument: " + arg);
		}

		return cfg;
	}

	const char *usage()
	{
		return "usage: vktri [--width N] [--height N] [--title S]\n"
			   "             [--vert PATH] [--frag PATH] [--no-validation] [--help]\n";
	}

}
