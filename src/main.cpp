#include <vktri/Config.hpp>
#include <vktri/VulkanApp.hpp>
#include <iostream>

int main(int argc, char **argv)
{
    try
    {
        const vktri::AppConfig config = vktri::parseArgs(argc, argv);
        if (config.showHelp)
        {
            std::cout << vktri::usage();
            return 0;
        }

        vktri::VulkanApp app(config);
        app.run();
    }
    catch (const std::exception &e)
    {
        std::cerr << "Fatal: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
