#include <vktri/VulkanApp.hpp>
#include <vktri/frame/FrameLoop.hpp>
#include <vktri/vk/Renderer.hpp>

#include <iostream>

namespace vktri
{

    void VulkanApp::run()
    {
        vk::Renderer renderer(config_);
        frame::FrameLoop loop(renderer.presenter(), renderer, renderer.window());

        while (loop.running())
        {
            for (const auto &event : renderer.pollEvents())
                loop.handleEvent(event);

            if (loop.running())
                loop.tick();
        }

        const frame::FrameStats &s = loop.stats();
        std::cout << "vktri: " << s.presented << " frames presented, "
                  << s.dropped << " dropped, "
                  << s.rebuilds << " swapchain rebuilds\n";
    }

}
