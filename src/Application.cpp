#include "Application.hpp"

#include <spdlog/spdlog.h>

namespace
{

auto requiredDeviceExtensions() -> const std::vector<const char *> &
{
    static const auto extensions = std::vector<const char *>{VK_KHR_SWAPCHAIN_EXTENSION_NAME};
    return extensions;
}

} // namespace

Application::Application(const RendererConfig &config)
    : graph{},
      window{createWindow(config)},
      renderContext{
          config,
          window,
          requiredDeviceExtensions(),
          graph},
      renderer{
          renderContext,
          config,
          graph},
      loop{renderer}
{
    spdlog::info(
        "Ready: {} frame slot(s), {} graph objects live",
        renderer.slotCount(),
        graph.liveCount());
}

void Application::run()
{
    loop.run([this] { return pollEvents(window.get()); });
}
