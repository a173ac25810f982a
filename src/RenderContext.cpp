#include "RenderContext.hpp"

RenderContext::RenderContext(
    const RendererConfig            &config,
    const Window                    &window,
    const std::vector<const char *> &requiredExtensions,
    ResourceGraph                   &graph)
    : instance{
          config,
          makeLogSink(),
          graph},
      surface{
          instance,
          window,
          graph},
      physicalDevice{
          instance,
          surface,
          requiredExtensions},
      device{
          instance,
          physicalDevice,
          window,
          requiredExtensions,
          graph},
      swapchain(
          device,
          physicalDevice,
          surface,
          graph)
{
}

auto RenderContext::extent() const -> vk::Extent2D
{
    return swapchain.extent();
}

auto RenderContext::colorFormat() const -> vk::Format
{
    return swapchain.imageFormat;
}
