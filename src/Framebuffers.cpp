#include "Framebuffers.hpp"

#include <spdlog/spdlog.h>

#include <stdexcept>

Framebuffers::Framebuffers(
    const Device     &device,
    const Swapchain  &swapchain,
    const RenderPass &renderPass,
    ResourceGraph    &graph)
    : device{device},
      swapchain{swapchain},
      renderPass{renderPass},
      graph{graph}
{
    create();
}

auto Framebuffers::create() -> void
{
    clear();

    const auto extent = swapchain.extent();

    tokens.reserve(swapchain.imageViews.size());
    handles.reserve(swapchain.imageViews.size());

    for (const auto &imageView : swapchain.imageViews) {
        tokens.emplace_back(
            graph,
            ResourceKind::Framebuffer,
            std::initializer_list<ResourceHandle>{
                device.token.handle(),
                swapchain.token.handle(),
                renderPass.token.handle()});

        const auto attachment = *imageView;

        handles.emplace_back(
            device.handle,
            vk::FramebufferCreateInfo{
                {},
                *renderPass.handle,
                attachment,
                extent.width,
                extent.height,
                1});
    }

    spdlog::debug("Created {} framebuffers", handles.size());
}

auto Framebuffers::clear() -> void
{
    while (!handles.empty()) {
        handles.pop_back();
    }

    while (!tokens.empty()) {
        tokens.pop_back();
    }
}

auto Framebuffers::size() const -> std::size_t
{
    return handles.size();
}

auto Framebuffers::operator[](uint32_t imageIndex) const -> const vk::raii::Framebuffer &
{
    if (imageIndex >= handles.size()) {
        throw std::out_of_range{"framebuffer index out of range"};
    }
    return handles[imageIndex];
}
