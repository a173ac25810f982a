#include "Surface.hpp"

#include <SDL3/SDL_vulkan.h>
#include <fmt/format.h>

#include <stdexcept>

auto Surface::createSurface(
    const Instance &instance,
    const Window   &window) -> vk::raii::SurfaceKHR
{
    VkSurfaceKHR surface;
    if (!SDL_Vulkan_CreateSurface(window.get(), *instance.handle, nullptr, &surface)) {
        throw std::runtime_error{
            fmt::format("SDL_Vulkan_CreateSurface failed: {}", SDL_GetError())};
    }
    return {instance.handle, surface};
}

Surface::Surface(
    const Instance &instance,
    const Window   &window,
    ResourceGraph  &graph)
    : token{graph, ResourceKind::Surface, {instance.token.handle()}},
      handle{createSurface(
          instance,
          window)}
{
}
