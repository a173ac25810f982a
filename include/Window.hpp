#pragma once

#include <vulkan/vulkan.hpp>

#include <SDL3/SDL_video.h>

#include <memory>
#include <vector>

#include "RendererConfig.hpp"

struct WindowDeleter {
    void operator()(SDL_Window *window) const;
};

using Window = std::unique_ptr<SDL_Window, WindowDeleter>;

// Initializes SDL video and the Vulkan loader; the returned window shuts SDL
// down again when destroyed.
auto createWindow(const RendererConfig &config) -> Window;

auto getFramebufferExtent(SDL_Window *window) -> vk::Extent2D;

// Drains pending events; true once the user asked to close the window
[[nodiscard]]
auto pollEvents(SDL_Window *window) -> bool;

// Blocks until at least one event arrives, then drains the queue like
// pollEvents
[[nodiscard]]
auto waitEvents(SDL_Window *window) -> bool;

// Instance extensions SDL needs to present to its windows
auto getRequiredInstanceExtensions() -> std::vector<const char *>;
