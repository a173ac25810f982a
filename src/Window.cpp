#include "Window.hpp"

#include <SDL3/SDL_events.h>
#include <SDL3/SDL_init.h>
#include <SDL3/SDL_vulkan.h>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <stdexcept>

void WindowDeleter::operator()(SDL_Window *window) const
{
    spdlog::debug("Destroying window");
    SDL_DestroyWindow(window);
    SDL_Vulkan_UnloadLibrary();
    SDL_Quit();
}

auto createWindow(const RendererConfig &config) -> Window
{
    // init SDL3
    if (!SDL_Init(SDL_INIT_VIDEO)) {
        throw std::runtime_error{fmt::format("SDL_Init Error: {}", SDL_GetError())};
    }

    // Dynamically load Vulkan loader library
    if (!SDL_Vulkan_LoadLibrary(nullptr)) {
        const auto error = fmt::format("SDL_Vulkan_LoadLibrary Error: {}", SDL_GetError());
        SDL_Quit();
        throw std::runtime_error{error};
    }

    // create Vulkan window, fixed size
    auto window = SDL_CreateWindow(
        config.windowTitle.c_str(),
        static_cast<int>(config.windowWidth),
        static_cast<int>(config.windowHeight),
        SDL_WINDOW_VULKAN);
    if (!window) {
        const auto error = fmt::format("SDL_CreateWindow Error: {}", SDL_GetError());
        SDL_Vulkan_UnloadLibrary();
        SDL_Quit();
        throw std::runtime_error{error};
    }

    spdlog::debug(
        "Created window \"{}\" {}x{}",
        config.windowTitle,
        config.windowWidth,
        config.windowHeight);

    return Window{window};
}

auto getFramebufferExtent(SDL_Window *window) -> vk::Extent2D
{
    int width  = 0;
    int height = 0;
    SDL_GetWindowSizeInPixels(window, &width, &height);

    return vk::Extent2D{static_cast<uint32_t>(width), static_cast<uint32_t>(height)};
}

namespace
{

auto isCloseRequest(
    const SDL_Event &event,
    SDL_Window      *window) -> bool
{
    switch (event.type) {
    case SDL_EVENT_QUIT:
        return true;

    case SDL_EVENT_WINDOW_CLOSE_REQUESTED:
        return event.window.windowID == SDL_GetWindowID(window);

    default:
        return false;
    }
}

} // namespace

auto pollEvents(SDL_Window *window) -> bool
{
    auto closeRequested = false;

    SDL_Event event;
    while (SDL_PollEvent(&event)) {
        if (isCloseRequest(event, window)) {
            closeRequested = true;
        }
    }

    return closeRequested;
}

auto waitEvents(SDL_Window *window) -> bool
{
    SDL_Event event;
    if (!SDL_WaitEvent(&event)) {
        throw std::runtime_error{fmt::format("SDL_WaitEvent failed: {}", SDL_GetError())};
    }

    const auto closeRequested = isCloseRequest(event, window);

    // whatever arrived together with the first event
    return pollEvents(window) || closeRequested;
}

auto getRequiredInstanceExtensions() -> std::vector<const char *>
{
    Uint32 sdlExtensionCount     = 0;
    auto   sdlInstanceExtensions = SDL_Vulkan_GetInstanceExtensions(&sdlExtensionCount);
    if (!sdlInstanceExtensions) {
        throw std::runtime_error{fmt::format(
            "SDL_Vulkan_GetInstanceExtensions failed: {}",
            SDL_GetError())};
    }

    return {sdlInstanceExtensions, sdlInstanceExtensions + sdlExtensionCount};
}
