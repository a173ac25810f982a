#pragma once
#include "FrameLoop.hpp"
#include "RenderContext.hpp"
#include "Renderer.hpp"
#include "RendererConfig.hpp"
#include "ResourceGraph.hpp"
#include "Window.hpp"

// Everything the triangle needs, constructed in dependency order and destroyed
// in reverse. The graph outlives every object registered in it.
struct Application {
    explicit Application(const RendererConfig &config);

    // Renders until the window is closed, then waits for the device to idle
    void run();

    ResourceGraph graph;
    Window        window;
    RenderContext renderContext;
    Renderer      renderer;
    FrameLoop     loop;
};
