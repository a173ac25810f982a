#pragma once

#include <cstdint>
#include <vector>

#include <vulkan/vulkan_raii.hpp>

#include "Command.hpp"
#include "Device.hpp"
#include "ResourceGraph.hpp"
#include "Sync.hpp"

// Per-slot command recorders and synchronization sets
class FrameContext
{
  public:
    FrameContext(
        const Device  &device,
        uint32_t       maxFramesInFlight,
        ResourceGraph &graph);

    [[nodiscard]]
    auto maxFrames() const -> uint32_t;

    auto cmd(uint32_t slot) -> vk::raii::CommandBuffer &;

    [[nodiscard]]
    auto sync(uint32_t slot) const -> const FrameSync &;

  private:
    uint32_t maxFramesInFlight = 0;

    // Per-frame command pools + buffers
    std::vector<Command> commands;

    // Per-frame synchronization
    std::vector<FrameSync> syncs;
};
