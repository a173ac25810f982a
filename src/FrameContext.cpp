#include "FrameContext.hpp"

#include <stdexcept>

FrameContext::FrameContext(
    const Device  &device,
    uint32_t       maxFrames,
    ResourceGraph &graph)
    : maxFramesInFlight(maxFrames)
{
    if (maxFrames == 0) {
        throw std::invalid_argument("maxFramesInFlight must be >= 1");
    }

    commands.reserve(maxFramesInFlight);
    for (uint32_t i = 0; i < maxFramesInFlight; ++i) {
        commands.emplace_back(device, graph);
    }

    syncs.reserve(maxFramesInFlight);
    for (uint32_t i = 0; i < maxFramesInFlight; ++i) {
        syncs.emplace_back(device, graph);
    }
}

auto FrameContext::maxFrames() const -> uint32_t
{
    return maxFramesInFlight;
}

auto FrameContext::cmd(uint32_t slot) -> vk::raii::CommandBuffer &
{
    return commands.at(slot).buffer;
}

auto FrameContext::sync(uint32_t slot) const -> const FrameSync &
{
    return syncs.at(slot);
}
