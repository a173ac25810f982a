// src/Sync.cpp
#include "Sync.hpp"

FrameSync::FrameSync(
    const Device  &device,
    ResourceGraph &graph)
    : token{graph, ResourceKind::FrameSync, {device.token.handle()}},
      imageAvailable{device.handle, vk::SemaphoreCreateInfo{}},
      inFlight{device.handle, vk::FenceCreateInfo{vk::FenceCreateFlagBits::eSignaled}}
{
}
