#include "Command.hpp"

Command::Command(
    const Device  &device,
    ResourceGraph &graph)
    : token{graph, ResourceKind::CommandRecorder, {device.token.handle()}},
      pool{
          device.handle,
          vk::CommandPoolCreateInfo{
              vk::CommandPoolCreateFlagBits::eResetCommandBuffer,
              device.queueFamilyIndices.graphicsIndex}},
      buffer{std::move(
          vk::raii::CommandBuffers{
              device.handle,
              vk::CommandBufferAllocateInfo{
                  pool,
                  vk::CommandBufferLevel::ePrimary,
                  1}}
              .front())}
{
}
