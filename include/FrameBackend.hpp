#pragma once

#include <cstdint>
#include <string_view>

// Health of the presentation targets as reported by acquire and present
enum class TargetStatus {
    Ready,
    Suboptimal,
    OutOfDate,
};

constexpr auto toString(TargetStatus status) -> std::string_view
{
    switch (status) {
    case TargetStatus::Ready:
        return "ready";
    case TargetStatus::Suboptimal:
        return "suboptimal";
    case TargetStatus::OutOfDate:
        return "out of date";
    }
    return "unknown";
}

struct AcquireResult {
    TargetStatus status     = TargetStatus::Ready;
    uint32_t     imageIndex = 0;
};

// The device-side operations one frame is built from. Slots index the
// per-frame command recorder and synchronization set.
class FrameBackend
{
public:
    virtual ~FrameBackend() = default;

    virtual auto slotCount() const -> uint32_t = 0;

    virtual auto waitForFence(uint32_t slot) -> void = 0;
    virtual auto resetFence(uint32_t slot) -> void   = 0;

    // Signals the slot's image-acquired semaphore
    virtual auto acquireImage(uint32_t slot) -> AcquireResult = 0;

    virtual auto resetCommands(uint32_t slot) -> void                       = 0;
    virtual auto recordCommands(uint32_t slot, uint32_t imageIndex) -> void = 0;

    // Waits on image-acquired, signals the image's render-complete semaphore
    // and the slot's fence
    virtual auto submit(uint32_t slot, uint32_t imageIndex) -> void = 0;

    virtual auto present(uint32_t slot, uint32_t imageIndex) -> TargetStatus = 0;

    // False when the window was closed before the targets could be rebuilt
    virtual auto recreateTargets() -> bool = 0;
    virtual auto waitIdle() -> void        = 0;
};
