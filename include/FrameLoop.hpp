#pragma once

#include <cstdint>
#include <functional>
#include <string_view>

#include "FrameBackend.hpp"

enum class FrameState {
    Idle,
    WaitingOnFence,
    ImageAcquired,
    Recording,
    Submitted,
    Presenting,
    Draining,
};

auto toString(FrameState state) -> std::string_view;

// Drives one frame at a time through the fence / semaphore handshake and
// rotates through the backend's frame slots.
class FrameLoop
{
  public:
    explicit FrameLoop(FrameBackend &backend);

    // Renders one frame. Returns false when the frame was skipped because the
    // presentation targets had to be rebuilt first.
    auto renderFrame() -> bool;

    // Renders until closeRequested() returns true or the window is closed
    // during target recreation, then drains the device.
    // On failure the device is drained as far as possible and the original
    // error is rethrown.
    auto run(const std::function<bool()> &closeRequested) -> void;

    // Waits for the device to go idle; only the first call has an effect
    auto drain() -> void;

    [[nodiscard]]
    auto state() const -> FrameState;

    [[nodiscard]]
    auto currentSlot() const -> uint32_t;

    [[nodiscard]]
    auto framesPresented() const -> uint64_t;

    [[nodiscard]]
    auto framesSkipped() const -> uint64_t;

    // Set when target recreation saw a close request
    [[nodiscard]]
    auto closePending() const -> bool;

  private:
    auto transition(FrameState next) -> void;

    FrameBackend &backend;
    FrameState    frameState = FrameState::Idle;
    uint32_t      slot       = 0;
    uint64_t      presented  = 0;
    uint64_t      skipped    = 0;
    bool          drained    = false;
    bool          closing    = false;
};
