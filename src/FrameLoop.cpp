#include "FrameLoop.hpp"

#include <spdlog/spdlog.h>

#include <exception>
#include <stdexcept>

auto toString(FrameState state) -> std::string_view
{
    switch (state) {
    case FrameState::Idle:
        return "idle";
    case FrameState::WaitingOnFence:
        return "waiting on fence";
    case FrameState::ImageAcquired:
        return "image acquired";
    case FrameState::Recording:
        return "recording";
    case FrameState::Submitted:
        return "submitted";
    case FrameState::Presenting:
        return "presenting";
    case FrameState::Draining:
        return "draining";
    }
    return "unknown";
}

FrameLoop::FrameLoop(FrameBackend &backend)
    : backend{backend}
{
    if (backend.slotCount() == 0) {
        throw std::invalid_argument{"Frame loop needs at least one frame slot"};
    }
}

auto FrameLoop::transition(FrameState next) -> void
{
    spdlog::trace("frame slot {}: {} -> {}", slot, toString(frameState), toString(next));
    frameState = next;
}

auto FrameLoop::renderFrame() -> bool
{
    // the recorder of this slot may still be executing
    transition(FrameState::WaitingOnFence);
    backend.waitForFence(slot);

    const auto acquired = backend.acquireImage(slot);

    if (acquired.status == TargetStatus::OutOfDate) {
        // the fence stays signaled, so the next wait on this slot returns
        spdlog::debug("Presentation targets out of date on acquire, recreating");
        closing = !backend.recreateTargets();
        transition(FrameState::Idle);
        ++skipped;
        return false;
    }

    transition(FrameState::ImageAcquired);
    backend.resetFence(slot);

    transition(FrameState::Recording);
    backend.resetCommands(slot);
    backend.recordCommands(slot, acquired.imageIndex);

    backend.submit(slot, acquired.imageIndex);
    transition(FrameState::Submitted);

    transition(FrameState::Presenting);
    const auto presentStatus = backend.present(slot, acquired.imageIndex);

    if (acquired.status != TargetStatus::Ready || presentStatus != TargetStatus::Ready) {
        spdlog::debug(
            "Presentation targets {} after present, recreating",
            toString(
                presentStatus != TargetStatus::Ready ? presentStatus : acquired.status));
        closing = !backend.recreateTargets();
    }

    transition(FrameState::Idle);
    ++presented;
    slot = (slot + 1) % backend.slotCount();

    return true;
}

auto FrameLoop::run(const std::function<bool()> &closeRequested) -> void
{
    try {
        while (!closing && !closeRequested()) {
            renderFrame();
        }
    } catch (...) {
        const auto error = std::current_exception();

        transition(FrameState::Draining);
        if (!drained) {
            drained = true;
            try {
                backend.waitIdle();
            } catch (const std::exception &drainError) {
                spdlog::error("Device drain after failure failed: {}", drainError.what());
            }
        }

        std::rethrow_exception(error);
    }

    drain();

    spdlog::info("Frame loop finished after {} frames ({} skipped)", presented, skipped);
}

auto FrameLoop::drain() -> void
{
    if (drained) {
        return;
    }

    transition(FrameState::Draining);
    drained = true;
    backend.waitIdle();
}

auto FrameLoop::state() const -> FrameState
{
    return frameState;
}

auto FrameLoop::currentSlot() const -> uint32_t
{
    return slot;
}

auto FrameLoop::framesPresented() const -> uint64_t
{
    return presented;
}

auto FrameLoop::framesSkipped() const -> uint64_t
{
    return skipped;
}

auto FrameLoop::closePending() const -> bool
{
    return closing;
}
