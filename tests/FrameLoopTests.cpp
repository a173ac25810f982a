#include "FrameLoop.hpp"
#include "CapturedLog.hpp"

#include <fmt/format.h>

#include <deque>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace
{

// Records every backend call and models the fence of each slot, so a wait on
// a fence that can never signal is reported instead of hanging.
struct ScriptedBackend final : FrameBackend {
    ScriptedBackend(
        std::shared_ptr<std::vector<std::string>> events,
        uint32_t                                  slots)
        : events{std::move(events)},
          fenceSignaled(slots, true),
          slots{slots}
    {
    }

    auto slotCount() const -> uint32_t override { return slots; }

    auto waitForFence(uint32_t slot) -> void override
    {
        events->push_back(fmt::format("wait:{}", slot));
        if (!fenceSignaled[slot]) {
            throw std::runtime_error{"wait on a fence that will never signal"};
        }
    }

    auto resetFence(uint32_t slot) -> void override
    {
        events->push_back(fmt::format("resetFence:{}", slot));
        fenceSignaled[slot] = false;
    }

    auto acquireImage(uint32_t slot) -> AcquireResult override
    {
        events->push_back(fmt::format("acquire:{}", slot));

        auto status = TargetStatus::Ready;
        if (!acquireScript.empty()) {
            status = acquireScript.front();
            acquireScript.pop_front();
        }

        const auto image = nextImage;
        nextImage        = (nextImage + 1) % 3;
        return {status, image};
    }

    auto resetCommands(uint32_t slot) -> void override
    {
        events->push_back(fmt::format("resetCommands:{}", slot));
    }

    auto recordCommands(
        uint32_t slot,
        uint32_t imageIndex) -> void override
    {
        events->push_back(fmt::format("record:{}:{}", slot, imageIndex));
    }

    auto submit(
        uint32_t slot,
        uint32_t imageIndex) -> void override
    {
        events->push_back(fmt::format("submit:{}", slot));
        submittedImages.push_back(imageIndex);
        if (failSubmit) {
            throw std::runtime_error{"submit failed"};
        }
        // the fake device finishes instantly
        fenceSignaled[slot] = true;
    }

    auto present(
        uint32_t slot,
        uint32_t imageIndex) -> TargetStatus override
    {
        events->push_back(fmt::format("present:{}:{}", slot, imageIndex));
        presentedImages.push_back(imageIndex);
        ++presents;

        if (!presentScript.empty()) {
            const auto status = presentScript.front();
            presentScript.pop_front();
            return status;
        }
        return TargetStatus::Ready;
    }

    auto recreateTargets() -> bool override
    {
        events->push_back("recreate");
        ++recreations;
        return !closeDuringRecreate;
    }

    auto waitIdle() -> void override
    {
        events->push_back("waitIdle");
        ++idleWaits;
        if (failWaitIdle) {
            throw std::runtime_error{"device lost"};
        }
    }

    std::shared_ptr<std::vector<std::string>> events;
    std::vector<bool>                         fenceSignaled;
    uint32_t                                  slots;
    uint32_t                                  nextImage = 0;
    std::deque<TargetStatus>                  acquireScript;
    std::deque<TargetStatus>                  presentScript;
    std::vector<uint32_t>                     submittedImages;
    std::vector<uint32_t>                     presentedImages;
    bool                                      failSubmit          = false;
    bool                                      failWaitIdle        = false;
    bool                                      closeDuringRecreate = false;
    int                                       presents            = 0;
    int                                       recreations         = 0;
    int                                       idleWaits           = 0;
};

// Stands in for a wrapper torn down after the loop returns
struct TeardownMarker {
    std::shared_ptr<std::vector<std::string>> events;
    ~TeardownMarker() { events->push_back("destroy"); }
};

auto indexOf(
    const std::vector<std::string> &events,
    std::string_view                event,
    std::size_t                     from = 0) -> std::size_t
{
    for (auto i = from; i < events.size(); ++i) {
        if (events[i] == event) return i;
    }
    return events.size();
}

auto count(
    const std::vector<std::string> &events,
    std::string_view                event) -> std::size_t
{
    std::size_t matches = 0;
    for (const auto &e : events) {
        if (e == event) ++matches;
    }
    return matches;
}

bool test_fence_wait_precedes_command_reset()
{
    auto events  = std::make_shared<std::vector<std::string>>();
    auto backend = ScriptedBackend{events, 2};
    auto loop    = FrameLoop{backend};

    for (int frame = 0; frame < 6; ++frame) {
        if (!loop.renderFrame()) return false;
    }

    // every reset of a slot's recorder is preceded by a wait on that slot's
    // fence issued after the slot's previous submission
    for (std::size_t i = 0; i < events->size(); ++i) {
        const auto &event = (*events)[i];
        if (!event.starts_with("resetCommands:")) continue;

        const auto slot       = event.substr(event.find(':') + 1);
        auto       lastWait   = std::string::npos;
        auto       lastSubmit = std::string::npos;
        for (std::size_t j = 0; j < i; ++j) {
            if ((*events)[j] == "wait:" + slot) lastWait = j;
            if ((*events)[j] == "submit:" + slot) lastSubmit = j;
        }

        if (lastWait == std::string::npos) return false;
        if (lastSubmit != std::string::npos && lastSubmit > lastWait) return false;
    }

    return loop.framesPresented() == 6 && loop.currentSlot() == 0
        && loop.state() == FrameState::Idle;
}

bool test_submit_and_present_share_the_acquired_image()
{
    auto events  = std::make_shared<std::vector<std::string>>();
    auto backend = ScriptedBackend{events, 2};
    auto loop    = FrameLoop{backend};

    for (int frame = 0; frame < 4; ++frame) {
        if (!loop.renderFrame()) return false;
    }

    // render-complete is signaled and waited per image, not per slot
    const auto expected = std::vector<uint32_t>{0, 1, 2, 0};
    return backend.submittedImages == expected && backend.presentedImages == expected;
}

bool test_three_frames_then_close()
{
    auto events = std::make_shared<std::vector<std::string>>();
    {
        TeardownMarker marker{events};
        auto          backend = ScriptedBackend{events, 1};
        auto          loop    = FrameLoop{backend};

        loop.run([&] { return backend.presents >= 3; });

        if (loop.framesPresented() != 3 || backend.idleWaits != 1) return false;
        if (loop.state() != FrameState::Draining) return false;

        // a second drain is a no-op
        loop.drain();
        if (backend.idleWaits != 1) return false;
    }

    const auto idle      = indexOf(*events, "waitIdle");
    const auto destroyed = indexOf(*events, "destroy");

    // idle after the third present and before anything is torn down
    auto lastPresent = std::size_t{0};
    for (std::size_t i = 0; i < events->size(); ++i) {
        if ((*events)[i].starts_with("present:")) lastPresent = i;
    }

    return count(*events, "waitIdle") == 1 && idle == lastPresent + 1 && idle < destroyed
        && destroyed == events->size() - 1;
}

bool test_out_of_date_acquire_skips_frame()
{
    auto events           = std::make_shared<std::vector<std::string>>();
    auto backend          = ScriptedBackend{events, 1};
    backend.acquireScript = {TargetStatus::OutOfDate};
    auto loop             = FrameLoop{backend};

    if (loop.renderFrame()) return false;

    const auto expected = std::vector<std::string>{"wait:0", "acquire:0", "recreate"};
    if (*events != expected) return false;

    // the fence was never reset, so the next frame can wait on it
    if (!loop.renderFrame()) return false;

    return backend.recreations == 1 && loop.framesPresented() == 1
        && loop.framesSkipped() == 1 && count(*events, "resetFence:0") == 1;
}

bool test_suboptimal_targets_recreated_after_present()
{
    auto events           = std::make_shared<std::vector<std::string>>();
    auto backend          = ScriptedBackend{events, 1};
    backend.acquireScript = {TargetStatus::Suboptimal};
    backend.presentScript = {TargetStatus::Ready, TargetStatus::OutOfDate};
    auto loop             = FrameLoop{backend};

    // suboptimal acquire still renders, then recreates
    if (!loop.renderFrame()) return false;
    if (backend.recreations != 1) return false;
    if (indexOf(*events, "recreate") < indexOf(*events, "present:0:0")) return false;

    // out of date on present
    if (!loop.renderFrame()) return false;
    if (backend.recreations != 2) return false;

    if (!loop.renderFrame()) return false;
    return backend.recreations == 2 && loop.framesPresented() == 3;
}

bool test_close_while_minimized_ends_loop()
{
    auto events                 = std::make_shared<std::vector<std::string>>();
    auto backend                = ScriptedBackend{events, 1};
    backend.acquireScript       = {TargetStatus::OutOfDate};
    backend.closeDuringRecreate = true;
    auto loop                   = FrameLoop{backend};

    // the caller never reports a close itself
    auto polls = 0;
    loop.run([&] { return ++polls > 100; });

    const auto expected =
        std::vector<std::string>{"wait:0", "acquire:0", "recreate", "waitIdle"};

    return *events == expected && loop.closePending() && backend.idleWaits == 1
        && loop.state() == FrameState::Draining && loop.framesSkipped() == 1
        && polls == 1;
}

bool test_close_after_present_recreation_ends_loop()
{
    auto events                 = std::make_shared<std::vector<std::string>>();
    auto backend                = ScriptedBackend{events, 2};
    backend.presentScript       = {TargetStatus::OutOfDate};
    backend.closeDuringRecreate = true;
    auto loop                   = FrameLoop{backend};

    loop.run([] { return false; });

    return loop.framesPresented() == 1 && backend.recreations == 1
        && backend.idleWaits == 1 && events->back() == "waitIdle"
        && indexOf(*events, "recreate") == indexOf(*events, "present:0:0") + 1;
}

bool test_failure_drains_and_rethrows()
{
    auto events        = std::make_shared<std::vector<std::string>>();
    auto backend       = ScriptedBackend{events, 2};
    backend.failSubmit = true;
    auto loop          = FrameLoop{backend};

    try {
        loop.run([] { return false; });
        return false;
    } catch (const std::runtime_error &error) {
        if (std::string_view{error.what()} != "submit failed") return false;
    }

    return backend.idleWaits == 1 && loop.state() == FrameState::Draining
        && events->back() == "waitIdle";
}

bool test_failed_drain_keeps_original_error()
{
    CapturedLog log{spdlog::level::err};

    auto events          = std::make_shared<std::vector<std::string>>();
    auto backend         = ScriptedBackend{events, 1};
    backend.failSubmit   = true;
    backend.failWaitIdle = true;
    auto loop            = FrameLoop{backend};

    auto ok = false;
    try {
        loop.run([] { return false; });
    } catch (const std::runtime_error &error) {
        ok = std::string_view{error.what()} == "submit failed";
    }

    return ok && backend.idleWaits == 1
        && log.count("Device drain after failure failed") == 1;
}

bool test_zero_slots_rejected()
{
    auto events  = std::make_shared<std::vector<std::string>>();
    auto backend = ScriptedBackend{events, 0};

    try {
        FrameLoop loop{backend};
    } catch (const std::invalid_argument &) {
        return true;
    }
    return false;
}

} // namespace

int main()
{
    const bool ok_fence      = test_fence_wait_precedes_command_reset();
    const bool ok_images     = test_submit_and_present_share_the_acquired_image();
    const bool ok_close      = test_three_frames_then_close();
    const bool ok_stale      = test_out_of_date_acquire_skips_frame();
    const bool ok_suboptimal = test_suboptimal_targets_recreated_after_present();
    const bool ok_minimized  = test_close_while_minimized_ends_loop();
    const bool ok_closed     = test_close_after_present_recreation_ends_loop();
    const bool ok_failure    = test_failure_drains_and_rethrows();
    const bool ok_drain      = test_failed_drain_keeps_original_error();
    const bool ok_slots      = test_zero_slots_rejected();

    if (!ok_fence) fmt::print(stderr, "[frame-loop-tests] recorder reset before fence wait\n");
    if (!ok_images) fmt::print(stderr, "[frame-loop-tests] submit and present used different images\n");
    if (!ok_close) fmt::print(stderr, "[frame-loop-tests] close did not drain exactly once\n");
    if (!ok_stale) fmt::print(stderr, "[frame-loop-tests] out-of-date acquire mishandled\n");
    if (!ok_suboptimal) fmt::print(stderr, "[frame-loop-tests] suboptimal targets not recreated\n");
    if (!ok_minimized) fmt::print(stderr, "[frame-loop-tests] close while minimized ignored\n");
    if (!ok_closed) fmt::print(stderr, "[frame-loop-tests] close during recreation ignored\n");
    if (!ok_failure) fmt::print(stderr, "[frame-loop-tests] failure did not drain and rethrow\n");
    if (!ok_drain) fmt::print(stderr, "[frame-loop-tests] failed drain replaced the error\n");
    if (!ok_slots) fmt::print(stderr, "[frame-loop-tests] zero frame slots accepted\n");

    if (!(ok_fence && ok_images && ok_close && ok_stale && ok_suboptimal && ok_minimized && ok_closed
          && ok_failure && ok_drain && ok_slots)) {
        return 1;
    }
    fmt::print(stderr, "[frame-loop-tests] all tests passed\n");
    return 0;
}
