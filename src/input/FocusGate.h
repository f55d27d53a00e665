#pragma once

#include "identity/SecondaryInstanceFlag.h"
#include "input/InputEvent.h"
#include "input/InputRouting.h"

#include <memory>
#include <mutex>
#include <span>

#include <spdlog/logger.h>

namespace twinboot::input {

// Keeps pointer/touch input off in a secondary (clone) instance until the
// window system first gives it foreground focus. The UI input module otherwise
// reports errors for events that arrive before focus is attached to the right
// instance.
//
// One-way: after the first focus gain input stays enabled, focus loss does not
// re-disable it. Does nothing at all in a primary instance.
//
// Engage() may arrive from the thread running the bootstrap while focus
// events arrive from the window thread; both are serialized internally.
class FocusGate {
public:
    FocusGate(IPointerInputRouting& routing,
              const identity::SecondaryInstanceFlag& secondary,
              std::shared_ptr<spdlog::logger> logger);

    // Disables pointer and touch routing if this process is a secondary
    // instance and the gate has not been released yet.
    void Engage();

    void OnFocusGained();
    void OnFocusLost();
    void OnApplicationFocus(bool focused) { focused ? OnFocusGained() : OnFocusLost(); }

    // Feeds the focus events of one frame's input queue through the gate.
    void Consume(std::span<const InputEvent> events);

    [[nodiscard]] bool IsActive() const noexcept { return m_secondary.IsSet(); }
    [[nodiscard]] bool IsEngaged() const;
    [[nodiscard]] bool IsReleased() const;

private:
    IPointerInputRouting& m_routing;
    const identity::SecondaryInstanceFlag& m_secondary;
    std::shared_ptr<spdlog::logger> m_log;

    mutable std::mutex m_mutex;
    bool m_focused = false;
    bool m_engaged = false;
    bool m_released = false;
};

} // namespace twinboot::input
