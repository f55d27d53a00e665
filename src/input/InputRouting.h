#pragma once

#include "input/InputEvent.h"

#include <atomic>

namespace twinboot::input {

// -----------------------------------------------------------------------------
// IPointerInputRouting - switch for the UI input module
// -----------------------------------------------------------------------------

// The UI layer routes pointer and touch events to widgets. The focus gate only
// needs to flip these two switches; it never routes events itself.
class IPointerInputRouting {
public:
    virtual ~IPointerInputRouting() = default;

    virtual void SetPointerInputEnabled(bool enabled) = 0;
    virtual void SetTouchInputEnabled(bool enabled) = 0;
};

// Default routing switch: keeps the two flags and tells the frame loop which
// queued events to forward to the UI.
class InputRoutingSwitch final : public IPointerInputRouting {
public:
    void SetPointerInputEnabled(bool enabled) override { m_pointer.store(enabled, std::memory_order_release); }
    void SetTouchInputEnabled(bool enabled) override { m_touch.store(enabled, std::memory_order_release); }

    [[nodiscard]] bool PointerInputEnabled() const noexcept { return m_pointer.load(std::memory_order_acquire); }
    [[nodiscard]] bool TouchInputEnabled() const noexcept { return m_touch.load(std::memory_order_acquire); }

    // Keyboard and focus events always pass.
    [[nodiscard]] bool Accepts(const InputEvent& ev) const noexcept
    {
        if (IsPointerEvent(ev.type)) return PointerInputEnabled();
        if (IsTouchEvent(ev.type))   return TouchInputEnabled();
        return true;
    }

private:
    std::atomic<bool> m_pointer{true};
    std::atomic<bool> m_touch{true};
};

} // namespace twinboot::input
