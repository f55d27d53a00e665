#include "input/FocusGate.h"

#include <utility>

#include <spdlog/spdlog.h>

namespace twinboot::input {

FocusGate::FocusGate(IPointerInputRouting& routing,
                     const identity::SecondaryInstanceFlag& secondary,
                     std::shared_ptr<spdlog::logger> logger)
    : m_routing(routing)
    , m_secondary(secondary)
    , m_log(logger ? std::move(logger) : spdlog::default_logger())
{
}

void FocusGate::Engage()
{
    std::lock_guard lk(m_mutex);
    if (!IsActive() || m_engaged || m_released)
        return;

    if (m_focused)
    {
        // Detection finished after the window already had focus.
        m_released = true;
        m_log->info("[FocusGate] Secondary instance already focused; input left enabled");
        return;
    }

    m_routing.SetPointerInputEnabled(false);
    m_routing.SetTouchInputEnabled(false);
    m_engaged = true;
    m_log->info("[FocusGate] Secondary instance: pointer/touch input held until first focus");
}

void FocusGate::OnFocusGained()
{
    std::lock_guard lk(m_mutex);
    m_focused = true;
    if (!IsActive())
        return;

    m_routing.SetPointerInputEnabled(true);
    m_routing.SetTouchInputEnabled(true);

    if (!m_released)
        m_log->info("[FocusGate] Focus gained; pointer/touch input enabled");
    m_released = true;
    m_engaged = false;
}

void FocusGate::OnFocusLost()
{
    // Never re-disables input.
    std::lock_guard lk(m_mutex);
    m_focused = false;
    if (IsActive())
        m_log->debug("[FocusGate] Focus lost; input stays {}", m_released ? "enabled" : "held");
}

bool FocusGate::IsEngaged() const
{
    std::lock_guard lk(m_mutex);
    return m_engaged;
}

bool FocusGate::IsReleased() const
{
    std::lock_guard lk(m_mutex);
    return m_released;
}

void FocusGate::Consume(std::span<const InputEvent> events)
{
    for (const auto& ev : events)
    {
        if (ev.type == InputEventType::FocusGained)
            OnFocusGained();
        else if (ev.type == InputEventType::FocusLost)
            OnFocusLost();
    }
}

} // namespace twinboot::input
