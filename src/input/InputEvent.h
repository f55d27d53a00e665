#pragma once

#include <cstdint>

namespace twinboot::input {

// Lightweight input event as delivered by the platform layer.
//
//  - Trivial POD type (fixed-size queue friendly)
//  - No windowing-system types, so tests and tools can synthesize events

enum class InputEventType : std::uint8_t {
    PointerMove   = 0,
    PointerButton = 1,
    PointerWheel  = 2,
    Touch         = 3,
    KeyDown       = 4,
    KeyUp         = 5,
    FocusGained   = 6,
    FocusLost     = 7,
};

enum class TouchPhase : std::uint8_t {
    Began = 0,
    Moved = 1,
    Ended = 2,
    Cancelled = 3,
};

// NOTE: Keep this POD/trivial; "wide" on purpose instead of a union/variant.
struct InputEvent {
    InputEventType type = InputEventType::PointerMove;

    // PointerMove / Touch (window client coordinates)
    float x = 0.0f;
    float y = 0.0f;

    // PointerButton
    std::uint8_t button = 0;
    bool pressed = false;

    // PointerWheel
    std::int32_t wheelDetents = 0;

    // Touch
    std::uint32_t touchId = 0;
    TouchPhase touchPhase = TouchPhase::Began;

    // KeyDown/KeyUp
    std::uint32_t key = 0;
};

[[nodiscard]] constexpr bool IsPointerEvent(InputEventType t) noexcept
{
    return t == InputEventType::PointerMove ||
           t == InputEventType::PointerButton ||
           t == InputEventType::PointerWheel;
}

[[nodiscard]] constexpr bool IsTouchEvent(InputEventType t) noexcept
{
    return t == InputEventType::Touch;
}

} // namespace twinboot::input
