#pragma once

#include <cstdint>

namespace rocketrun::input {

// Edge-annotated state of one digital button for the current frame.
struct ButtonState {
    bool down     = false; // held this frame
    bool pressed  = false; // went down this frame
    bool released = false; // went up this frame

    [[nodiscard]] bool isUp() const noexcept { return released; }
    [[nodiscard]] bool isDown() const noexcept { return down || pressed; }

    friend bool operator==(const ButtonState&, const ButtonState&) = default;
};

// Derives this frame's edges from the previous frame and a raw sample.
[[nodiscard]] ButtonState NextButtonState(const ButtonState& previous, bool rawDown) noexcept;

// Analog stick range is 12-bit signed. Positive y is up.
inline constexpr std::int16_t kAxisMin        = -2048;
inline constexpr std::int16_t kAxisMax        = 2047;
inline constexpr std::int16_t kFlickDeadZone  = 512;
inline constexpr std::int16_t kFlickThreshold = 1536;

// One input snapshot handed to the state machine every frame.
struct InputState {
    std::int16_t jsX = 0;
    std::int16_t jsY = 0;

    // Stick flicks, treated as virtual buttons.
    ButtonState jsUp;
    ButtonState jsDown;
    ButtonState jsLeft;
    ButtonState jsRight;

    ButtonState btnA;
    ButtonState btnB;
    ButtonState btnStart;
    ButtonState btnSelect;

    friend bool operator==(const InputState&, const InputState&) = default;
};

// Fills the four flick buttons of `current` from its axis values and the
// flick state of `previous`. A flick starts when the axis moves past the
// threshold and ends only once the axis is back inside the dead zone, so
// a stick held between the two keeps its flick down.
void DeriveFlicks(const InputState& previous, InputState& current) noexcept;

} // namespace rocketrun::input
