#include "input/InputState.h"

namespace rocketrun::input {

namespace {

// `value` is the axis reading signed so that the flick direction is positive.
ButtonState UpdateFlick(const ButtonState& previous, int value) noexcept
{
    const bool wasDown = previous.isDown();

    ButtonState next;
    if (wasDown)
    {
        if (value < kFlickDeadZone)
            next.released = true;
        else
            next.down = true;
    }
    else if (value > kFlickThreshold)
    {
        next.pressed = true;
        next.down = true;
    }
    return next;
}

} // namespace

ButtonState NextButtonState(const ButtonState& previous, bool rawDown) noexcept
{
    const bool wasDown = previous.isDown();

    ButtonState next;
    next.pressed  = rawDown && !wasDown;
    next.down     = rawDown;
    next.released = !rawDown && wasDown;
    return next;
}

void DeriveFlicks(const InputState& previous, InputState& current) noexcept
{
    const int x = current.jsX;
    const int y = current.jsY;

    current.jsUp    = UpdateFlick(previous.jsUp, y);
    current.jsDown  = UpdateFlick(previous.jsDown, -y);
    current.jsRight = UpdateFlick(previous.jsRight, x);
    current.jsLeft  = UpdateFlick(previous.jsLeft, -x);
}

} // namespace rocketrun::input
