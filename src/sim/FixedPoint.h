#pragma once

#include <cstdint>

namespace rocketrun::sim {

// Signed fixed-point number: an 8-bit integer part plus a fractional part
// counted in 360ths. Add and subtract carry whole units between the two
// parts so the fractional part always stays within [-359, 359].
//
// The sign of the fractional part is independent of the integer part:
// (1, -6) is 354/360 and still reports integerPart() == 1. Motion code
// relies on this: the integer part only changes once a whole unit has been
// travelled in either direction.
class FixedPoint {
public:
    static constexpr std::int16_t kFractionsPerUnit = 360;

    constexpr FixedPoint() noexcept = default;
    constexpr FixedPoint(std::int8_t integer, std::int16_t fractional) noexcept
        : m_integer(integer), m_fractional(fractional)
    {
    }

    // Truncates toward zero at 1/360 resolution. Host-side helper only;
    // nothing in the simulation core uses floating point.
    [[nodiscard]] static FixedPoint fromFloat(float value) noexcept;

    [[nodiscard]] constexpr std::int8_t  integerPart() const noexcept { return m_integer; }
    [[nodiscard]] constexpr std::int16_t fractionalPart() const noexcept { return m_fractional; }

    // Value expressed in 360ths of a unit.
    [[nodiscard]] constexpr std::int32_t toScaled() const noexcept
    {
        return static_cast<std::int32_t>(m_integer) * kFractionsPerUnit + m_fractional;
    }

    // True iff the integer part differs from `previous`. Used to detect that
    // a walker entered a new grid cell without any division.
    [[nodiscard]] constexpr bool didOverflow(FixedPoint previous) const noexcept
    {
        return m_integer != previous.m_integer;
    }

    // Linearly rescales this value from [fromMin, fromMax] onto [toMin, toMax]
    // in integer math. Inputs outside the source interval map outside the
    // target interval. `fromMin` and `fromMax` must differ.
    [[nodiscard]] std::int32_t mapToLinearRange(FixedPoint fromMin, FixedPoint fromMax,
                                                std::int32_t toMin, std::int32_t toMax) const;

    constexpr FixedPoint& operator+=(FixedPoint rhs) noexcept
    {
        return normalize(static_cast<int>(m_integer) + rhs.m_integer,
                         static_cast<int>(m_fractional) + rhs.m_fractional);
    }

    constexpr FixedPoint& operator-=(FixedPoint rhs) noexcept
    {
        return normalize(static_cast<int>(m_integer) - rhs.m_integer,
                         static_cast<int>(m_fractional) - rhs.m_fractional);
    }

    [[nodiscard]] friend constexpr FixedPoint operator+(FixedPoint lhs, FixedPoint rhs) noexcept
    {
        lhs += rhs;
        return lhs;
    }

    [[nodiscard]] friend constexpr FixedPoint operator-(FixedPoint lhs, FixedPoint rhs) noexcept
    {
        lhs -= rhs;
        return lhs;
    }

    friend constexpr bool operator==(FixedPoint, FixedPoint) noexcept = default;

private:
    constexpr FixedPoint& normalize(int integer, int fractional) noexcept
    {
        integer    += fractional / kFractionsPerUnit;
        fractional %= kFractionsPerUnit;
        // The integer part wraps like the 8-bit register it models.
        m_integer    = static_cast<std::int8_t>(integer);
        m_fractional = static_cast<std::int16_t>(fractional);
        return *this;
    }

    std::int8_t  m_integer    = 0;
    std::int16_t m_fractional = 0;
};

} // namespace rocketrun::sim
