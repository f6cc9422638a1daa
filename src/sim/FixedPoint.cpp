#include "sim/FixedPoint.h"

#include <cmath>

#include "common/Compiler.h"

namespace rocketrun::sim {

FixedPoint FixedPoint::fromFloat(float value) noexcept
{
    const float whole = std::trunc(value);
    const float remainder = value - whole;
    return FixedPoint(static_cast<std::int8_t>(whole),
                      static_cast<std::int16_t>(remainder * kFractionsPerUnit));
}

std::int32_t FixedPoint::mapToLinearRange(FixedPoint fromMin, FixedPoint fromMax,
                                          std::int32_t toMin, std::int32_t toMax) const
{
    const std::int32_t fromMinScaled = fromMin.toScaled();
    const std::int32_t fromDelta     = fromMax.toScaled() - fromMinScaled;
    ROCKETRUN_VERIFY(fromDelta != 0, "mapToLinearRange: empty source interval");

    // The product needs more than 32 bits once the target range is wider
    // than about 46000.
    const std::int64_t toDelta = static_cast<std::int64_t>(toMax) - toMin;
    const std::int64_t offset  = static_cast<std::int64_t>(toScaled() - fromMinScaled) * toDelta / fromDelta;
    return static_cast<std::int32_t>(toMin + offset);
}

} // namespace rocketrun::sim
