#pragma once
#include <algorithm>
#include <cstdint>

namespace rocketrun::sim {

// Result of advancing the fixed-step accumulator by one host frame.
struct TickResult {
    int steps;   // how many fixed updates ran this frame
};

// Fixed-timestep accumulator ("Fix Your Timestep!", Gaffer on Games) for
// pacing the 60 Hz simulation against a wall clock on the host. The
// simulation itself never sees the elapsed time, only the step count.
class FixedTimestep {
public:
    static constexpr double kDefaultDt = 1.0 / 60.0;

    explicit FixedTimestep(double dtSeconds = kDefaultDt, double maxFrameClamp = 0.25)
        : m_dt(dtSeconds), m_maxFrameClamp(maxFrameClamp) {}

    // Adds one variable-length host frame; runs `onFixedUpdate(tickIndex)`
    // once per whole step now due. `onFixedUpdate` returns false to stop
    // early (remaining time stays in the accumulator).
    template <class UpdateFn>
    TickResult step(double frameSeconds, UpdateFn&& onFixedUpdate)
    {
        frameSeconds = std::clamp(frameSeconds, 0.0, m_maxFrameClamp);
        m_accum += frameSeconds;
        int steps = 0;
        while (m_accum >= m_dt) {
            m_accum -= m_dt;
            ++steps;
            if (!onFixedUpdate(m_tick++))
                break;
        }
        return { steps };
    }

    // Seconds until the next step is due.
    [[nodiscard]] double remaining() const { return m_dt - m_accum; }

    [[nodiscard]] double   dt()    const { return m_dt; }
    [[nodiscard]] uint64_t ticks() const { return m_tick; }

private:
    double   m_dt;
    double   m_maxFrameClamp;
    double   m_accum{0.0};
    uint64_t m_tick{0};
};

} // namespace rocketrun::sim
