#pragma once

#include <array>
#include <cstdint>

#include "sim/Direction.h"

namespace rocketrun::sim {

// Arrows the player still holds, per direction.
class ArrowStock {
public:
    ArrowStock() = default;

    [[nodiscard]] std::uint8_t count(Direction d) const noexcept { return m_counts[index(d)]; }
    [[nodiscard]] bool has(Direction d) const noexcept { return count(d) > 0; }

    [[nodiscard]] int total() const noexcept
    {
        int sum = 0;
        for (const std::uint8_t c : m_counts)
            sum += c;
        return sum;
    }

    void set(Direction d, std::uint8_t count) noexcept { m_counts[index(d)] = count; }

    // Saturates at 255.
    void add(Direction d) noexcept
    {
        auto& c = m_counts[index(d)];
        if (c != 0xFF)
            ++c;
    }

    // Returns false when none are left.
    [[nodiscard]] bool take(Direction d) noexcept
    {
        auto& c = m_counts[index(d)];
        if (c == 0)
            return false;
        --c;
        return true;
    }

    void clear() noexcept { m_counts.fill(0); }

    friend bool operator==(const ArrowStock&, const ArrowStock&) = default;

private:
    static constexpr std::size_t index(Direction d) noexcept { return static_cast<std::size_t>(d); }

    std::array<std::uint8_t, kDirectionCount> m_counts{};
};

} // namespace rocketrun::sim
