#pragma once

#include <cstdint>
#include <span>

#include "Base.hpp"

namespace Strata
{
    /**
     * @brief 32-bit wrapping change-detection timestamp
     *
     * Ticks are only meaningful relative to the world's current tick. Ages are
     * computed with wrapping subtraction and clamped to MAX_AGE, so every stored
     * tick must be re-clamped at least once per CHECK_CYCLE increments
     * (World::CheckChangeTicks).
     */
    class Tick
    {
    public:
        static constexpr std::uint32_t CHECK_CYCLE = 1u << 29;
        static constexpr std::uint32_t MAX_AGE = 0xFFFFFFFFu - (CHECK_CYCLE << 1) - 1;

        constexpr Tick() noexcept = default;
        constexpr explicit Tick(std::uint32_t value) noexcept : m_value(value) {}

        STRATA_NODISCARD constexpr std::uint32_t Get() const noexcept { return m_value; }
        constexpr void Set(std::uint32_t value) noexcept { m_value = value; }

        STRATA_NODISCARD constexpr Tick RelativeTo(Tick other) const noexcept
        {
            return Tick(m_value - other.m_value);
        }

        // True if this tick happened after `lastRun`, both measured from `now`
        STRATA_NODISCARD constexpr bool IsNewerThan(Tick lastRun, Tick now) const noexcept
        {
            std::uint32_t sinceThis = Clamp(now.RelativeTo(*this).m_value);
            std::uint32_t sinceLastRun = Clamp(now.RelativeTo(lastRun).m_value);
            return sinceLastRun > sinceThis;
        }

        // Clamps an over-aged tick to now - MAX_AGE. Returns true if it was clamped.
        constexpr bool CheckAge(Tick now) noexcept
        {
            if (now.RelativeTo(*this).m_value > MAX_AGE)
            {
                m_value = now.m_value - MAX_AGE;
                return true;
            }
            return false;
        }

        static void CheckAll(std::span<Tick> ticks, Tick now) noexcept
        {
            for (Tick& tick : ticks)
            {
                tick.CheckAge(now);
            }
        }

        constexpr bool operator==(const Tick&) const noexcept = default;

    private:
        static constexpr std::uint32_t Clamp(std::uint32_t age) noexcept
        {
            return age < MAX_AGE ? age : MAX_AGE;
        }

        std::uint32_t m_value = 0;
    };
}
