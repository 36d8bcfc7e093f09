#pragma once

#include <array>
#include <bit>
#include <cstddef>
#include <cstdint>

#include "../Core/Base.hpp"

namespace Strata
{
    /**
     * @brief Fixed-size bit set over 64-bit words
     *
     * Used for component masks on archetypes and for the read/write sets of a
     * ClaimSet. Out-of-range indices are ignored by Set/Reset and read as false.
     */
    template<std::size_t Bits>
    class Bitmap
    {
    public:
        using Word = std::uint64_t;
        static constexpr std::size_t BITS_PER_WORD = 64;
        static constexpr std::size_t WORD_COUNT = (Bits + BITS_PER_WORD - 1) / BITS_PER_WORD;
        static constexpr std::size_t SIZE = Bits;

        constexpr Bitmap() noexcept = default;

        constexpr void Set(std::size_t index) noexcept
        {
            if (index < Bits) STRATA_LIKELY
                m_words[index / BITS_PER_WORD] |= Word{1} << (index % BITS_PER_WORD);
        }

        constexpr void Reset(std::size_t index) noexcept
        {
            if (index < Bits) STRATA_LIKELY
                m_words[index / BITS_PER_WORD] &= ~(Word{1} << (index % BITS_PER_WORD));
        }

        constexpr void Clear() noexcept
        {
            m_words.fill(0);
        }

        STRATA_NODISCARD constexpr bool Test(std::size_t index) const noexcept
        {
            if (index >= Bits) STRATA_UNLIKELY
                return false;
            return (m_words[index / BITS_PER_WORD] >> (index % BITS_PER_WORD)) & 1;
        }

        // True if every bit of `mask` is also set here
        STRATA_NODISCARD constexpr bool HasAll(const Bitmap& mask) const noexcept
        {
            for (std::size_t i = 0; i < WORD_COUNT; ++i)
            {
                if ((m_words[i] & mask.m_words[i]) != mask.m_words[i])
                    return false;
            }
            return true;
        }

        // True if this and `mask` share at least one bit
        STRATA_NODISCARD constexpr bool Intersects(const Bitmap& mask) const noexcept
        {
            for (std::size_t i = 0; i < WORD_COUNT; ++i)
            {
                if (m_words[i] & mask.m_words[i])
                    return true;
            }
            return false;
        }

        STRATA_NODISCARD constexpr Bitmap operator&(const Bitmap& other) const noexcept
        {
            Bitmap result;
            for (std::size_t i = 0; i < WORD_COUNT; ++i)
                result.m_words[i] = m_words[i] & other.m_words[i];
            return result;
        }

        STRATA_NODISCARD constexpr Bitmap operator|(const Bitmap& other) const noexcept
        {
            Bitmap result;
            for (std::size_t i = 0; i < WORD_COUNT; ++i)
                result.m_words[i] = m_words[i] | other.m_words[i];
            return result;
        }

        constexpr Bitmap& operator|=(const Bitmap& other) noexcept
        {
            for (std::size_t i = 0; i < WORD_COUNT; ++i)
                m_words[i] |= other.m_words[i];
            return *this;
        }

        STRATA_NODISCARD constexpr bool operator==(const Bitmap& other) const noexcept = default;

        STRATA_NODISCARD constexpr std::size_t Count() const noexcept
        {
            std::size_t count = 0;
            for (Word word : m_words)
                count += static_cast<std::size_t>(std::popcount(word));
            return count;
        }

        STRATA_NODISCARD constexpr bool Any() const noexcept
        {
            for (Word word : m_words)
            {
                if (word != 0)
                    return true;
            }
            return false;
        }

        STRATA_NODISCARD constexpr bool None() const noexcept { return !Any(); }

        // Calls func(index) for every set bit in ascending order
        template<typename Func>
        constexpr void ForEachSet(Func&& func) const
        {
            for (std::size_t w = 0; w < WORD_COUNT; ++w)
            {
                Word word = m_words[w];
                while (word != 0)
                {
                    std::size_t bit = static_cast<std::size_t>(std::countr_zero(word));
                    func(w * BITS_PER_WORD + bit);
                    word &= word - 1;
                }
            }
        }

    private:
        std::array<Word, WORD_COUNT> m_words{};
    };
}
