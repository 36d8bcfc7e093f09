#pragma once

#include <cstddef>
#include <span>
#include <vector>

#include "../Component/Component.hpp"
#include "../Core/Base.hpp"
#include "AccessMode.hpp"

namespace Strata
{
    /**
     * @brief Declared data access of one system or query
     *
     * Writes imply reads. The claim set never touches data; an external scheduler
     * compares claim sets with Conflicts() to decide what may run concurrently.
     */
    class ClaimSet
    {
    public:
        void Read(ComponentID id) noexcept { m_componentReads.Set(id); }

        void Write(ComponentID id) noexcept
        {
            m_componentReads.Set(id);
            m_componentWrites.Set(id);
            m_mode = Strata::Merge(m_mode, AccessMode::DataMut);
        }

        void ReadResource(ResourceID id) noexcept { m_resourceReads.Set(id); }

        void WriteResource(ResourceID id) noexcept
        {
            m_resourceReads.Set(id);
            m_resourceWrites.Set(id);
            m_mode = Strata::Merge(m_mode, AccessMode::DataMut);
        }

        // Read access to every component and resource (a shared world reference)
        void ReadAll() noexcept { m_readsAll = true; }

        void SetMainThread() noexcept { m_mainThread = true; }

        // Exclusive access implies FullMut
        void SetExclusive() noexcept
        {
            m_exclusive = true;
            m_mode = AccessMode::FullMut;
        }

        void RaiseMode(AccessMode mode) noexcept
        {
            m_mode = Strata::Merge(m_mode, mode);
            if (m_mode == AccessMode::FullMut)
                m_exclusive = true;
        }

        // Union of both claims. The merged mode is the maximum of both modes.
        void Merge(const ClaimSet& other) noexcept
        {
            m_componentReads |= other.m_componentReads;
            m_componentWrites |= other.m_componentWrites;
            m_resourceReads |= other.m_resourceReads;
            m_resourceWrites |= other.m_resourceWrites;
            m_readsAll = m_readsAll || other.m_readsAll;
            m_mainThread = m_mainThread || other.m_mainThread;
            m_exclusive = m_exclusive || other.m_exclusive;
            m_mode = Strata::Merge(m_mode, other.m_mode);
        }

        STRATA_NODISCARD bool Reads(ComponentID id) const noexcept { return m_readsAll || m_componentReads.Test(id); }
        STRATA_NODISCARD bool Writes(ComponentID id) const noexcept { return m_componentWrites.Test(id); }
        STRATA_NODISCARD bool ReadsResource(ResourceID id) const noexcept { return m_readsAll || m_resourceReads.Test(id); }
        STRATA_NODISCARD bool WritesResource(ResourceID id) const noexcept { return m_resourceWrites.Test(id); }

        STRATA_NODISCARD bool ReadsAll() const noexcept { return m_readsAll; }
        STRATA_NODISCARD bool IsMainThread() const noexcept { return m_mainThread; }
        STRATA_NODISCARD bool IsExclusive() const noexcept { return m_exclusive; }
        STRATA_NODISCARD AccessMode GetMode() const noexcept { return m_mode; }

        STRATA_NODISCARD bool HasWrites() const noexcept { return m_componentWrites.Any() || m_resourceWrites.Any(); }
        STRATA_NODISCARD bool IsEmpty() const noexcept
        {
            return !m_readsAll && !m_exclusive && m_componentReads.None() && m_resourceReads.None();
        }

        /**
         * @brief True if the two claims may not be live at the same time
         *
         * An id claimed for writing by one side conflicts with any claim of that id
         * on the other side. Read/read overlaps never conflict. An exclusive claim
         * conflicts with everything.
         */
        STRATA_NODISCARD friend bool Conflicts(const ClaimSet& a, const ClaimSet& b) noexcept
        {
            if (a.m_exclusive || b.m_exclusive)
                return true;
            return WritesOverlap(a, b) || WritesOverlap(b, a);
        }

    private:
        // Does `writer` write anything `other` reads or writes?
        static bool WritesOverlap(const ClaimSet& writer, const ClaimSet& other) noexcept
        {
            if (other.m_readsAll)
                return writer.HasWrites();
            return writer.m_componentWrites.Intersects(other.m_componentReads) ||
                   writer.m_resourceWrites.Intersects(other.m_resourceReads);
        }

        ComponentMask m_componentReads;
        ComponentMask m_componentWrites;
        ResourceMask m_resourceReads;
        ResourceMask m_resourceWrites;
        AccessMode m_mode = AccessMode::ReadOnly;
        bool m_readsAll = false;
        bool m_mainThread = false;
        bool m_exclusive = false;
    };

    /**
     * @brief Pairwise conflict table for a set of claims
     *
     * Entry (i, j) is true when claims i and j must not run concurrently. How the
     * table is turned into an execution plan is up to the caller.
     */
    class ConflictMatrix
    {
    public:
        explicit ConflictMatrix(std::span<const ClaimSet> claims)
            : m_size(claims.size())
            , m_bits(claims.size() * claims.size(), false)
        {
            for (std::size_t i = 0; i < m_size; ++i)
            {
                for (std::size_t j = i + 1; j < m_size; ++j)
                {
                    const bool conflict = Conflicts(claims[i], claims[j]);
                    m_bits[i * m_size + j] = conflict;
                    m_bits[j * m_size + i] = conflict;
                }
            }
        }

        STRATA_NODISCARD bool operator()(std::size_t i, std::size_t j) const noexcept
        {
            return m_bits[i * m_size + j];
        }

        STRATA_NODISCARD std::size_t Size() const noexcept { return m_size; }

    private:
        std::size_t m_size;
        std::vector<bool> m_bits;
    };
}
