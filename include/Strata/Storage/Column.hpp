#pragma once

#include <algorithm>
#include <cstddef>
#include <cstring>
#include <new>
#include <span>
#include <utility>
#include <vector>

#include "../Component/Component.hpp"
#include "../Core/Contract.hpp"
#include "../Core/Tick.hpp"

namespace Strata
{
    /**
     * @brief Type-erased growable array of one component type
     *
     * Elements are moved with the descriptor's capability record, so a column
     * never needs static knowledge of the type it stores. Each element carries
     * an added tick and a changed tick for change detection.
     */
    class Column
    {
    public:
        explicit Column(const ComponentDescriptor& descriptor) noexcept
            : m_descriptor(descriptor)
        {}

        ~Column()
        {
            Clear();
            Deallocate(m_data);
        }

        Column(const Column&) = delete;
        Column& operator=(const Column&) = delete;

        Column(Column&& other) noexcept
            : m_descriptor(other.m_descriptor)
            , m_data(std::exchange(other.m_data, nullptr))
            , m_size(std::exchange(other.m_size, 0))
            , m_capacity(std::exchange(other.m_capacity, 0))
            , m_added(std::move(other.m_added))
            , m_changed(std::move(other.m_changed))
        {}

        Column& operator=(Column&&) = delete;

        STRATA_NODISCARD const ComponentDescriptor& GetDescriptor() const noexcept { return m_descriptor; }
        STRATA_NODISCARD ComponentID GetComponentID() const noexcept { return m_descriptor.id; }
        STRATA_NODISCARD std::size_t Size() const noexcept { return m_size; }
        STRATA_NODISCARD std::size_t Capacity() const noexcept { return m_capacity; }
        STRATA_NODISCARD bool Empty() const noexcept { return m_size == 0; }

        STRATA_NODISCARD void* Get(std::size_t row) noexcept
        {
            STRATA_ASSERT(row < m_size, "Column row out of range");
            return m_data + row * m_descriptor.size;
        }

        STRATA_NODISCARD const void* Get(std::size_t row) const noexcept
        {
            STRATA_ASSERT(row < m_size, "Column row out of range");
            return m_data + row * m_descriptor.size;
        }

        template<typename T>
        STRATA_NODISCARD T* Data() noexcept
        {
            return std::launder(reinterpret_cast<T*>(m_data));
        }

        STRATA_NODISCARD Tick GetAddedTick(std::size_t row) const noexcept { return m_added[row]; }
        STRATA_NODISCARD Tick GetChangedTick(std::size_t row) const noexcept { return m_changed[row]; }
        STRATA_NODISCARD Tick* AddedTicks() noexcept { return m_added.data(); }
        STRATA_NODISCARD Tick* ChangedTicks() noexcept { return m_changed.data(); }

        void SetChangedTick(std::size_t row, Tick tick) noexcept { m_changed[row] = tick; }

        void Reserve(std::size_t capacity)
        {
            if (capacity > m_capacity)
                Grow(capacity);
        }

        // Appends a value move-constructed from src. src stays alive and owned by the caller.
        void PushMoved(void* src, Tick tick)
        {
            void* dst = PushUninitialized();
            m_descriptor.MoveConstruct(dst, src);
            m_added.push_back(tick);
            m_changed.push_back(tick);
        }

        // Appends a value relocated out of src, keeping its ticks. src is left without a live object.
        void PushRelocated(void* src, Tick added, Tick changed)
        {
            void* dst = PushUninitialized();
            m_descriptor.Relocate(dst, src);
            m_added.push_back(added);
            m_changed.push_back(changed);
        }

        // Drops the value at `row` and move-constructs a new one from src in its place
        void Replace(std::size_t row, void* src, Tick tick)
        {
            void* dst = Get(row);
            m_descriptor.Drop(dst);
            m_descriptor.MoveConstruct(dst, src);
            m_changed[row] = tick;
        }

        // Drops the value at `row` and fills the hole with the last element
        void SwapRemoveAndDrop(std::size_t row)
        {
            STRATA_VERIFY(row < m_size, "Column swap-remove out of range");
            m_descriptor.Drop(Get(row));
            FillHole(row);
        }

        // Removes `row` whose value has already been relocated elsewhere
        void SwapRemoveForget(std::size_t row)
        {
            STRATA_VERIFY(row < m_size, "Column swap-remove out of range");
            FillHole(row);
        }

        // Relocates the value at `row` (with its ticks) to the end of dst, then swap-removes it here
        void MoveRowTo(std::size_t row, Column& dst)
        {
            STRATA_VERIFY(dst.m_descriptor.id == m_descriptor.id, "Moving a row between columns of different components");
            dst.PushRelocated(Get(row), m_added[row], m_changed[row]);
            SwapRemoveForget(row);
        }

        void Clear() noexcept
        {
            if (m_descriptor.drop)
            {
                for (std::size_t i = 0; i < m_size; ++i)
                    m_descriptor.drop(m_data + i * m_descriptor.size);
            }
            m_size = 0;
            m_added.clear();
            m_changed.clear();
        }

        void CheckTicks(Tick now) noexcept
        {
            Tick::CheckAll(m_added, now);
            Tick::CheckAll(m_changed, now);
        }

    private:
        void* PushUninitialized()
        {
            if (m_size == m_capacity)
            {
                std::size_t minElements = std::max<std::size_t>(1, config::COLUMN_MIN_BYTES / std::max<std::size_t>(1, m_descriptor.size));
                Grow(std::max(minElements, m_capacity * 2));
            }
            return m_data + (m_size++) * m_descriptor.size;
        }

        void FillHole(std::size_t row) noexcept
        {
            const std::size_t last = m_size - 1;
            if (row != last)
            {
                m_descriptor.Relocate(m_data + row * m_descriptor.size, m_data + last * m_descriptor.size);
                m_added[row] = m_added[last];
                m_changed[row] = m_changed[last];
            }
            m_added.pop_back();
            m_changed.pop_back();
            --m_size;
        }

        void Grow(std::size_t capacity)
        {
            std::byte* data = Allocate(capacity);
            if (m_data)
            {
                if (m_descriptor.IsTriviallyRelocatable())
                {
                    std::memcpy(data, m_data, m_size * m_descriptor.size);
                }
                else
                {
                    for (std::size_t i = 0; i < m_size; ++i)
                        m_descriptor.Relocate(data + i * m_descriptor.size, m_data + i * m_descriptor.size);
                }
                Deallocate(m_data);
            }
            m_data = data;
            m_capacity = capacity;
            m_added.reserve(capacity);
            m_changed.reserve(capacity);
        }

        std::byte* Allocate(std::size_t capacity) const
        {
            return static_cast<std::byte*>(::operator new(capacity * m_descriptor.size, std::align_val_t{m_descriptor.alignment}));
        }

        void Deallocate(std::byte* data) const noexcept
        {
            if (data)
                ::operator delete(data, std::align_val_t{m_descriptor.alignment});
        }

        ComponentDescriptor m_descriptor;
        std::byte* m_data = nullptr;
        std::size_t m_size = 0;
        std::size_t m_capacity = 0;
        std::vector<Tick> m_added;
        std::vector<Tick> m_changed;
    };
}
