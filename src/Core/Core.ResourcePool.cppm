module;

#include <cstddef>
#include <cstdint>
#include <memory>
#include <utility>
#include <vector>

export module Core:ResourcePool;
import :Handle;

export namespace Core
{
    // -------------------------------------------------------------------------
    // ResourcePool - dense slot arena handing out generational handles
    // -------------------------------------------------------------------------
    // Remove() deactivates a slot immediately: any outstanding handle to it
    // fails Get() from that point on. The slot is recycled by a later Add(),
    // which bumps its generation so stale handles can never alias the new
    // occupant.
    //
    // Single-threaded by contract (the runtime has one execution thread), so
    // there is no locking here.
    // -------------------------------------------------------------------------
    template <typename T, typename Tag>
    class ResourcePool
    {
    public:
        using Handle = StrongHandle<Tag>;

        ResourcePool() = default;

        ResourcePool(const ResourcePool&) = delete;
        ResourcePool& operator=(const ResourcePool&) = delete;
        ResourcePool(ResourcePool&&) noexcept = default;
        ResourcePool& operator=(ResourcePool&&) noexcept = default;

        Handle Add(T value)
        {
            uint32_t index;
            if (!m_FreeIndices.empty())
            {
                index = m_FreeIndices.back();
                m_FreeIndices.pop_back();
            }
            else
            {
                index = static_cast<uint32_t>(m_Slots.size());
                m_Slots.emplace_back();
            }

            Slot& slot = m_Slots[index];
            // The value lives behind a unique_ptr so pointers returned by Get()
            // survive m_Slots reallocating.
            slot.Data = std::make_unique<T>(std::move(value));
            ++slot.Generation;
            slot.IsActive = true;
            ++m_ActiveCount;

            return {index, slot.Generation};
        }

        template <typename... Args>
        Handle Create(Args&&... args)
        {
            return Add(T(std::forward<Args>(args)...));
        }

        // Returns false if the handle was already stale.
        bool Remove(Handle handle)
        {
            if (handle.Index >= m_Slots.size()) return false;

            Slot& slot = m_Slots[handle.Index];
            if (!slot.IsActive || slot.Generation != handle.Generation) return false;

            slot.IsActive = false;
            slot.Data.reset();
            m_FreeIndices.push_back(handle.Index);
            --m_ActiveCount;
            return true;
        }

        [[nodiscard]] T* Get(Handle handle) const
        {
            if (handle.Index >= m_Slots.size()) return nullptr;

            const Slot& slot = m_Slots[handle.Index];
            if (!slot.IsActive || slot.Generation != handle.Generation) return nullptr;

            return slot.Data.get();
        }

        [[nodiscard]] bool Contains(Handle handle) const { return Get(handle) != nullptr; }

        // Visits live entries in slot order: fn(Handle, T&).
        template <typename Fn>
        void ForEach(Fn&& fn)
        {
            for (uint32_t i = 0; i < m_Slots.size(); ++i)
            {
                Slot& slot = m_Slots[i];
                if (slot.IsActive) fn(Handle{i, slot.Generation}, *slot.Data);
            }
        }

        void Clear()
        {
            m_Slots.clear();
            m_FreeIndices.clear();
            m_ActiveCount = 0;
        }

        [[nodiscard]] size_t Size() const { return m_ActiveCount; }
        [[nodiscard]] size_t Capacity() const { return m_Slots.size(); }

    private:
        struct Slot
        {
            std::unique_ptr<T> Data;
            uint32_t Generation = 0;
            bool IsActive = false;
        };

        std::vector<Slot> m_Slots;
        std::vector<uint32_t> m_FreeIndices;
        size_t m_ActiveCount = 0;
    };
}
