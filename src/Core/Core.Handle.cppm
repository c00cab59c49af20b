module;
#include <cstdint>
#include <limits>

export module Core:Handle;

export namespace Core
{
    // Slot index plus the generation it was issued under. Handles come from a
    // Core::ResourcePool; once the slot is removed the old generation no
    // longer resolves. Tag keeps signal, task and GPU handles apart.
    template <typename Tag>
    struct StrongHandle
    {
        static constexpr uint32_t INVALID_INDEX = std::numeric_limits<uint32_t>::max();

        uint32_t Index = INVALID_INDEX;
        uint32_t Generation = 0;

        constexpr StrongHandle() = default;
        constexpr StrongHandle(uint32_t index, uint32_t generation) : Index(index), Generation(generation) {}

        // Says nothing about liveness; ask the owning pool for that.
        [[nodiscard]] constexpr bool IsValid() const noexcept { return Index != INVALID_INDEX; }
        [[nodiscard]] constexpr explicit operator bool() const noexcept { return IsValid(); }

        bool operator==(const StrongHandle&) const = default;
    };
}
