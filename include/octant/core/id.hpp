#pragma once

/// @file id.hpp
/// @brief Entity identifiers for octant_core

#include "fwd.hpp"
#include <compare>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <ostream>
#include <vector>

namespace octant_core {

// =============================================================================
// EntityId
// =============================================================================

/// 64-bit entity key: generation in the high word, slot index in the low word.
/// A recycled slot gets a new generation, so a stale id never matches the
/// entity that reused its slot.
struct EntityId {
    static constexpr std::uint64_t NULL_BITS = ~std::uint64_t{0};

    std::uint64_t bits = NULL_BITS;

    constexpr EntityId() noexcept = default;
    constexpr explicit EntityId(std::uint64_t raw) noexcept : bits(raw) {}

    [[nodiscard]] static constexpr EntityId create(std::uint32_t index, std::uint32_t generation) noexcept {
        return EntityId((std::uint64_t{generation} << 32) | index);
    }

    [[nodiscard]] static constexpr EntityId null() noexcept { return EntityId{}; }

    [[nodiscard]] constexpr bool is_valid() const noexcept { return bits != NULL_BITS; }

    [[nodiscard]] constexpr std::uint32_t index() const noexcept {
        return static_cast<std::uint32_t>(bits);
    }

    [[nodiscard]] constexpr std::uint32_t generation() const noexcept {
        return static_cast<std::uint32_t>(bits >> 32);
    }

    constexpr auto operator<=>(const EntityId&) const noexcept = default;

    explicit constexpr operator bool() const noexcept { return is_valid(); }
};

/// Prints `Entity(<index>v<generation>)`, or `Entity(null)`
inline std::ostream& operator<<(std::ostream& os, const EntityId& id) {
    if (!id.is_valid()) {
        return os << "Entity(null)";
    }
    return os << "Entity(" << id.index() << "v" << id.generation() << ")";
}

// =============================================================================
// EntityIdGenerator
// =============================================================================

/// Hands out entity ids, reusing released slots with a bumped generation.
/// All members are thread-safe.
class EntityIdGenerator {
public:
    [[nodiscard]] EntityId next() {
        std::lock_guard<std::mutex> lock(m_mutex);

        if (!m_free.empty()) {
            std::uint32_t index = m_free.back();
            m_free.pop_back();
            m_slots[index].live = true;
            return EntityId::create(index, m_slots[index].generation);
        }

        auto index = static_cast<std::uint32_t>(m_slots.size());
        m_slots.push_back(Slot{0, true});
        return EntityId::create(index, 0);
    }

    /// Retire `id`; its slot comes back from next() under a new generation.
    /// Returns false for null, stale or unknown ids.
    bool release(EntityId id) {
        std::lock_guard<std::mutex> lock(m_mutex);

        if (!is_live_locked(id)) {
            return false;
        }
        Slot& slot = m_slots[id.index()];
        slot.live = false;
        ++slot.generation;
        m_free.push_back(id.index());
        return true;
    }

    /// True if `id` was handed out and not yet released
    [[nodiscard]] bool is_live(EntityId id) const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return is_live_locked(id);
    }

    [[nodiscard]] std::size_t live_count() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_slots.size() - m_free.size();
    }

private:
    struct Slot {
        std::uint32_t generation;
        bool live;
    };

    bool is_live_locked(EntityId id) const {
        if (!id.is_valid() || id.index() >= m_slots.size()) {
            return false;
        }
        const Slot& slot = m_slots[id.index()];
        return slot.live && slot.generation == id.generation();
    }

    mutable std::mutex m_mutex;
    std::vector<Slot> m_slots;
    std::vector<std::uint32_t> m_free;
};

} // namespace octant_core

template<>
struct std::hash<octant_core::EntityId> {
    std::size_t operator()(const octant_core::EntityId& id) const noexcept {
        return std::hash<std::uint64_t>{}(id.bits);
    }
};
