#pragma once

#include "entity/EntityState.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string_view>
#include <vector>

#include <parallel_hashmap/phmap.h>

namespace HC {

/**
 * Versioned mirror of the source's entity states.
 *
 * - Single writer (the upstream sync client) calls apply(); any number of
 *   readers call get()/snapshot() concurrently. Critical sections only copy
 *   shared pointers, never wait on I/O.
 * - Every applied update bumps the generation by one. A replay with an older
 *   timestamp, or the same timestamp and identical content, is a no-op and
 *   leaves the generation untouched.
 * - Entries are never erased; removals arrive as tombstone states.
 */
class EntityCache {
public:
    using EntityMap = phmap::flat_hash_map<EntityId, EntityStatePtr>;
    using Clock     = std::chrono::steady_clock;

    struct Snapshot {
        EntityMap     entities;
        std::uint64_t generation{0};
    };

    EntityCache() = default;
    EntityCache(EntityCache const&)            = delete;
    EntityCache& operator=(EntityCache const&) = delete;

    [[nodiscard]] auto get(std::string_view id) const -> std::optional<EntityStatePtr>;

    // Returns the generation after the call; unchanged when the update was a no-op.
    auto apply(EntityState update) -> std::uint64_t;

    [[nodiscard]] auto snapshot() const -> Snapshot;
    // Snapshot restricted to `ids`; ids never observed are left out.
    [[nodiscard]] auto select(std::vector<EntityId> const& ids) const -> Snapshot;
    [[nodiscard]] auto generation() const -> std::uint64_t;
    [[nodiscard]] auto size() const -> std::size_t;

    // Generation of the last applied update that left `id` on (or off); 0 when none did.
    [[nodiscard]] auto generationWith(std::string_view id, bool value) const -> std::uint64_t;

    // Blocks until the generation exceeds `after` or the deadline passes; returns the generation seen last.
    auto waitForGeneration(std::uint64_t after, Clock::time_point deadline) const -> std::uint64_t;

    // As above, but also returns once interruptWaiters() has moved the interrupt count past `interrupts`.
    auto waitForGeneration(std::uint64_t after, std::uint64_t interrupts, Clock::time_point deadline) const
        -> std::uint64_t;

    [[nodiscard]] auto interruptCount() const -> std::uint64_t;

    // Wakes waiters that passed an interrupt count without publishing anything.
    void interruptWaiters();

private:
    struct ToggleMarks {
        std::uint64_t on{0};
        std::uint64_t off{0};
    };

    mutable std::mutex                                 mutex_;
    mutable std::condition_variable                    changed_;
    EntityMap                                          entities_;
    phmap::flat_hash_map<EntityId, ToggleMarks>        toggles_;
    std::uint64_t                                      generation_{0};
    std::uint64_t                                      interrupts_{0};
};

} // namespace HC
