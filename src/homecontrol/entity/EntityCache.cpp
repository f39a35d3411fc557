#include "entity/EntityCache.hpp"

#include "log/TaggedLogger.hpp"

#include <memory>
#include <string>
#include <utility>

namespace HC {

auto EntityCache::get(std::string_view id) const -> std::optional<EntityStatePtr> {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entities_.find(std::string{id});
    if (it == entities_.end()) {
        return std::nullopt;
    }
    return it->second;
}

auto EntityCache::apply(EntityState update) -> std::uint64_t {
    auto next   = std::make_shared<EntityState const>(std::move(update));
    auto toggle = asBool(*next);

    std::uint64_t generation = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto const* stored = next.get();
        auto        it     = entities_.find(next->id);
        if (it != entities_.end()) {
            auto const& current = *it->second;
            if (next->last_updated < current.last_updated) {
                hc_log("Dropped out-of-order update for " + next->id, "DEBUG", "Cache");
                return generation_;
            }
            if (next->last_updated == current.last_updated && sameContent(current, *next)) {
                return generation_;
            }
            it->second = std::move(next);
        } else {
            entities_.emplace(next->id, std::move(next));
        }
        generation = ++generation_;
        if (toggle) {
            auto& marks = toggles_[stored->id];
            (*toggle ? marks.on : marks.off) = generation;
        }
    }
    changed_.notify_all();
    return generation;
}

auto EntityCache::snapshot() const -> Snapshot {
    std::lock_guard<std::mutex> lock(mutex_);
    return Snapshot{.entities = entities_, .generation = generation_};
}

auto EntityCache::select(std::vector<EntityId> const& ids) const -> Snapshot {
    Snapshot selected;
    selected.entities.reserve(ids.size());
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto const& id : ids) {
        if (auto it = entities_.find(id); it != entities_.end()) {
            selected.entities.emplace(it->first, it->second);
        }
    }
    selected.generation = generation_;
    return selected;
}

auto EntityCache::generation() const -> std::uint64_t {
    std::lock_guard<std::mutex> lock(mutex_);
    return generation_;
}

auto EntityCache::size() const -> std::size_t {
    std::lock_guard<std::mutex> lock(mutex_);
    return entities_.size();
}

auto EntityCache::waitForGeneration(std::uint64_t after, Clock::time_point deadline) const -> std::uint64_t {
    std::unique_lock<std::mutex> lock(mutex_);
    changed_.wait_until(lock, deadline, [&] { return generation_ > after; });
    return generation_;
}

auto EntityCache::waitForGeneration(std::uint64_t after, std::uint64_t interrupts, Clock::time_point deadline) const
    -> std::uint64_t {
    std::unique_lock<std::mutex> lock(mutex_);
    changed_.wait_until(lock, deadline, [&] { return generation_ > after || interrupts_ > interrupts; });
    return generation_;
}

auto EntityCache::generationWith(std::string_view id, bool value) const -> std::uint64_t {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = toggles_.find(std::string{id});
    if (it == toggles_.end()) {
        return 0;
    }
    return value ? it->second.on : it->second.off;
}

auto EntityCache::interruptCount() const -> std::uint64_t {
    std::lock_guard<std::mutex> lock(mutex_);
    return interrupts_;
}

void EntityCache::interruptWaiters() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++interrupts_;
    }
    changed_.notify_all();
}

} // namespace HC
