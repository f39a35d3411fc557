#pragma once

#include "core/TimeUtils.hpp"

#include <homecontrol/core/Error.hpp>

#include <nlohmann/json.hpp>

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace HC {

using EntityId = std::string;

struct OnOff {
    bool on{false};
    bool operator==(OnOff const&) const = default;
};

struct Numeric {
    double value{0.0};
    bool operator==(Numeric const&) const = default;
};

struct Text {
    std::string value;
    bool operator==(Text const&) const = default;
};

// The entity has no scalar state; everything lives in its attributes.
struct Composite {
    bool operator==(Composite const&) const = default;
};

// The source removed the entity. Kept in the cache so reads fail predictably.
struct Tombstone {
    bool operator==(Tombstone const&) const = default;
};

using EntityValue = std::variant<OnOff, Numeric, Text, Composite, Tombstone>;

/**
 * One observed state of an upstream entity.
 *
 * Records are immutable once published to the cache; an update replaces the
 * whole record. `raw_state` keeps the source's own string so the UI can show
 * it verbatim.
 */
struct EntityState {
    EntityId       id;
    EntityValue    value;
    nlohmann::json attributes = nlohmann::json::object();
    Timestamp      last_updated{};
    std::string    raw_state;
};

using EntityStatePtr = std::shared_ptr<EntityState const>;

[[nodiscard]] auto isValidEntityId(std::string_view id) -> bool;

// Domain part of `domain.object_id`; empty when the id is malformed.
[[nodiscard]] auto entityDomain(std::string_view id) -> std::string_view;

[[nodiscard]] auto classifyState(std::string_view state, nlohmann::json const& attributes) -> EntityValue;

[[nodiscard]] auto makeEntityState(EntityId id, std::string_view state, nlohmann::json attributes, Timestamp last_updated)
    -> EntityState;

[[nodiscard]] auto makeTombstone(EntityId id, Timestamp removed_at) -> EntityState;

[[nodiscard]] auto isTombstone(EntityState const& state) -> bool;

[[nodiscard]] auto asBool(EntityState const& state) -> std::optional<bool>;

[[nodiscard]] auto valueKindName(EntityValue const& value) -> std::string_view;

// Same value and attributes. Timestamps are not compared.
[[nodiscard]] auto sameContent(EntityState const& lhs, EntityState const& rhs) -> bool;

[[nodiscard]] auto toJson(EntityState const& state) -> nlohmann::json;

} // namespace HC
