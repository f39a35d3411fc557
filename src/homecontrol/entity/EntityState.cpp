#include "entity/EntityState.hpp"

#include <cctype>
#include <charconv>
#include <cmath>
#include <type_traits>

namespace HC {

namespace {

bool is_id_char(unsigned char ch) {
    return std::islower(ch) != 0 || std::isdigit(ch) != 0 || ch == '_';
}

std::optional<double> parse_number(std::string_view text) {
    if (text.empty()) {
        return std::nullopt;
    }
    double value = 0.0;
    auto   result = std::from_chars(text.data(), text.data() + text.size(), value);
    if (result.ec != std::errc{} || result.ptr != text.data() + text.size() || !std::isfinite(value)) {
        return std::nullopt;
    }
    return value;
}

} // namespace

auto isValidEntityId(std::string_view id) -> bool {
    auto dot = id.find('.');
    if (dot == std::string_view::npos || dot == 0 || dot + 1 >= id.size()) {
        return false;
    }
    for (std::size_t i = 0; i < id.size(); ++i) {
        if (i == dot) {
            continue;
        }
        if (!is_id_char(static_cast<unsigned char>(id[i]))) {
            return false;
        }
    }
    return true;
}

auto entityDomain(std::string_view id) -> std::string_view {
    if (!isValidEntityId(id)) {
        return {};
    }
    return id.substr(0, id.find('.'));
}

auto classifyState(std::string_view state, nlohmann::json const& attributes) -> EntityValue {
    if (state == "on") {
        return OnOff{true};
    }
    if (state == "off") {
        return OnOff{false};
    }
    if (auto number = parse_number(state)) {
        return Numeric{*number};
    }
    if (state.empty() && attributes.is_object() && !attributes.empty()) {
        return Composite{};
    }
    return Text{std::string{state}};
}

auto makeEntityState(EntityId id, std::string_view state, nlohmann::json attributes, Timestamp last_updated)
    -> EntityState {
    if (!attributes.is_object()) {
        attributes = nlohmann::json::object();
    }
    EntityState entity;
    entity.value        = classifyState(state, attributes);
    entity.id           = std::move(id);
    entity.attributes   = std::move(attributes);
    entity.last_updated = last_updated;
    entity.raw_state    = std::string{state};
    return entity;
}

auto makeTombstone(EntityId id, Timestamp removed_at) -> EntityState {
    EntityState entity;
    entity.id           = std::move(id);
    entity.value        = Tombstone{};
    entity.last_updated = removed_at;
    return entity;
}

auto isTombstone(EntityState const& state) -> bool {
    return std::holds_alternative<Tombstone>(state.value);
}

auto asBool(EntityState const& state) -> std::optional<bool> {
    if (auto const* toggle = std::get_if<OnOff>(&state.value)) {
        return toggle->on;
    }
    return std::nullopt;
}

auto valueKindName(EntityValue const& value) -> std::string_view {
    struct Visitor {
        auto operator()(OnOff const&) const -> std::string_view { return "on_off"; }
        auto operator()(Numeric const&) const -> std::string_view { return "numeric"; }
        auto operator()(Text const&) const -> std::string_view { return "string"; }
        auto operator()(Composite const&) const -> std::string_view { return "composite"; }
        auto operator()(Tombstone const&) const -> std::string_view { return "removed"; }
    };
    return std::visit(Visitor{}, value);
}

auto sameContent(EntityState const& lhs, EntityState const& rhs) -> bool {
    return lhs.id == rhs.id && lhs.value == rhs.value && lhs.raw_state == rhs.raw_state
           && lhs.attributes == rhs.attributes;
}

auto toJson(EntityState const& state) -> nlohmann::json {
    nlohmann::json value;
    std::visit(
        [&value](auto const& alternative) {
            using T = std::decay_t<decltype(alternative)>;
            if constexpr (std::is_same_v<T, OnOff>) {
                value = alternative.on;
            } else if constexpr (std::is_same_v<T, Numeric>) {
                value = alternative.value;
            } else if constexpr (std::is_same_v<T, Text>) {
                value = alternative.value;
            } else {
                value = nullptr;
            }
        },
        state.value);

    return nlohmann::json{{"entity_id", state.id},
                          {"kind", valueKindName(state.value)},
                          {"state", state.raw_state},
                          {"value", std::move(value)},
                          {"attributes", state.attributes},
                          {"last_updated", format_timestamp(state.last_updated)}};
}

} // namespace HC
