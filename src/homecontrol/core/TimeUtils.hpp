#pragma once

#include <homecontrol/core/Error.hpp>

#include <chrono>
#include <string>
#include <string_view>

namespace HC {

using Timestamp = std::chrono::system_clock::time_point;

auto format_timestamp(Timestamp tp) -> std::string;

// Accepts `YYYY-MM-DDTHH:MM:SS[.fraction](Z|+HH:MM|-HH:MM)`; a missing offset is read as UTC.
auto parse_timestamp(std::string_view text) -> Expected<Timestamp>;

} // namespace HC
