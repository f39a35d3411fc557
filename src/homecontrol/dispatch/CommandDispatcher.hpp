#pragma once

#include "entity/EntityCache.hpp"
#include "hardware/HardwareOutputDriver.hpp"
#include "upstream/CommandSink.hpp"

#include <homecontrol/core/Error.hpp>

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>

namespace HC {

struct CommandIntent {
    std::string target;
    bool        desired{false};
};

enum class TargetKind {
    HardwareChannel,
    UpstreamEntity,
};

[[nodiscard]] auto targetKindToString(TargetKind kind) -> std::string_view;

struct DispatchResult {
    std::string   target;
    TargetKind    kind{TargetKind::UpstreamEntity};
    bool          state{false};
    std::uint64_t generation{0};
    bool          changed{false};
};

struct DispatcherOptions {
    // Bounds the acknowledgment and the confirmation wait together.
    std::chrono::milliseconds command_timeout{std::chrono::milliseconds{5000}};
};

/**
 * Turns UI intents into hardware writes or upstream commands.
 *
 * Hardware channels are written directly and are authoritative once the
 * driver accepts the write. Upstream entities are commanded through the sink;
 * success is reported only after the cache shows the desired value, so the
 * caller can trust the state actually changed.
 *
 * Errors: Unreachable, CommandRejected, Timeout and HardwareFault per
 * outcome; NotFound for a target that is neither a channel nor an entity id.
 */
class CommandDispatcher {
public:
    CommandDispatcher(EntityCache const&                              cache,
                      std::shared_ptr<Hardware::HardwareOutputDriver> outputs,
                      Upstream::CommandSink*                          sink,
                      DispatcherOptions                               options = {});

    CommandDispatcher(CommandDispatcher const&)            = delete;
    CommandDispatcher& operator=(CommandDispatcher const&) = delete;

    auto dispatch(CommandIntent const& intent) -> Expected<DispatchResult>;
    auto dispatch(CommandIntent const& intent, std::chrono::milliseconds timeout) -> Expected<DispatchResult>;

    [[nodiscard]] auto resolve(std::string_view target) const -> Expected<TargetKind>;
    [[nodiscard]] auto options() const -> DispatcherOptions const& { return options_; }

private:
    auto dispatchHardware(CommandIntent const& intent) -> Expected<DispatchResult>;
    auto dispatchUpstream(CommandIntent const& intent, std::chrono::milliseconds timeout) -> Expected<DispatchResult>;

    EntityCache const&                              cache_;
    std::shared_ptr<Hardware::HardwareOutputDriver> outputs_;
    Upstream::CommandSink*                          sink_;
    DispatcherOptions                               options_;
    std::map<std::string, std::unique_ptr<std::mutex>, std::less<>> channel_locks_;
};

} // namespace HC
