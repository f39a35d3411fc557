#include "dispatch/CommandDispatcher.hpp"

#include "log/TaggedLogger.hpp"
#include "upstream/UpstreamProtocol.hpp"

#include <utility>

namespace HC {

using Clock = std::chrono::steady_clock;

auto targetKindToString(TargetKind kind) -> std::string_view {
    switch (kind) {
    case TargetKind::HardwareChannel:
        return "output";
    case TargetKind::UpstreamEntity:
        return "entity";
    }
    return "entity";
}

CommandDispatcher::CommandDispatcher(EntityCache const&                              cache,
                                     std::shared_ptr<Hardware::HardwareOutputDriver> outputs,
                                     Upstream::CommandSink*                          sink,
                                     DispatcherOptions                               options)
    : cache_(cache)
    , outputs_(std::move(outputs))
    , sink_(sink)
    , options_(options) {
    if (outputs_) {
        for (auto const& channel : outputs_->channels()) {
            channel_locks_.emplace(channel.channel_id, std::make_unique<std::mutex>());
        }
    }
}

auto CommandDispatcher::resolve(std::string_view target) const -> Expected<TargetKind> {
    if (channel_locks_.contains(target)) {
        return TargetKind::HardwareChannel;
    }
    if (isValidEntityId(target)) {
        return TargetKind::UpstreamEntity;
    }
    return std::unexpected(Error{Error::Code::NotFound, "unknown target " + std::string{target}});
}

auto CommandDispatcher::dispatch(CommandIntent const& intent) -> Expected<DispatchResult> {
    return dispatch(intent, options_.command_timeout);
}

auto CommandDispatcher::dispatch(CommandIntent const& intent, std::chrono::milliseconds timeout)
    -> Expected<DispatchResult> {
    auto kind = resolve(intent.target);
    if (!kind) {
        return std::unexpected(kind.error());
    }
    if (*kind == TargetKind::HardwareChannel) {
        return dispatchHardware(intent);
    }
    return dispatchUpstream(intent, timeout);
}

auto CommandDispatcher::dispatchHardware(CommandIntent const& intent) -> Expected<DispatchResult> {
    auto& lock_ptr = channel_locks_.find(intent.target)->second;
    std::lock_guard<std::mutex> lock(*lock_ptr);

    DispatchResult result{intent.target, TargetKind::HardwareChannel, intent.desired, cache_.generation(), false};
    if (outputs_->read(intent.target) == intent.desired) {
        return result;
    }
    if (auto written = outputs_->write(intent.target, intent.desired); !written) {
        if (written.error().code == Error::Code::HardwareFault) {
            return std::unexpected(written.error());
        }
        return std::unexpected(Error{Error::Code::HardwareFault, describeError(written.error())});
    }
    result.state   = outputs_->read(intent.target);
    result.changed = true;
    hc_log("Output " + intent.target + (intent.desired ? " on" : " off"), "INFO", "Dispatch");
    return result;
}

auto CommandDispatcher::dispatchUpstream(CommandIntent const& intent, std::chrono::milliseconds timeout)
    -> Expected<DispatchResult> {
    if (sink_ == nullptr || sink_->connectionState() != Upstream::ConnectionState::Subscribed) {
        return std::unexpected(Error{Error::Code::Unreachable, "not connected to the source"});
    }

    // Confirmation is any update after this point that sets the desired value,
    // even if a later update has already replaced it.
    auto baseline = cache_.generation();
    if (auto current = cache_.get(intent.target)) {
        if (auto value = asBool(**current); value && *value == intent.desired) {
            return DispatchResult{intent.target, TargetKind::UpstreamEntity, intent.desired, baseline, false};
        }
    }

    auto call = Upstream::makeToggleCall(intent.target, intent.desired);
    if (!call) {
        return std::unexpected(call.error());
    }

    auto deadline = Clock::now() + timeout;
    if (auto accepted = sink_->callService(*call, timeout); !accepted) {
        return std::unexpected(accepted.error());
    }

    while (true) {
        auto interrupts = cache_.interruptCount();
        auto seen       = cache_.generation();
        if (auto confirmed = cache_.generationWith(intent.target, intent.desired); confirmed > baseline) {
            hc_log("Confirmed " + intent.target + (intent.desired ? " on" : " off"), "INFO", "Dispatch");
            return DispatchResult{intent.target, TargetKind::UpstreamEntity, intent.desired, confirmed, true};
        }
        if (sink_->connectionState() != Upstream::ConnectionState::Subscribed) {
            hc_log("Connection lost before " + intent.target + " was confirmed", "WARN", "Dispatch");
            return std::unexpected(
                Error{Error::Code::Timeout, "command accepted but the connection was lost before confirmation"});
        }
        if (Clock::now() >= deadline) {
            break;
        }
        cache_.waitForGeneration(seen, interrupts, deadline);
    }
    hc_log("No confirming update for " + intent.target + " within " + std::to_string(timeout.count()) + " ms",
           "WARN", "Dispatch");
    return std::unexpected(Error{Error::Code::Timeout, "command accepted but not confirmed in time"});
}

} // namespace HC
