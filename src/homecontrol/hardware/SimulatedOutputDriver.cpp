#include "hardware/SimulatedOutputDriver.hpp"

#include "log/TaggedLogger.hpp"

namespace HC::Hardware {

SimulatedOutputDriver::SimulatedOutputDriver(std::vector<OutputChannelConfig> const& channels) {
    for (auto const& channel : channels) {
        if (states_.emplace(channel.channel_id, false).second) {
            order_.push_back(channel.channel_id);
        }
    }
}

auto SimulatedOutputDriver::write(std::string_view channel_id, bool is_on) -> Expected<void> {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = states_.find(channel_id);
    if (it == states_.end()) {
        return std::unexpected(Error{Error::Code::NotFound, "unknown output channel " + std::string{channel_id}});
    }
    if (failing_.contains(channel_id)) {
        return std::unexpected(
            Error{Error::Code::HardwareFault, "simulated write failure on " + std::string{channel_id}});
    }
    it->second = is_on;
    ++writes_;
    hc_log("Simulated " + it->first + (is_on ? " on" : " off"), "DEBUG", "Gpio");
    return {};
}

auto SimulatedOutputDriver::read(std::string_view channel_id) const -> bool {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = states_.find(channel_id);
    return it != states_.end() && it->second;
}

auto SimulatedOutputDriver::channels() const -> std::vector<HardwareOutput> {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<HardwareOutput> outputs;
    outputs.reserve(order_.size());
    for (auto const& id : order_) {
        outputs.push_back(HardwareOutput{id, states_.find(id)->second});
    }
    return outputs;
}

auto SimulatedOutputDriver::hasChannel(std::string_view channel_id) const -> bool {
    std::lock_guard<std::mutex> lock(mutex_);
    return states_.contains(channel_id);
}

void SimulatedOutputDriver::setFailing(std::string const& channel_id, bool failing) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (failing) {
        failing_.insert(channel_id);
    } else {
        failing_.erase(channel_id);
    }
}

auto SimulatedOutputDriver::writeCount() const -> std::size_t {
    std::lock_guard<std::mutex> lock(mutex_);
    return writes_;
}

} // namespace HC::Hardware
