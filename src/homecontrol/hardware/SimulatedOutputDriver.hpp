#pragma once

#include "hardware/HardwareOutputDriver.hpp"

#include <map>
#include <mutex>
#include <set>
#include <string>

namespace HC::Hardware {

// In-memory outputs for hosts without attached hardware. Every channel starts off.
class SimulatedOutputDriver final : public HardwareOutputDriver {
public:
    explicit SimulatedOutputDriver(std::vector<OutputChannelConfig> const& channels);

    auto write(std::string_view channel_id, bool is_on) -> Expected<void> override;
    [[nodiscard]] auto read(std::string_view channel_id) const -> bool override;
    [[nodiscard]] auto channels() const -> std::vector<HardwareOutput> override;
    [[nodiscard]] auto hasChannel(std::string_view channel_id) const -> bool override;

    // Subsequent writes to `channel_id` fail with HardwareFault until cleared.
    void setFailing(std::string const& channel_id, bool failing);
    [[nodiscard]] auto writeCount() const -> std::size_t;

private:
    mutable std::mutex                         mutex_;
    std::vector<std::string>                   order_;
    std::map<std::string, bool, std::less<>>   states_;
    std::set<std::string, std::less<>>         failing_;
    std::size_t                                writes_{0};
};

} // namespace HC::Hardware
