#pragma once

#include <homecontrol/core/Error.hpp>

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace HC::Hardware {

struct HardwareOutput {
    std::string channel_id;
    bool        is_on{false};
};

struct OutputChannelConfig {
    std::string   channel_id;
    std::uint32_t pin{0};
};

/**
 * Locally attached on/off outputs, addressed by channel id.
 *
 * The driver owns the channel states. Callers serialize writes per channel;
 * reads may happen from any thread at any time.
 */
class HardwareOutputDriver {
public:
    virtual ~HardwareOutputDriver() = default;

    // HardwareFault when the write did not reach the output; NotFound for an unknown channel.
    virtual auto write(std::string_view channel_id, bool is_on) -> Expected<void> = 0;

    // Last state written; false for unknown channels.
    [[nodiscard]] virtual auto read(std::string_view channel_id) const -> bool = 0;

    [[nodiscard]] virtual auto channels() const -> std::vector<HardwareOutput> = 0;

    [[nodiscard]] virtual auto hasChannel(std::string_view channel_id) const -> bool = 0;
};

} // namespace HC::Hardware
