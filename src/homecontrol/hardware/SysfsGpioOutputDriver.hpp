#pragma once
#if defined(HC_WITH_GPIO)

#include "hardware/HardwareOutputDriver.hpp"

#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace HC::Hardware {

/**
 * Drives outputs through the Linux sysfs GPIO interface.
 *
 * Each configured pin is exported and set to direction `out` on open(); a
 * write replaces the pin's `value` file content with `0` or `1`.
 */
class SysfsGpioOutputDriver final : public HardwareOutputDriver {
public:
    static auto open(std::vector<OutputChannelConfig> const& channels,
                     std::filesystem::path                  root = "/sys/class/gpio")
        -> Expected<std::unique_ptr<SysfsGpioOutputDriver>>;

    auto write(std::string_view channel_id, bool is_on) -> Expected<void> override;
    [[nodiscard]] auto read(std::string_view channel_id) const -> bool override;
    [[nodiscard]] auto channels() const -> std::vector<HardwareOutput> override;
    [[nodiscard]] auto hasChannel(std::string_view channel_id) const -> bool override;

private:
    struct Channel {
        std::uint32_t         pin{0};
        std::filesystem::path value_path;
        bool                  is_on{false};
    };

    explicit SysfsGpioOutputDriver(std::filesystem::path root);

    auto exportPin(std::uint32_t pin) -> Expected<std::filesystem::path>;

    std::filesystem::path                     root_;
    mutable std::mutex                        mutex_;
    std::vector<std::string>                  order_;
    std::map<std::string, Channel, std::less<>> channels_;
};

} // namespace HC::Hardware

#endif // HC_WITH_GPIO
