#if defined(HC_WITH_GPIO)
#include "hardware/SysfsGpioOutputDriver.hpp"

#include "log/TaggedLogger.hpp"

#include <chrono>
#include <fstream>
#include <memory>
#include <system_error>
#include <thread>

namespace HC::Hardware {
namespace {

[[nodiscard]] auto hardware_fault(std::string message) -> Error {
    return Error{Error::Code::HardwareFault, std::move(message)};
}

[[nodiscard]] auto write_file(std::filesystem::path const& path, std::string_view content) -> Expected<void> {
    std::ofstream out(path);
    if (!out) {
        return std::unexpected(hardware_fault("cannot open " + path.string()));
    }
    out << content;
    out.flush();
    if (!out) {
        return std::unexpected(hardware_fault("cannot write " + path.string()));
    }
    return {};
}

} // namespace

SysfsGpioOutputDriver::SysfsGpioOutputDriver(std::filesystem::path root)
    : root_(std::move(root)) {}

auto SysfsGpioOutputDriver::open(std::vector<OutputChannelConfig> const& channels, std::filesystem::path root)
    -> Expected<std::unique_ptr<SysfsGpioOutputDriver>> {
    std::unique_ptr<SysfsGpioOutputDriver> driver(new SysfsGpioOutputDriver(std::move(root)));
    for (auto const& config : channels) {
        auto value_path = driver->exportPin(config.pin);
        if (!value_path) {
            return std::unexpected(value_path.error());
        }
        if (auto cleared = write_file(*value_path, "0"); !cleared) {
            return std::unexpected(cleared.error());
        }
        driver->order_.push_back(config.channel_id);
        driver->channels_.emplace(config.channel_id, Channel{config.pin, *value_path, false});
        hc_log("GPIO " + std::to_string(config.pin) + " ready as " + config.channel_id, "INFO", "Gpio");
    }
    return driver;
}

auto SysfsGpioOutputDriver::exportPin(std::uint32_t pin) -> Expected<std::filesystem::path> {
    auto pin_dir = root_ / ("gpio" + std::to_string(pin));
    std::error_code ec;
    if (!std::filesystem::exists(pin_dir, ec)) {
        if (auto exported = write_file(root_ / "export", std::to_string(pin)); !exported) {
            return std::unexpected(exported.error());
        }
        // udev needs a moment to fix permissions on the new directory.
        for (int attempt = 0; attempt < 20 && !std::filesystem::exists(pin_dir / "direction", ec); ++attempt) {
            std::this_thread::sleep_for(std::chrono::milliseconds{25});
        }
    }
    if (auto direction = write_file(pin_dir / "direction", "out"); !direction) {
        return std::unexpected(direction.error());
    }
    return pin_dir / "value";
}

auto SysfsGpioOutputDriver::write(std::string_view channel_id, bool is_on) -> Expected<void> {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = channels_.find(channel_id);
    if (it == channels_.end()) {
        return std::unexpected(Error{Error::Code::NotFound, "unknown output channel " + std::string{channel_id}});
    }
    if (auto written = write_file(it->second.value_path, is_on ? "1" : "0"); !written) {
        hc_log("GPIO write failed on " + it->first + ": " + describeError(written.error()), "ERROR", "Gpio");
        return written;
    }
    it->second.is_on = is_on;
    return {};
}

auto SysfsGpioOutputDriver::read(std::string_view channel_id) const -> bool {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = channels_.find(channel_id);
    return it != channels_.end() && it->second.is_on;
}

auto SysfsGpioOutputDriver::channels() const -> std::vector<HardwareOutput> {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<HardwareOutput> outputs;
    outputs.reserve(order_.size());
    for (auto const& id : order_) {
        outputs.push_back(HardwareOutput{id, channels_.find(id)->second.is_on});
    }
    return outputs;
}

auto SysfsGpioOutputDriver::hasChannel(std::string_view channel_id) const -> bool {
    std::lock_guard<std::mutex> lock(mutex_);
    return channels_.contains(channel_id);
}

} // namespace HC::Hardware
#endif // HC_WITH_GPIO
