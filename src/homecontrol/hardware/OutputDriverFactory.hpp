#pragma once

#include "hardware/HardwareOutputDriver.hpp"

#include <memory>
#include <vector>

namespace HC::Hardware {

struct OutputDriverOptions {
    std::vector<OutputChannelConfig> channels;
    bool                             simulate{true};
};

[[nodiscard]] auto defaultOutputChannels() -> std::vector<OutputChannelConfig>;

[[nodiscard]] constexpr auto gpioSupported() -> bool {
#if defined(HC_WITH_GPIO)
    return true;
#else
    return false;
#endif
}

// NotSupported when real GPIO is requested from a build without it.
[[nodiscard]] auto makeOutputDriver(OutputDriverOptions const& options)
    -> Expected<std::shared_ptr<HardwareOutputDriver>>;

} // namespace HC::Hardware
