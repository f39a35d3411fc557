#include "hardware/OutputDriverFactory.hpp"

#include "hardware/SimulatedOutputDriver.hpp"
#include "hardware/SysfsGpioOutputDriver.hpp"
#include "log/TaggedLogger.hpp"

namespace HC::Hardware {

auto defaultOutputChannels() -> std::vector<OutputChannelConfig> {
    return {
        OutputChannelConfig{"red_led", 17},
        OutputChannelConfig{"green_led", 27},
        OutputChannelConfig{"buzzer", 18},
    };
}

auto makeOutputDriver(OutputDriverOptions const& options) -> Expected<std::shared_ptr<HardwareOutputDriver>> {
    if (options.simulate) {
        hc_log("Using simulated outputs", "INFO", "Gpio");
        return std::make_shared<SimulatedOutputDriver>(options.channels);
    }
#if defined(HC_WITH_GPIO)
    auto driver = SysfsGpioOutputDriver::open(options.channels);
    if (!driver) {
        return std::unexpected(driver.error());
    }
    return std::shared_ptr<HardwareOutputDriver>(std::move(*driver));
#else
    return std::unexpected(Error{Error::Code::NotSupported, "built without GPIO support; use --simulate-gpio"});
#endif
}

} // namespace HC::Hardware
