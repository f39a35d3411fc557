#include "hardware/OutputDriverFactory.hpp"
#include "hardware/SimulatedOutputDriver.hpp"

#include <doctest/doctest.h>

using namespace HC;
using namespace HC::Hardware;

TEST_SUITE("hardware.simulated") {
    TEST_CASE("Channels start off and keep their configured order") {
        SimulatedOutputDriver driver{defaultOutputChannels()};
        auto                  channels = driver.channels();
        REQUIRE(channels.size() == 3);
        CHECK(channels[0].channel_id == "red_led");
        CHECK(channels[1].channel_id == "green_led");
        CHECK(channels[2].channel_id == "buzzer");
        for (auto const& channel : channels) {
            CHECK_FALSE(channel.is_on);
        }
        CHECK(driver.hasChannel("buzzer"));
        CHECK_FALSE(driver.hasChannel("siren"));
    }

    TEST_CASE("Writes are visible to reads and snapshots") {
        SimulatedOutputDriver driver{defaultOutputChannels()};
        REQUIRE(driver.write("green_led", true).has_value());
        CHECK(driver.read("green_led"));
        CHECK_FALSE(driver.read("red_led"));
        CHECK(driver.channels()[1].is_on);
        CHECK(driver.writeCount() == 1);
    }

    TEST_CASE("Unknown channels and injected faults are reported") {
        SimulatedOutputDriver driver{defaultOutputChannels()};
        auto unknown = driver.write("siren", true);
        REQUIRE_FALSE(unknown.has_value());
        CHECK(unknown.error().code == Error::Code::NotFound);
        CHECK_FALSE(driver.read("siren"));

        driver.setFailing("buzzer", true);
        auto fault = driver.write("buzzer", true);
        REQUIRE_FALSE(fault.has_value());
        CHECK(fault.error().code == Error::Code::HardwareFault);
        CHECK_FALSE(driver.read("buzzer"));

        driver.setFailing("buzzer", false);
        CHECK(driver.write("buzzer", true).has_value());
        CHECK(driver.read("buzzer"));
    }

    TEST_CASE("Duplicate channel ids collapse to one channel") {
        SimulatedOutputDriver driver{{OutputChannelConfig{"red_led", 17}, OutputChannelConfig{"red_led", 22}}};
        CHECK(driver.channels().size() == 1);
    }

    TEST_CASE("Factory picks the simulated driver on request") {
        auto driver = makeOutputDriver(OutputDriverOptions{.channels = defaultOutputChannels(), .simulate = true});
        REQUIRE(driver.has_value());
        CHECK((*driver)->channels().size() == 3);

        if (!gpioSupported()) {
            auto gpio = makeOutputDriver(OutputDriverOptions{.channels = defaultOutputChannels(), .simulate = false});
            REQUIRE_FALSE(gpio.has_value());
            CHECK(gpio.error().code == Error::Code::NotSupported);
        }
    }
}
