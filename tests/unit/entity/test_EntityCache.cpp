#include "entity/EntityCache.hpp"

#include <doctest/doctest.h>

#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

using namespace HC;
using namespace std::chrono_literals;

namespace {

auto at(int seconds) -> Timestamp {
    return Timestamp{} + std::chrono::hours{24 * 365 * 54} + std::chrono::seconds{seconds};
}

} // namespace

TEST_SUITE("entity.cache") {
    TEST_CASE("Applying new states bumps the generation") {
        EntityCache cache;
        CHECK(cache.generation() == 0);
        CHECK_FALSE(cache.get("light.a").has_value());

        CHECK(cache.apply(makeEntityState("light.a", "off", {}, at(1))) == 1);
        CHECK(cache.apply(makeEntityState("light.b", "on", {}, at(1))) == 2);
        CHECK(cache.apply(makeEntityState("light.a", "on", {}, at(2))) == 3);
        CHECK(cache.size() == 2);

        auto a = cache.get("light.a");
        REQUIRE(a.has_value());
        CHECK(asBool(**a) == std::optional<bool>{true});
    }

    TEST_CASE("Older timestamps never overwrite newer ones") {
        EntityCache cache;
        cache.apply(makeEntityState("light.a", "on", {}, at(10)));
        auto before = cache.generation();

        CHECK(cache.apply(makeEntityState("light.a", "off", {}, at(5))) == before);
        auto a = cache.get("light.a");
        REQUIRE(a.has_value());
        CHECK(asBool(**a) == std::optional<bool>{true});
    }

    TEST_CASE("Replays of the same state are idempotent") {
        EntityCache cache;
        cache.apply(makeEntityState("sensor.t", "20", nlohmann::json{{"unit", "C"}}, at(3)));
        auto before = cache.generation();
        CHECK(cache.apply(makeEntityState("sensor.t", "20", nlohmann::json{{"unit", "C"}}, at(3))) == before);

        // Same timestamp with different content is a correction and is applied.
        CHECK(cache.apply(makeEntityState("sensor.t", "21", nlohmann::json{{"unit", "C"}}, at(3))) == before + 1);
    }

    TEST_CASE("Tombstones keep the entry and hide the value") {
        EntityCache cache;
        cache.apply(makeEntityState("light.a", "on", {}, at(1)));
        cache.apply(makeTombstone("light.a", at(2)));
        auto a = cache.get("light.a");
        REQUIRE(a.has_value());
        CHECK(isTombstone(**a));
        CHECK(cache.size() == 1);

        cache.apply(makeEntityState("light.a", "off", {}, at(3)));
        a = cache.get("light.a");
        REQUIRE(a.has_value());
        CHECK_FALSE(isTombstone(**a));
    }

    TEST_CASE("Snapshots are stable copies") {
        EntityCache cache;
        cache.apply(makeEntityState("light.a", "on", {}, at(1)));
        auto snapshot = cache.snapshot();
        cache.apply(makeEntityState("light.a", "off", {}, at(2)));
        cache.apply(makeEntityState("light.b", "off", {}, at(2)));

        CHECK(snapshot.generation == 1);
        CHECK(snapshot.entities.size() == 1);
        CHECK(asBool(*snapshot.entities.at("light.a")) == std::optional<bool>{true});
    }

    TEST_CASE("waitForGeneration wakes on apply and honors the deadline") {
        EntityCache cache;
        auto start = EntityCache::Clock::now();
        CHECK(cache.waitForGeneration(0, start + 30ms) == 0);
        CHECK(EntityCache::Clock::now() - start >= 30ms);

        std::thread writer([&] {
            std::this_thread::sleep_for(20ms);
            cache.apply(makeEntityState("light.a", "on", {}, at(1)));
        });
        auto seen = cache.waitForGeneration(0, EntityCache::Clock::now() + 2s);
        writer.join();
        CHECK(seen == 1);
    }

    TEST_CASE("Toggle marks remember the last generation that set each value") {
        EntityCache cache;
        CHECK(cache.generationWith("light.a", true) == 0);

        auto on  = cache.apply(makeEntityState("light.a", "on", {}, at(1)));
        auto off = cache.apply(makeEntityState("light.a", "off", {}, at(2)));
        cache.apply(makeEntityState("sensor.t", "21.5", {}, at(3)));

        CHECK(cache.generationWith("light.a", true) == on);
        CHECK(cache.generationWith("light.a", false) == off);
        CHECK(cache.generationWith("sensor.t", true) == 0);
        CHECK(cache.generationWith("sensor.t", false) == 0);
        CHECK(asBool(**cache.get("light.a")) == std::optional<bool>{false});
    }

    TEST_CASE("interruptWaiters releases a waiter without an update") {
        EntityCache cache;
        auto        seen       = cache.generation();
        auto        interrupts = cache.interruptCount();

        std::thread interrupter([&] {
            std::this_thread::sleep_for(20ms);
            cache.interruptWaiters();
        });
        auto start = EntityCache::Clock::now();
        CHECK(cache.waitForGeneration(seen, interrupts, start + 2s) == seen);
        interrupter.join();
        CHECK(EntityCache::Clock::now() - start < 1s);
        CHECK(cache.interruptCount() == interrupts + 1);

        // A stale interrupt count returns immediately.
        start = EntityCache::Clock::now();
        CHECK(cache.waitForGeneration(seen, interrupts, start + 2s) == seen);
        CHECK(EntityCache::Clock::now() - start < 1s);
    }

    TEST_CASE("select copies only the requested entities") {
        EntityCache cache;
        cache.apply(makeEntityState("light.a", "on", {}, at(1)));
        cache.apply(makeEntityState("light.b", "off", {}, at(1)));
        cache.apply(makeEntityState("sensor.t", "21.5", {}, at(1)));

        auto selected = cache.select({"light.b", "sensor.t", "light.missing"});
        CHECK(selected.generation == cache.generation());
        CHECK(selected.entities.size() == 2);
        CHECK(selected.entities.count("light.b") == 1);
        CHECK(selected.entities.count("sensor.t") == 1);
        CHECK(selected.entities.count("light.a") == 0);
        CHECK(cache.select({}).entities.empty());
    }

    TEST_CASE("Readers never observe a generation going backwards") {
        EntityCache       cache;
        std::atomic<bool> done{false};
        std::atomic<bool> regressed{false};

        std::vector<std::thread> readers;
        for (int i = 0; i < 4; ++i) {
            readers.emplace_back([&] {
                std::uint64_t last = 0;
                while (!done.load()) {
                    auto snapshot = cache.snapshot();
                    if (snapshot.generation < last) {
                        regressed.store(true);
                    }
                    last = snapshot.generation;
                    if (auto a = cache.get("sensor.counter")) {
                        (void)(*a)->raw_state.size();
                    }
                }
            });
        }

        for (int i = 1; i <= 500; ++i) {
            cache.apply(makeEntityState("sensor.counter", std::to_string(i), {}, at(i)));
        }
        done.store(true);
        for (auto& reader : readers) {
            reader.join();
        }

        CHECK_FALSE(regressed.load());
        CHECK(cache.generation() == 500);
    }
}
