#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <optional>
#include <vector>

#include <boost/asio.hpp>

#include "cloudbrowser/pool/startup_gate.hpp"
#include "../support/fake_provisioning_api.hpp"

using namespace cloudbrowser;
using namespace cloudbrowser::pool;
using cloudbrowser::testing::run_test;
using boost::asio::awaitable;
using namespace std::chrono_literals;

namespace {

auto sleep_for(std::chrono::milliseconds d) -> awaitable<void> {
    return cloudbrowser::testing::FakeProvisioningApi::sleep(d);
}

} // anonymous namespace

TEST_CASE("StartupGate grants up to capacity immediately", "[pool][gate]") {
    boost::asio::io_context ioc;
    StartupGate gate(2);

    run_test(ioc, [&]() -> awaitable<void> {
        auto a = co_await gate.acquire();
        auto b = co_await gate.acquire();
        REQUIRE(a.has_value());
        REQUIRE(b.has_value());
        CHECK(gate.in_flight() == 2);
        CHECK_FALSE(gate.try_acquire().has_value());

        a->release();
        CHECK(gate.in_flight() == 1);
        a->release();
        CHECK(gate.in_flight() == 1);
    });
    CHECK(gate.in_flight() == 0);
}

TEST_CASE("StartupGate capacity is at least one", "[pool][gate]") {
    StartupGate gate(0);
    CHECK(gate.capacity() == 1);
    auto permit = gate.try_acquire();
    REQUIRE(permit.has_value());
    CHECK(static_cast<bool>(*permit));
    CHECK_FALSE(gate.try_acquire().has_value());
}

TEST_CASE("StartupGate serves waiters in arrival order", "[pool][gate]") {
    boost::asio::io_context ioc;
    StartupGate gate(1);

    run_test(ioc, [&]() -> awaitable<void> {
        auto executor = co_await boost::asio::this_coro::executor;
        auto held = co_await gate.acquire();
        REQUIRE(held.has_value());

        std::vector<int> order;
        for (int i = 0; i < 3; ++i) {
            boost::asio::co_spawn(
                executor,
                [&, i]() -> awaitable<void> {
                    auto permit = co_await gate.acquire();
                    REQUIRE(permit.has_value());
                    order.push_back(i);
                    co_await sleep_for(2ms);
                },
                boost::asio::detached);
            co_await sleep_for(2ms);
        }

        CHECK(gate.waiting() == 3);
        CHECK(gate.in_flight() == 1);

        // A newcomer cannot overtake the queue.
        held->release();
        CHECK_FALSE(gate.try_acquire().has_value());

        for (int spins = 0; order.size() < 3 && spins < 100; ++spins) {
            co_await sleep_for(5ms);
        }
        CHECK(order == std::vector<int>{0, 1, 2});
        co_await sleep_for(10ms);
        CHECK(gate.waiting() == 0);
        CHECK(gate.in_flight() == 0);
    });
}

TEST_CASE("StartupGate never exceeds its capacity", "[pool][gate]") {
    boost::asio::io_context ioc;
    StartupGate gate(3);

    run_test(ioc, [&]() -> awaitable<void> {
        auto executor = co_await boost::asio::this_coro::executor;
        int active = 0;
        int peak = 0;
        int finished = 0;

        for (int i = 0; i < 10; ++i) {
            boost::asio::co_spawn(
                executor,
                [&]() -> awaitable<void> {
                    auto permit = co_await gate.acquire();
                    REQUIRE(permit.has_value());
                    ++active;
                    peak = std::max(peak, active);
                    co_await sleep_for(3ms);
                    --active;
                    ++finished;
                },
                boost::asio::detached);
        }

        for (int spins = 0; finished < 10 && spins < 200; ++spins) {
            co_await sleep_for(5ms);
        }
        CHECK(finished == 10);
        CHECK(peak == 3);
    });
}

TEST_CASE("StartupGate cancel fails queued and future acquisitions", "[pool][gate]") {
    boost::asio::io_context ioc;
    StartupGate gate(1);

    run_test(ioc, [&]() -> awaitable<void> {
        auto executor = co_await boost::asio::this_coro::executor;
        auto held = co_await gate.acquire();
        REQUIRE(held.has_value());

        std::optional<ErrorCode> queued_error;
        boost::asio::co_spawn(
            executor,
            [&]() -> awaitable<void> {
                auto permit = co_await gate.acquire();
                REQUIRE_FALSE(permit.has_value());
                queued_error = permit.error().code();
            },
            boost::asio::detached);
        co_await sleep_for(5ms);
        CHECK(gate.waiting() == 1);

        gate.cancel();
        CHECK(gate.cancelled());
        co_await sleep_for(5ms);
        CHECK(queued_error == ErrorCode::PoolShutDown);
        CHECK(gate.waiting() == 0);

        auto late = co_await gate.acquire();
        REQUIRE_FALSE(late.has_value());
        CHECK(late.error().code() == ErrorCode::PoolShutDown);
        CHECK_FALSE(gate.try_acquire().has_value());

        // Outstanding permits are still released cleanly.
        held->release();
        CHECK(gate.in_flight() == 0);
    });
}
