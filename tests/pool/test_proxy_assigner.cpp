#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <set>
#include <string>
#include <vector>

#include "cloudbrowser/pool/proxy_assigner.hpp"

using namespace cloudbrowser;
using namespace cloudbrowser::pool;

namespace {

const std::vector<std::string> kProxies = {
    "http://p0.example:8000",
    "http://p1.example:8000",
    "http://p2.example:8000",
};

} // anonymous namespace

TEST_CASE("ProxyAssigner without proxies", "[pool][proxy]") {
    ProxyAssigner random({}, ProxyOrdering::Random);
    ProxyAssigner round_robin({}, ProxyOrdering::RoundRobin);
    CHECK_FALSE(random.assign(0).has_value());
    CHECK_FALSE(round_robin.assign(3).has_value());
}

TEST_CASE("ProxyAssigner round-robin", "[pool][proxy]") {
    ProxyAssigner assigner(kProxies, ProxyOrdering::RoundRobin);

    SECTION("first assignment follows the slot index") {
        CHECK(assigner.assign(0) == kProxies[0]);
        CHECK(assigner.assign(1) == kProxies[1]);
        CHECK(assigner.assign(2) == kProxies[2]);
        CHECK(assigner.assign(4) == kProxies[1]);
    }

    SECTION("each slot advances its own cursor") {
        CHECK(assigner.assign(0) == kProxies[0]);
        CHECK(assigner.assign(0) == kProxies[1]);
        CHECK(assigner.assign(0) == kProxies[2]);
        CHECK(assigner.assign(0) == kProxies[0]);

        // Slot 1 is unaffected by slot 0's history.
        CHECK(assigner.assign(1) == kProxies[1]);
        CHECK(assigner.assign(1) == kProxies[2]);
    }

    SECTION("a single proxy is always chosen") {
        ProxyAssigner single({kProxies[0]}, ProxyOrdering::RoundRobin);
        for (std::size_t i = 0; i < 5; ++i) {
            CHECK(single.assign(i % 2) == kProxies[0]);
        }
    }
}

TEST_CASE("ProxyAssigner random", "[pool][proxy]") {
    ProxyAssigner assigner(kProxies, ProxyOrdering::Random, 42);
    CHECK(assigner.ordering() == ProxyOrdering::Random);

    std::set<std::string> seen;
    for (int i = 0; i < 200; ++i) {
        auto proxy = assigner.assign(0);
        REQUIRE(proxy.has_value());
        CHECK(std::ranges::find(kProxies, *proxy) != kProxies.end());
        seen.insert(*proxy);
    }
    // 200 uniform draws over three proxies hit each of them.
    CHECK(seen.size() == kProxies.size());
}

TEST_CASE("ProxyAssigner random is reproducible with a seed", "[pool][proxy]") {
    ProxyAssigner a(kProxies, ProxyOrdering::Random, 7);
    ProxyAssigner b(kProxies, ProxyOrdering::Random, 7);
    for (std::size_t slot = 0; slot < 20; ++slot) {
        CHECK(a.assign(slot) == b.assign(slot));
    }
}
