#include <catch2/catch_test_macros.hpp>

#include "cloudbrowser/pool/session_handle.hpp"

using namespace cloudbrowser::pool;

TEST_CASE("SessionHandle starts without a remote session", "[pool][handle]") {
    SessionHandle handle(2, std::string("http://proxy.example:3128"));
    CHECK(handle.state() == SessionState::Starting);
    CHECK(handle.id().empty());
    CHECK(handle.slot_index() == 2);
    REQUIRE(handle.proxy().has_value());
    CHECK(*handle.proxy() == "http://proxy.example:3128");
    CHECK(handle.pages_served() == 0);
    CHECK_FALSE(handle.suspect());
}

TEST_CASE("SessionHandle state transitions", "[pool][handle]") {
    SessionHandle handle(0, std::nullopt);

    SECTION("only ready handles can be leased") {
        CHECK_FALSE(handle.mark_busy());
        handle.mark_ready("s-1");
        CHECK(handle.id() == "s-1");
        CHECK(handle.state() == SessionState::Ready);
        CHECK(handle.mark_busy());
        CHECK_FALSE(handle.mark_busy());
        handle.mark_idle();
        CHECK(handle.state() == SessionState::Ready);
    }

    SECTION("the id is bound once") {
        handle.mark_ready("s-1");
        handle.mark_ready("s-2");
        CHECK(handle.id() == "s-1");
    }

    SECTION("dead is terminal and reported once") {
        handle.mark_ready("s-1");
        CHECK(handle.mark_dead());
        CHECK(handle.is_dead());
        CHECK_FALSE(handle.mark_dead());
        CHECK_FALSE(handle.mark_busy());
        handle.mark_idle();
        CHECK(handle.state() == SessionState::Dead);
    }
}

TEST_CASE("SessionHandle page budget", "[pool][handle]") {
    SessionHandle handle(0, std::nullopt);
    handle.mark_ready("s-1");

    CHECK_FALSE(handle.budget_reached(2));
    handle.record_page();
    CHECK_FALSE(handle.budget_reached(2));
    handle.record_page();
    CHECK(handle.budget_reached(2));
    CHECK(handle.pages_served() == 2);
}

TEST_CASE("SessionState names", "[pool][handle]") {
    CHECK(to_string(SessionState::Starting) == "starting");
    CHECK(to_string(SessionState::Ready) == "ready");
    CHECK(to_string(SessionState::Busy) == "busy");
    CHECK(to_string(SessionState::Dead) == "dead");
}
