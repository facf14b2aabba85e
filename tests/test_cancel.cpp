#include <chtest.hpp>

#include <keyco/core/cancel.h>

#include <atomic>
#include <thread>

using keyco::CancelSource;
using keyco::CancelToken;

TEST_CASE("CancelToken default is never cancelled") {
    CancelToken t;
    REQUIRE(!t.cancelled());

    bool called = false;
    auto reg = t.OnCancel([&] { called = true; });
    REQUIRE(!called);
}

TEST_CASE("CancelSource runs callbacks once") {
    CancelSource src;
    auto token = src.token();
    int calls = 0;
    auto reg = token.OnCancel([&] { ++calls; });

    REQUIRE(src.Cancel());
    REQUIRE(!src.Cancel());
    REQUIRE(token.cancelled());
    REQUIRE(calls == 1);
}

TEST_CASE("CancelToken runs the callback at once when already cancelled") {
    CancelSource src;
    src.Cancel();

    bool called = false;
    auto reg = src.token().OnCancel([&] { called = true; });
    REQUIRE(called);
}

TEST_CASE("CancelRegistration unregisters on reset and destruction") {
    CancelSource src;
    int calls = 0;
    {
        auto reg = src.token().OnCancel([&] { ++calls; });
    }
    auto reg = src.token().OnCancel([&] { ++calls; });
    reg.Reset();

    src.Cancel();
    REQUIRE(calls == 0);
}

TEST_CASE("CancelSource cancels across threads") {
    CancelSource src;
    std::atomic<bool> seen{false};
    auto reg = src.token().OnCancel([&] { seen = true; });

    std::thread t([&] { src.Cancel(); });
    t.join();
    REQUIRE(seen.load());
}
