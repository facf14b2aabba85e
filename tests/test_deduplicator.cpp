#include <chtest.hpp>

#include "fake_transport.h"

#include <keyco/client/request_key.h>
#include <keyco/resilience/deduplicator.h>

using keyco::resilience::DeduplicatorOptions;
using keyco::resilience::RequestDeduplicator;
using keyco::testing::ManualClock;

using namespace std::chrono_literals;

TEST_CASE("RequestDeduplicator suppresses a repeat inside the window") {
    ManualClock clock;
    RequestDeduplicator dedup(DeduplicatorOptions{}, clock.AsClock());

    REQUIRE(!dedup.IsDuplicate("k"));
    clock.Advance(2s);
    REQUIRE(dedup.IsDuplicate("k"));
    REQUIRE(!dedup.IsDuplicate("other"));
}

TEST_CASE("RequestDeduplicator lets a repeat through after the window") {
    ManualClock clock;
    RequestDeduplicator dedup(DeduplicatorOptions{}, clock.AsClock());

    REQUIRE(!dedup.IsDuplicate("k"));
    clock.Advance(6s);
    REQUIRE(!dedup.IsDuplicate("k"));
    clock.Advance(1s);
    REQUIRE(dedup.IsDuplicate("k"));
}

TEST_CASE("RequestDeduplicator purges records past retention") {
    ManualClock clock;
    RequestDeduplicator dedup(DeduplicatorOptions{}, clock.AsClock());

    REQUIRE(!dedup.IsDuplicate("a"));
    REQUIRE(!dedup.IsDuplicate("b"));
    REQUIRE(dedup.size() == 2);

    clock.Advance(5min);
    REQUIRE(!dedup.IsDuplicate("c"));
    REQUIRE(dedup.size() == 1);
}

TEST_CASE("RequestDeduplicator forget allows an immediate repeat") {
    ManualClock clock;
    RequestDeduplicator dedup(DeduplicatorOptions{}, clock.AsClock());

    REQUIRE(!dedup.IsDuplicate("k"));
    dedup.Forget("k");
    REQUIRE(!dedup.IsDuplicate("k"));
}

TEST_CASE("RequestKey depends only on the leading text, tone and length") {
    keyco::client::RewriteParams a;
    a.text = std::string(50, 'x') + " tail one";
    keyco::client::RewriteParams b = a;
    b.text = std::string(50, 'x') + " tail two";
    b.preset_id = "formal";
    REQUIRE(keyco::client::RequestKey(a) == keyco::client::RequestKey(b));

    b.tone = 0.9f;
    REQUIRE(keyco::client::RequestKey(a) != keyco::client::RequestKey(b));

    auto key = keyco::client::RequestKey(a);
    REQUIRE(key.size() == 16);
    REQUIRE(key.find_first_not_of("0123456789abcdef") == std::string::npos);
}

TEST_CASE("RequestKey counts code points, not bytes") {
    // "é" is two bytes in UTF-8.
    std::string accented;
    for (int i = 0; i < 60; ++i) {
        accented += "\xC3\xA9";
    }
    auto prefix = keyco::client::Utf8Prefix(accented, 50);
    REQUIRE(prefix.size() == 100);

    keyco::client::ChatParams a;
    a.query = std::string(100, 'q') + "A";
    keyco::client::ChatParams b;
    b.query = std::string(100, 'q') + "B";
    REQUIRE(keyco::client::RequestKey(a) == keyco::client::RequestKey(b));
}

TEST_CASE("Fnv1a64 matches the reference vectors") {
    REQUIRE(keyco::client::Fnv1a64("") == 0xcbf29ce484222325ULL);
    REQUIRE(keyco::client::Fnv1a64("a") == 0xaf63dc4c8601ec8cULL);
}
