#include <chtest.hpp>

#include <keyco/client/client_options.h>
#include <keyco/config/config.h>

#include <chrono>
#include <string>

using keyco::client::ClientOptions;
using keyco::client::LoadClientOptions;
using keyco::config::Config;

TEST_CASE("Config reads dotted keys") {
    auto cfg = Config::Parse(R"({"retry":{"max_retries":5,"jitter_ratio":0.25},"log_level":"debug","tls":{"verify_peer":false}})");
    REQUIRE(cfg.ok());

    const auto& c = cfg.value();
    REQUIRE(c.Has("retry.max_retries"));
    REQUIRE(!c.Has("retry.base_delay_ms"));
    REQUIRE(!c.Has("log_level.nested"));
    REQUIRE(c.GetInt("retry.max_retries").value() == 5);
    REQUIRE(c.GetDouble("retry.jitter_ratio").value() == 0.25);
    REQUIRE(c.GetDouble("retry.max_retries").value() == 5.0);
    REQUIRE(c.GetString("log_level").value() == "debug");
    REQUIRE(!c.GetBool("tls.verify_peer").value());

    REQUIRE(c.GetString("missing").status().code() == keyco::StatusCode::not_found);
    REQUIRE(c.GetInt("log_level").status().code() == keyco::StatusCode::invalid_argument);
}

TEST_CASE("Config rejects malformed documents") {
    auto bad = Config::Parse("{\"a\": }");
    REQUIRE(!bad.ok());
    REQUIRE(bad.status().message().find("line") != std::string::npos);

    REQUIRE(!Config::Parse("[1,2,3]").ok());
    REQUIRE(Config::LoadFile("/nonexistent/keyco.json").status().code() == keyco::StatusCode::not_found);
}

TEST_CASE("LoadClientOptions keeps defaults for missing keys") {
    auto cfg = Config::Parse("{}");
    REQUIRE(cfg.ok());
    auto opts = LoadClientOptions(cfg.value());
    REQUIRE(opts.ok());

    const auto& o = opts.value();
    REQUIRE(o.base_url == "https://keyco-backend.vercel.app");
    REQUIRE(o.request_timeout == std::chrono::milliseconds(15000));
    REQUIRE(o.locale == "en-GB");
    REQUIRE(o.preflight.connectivity_check);
    REQUIRE(o.preflight.connectivity_timeout == std::chrono::milliseconds(3000));
    REQUIRE(o.preflight.health_timeout == std::chrono::milliseconds(2000));
    REQUIRE(o.breaker.failure_threshold == 3);
    REQUIRE(o.breaker.cooldown == std::chrono::milliseconds(8000));
    REQUIRE(o.breaker.half_open_timeout == std::chrono::milliseconds(5000));
    REQUIRE(o.retry.max_retries == 3);
    REQUIRE(o.retry.base_delay == std::chrono::milliseconds(1000));
    REQUIRE(o.retry.jitter_ratio == 0.3);
    REQUIRE(o.retry.min_delay == std::chrono::milliseconds(100));
    REQUIRE(o.dedup.window == std::chrono::milliseconds(5000));
    REQUIRE(o.dedup.retention == std::chrono::milliseconds(300000));
    REQUIRE(o.failsafe_timeout == std::chrono::milliseconds(90000));
    REQUIRE(o.failsafe_timeout > keyco::client::WorstCaseLatency(o));
    REQUIRE(o.tls.verify_peer);
    REQUIRE(o.credential_env == "KEYCO_API_KEY");
}

TEST_CASE("LoadClientOptions overlays configured values") {
    auto cfg = Config::Parse(R"({
        "backend": {"base_url": "http://localhost:3000", "request_timeout_ms": 9000},
        "preflight": {"connectivity_check": false},
        "breaker": {"failure_threshold": 5, "cooldown_ms": 30000, "half_open_timeout_ms": 10000},
        "retry": {"max_retries": 1, "jitter_ratio": 0},
        "credential_env": "MY_KEY"
    })");
    REQUIRE(cfg.ok());
    auto opts = LoadClientOptions(cfg.value());
    REQUIRE(opts.ok());

    const auto& o = opts.value();
    REQUIRE(o.base_url == "http://localhost:3000");
    REQUIRE(o.request_timeout == std::chrono::milliseconds(9000));
    REQUIRE(!o.preflight.connectivity_check);
    REQUIRE(o.breaker.failure_threshold == 5);
    REQUIRE(o.breaker.cooldown == std::chrono::milliseconds(30000));
    REQUIRE(o.breaker.half_open_timeout == std::chrono::milliseconds(10000));
    REQUIRE(o.retry.max_retries == 1);
    REQUIRE(o.retry.jitter_ratio == 0.0);
    REQUIRE(o.credential_env == "MY_KEY");
}

TEST_CASE("LoadClientOptions rejects wrong types and ranges") {
    auto wrong_type = Config::Parse(R"({"retry":{"max_retries":"three"}})");
    REQUIRE(LoadClientOptions(wrong_type.value()).status().code() == keyco::StatusCode::invalid_argument);

    auto zero_threshold = Config::Parse(R"({"breaker":{"failure_threshold":0}})");
    REQUIRE(!LoadClientOptions(zero_threshold.value()).ok());

    auto jitter = Config::Parse(R"({"retry":{"jitter_ratio":1.5}})");
    REQUIRE(!LoadClientOptions(jitter.value()).ok());

    auto url = Config::Parse(R"({"backend":{"base_url":"keyco-backend"}})");
    REQUIRE(!LoadClientOptions(url.value()).ok());

    auto windows = Config::Parse(R"({"dedup":{"window_ms":10000,"retention_ms":1000}})");
    REQUIRE(!LoadClientOptions(windows.value()).ok());
}

TEST_CASE("WorstCaseLatency adds every attempt, the checks and full-jitter backoff") {
    ClientOptions o;
    // 3000 + 4 * (2000 + 15000) + 1300 + 2600 + 5200
    REQUIRE(keyco::client::WorstCaseLatency(o) == std::chrono::milliseconds(80100));

    o.preflight.connectivity_check = false;
    o.retry.max_retries = 0;
    REQUIRE(keyco::client::WorstCaseLatency(o) == std::chrono::milliseconds(17000));
}

TEST_CASE("LoadClientOptions rejects a fail-safe shorter than the retry ladder") {
    auto old_default = Config::Parse(R"({"failsafe_timeout_ms": 60000})");
    auto r = LoadClientOptions(old_default.value());
    REQUIRE(r.status().code() == keyco::StatusCode::invalid_argument);
    REQUIRE(r.status().message().find("80100ms") != std::string::npos);

    auto slow_backend = Config::Parse(R"({"backend": {"request_timeout_ms": 30000}})");
    REQUIRE(!LoadClientOptions(slow_backend.value()).ok());

    auto fewer_retries = Config::Parse(R"({"failsafe_timeout_ms": 60000, "retry": {"max_retries": 1}})");
    REQUIRE(LoadClientOptions(fewer_retries.value()).ok());
}
