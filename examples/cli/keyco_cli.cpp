#include <keyco/client/api_client.h>
#include <keyco/client/client_options.h>
#include <keyco/client/credential_store.h>
#include <keyco/config/config.h>
#include <keyco/core/cancel.h>
#include <keyco/core/log.h>
#include <keyco/core/metrics.h>
#include <keyco/http/beast_transport.h>
#include <keyco/runtime/app.h>

#include <cstdlib>
#include <exception>
#include <future>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>

namespace {

void PrintUsage() {
    std::cerr << "usage: keyco_cli [--config file] [--log level] [--metrics] <command>\n"
                 "  rewrite --text T [--tone 0..1] [--length 0..1] [--preset id]\n"
                 "  chat --query Q\n"
                 "  health\n"
                 "  connectivity\n";
}

bool ParseUnit(const char* s, float& out) {
    char* end = nullptr;
    double v = std::strtod(s, &end);
    if (end == s || *end != '\0') {
        return false;
    }
    out = static_cast<float>(v);
    return true;
}

int PrintResult(const keyco::client::ApiResult& r) {
    if (r.ok()) {
        std::cout << r.value().text << "\n";
        return 0;
    }
    std::cerr << r.error().UserMessage() << "\n";
    keyco::log::debug("final error: {}", r.error().ToString());
    return 1;
}

} // namespace

int main(int argc, char** argv) {
    std::string config_path;
    std::optional<std::string> log_level;
    bool dump_metrics = false;
    std::string command;

    keyco::client::RewriteParams rewrite;
    keyco::client::ChatParams chat;

    for (int i = 1; i < argc; ++i) {
        std::string_view a(argv[i]);
        bool has_value = i + 1 < argc;
        if (a == "--config" && has_value) {
            config_path = argv[++i];
        } else if (a == "--log" && has_value) {
            log_level = argv[++i];
        } else if (a == "--metrics") {
            dump_metrics = true;
        } else if (a == "--text" && has_value) {
            rewrite.text = argv[++i];
        } else if (a == "--tone" && has_value) {
            if (!ParseUnit(argv[++i], rewrite.tone)) {
                std::cerr << "Invalid --tone, expected a number\n";
                return 2;
            }
        } else if (a == "--length" && has_value) {
            if (!ParseUnit(argv[++i], rewrite.length)) {
                std::cerr << "Invalid --length, expected a number\n";
                return 2;
            }
        } else if (a == "--preset" && has_value) {
            rewrite.preset_id = std::string(argv[++i]);
        } else if (a == "--query" && has_value) {
            chat.query = argv[++i];
        } else if (command.empty() && !a.starts_with("--")) {
            command = std::string(a);
        } else {
            std::cerr << "Unknown argument: " << a << "\n";
            PrintUsage();
            return 2;
        }
    }
    if (command != "rewrite" && command != "chat" && command != "health" && command != "connectivity") {
        PrintUsage();
        return 2;
    }

    keyco::client::ClientOptions opts;
    if (!config_path.empty()) {
        auto cfg = keyco::config::Config::LoadFile(config_path);
        if (!cfg.ok()) {
            std::cerr << "Config error: " << cfg.status().message() << "\n";
            return 2;
        }
        auto loaded = keyco::client::LoadClientOptions(cfg.value());
        if (!loaded.ok()) {
            std::cerr << "Config error: " << loaded.status().message() << "\n";
            return 2;
        }
        opts = std::move(loaded).value();
    }
    if (log_level) {
        opts.log_level = *log_level;
    }

    keyco::AppOptions app_opt;
    app_opt.log_level = opts.log_level;
    keyco::App app(app_opt);

    keyco::CancelSource cancel;
    app.OnInterrupt([&cancel] { cancel.Cancel(); });

    int rc = 1;
    try {
        keyco::http::BeastTransport transport(app.Io(), opts.tls);
        keyco::client::EnvCredentialStore credentials(opts.credential_env);
        keyco::MetricsRegistry metrics;

        app.Start();
        {
            keyco::client::ApiClient client(opts, transport, app.Delivery(), metrics, &credentials);

            if (command == "rewrite") {
                rc = PrintResult(client.RewriteAsync(rewrite, cancel.token()).get());
            } else if (command == "chat") {
                rc = PrintResult(client.ChatAsync(chat, cancel.token()).get());
            } else {
                std::promise<bool> probe;
                auto fut = probe.get_future();
                auto cb = [&probe](bool ok) { probe.set_value(ok); };
                if (command == "health") {
                    client.CheckBackendStatus(cb, cancel.token());
                } else {
                    client.CheckConnectivity(cb, cancel.token());
                }
                bool ok = fut.get();
                std::cout << command << ": " << (ok ? "ok" : "unavailable") << "\n";
                rc = ok ? 0 : 1;
            }

            // Handlers queued on the runtime refer to the client.
            app.Stop();
        }

        if (dump_metrics) {
            std::cerr << metrics.ToPrometheusText();
        }
    } catch (const std::exception& e) {
        keyco::log::error("keyco_cli: {}", e.what());
        return 1;
    }
    return rc;
}
