#pragma once

#include <functional>
#include <optional>
#include <string>

#include <keyco/client/api_error.h>
#include <keyco/core/status.h>

namespace keyco::client {

enum class Operation {
    rewrite,
    chat,
};

const char* ToString(Operation op);

struct RewriteParams {
    std::string text;
    float tone = 0.5f;   // 0 casual .. 1 formal
    float length = 0.5f; // 0 detailed .. 1 brief
    std::optional<std::string> preset_id;
    // Empty: ClientOptions::locale.
    std::string locale;
};

struct ChatParams {
    std::string query;
};

struct Completion {
    std::string text;
};

using ApiResult = keyco::Result<Completion, ApiError>;

using ProgressCallback = std::function<void(const std::string& message)>;
using CompletionCallback = std::function<void(ApiResult result)>;

} // namespace keyco::client
