#pragma once

#include <string>
#include <string_view>

#include <keyco/client/types.h>

// JSON wire contract with the text-generation backend.
//
//   POST /api/rewrite  {text, tone, length, locale, preset?} -> {text}
//   POST /api/chat     {query}                               -> {text}
//   GET  /api/health                                         -> 200
//
// Failures carry {error, details?}.
namespace keyco::client::wire {

inline constexpr std::string_view kRewritePath = "/api/rewrite";
inline constexpr std::string_view kChatPath = "/api/chat";
inline constexpr std::string_view kHealthPath = "/api/health";
inline constexpr std::string_view kJsonContentType = "application/json";

std::string EncodeRewrite(const RewriteParams& params, std::string_view default_locale);
std::string EncodeChat(const ChatParams& params);

// Decodes a 2xx body: {text} -> Completion (trimmed); {error, details?} ->
// http_error carrying `status`; empty -> no_data; anything else ->
// invalid_response.
ApiResult DecodeCompletion(int status, std::string_view body);

// `error`, else `details`, else empty. Never fails.
std::string ExtractErrorMessage(std::string_view body);

// Strips ASCII whitespace (space, \t, \n, \r, \f, \v) from both ends.
std::string_view Trim(std::string_view s);

} // namespace keyco::client::wire
