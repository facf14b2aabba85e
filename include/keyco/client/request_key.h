#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

#include <keyco/client/types.h>

namespace keyco::client {

inline constexpr std::size_t kRewriteKeyChars = 50;
inline constexpr std::size_t kChatKeyChars = 100;

// 64-bit FNV-1a. Stable across processes and platforms.
std::uint64_t Fnv1a64(std::string_view data);

// At most `max_chars` UTF-8 code points from the front of `s`.
std::string_view Utf8Prefix(std::string_view s, std::size_t max_chars);

// Dedup keys: 16 lowercase hex digits over the fields that make two requests
// "the same" from the user's point of view.
std::string RequestKey(const RewriteParams& params);
std::string RequestKey(const ChatParams& params);

} // namespace keyco::client
