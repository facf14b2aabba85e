#include <keyco/client/request_key.h>

#include <format>

namespace keyco::client {
namespace {

std::string ToHex(std::uint64_t v) {
    static const char* kHex = "0123456789abcdef";
    std::string out(16, '0');
    for (int i = 15; i >= 0; --i) {
        out[static_cast<std::size_t>(i)] = kHex[v & 0xF];
        v >>= 4;
    }
    return out;
}

} // namespace

std::uint64_t Fnv1a64(std::string_view data) {
    std::uint64_t h = 14695981039346656037ULL;
    for (unsigned char c : data) {
        h ^= c;
        h *= 1099511628211ULL;
    }
    return h;
}

std::string_view Utf8Prefix(std::string_view s, std::size_t max_chars) {
    std::size_t chars = 0;
    std::size_t i = 0;
    while (i < s.size()) {
        // continuation bytes are 10xxxxxx
        if ((static_cast<unsigned char>(s[i]) & 0xC0) != 0x80) {
            if (chars == max_chars) {
                break;
            }
            ++chars;
        }
        ++i;
    }
    return s.substr(0, i);
}

std::string RequestKey(const RewriteParams& params) {
    auto content = std::format("rewrite|{}|{}|{}", Utf8Prefix(params.text, kRewriteKeyChars), params.tone, params.length);
    return ToHex(Fnv1a64(content));
}

std::string RequestKey(const ChatParams& params) {
    auto content = std::format("chat|{}", Utf8Prefix(params.query, kChatKeyChars));
    return ToHex(Fnv1a64(content));
}

} // namespace keyco::client
