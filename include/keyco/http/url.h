#pragma once

#include <string>
#include <string_view>

#include <keyco/core/status.h>

namespace keyco::http {

struct Url {
    std::string scheme; // "http" or "https"
    std::string host;
    std::string port;   // always set; defaults to 80 / 443
    std::string target; // path (+ query), starts with '/'

    bool tls() const { return scheme == "https"; }

    // Replaces the target with base path + path. A trailing '/' on the base
    // path is not duplicated.
    Url WithPath(std::string_view path) const;

    std::string ToString() const;

    static keyco::Result<Url> Parse(std::string_view text);
};

} // namespace keyco::http
