#pragma once

#include <string>

namespace keyco::http {

struct TlsOptions {
    bool verify_peer = true;
    // Empty: the OpenSSL default verify paths.
    std::string ca_file;
};

} // namespace keyco::http
