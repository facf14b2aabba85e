#include <keyco/client/credential_store.h>

#include <cstdlib>

namespace keyco::client {

std::optional<std::string> EnvCredentialStore::Get() const {
    if (variable_.empty()) {
        return std::nullopt;
    }
    const char* v = std::getenv(variable_.c_str());
    if (v == nullptr || *v == '\0') {
        return std::nullopt;
    }
    return std::string(v);
}

} // namespace keyco::client
