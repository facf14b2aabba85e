#pragma once

#include <optional>
#include <string>

namespace keyco::client {

// Source of the bearer credential attached to backend calls. The secret is
// opaque to the client and is never logged.
class ICredentialStore {
public:
    virtual ~ICredentialStore() = default;

    // Thread-safe. nullopt: send the request without Authorization.
    virtual std::optional<std::string> Get() const = 0;
};

class StaticCredentialStore final : public ICredentialStore {
public:
    explicit StaticCredentialStore(std::optional<std::string> secret) : secret_(std::move(secret)) {}

    std::optional<std::string> Get() const override { return secret_; }

private:
    std::optional<std::string> secret_;
};

// Reads the variable on every Get() so a rotated secret is picked up.
class EnvCredentialStore final : public ICredentialStore {
public:
    explicit EnvCredentialStore(std::string variable) : variable_(std::move(variable)) {}

    std::optional<std::string> Get() const override;

    const std::string& variable() const { return variable_; }

private:
    std::string variable_;
};

} // namespace keyco::client
