#pragma once

#include <string>
#include <string_view>

#include <keyco/core/status.h>

#include <chjson/chjson.hpp>

namespace keyco::config {

// Read-only view over a JSON configuration document. Keys may be dotted
// ("retry.max_retries") to reach into nested objects.
class Config {
public:
    static keyco::Result<Config> LoadFile(const std::string& path);
    static keyco::Result<Config> Parse(const std::string& text);

    bool Has(std::string_view key) const;

    keyco::Result<std::string> GetString(std::string_view key) const;
    keyco::Result<int> GetInt(std::string_view key) const;
    keyco::Result<double> GetDouble(std::string_view key) const;
    keyco::Result<bool> GetBool(std::string_view key) const;

    const chjson::sv_value& raw() const { return doc_.root(); }

private:
    const chjson::sv_value* Find(std::string_view key) const;

    chjson::document doc_;
};

} // namespace keyco::config
