#include <keyco/config/config.h>

#include <fstream>
#include <sstream>

namespace keyco::config {

namespace {

const char* ErrorCodeToString(chjson::error_code code) {
    switch (code) {
        case chjson::error_code::ok: return "ok";
        case chjson::error_code::unexpected_eof: return "unexpected_eof";
        case chjson::error_code::invalid_value: return "invalid_value";
        case chjson::error_code::invalid_number: return "invalid_number";
        case chjson::error_code::invalid_string: return "invalid_string";
        case chjson::error_code::invalid_escape: return "invalid_escape";
        case chjson::error_code::invalid_unicode_escape: return "invalid_unicode_escape";
        case chjson::error_code::invalid_utf16_surrogate: return "invalid_utf16_surrogate";
        case chjson::error_code::expected_colon: return "expected_colon";
        case chjson::error_code::expected_comma_or_end: return "expected_comma_or_end";
        case chjson::error_code::expected_key_string: return "expected_key_string";
        case chjson::error_code::trailing_characters: return "trailing_characters";
        case chjson::error_code::nesting_too_deep: return "nesting_too_deep";
        case chjson::error_code::out_of_memory: return "out_of_memory";
    }
    return "unknown";
}

keyco::Status MissingKey(std::string_view key) {
    return keyco::Status(keyco::StatusCode::not_found, "missing key: " + std::string(key));
}

keyco::Status WrongType(std::string_view key, const char* expected) {
    return keyco::Status(keyco::StatusCode::invalid_argument,
        "config key " + std::string(key) + " is not " + expected);
}

} // namespace

keyco::Result<Config> Config::LoadFile(const std::string& path) {
    std::ifstream ifs(path);
    if (!ifs.is_open()) {
        return keyco::Status(keyco::StatusCode::not_found, "config file not found: " + path);
    }

    std::ostringstream ss;
    ss << ifs.rdbuf();
    return Parse(ss.str());
}

keyco::Result<Config> Config::Parse(const std::string& text) {
    auto r = chjson::parse(text);
    if (r.err) {
        std::ostringstream oss;
        oss << "invalid json: " << ErrorCodeToString(r.err.code)
            << " at line " << r.err.line << ", col " << r.err.column;
        return keyco::Status(keyco::StatusCode::invalid_argument, oss.str());
    }

    if (!r.doc.root().is_object()) {
        return keyco::Status(keyco::StatusCode::invalid_argument, "config root must be a JSON object");
    }

    Config c;
    c.doc_ = std::move(r.doc);
    return c;
}

const chjson::sv_value* Config::Find(std::string_view key) const {
    const chjson::sv_value* cur = &doc_.root();
    while (cur != nullptr) {
        auto dot = key.find('.');
        if (dot == std::string_view::npos) {
            return cur->find(key);
        }
        const auto* next = cur->find(key.substr(0, dot));
        if (next == nullptr || !next->is_object()) {
            return nullptr;
        }
        cur = next;
        key.remove_prefix(dot + 1);
    }
    return nullptr;
}

bool Config::Has(std::string_view key) const {
    return Find(key) != nullptr;
}

keyco::Result<std::string> Config::GetString(std::string_view key) const {
    const auto* v = Find(key);
    if (v == nullptr) {
        return MissingKey(key);
    }
    if (!v->is_string()) {
        return WrongType(key, "a string");
    }
    return std::string(v->as_string_view());
}

keyco::Result<int> Config::GetInt(std::string_view key) const {
    const auto* v = Find(key);
    if (v == nullptr) {
        return MissingKey(key);
    }
    if (!v->is_number() || !v->is_int()) {
        return WrongType(key, "an int");
    }
    return static_cast<int>(v->as_int());
}

keyco::Result<double> Config::GetDouble(std::string_view key) const {
    const auto* v = Find(key);
    if (v == nullptr) {
        return MissingKey(key);
    }
    if (!v->is_number()) {
        return WrongType(key, "a number");
    }
    if (v->is_int()) {
        return static_cast<double>(v->as_int());
    }
    return v->as_double();
}

keyco::Result<bool> Config::GetBool(std::string_view key) const {
    const auto* v = Find(key);
    if (v == nullptr) {
        return MissingKey(key);
    }
    if (!v->is_bool()) {
        return WrongType(key, "a bool");
    }
    return v->as_bool();
}

} // namespace keyco::config
