#include <keyco/http/url.h>

#include <algorithm>
#include <cctype>

namespace keyco::http {
namespace {

keyco::Status Invalid(std::string_view text, const char* why) {
    return keyco::Status(keyco::StatusCode::invalid_argument,
        "invalid url '" + std::string(text) + "': " + why);
}

bool IsDigits(std::string_view s) {
    return !s.empty() && std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isdigit(c) != 0; });
}

} // namespace

keyco::Result<Url> Url::Parse(std::string_view text) {
    auto sep = text.find("://");
    if (sep == std::string_view::npos) {
        return Invalid(text, "missing scheme");
    }

    Url u;
    u.scheme = std::string(text.substr(0, sep));
    std::transform(u.scheme.begin(), u.scheme.end(), u.scheme.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (u.scheme != "http" && u.scheme != "https") {
        return Invalid(text, "scheme must be http or https");
    }

    auto rest = text.substr(sep + 3);
    auto slash = rest.find_first_of("/?");
    auto authority = rest.substr(0, slash);
    u.target = slash == std::string_view::npos ? "/" : std::string(rest.substr(slash));
    if (u.target.front() == '?') {
        u.target.insert(u.target.begin(), '/');
    }

    if (authority.find('@') != std::string_view::npos) {
        return Invalid(text, "credentials in url are not supported");
    }

    if (!authority.empty() && authority.front() == '[') {
        return Invalid(text, "ipv6 literals are not supported");
    }

    auto colon = authority.rfind(':');
    if (colon != std::string_view::npos) {
        auto port = authority.substr(colon + 1);
        if (!IsDigits(port)) {
            return Invalid(text, "bad port");
        }
        u.port = std::string(port);
        authority = authority.substr(0, colon);
    } else {
        u.port = u.tls() ? "443" : "80";
    }

    if (authority.empty()) {
        return Invalid(text, "missing host");
    }
    u.host = std::string(authority);
    return u;
}

Url Url::WithPath(std::string_view path) const {
    Url out = *this;
    std::string base = target;
    auto q = base.find('?');
    if (q != std::string::npos) {
        base.resize(q);
    }
    while (!base.empty() && base.back() == '/') {
        base.pop_back();
    }
    if (path.empty() || path.front() != '/') {
        base.push_back('/');
    }
    base.append(path);
    out.target = std::move(base);
    return out;
}

std::string Url::ToString() const {
    std::string out = scheme + "://" + host;
    bool default_port = (tls() && port == "443") || (!tls() && port == "80");
    if (!default_port) {
        out += ":" + port;
    }
    out += target;
    return out;
}

} // namespace keyco::http
