#include <keyco/client/wire.h>

#include <chjson/chjson.hpp>

namespace keyco::client::wire {
namespace {

bool IsSpace(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

std::string StringField(const chjson::sv_value& obj, std::string_view key) {
    const auto* v = obj.find(key);
    if (v == nullptr || !v->is_string()) {
        return {};
    }
    return std::string(v->as_string_view());
}

} // namespace

std::string_view Trim(std::string_view s) {
    while (!s.empty() && IsSpace(s.front())) {
        s.remove_prefix(1);
    }
    while (!s.empty() && IsSpace(s.back())) {
        s.remove_suffix(1);
    }
    return s;
}

std::string EncodeRewrite(const RewriteParams& params, std::string_view default_locale) {
    std::string locale = params.locale.empty() ? std::string(default_locale) : params.locale;

    if (params.preset_id) {
        chjson::value j(chjson::value::object{
            {"text", chjson::value(params.text)},
            {"tone", chjson::value(static_cast<double>(params.tone))},
            {"length", chjson::value(static_cast<double>(params.length))},
            {"locale", chjson::value(locale)},
            {"preset", chjson::value(*params.preset_id)},
        });
        return chjson::dump(j);
    }

    chjson::value j(chjson::value::object{
        {"text", chjson::value(params.text)},
        {"tone", chjson::value(static_cast<double>(params.tone))},
        {"length", chjson::value(static_cast<double>(params.length))},
        {"locale", chjson::value(locale)},
    });
    return chjson::dump(j);
}

std::string EncodeChat(const ChatParams& params) {
    chjson::value j(chjson::value::object{
        {"query", chjson::value(params.query)},
    });
    return chjson::dump(j);
}

ApiResult DecodeCompletion(int status, std::string_view body) {
    if (Trim(body).empty()) {
        return ApiError::NoData();
    }

    std::string text(body);
    auto r = chjson::parse(text);
    if (r.err) {
        return ApiError::InvalidResponse("response is not valid json");
    }
    const auto& root = r.doc.root();
    if (!root.is_object()) {
        return ApiError::InvalidResponse("response is not a json object");
    }

    // Some deployments answer 200 with an application error. Any string
    // counts, even an empty one.
    if (const auto* error = root.find("error"); error != nullptr && error->is_string()) {
        auto details = StringField(root, "details");
        return ApiError::Http(status, details.empty() ? std::string(error->as_string_view()) : details);
    }

    const auto* field = root.find("text");
    if (field == nullptr || !field->is_string()) {
        return ApiError::InvalidResponse("response has no text field");
    }
    return Completion{std::string(Trim(field->as_string_view()))};
}

std::string ExtractErrorMessage(std::string_view body) {
    if (Trim(body).empty()) {
        return {};
    }
    std::string text(body);
    auto r = chjson::parse(text);
    if (r.err || !r.doc.root().is_object()) {
        return {};
    }
    auto error = StringField(r.doc.root(), "error");
    if (!error.empty()) {
        return error;
    }
    return StringField(r.doc.root(), "details");
}

} // namespace keyco::client::wire
