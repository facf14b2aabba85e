#include <chtest.hpp>

#include <keyco/client/wire.h>
#include <keyco/config/config.h>

using keyco::client::ApiErrorKind;
using keyco::config::Config;
namespace wire = keyco::client::wire;

TEST_CASE("EncodeRewrite fills the default locale and omits a missing preset") {
    keyco::client::RewriteParams p;
    p.text = "make this nicer";
    p.tone = 1.0f;
    p.length = 0.0f;

    auto body = Config::Parse(wire::EncodeRewrite(p, "en-GB"));
    REQUIRE(body.ok());
    REQUIRE(body.value().GetString("text").value() == "make this nicer");
    REQUIRE(body.value().GetDouble("tone").value() == 1.0);
    REQUIRE(body.value().GetDouble("length").value() == 0.0);
    REQUIRE(body.value().GetString("locale").value() == "en-GB");
    REQUIRE(!body.value().Has("preset"));
}

TEST_CASE("EncodeRewrite carries the preset and an explicit locale") {
    keyco::client::RewriteParams p;
    p.text = "hi";
    p.preset_id = "email";
    p.locale = "en-US";

    auto body = Config::Parse(wire::EncodeRewrite(p, "en-GB"));
    REQUIRE(body.ok());
    REQUIRE(body.value().GetString("preset").value() == "email");
    REQUIRE(body.value().GetString("locale").value() == "en-US");
}

TEST_CASE("EncodeChat escapes the query") {
    keyco::client::ChatParams p;
    p.query = "say \"hi\"\nplease";

    auto body = Config::Parse(wire::EncodeChat(p));
    REQUIRE(body.ok());
    REQUIRE(body.value().GetString("query").value() == p.query);
}

TEST_CASE("DecodeCompletion trims the text") {
    auto r = wire::DecodeCompletion(200, R"({"text":"\n  Done.  "})");
    REQUIRE(r.ok());
    REQUIRE(r.value().text == "Done.");
}

TEST_CASE("DecodeCompletion classifies malformed bodies") {
    REQUIRE(wire::DecodeCompletion(200, "").error().kind() == ApiErrorKind::no_data);
    REQUIRE(wire::DecodeCompletion(200, "  \n").error().kind() == ApiErrorKind::no_data);
    REQUIRE(wire::DecodeCompletion(200, "not json").error().kind() == ApiErrorKind::invalid_response);
    REQUIRE(wire::DecodeCompletion(200, "[1,2]").error().kind() == ApiErrorKind::invalid_response);
    REQUIRE(wire::DecodeCompletion(200, R"({"txt":"x"})").error().kind() == ApiErrorKind::invalid_response);
    REQUIRE(wire::DecodeCompletion(200, R"({"text":42})").error().kind() == ApiErrorKind::invalid_response);
}

TEST_CASE("DecodeCompletion turns an error field into http_error") {
    auto r = wire::DecodeCompletion(200, R"({"error":"quota"})");
    REQUIRE(r.error().kind() == ApiErrorKind::http_error);
    REQUIRE(r.error().http_status() == 200);
    REQUIRE(r.error().detail() == "quota");
    REQUIRE(!r.error().ShouldRetry());

    auto d = wire::DecodeCompletion(200, R"({"error":"quota","details":"try tomorrow"})");
    REQUIRE(d.error().detail() == "try tomorrow");

    auto empty = wire::DecodeCompletion(200, R"({"error":"","text":"ignored"})");
    REQUIRE(empty.error().kind() == ApiErrorKind::http_error);
    REQUIRE(empty.error().detail().empty());

    auto not_string = wire::DecodeCompletion(200, R"({"error":null,"text":"fine"})");
    REQUIRE(not_string.ok());
    REQUIRE(not_string.value().text == "fine");
}

TEST_CASE("ExtractErrorMessage prefers error over details") {
    REQUIRE(wire::ExtractErrorMessage(R"({"error":"e","details":"d"})") == "e");
    REQUIRE(wire::ExtractErrorMessage(R"({"details":"d"})") == "d");
    REQUIRE(wire::ExtractErrorMessage("<html>502</html>").empty());
    REQUIRE(wire::ExtractErrorMessage("").empty());
}

TEST_CASE("Trim strips ascii whitespace only") {
    REQUIRE(wire::Trim(" \t\r\n x y \f\v") == "x y");
    REQUIRE(wire::Trim("   ").empty());
}
