#include "restcore/core/request_binder.h"

#include <gtest/gtest.h>

#include <any>
#include <memory>
#include <sstream>
#include <string>

#include "restcore/core/errors.h"
#include "restcore/core/http_request.h"
#include "test_types.hpp"

using namespace restcore::core;
using restcore::tests::Account;

namespace {

ResponsePtr echo_name(RequestContext&, Account& account) {
    return text_response(200, account.name);
}

HttpRequest post(std::string body, std::string content_type = {}) {
    HttpRequest request("POST", "/accounts");
    if (!content_type.empty()) {
        request.set_header("Content-Type", std::move(content_type));
    }
    request.set_body(std::move(body));
    return request;
}

}  // namespace

TEST(RequestBinderTest, ExtractsVariablesByPosition) {
    const auto pattern = RoutePattern::compile("/a/{mo-ck1}/bbb/{m-o-ck2}/a-b-c1/{mock3}");
    ASSERT_TRUE(pattern.has_value());

    const auto values = extract_path_variables(*pattern, "/a/111111/bbb/222222/a-b-c1/333333");

    const RequestContext::PathVariables expected{
        {"mo-ck1", "111111"}, {"m-o-ck2", "222222"}, {"mock3", "333333"}};
    EXPECT_EQ(values, expected);
}

TEST(RequestBinderTest, NoVariablesGiveEmptyMap) {
    const auto pattern = RoutePattern::compile("/accounts");
    ASSERT_TRUE(pattern.has_value());
    EXPECT_TRUE(extract_path_variables(*pattern, "/accounts").empty());
}

TEST(RequestBinderTest, JsonIsTheDefaultDecoder) {
    BodyCodecs codecs;
    auto request = post(R"({"name":"ada","age":36,"active":true,"balance":12.5})");

    const auto tree = read_body_tree(request, codecs);
    EXPECT_EQ(tree.get<std::string>("name"), "ada");
    EXPECT_EQ(tree.get<int>("age"), 36);
}

TEST(RequestBinderTest, UnknownContentTypeFallsBackToJson) {
    BodyCodecs codecs;
    auto request = post(R"({"name":"ada","age":36})", "text/csv");

    const auto body = bind_body(request, codecs, Handler::with_body<Account>(echo_name).body_handler());
    EXPECT_EQ(std::any_cast<const Account&>(body).age, 36);
}

TEST(RequestBinderTest, XmlContentTypeUsesXmlDecoder) {
    BodyCodecs codecs;
    auto request = post("<?xml version=\"1.0\"?><Account><name>ada</name><age>36</age>"
                        "<active>true</active><balance>12.5</balance></Account>",
                        "application/xml");

    const auto body = bind_body(request, codecs, Handler::with_body<Account>(echo_name).body_handler());
    const auto& account = std::any_cast<const Account&>(body);
    EXPECT_EQ(account, (Account{"ada", 36, true, 12.5}));
}

TEST(RequestBinderTest, ContentTypeMatchIsExact) {
    BodyCodecs codecs;
    auto request = post("<Account><name>ada</name><age>36</age></Account>", "application/xml; charset=utf-8");

    EXPECT_THROW(read_body_tree(request, codecs), BindError);
}

TEST(RequestBinderTest, MalformedPayloadIsABindError) {
    BodyCodecs codecs;
    auto request = post("{\"name\":");

    EXPECT_THROW(read_body_tree(request, codecs), BindError);
}

TEST(RequestBinderTest, EmptyPayloadIsABindError) {
    BodyCodecs codecs;
    auto request = post("");

    EXPECT_THROW(read_body_tree(request, codecs), BindError);
}

TEST(RequestBinderTest, MissingFieldIsABindError) {
    BodyCodecs codecs;
    auto request = post(R"({"name":"ada"})");

    try {
        bind_body(request, codecs, Handler::with_body<Account>(echo_name).body_handler());
        FAIL() << "expected BindError";
    } catch (const BindError& e) {
        EXPECT_NE(std::string(e.what()).find("age"), std::string::npos);
    }
}

TEST(RequestBinderTest, UnreadableStreamIsABindError) {
    BodyCodecs codecs;
    HttpRequest request("POST", "/accounts");
    auto stream = std::make_unique<std::istringstream>("{}");
    stream->setstate(std::ios::badbit);
    request.set_body_stream(std::move(stream));

    EXPECT_THROW(read_body_tree(request, codecs), BindError);
}

TEST(RequestBinderTest, CustomCodecIsSelectedByContentType) {
    BodyCodecs codecs;
    codecs.add("text/plain", [](std::istream& in) {
        Tree tree;
        std::string line;
        std::getline(in, line);
        tree.put("name", line);
        tree.put("age", 1);
        return tree;
    });

    auto request = post("grace", "text/plain");
    const auto body = bind_body(request, codecs, Handler::with_body<Account>(echo_name).body_handler());
    EXPECT_EQ(std::any_cast<const Account&>(body).name, "grace");
}
