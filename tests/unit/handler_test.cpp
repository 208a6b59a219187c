#include "restcore/core/handler.h"

#include <gtest/gtest.h>

#include <any>
#include <string>

#include "restcore/core/http_request.h"
#include "restcore/core/http_response.h"
#include "test_types.hpp"

using namespace restcore::core;
using restcore::tests::Account;

namespace {

ResponsePtr ping(RequestContext&) {
    return no_content_response();
}

ResponsePtr echo_name(RequestContext&, Account& account) {
    return text_response(200, account.name);
}

}  // namespace

TEST(HandlerTest, ContextOnlyHandlerHasNoBody) {
    const auto handler = Handler::context_only(ping);
    EXPECT_FALSE(handler.has_body());
    EXPECT_FALSE(handler.empty());
}

TEST(HandlerTest, BodyHandlerHasBody) {
    const auto handler = Handler::with_body<Account>(echo_name);
    EXPECT_TRUE(handler.has_body());
    EXPECT_FALSE(handler.empty());
}

TEST(HandlerTest, NullFunctionPointersProduceEmptyHandlers) {
    ResponsePtr (*no_context)(RequestContext&) = nullptr;
    ResponsePtr (*no_body)(RequestContext&, Account&) = nullptr;

    EXPECT_TRUE(Handler::context_only(no_context).empty());
    EXPECT_TRUE(Handler::with_body<Account>(no_body).empty());
}

TEST(HandlerTest, BodyableMethodsRejectContextOnlyHandlers) {
    const auto handler = Handler::context_only(ping);
    for (auto method : {HttpMethod::Post, HttpMethod::Put, HttpMethod::Patch, HttpMethod::Delete}) {
        const auto error = validate_handler(method, handler);
        ASSERT_TRUE(error.has_value()) << to_string(method);
        EXPECT_EQ(error->code, ConfigErrc::invalid_handler);
        EXPECT_NE(error->message.find("must have 2 parameters"), std::string::npos);
    }
}

TEST(HandlerTest, GetRejectsBodyHandlers) {
    const auto error = validate_handler(HttpMethod::Get, Handler::with_body<Account>(echo_name));
    ASSERT_TRUE(error.has_value());
    EXPECT_EQ(error->code, ConfigErrc::invalid_handler);
    EXPECT_NE(error->message.find("'GET'"), std::string::npos);
}

TEST(HandlerTest, MatchingShapesAreAccepted) {
    EXPECT_FALSE(validate_handler(HttpMethod::Get, Handler::context_only(ping)).has_value());
    EXPECT_FALSE(validate_handler(HttpMethod::Post, Handler::with_body<Account>(echo_name)).has_value());
    EXPECT_FALSE(validate_handler(HttpMethod::Delete, Handler::with_body<Account>(echo_name)).has_value());
}

TEST(HandlerTest, EmptyHandlerIsRejected) {
    ResponsePtr (*no_context)(RequestContext&) = nullptr;
    const auto error = validate_handler(HttpMethod::Get, Handler::context_only(no_context));
    ASSERT_TRUE(error.has_value());
    EXPECT_EQ(error->code, ConfigErrc::null_handler);
    EXPECT_EQ(error->error_code().category().name(), std::string("restcore.config"));
}

TEST(HandlerTest, BodyHandlerDecodesFreshInstanceAndInvokes) {
    const auto handler = Handler::with_body<Account>([](RequestContext& context, Account& account) {
        context.response().set_header("X-Age", std::to_string(account.age));
        return text_response(201, account.name);
    });

    Tree tree;
    tree.put("name", "ada");
    tree.put("age", 36);

    std::any body = handler.body_handler().decode(tree);
    ASSERT_TRUE(body.has_value());
    EXPECT_EQ(std::any_cast<Account&>(body).name, "ada");

    HttpRequest request("POST", "/accounts");
    HttpResponse response;
    RequestContext context(response, request, {});
    auto envelope = handler.body_handler().invoke(context, body);
    ASSERT_NE(envelope, nullptr);
    EXPECT_EQ(response.header("X-Age"), "36");
}

TEST(HandlerTest, DecodePropagatesMappingFailure) {
    const auto handler = Handler::with_body<Account>(echo_name);
    Tree missing_fields;
    EXPECT_ANY_THROW(handler.body_handler().decode(missing_fields));
}
