#include "restcore/core/path_pattern.h"

#include <gtest/gtest.h>

#include <string>
#include <vector>

using namespace restcore::core;

namespace {

const char* kTemplate = "/a/{mo-ck1}/bbb/{m-o-ck2}/a-b-c1/{mock3}";

}  // namespace

TEST(PathPatternTest, RootIsValid) {
    EXPECT_TRUE(is_valid_path("/"));
}

TEST(PathPatternTest, EmptyIsInvalid) {
    EXPECT_FALSE(is_valid_path(""));
}

TEST(PathPatternTest, EmptyBracesAreInvalid) {
    EXPECT_FALSE(is_valid_path("/{}"));
}

TEST(PathPatternTest, MixedTemplateIsValid) {
    EXPECT_TRUE(is_valid_path(kTemplate));
    EXPECT_TRUE(is_valid_path("/path1"));
    EXPECT_TRUE(is_valid_path("/path1/pa-th-2/3"));
    EXPECT_TRUE(is_valid_path("/path1/{pa-th-2}/3"));
}

TEST(PathPatternTest, GrammarViolationsAreInvalid) {
    EXPECT_FALSE(is_valid_path("path"));
    EXPECT_FALSE(is_valid_path("/path/"));
    EXPECT_FALSE(is_valid_path("//path"));
    EXPECT_FALSE(is_valid_path("/Path"));
    EXPECT_FALSE(is_valid_path("/pa_th"));
    EXPECT_FALSE(is_valid_path("/-path"));
    EXPECT_FALSE(is_valid_path("/path-"));
    EXPECT_FALSE(is_valid_path("/pa--th"));
    EXPECT_FALSE(is_valid_path("/{path"));
    EXPECT_FALSE(is_valid_path("/{{path}}"));
    EXPECT_FALSE(is_valid_path("/{Path}"));
}

TEST(PathPatternTest, CompileRejectsInvalidTemplate) {
    EXPECT_FALSE(RoutePattern::compile("").has_value());
    EXPECT_FALSE(RoutePattern::compile("/{}").has_value());
}

TEST(PathPatternTest, VariablesInSegmentOrderWithoutBraces) {
    const auto pattern = RoutePattern::compile(kTemplate);
    ASSERT_TRUE(pattern.has_value());

    const std::vector<PathVariable> expected{{1, "mo-ck1"}, {3, "m-o-ck2"}, {5, "mock3"}};
    EXPECT_EQ(pattern->variables(), expected);
    EXPECT_EQ(pattern->path_template(), kTemplate);
}

TEST(PathPatternTest, LeadingVariableHasPositionZero) {
    const auto pattern = RoutePattern::compile("/{v0}/{v1}/path2/{v3}/path4");
    ASSERT_TRUE(pattern.has_value());

    const std::vector<PathVariable> expected{{0, "v0"}, {1, "v1"}, {3, "v3"}};
    EXPECT_EQ(pattern->variables(), expected);
}

TEST(PathPatternTest, LiteralTemplateHasNoVariables) {
    const auto pattern = RoutePattern::compile("/users/list");
    ASSERT_TRUE(pattern.has_value());
    EXPECT_TRUE(pattern->variables().empty());
}

TEST(PathPatternTest, MatchesWholePathOnly) {
    const auto pattern = RoutePattern::compile(kTemplate);
    ASSERT_TRUE(pattern.has_value());

    EXPECT_TRUE(pattern->matches("/a/111111/bbb/222222/a-b-c1/333333"));
    EXPECT_TRUE(pattern->matches("/a/Ab_c-1/bbb/x/a-b-c1/Z"));
    EXPECT_FALSE(pattern->matches("/a/111111/bbb/222222/a-b-c1"));
    EXPECT_FALSE(pattern->matches("/a/111111/bbb/222222/a-b-c1/333333/extra"));
    EXPECT_FALSE(pattern->matches("/prefix/a/111111/bbb/222222/a-b-c1/333333"));
    EXPECT_FALSE(pattern->matches("/a/111111/ccc/222222/a-b-c1/333333"));
}

TEST(PathPatternTest, VariableSegmentRejectsSeparatorAndSymbols) {
    const auto pattern = RoutePattern::compile("/users/{id}");
    ASSERT_TRUE(pattern.has_value());

    EXPECT_TRUE(pattern->matches("/users/42"));
    EXPECT_FALSE(pattern->matches("/users/"));
    EXPECT_FALSE(pattern->matches("/users/4/2"));
    EXPECT_FALSE(pattern->matches("/users/a.b"));
    EXPECT_FALSE(pattern->matches("/users/a%20b"));
}

TEST(PathPatternTest, RootMatchesOnlyRoot) {
    const auto pattern = RoutePattern::compile("/");
    ASSERT_TRUE(pattern.has_value());

    EXPECT_TRUE(pattern->matches("/"));
    EXPECT_FALSE(pattern->matches("/users"));
    EXPECT_FALSE(pattern->matches(""));
}

TEST(PathPatternTest, CompiledPatternIsCopyable) {
    const auto pattern = RoutePattern::compile("/users/{id}");
    ASSERT_TRUE(pattern.has_value());

    const RoutePattern copy = *pattern;
    EXPECT_TRUE(copy.matches("/users/7"));
    EXPECT_EQ(copy.variables(), pattern->variables());
}

TEST(PathPatternTest, VeryLongSegmentMatchesWithoutExhaustingStack) {
    const auto pattern = RoutePattern::compile("/a/{id}");
    ASSERT_TRUE(pattern.has_value());

    const std::string segment(200000, 'x');
    EXPECT_TRUE(pattern->matches("/a/" + segment));
    EXPECT_FALSE(pattern->matches("/a/" + segment + "/"));
    EXPECT_FALSE(pattern->matches("/a/" + segment + "."));
}
