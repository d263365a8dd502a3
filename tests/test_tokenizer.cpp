/**
 * @file test_tokenizer.cpp
 * @brief Unit tests for path tokenizing (GoogleTest)
 *
 * Tests cover:
 * - Identifier and index segments in order
 * - Custom separators
 * - EmptyQueryError, EmptyIdentifier and ArrayAccessWithoutIndex
 * - join_path rendering
 */

#include <gtest/gtest.h>
#include "tomlpath/Tokenizer.hpp"
#include "tomlpath/Errors.hpp"

using namespace tomlpath;

// ============================================================================
// Successful tokenizing
// ============================================================================

TEST(TokenizeTest, SingleIdentifier) {
    TokenChain t = tokenize("a");
    ASSERT_EQ(t.size(), 1u);
    EXPECT_EQ(t[0], Token::identifier("a"));
}

TEST(TokenizeTest, IdentifiersInOrder) {
    TokenChain t = tokenize("server.http.port");
    ASSERT_EQ(t.size(), 3u);
    EXPECT_EQ(t[0].ident(), "server");
    EXPECT_EQ(t[1].ident(), "http");
    EXPECT_EQ(t[2].ident(), "port");
}

TEST(TokenizeTest, TrailingIndex) {
    TokenChain expected{
        Token::identifier("a"),
        Token::identifier("b"),
        Token::identifier("c"),
        Token::index(1000),
    };
    EXPECT_EQ(tokenize("a.b.c.[1000]"), expected);
}

TEST(TokenizeTest, IndexInTheMiddle) {
    TokenChain t = tokenize("a.[0].c");
    ASSERT_EQ(t.size(), 3u);
    EXPECT_TRUE(t[1].is_index());
    EXPECT_EQ(t[1].idx(), 0);
    EXPECT_TRUE(t[2].is_identifier());
}

TEST(TokenizeTest, NegativeIndexIsTokenized) {
    TokenChain t = tokenize("a.[-1]");
    ASSERT_EQ(t.size(), 2u);
    EXPECT_EQ(t[1], Token::index(-1));
}

TEST(TokenizeTest, CustomSeparator) {
    TokenChain t = tokenize("a/b.c/[2]", '/');
    ASSERT_EQ(t.size(), 3u);
    EXPECT_EQ(t[1].ident(), "b.c");
    EXPECT_EQ(t[2].idx(), 2);
}

TEST(TokenizeTest, OpenBracketOnlyIsIdentifier) {
    TokenChain t = tokenize("[abc");
    ASSERT_EQ(t.size(), 1u);
    EXPECT_TRUE(t[0].is_identifier());
    EXPECT_EQ(t[0].ident(), "[abc");
}

// ============================================================================
// Tokenizer errors
// ============================================================================

TEST(TokenizeErrorTest, EmptyPath) {
    EXPECT_THROW(tokenize(""), EmptyQueryError);
}

TEST(TokenizeErrorTest, BareSeparator) {
    EXPECT_THROW(tokenize("."), EmptyIdentifier);
    EXPECT_THROW(tokenize("/", '/'), EmptyIdentifier);
}

TEST(TokenizeErrorTest, LeadingTrailingAndDoubledSeparators) {
    EXPECT_THROW(tokenize(".a"), EmptyIdentifier);
    EXPECT_THROW(tokenize("a."), EmptyIdentifier);
    EXPECT_THROW(tokenize("a..b"), EmptyIdentifier);
}

TEST(TokenizeErrorTest, EmptyIdentifierKeepsPath) {
    try {
        tokenize("a..b");
        FAIL() << "Expected EmptyIdentifier";
    } catch (const EmptyIdentifier& e) {
        EXPECT_EQ(e.path(), "a..b");
    }
}

TEST(TokenizeErrorTest, BracketsWithoutInteger) {
    EXPECT_THROW(tokenize("[]"), ArrayAccessWithoutIndex);
    EXPECT_THROW(tokenize("[a]"), ArrayAccessWithoutIndex);
    EXPECT_THROW(tokenize("a.[1.5]"), ArrayAccessWithoutIndex);
    EXPECT_THROW(tokenize("a.[99999999999999999999]"), ArrayAccessWithoutIndex);
}

TEST(TokenizeErrorTest, ErrorsShareBase) {
    EXPECT_THROW(tokenize(""), TokenizeError);
    EXPECT_THROW(tokenize("[x]"), PathError);
}

// ============================================================================
// join_path
// ============================================================================

TEST(JoinPathTest, RendersIndicesInBrackets) {
    TokenChain t{Token::identifier("a"), Token::index(3), Token::identifier("b")};
    EXPECT_EQ(join_path(t), "a.[3].b");
    EXPECT_EQ(join_path(t, '/'), "a/[3]/b");
}

TEST(JoinPathTest, PrefixRange) {
    TokenChain t = tokenize("a.b.c");
    EXPECT_EQ(join_path(t.begin(), t.begin() + 2, '.'), "a.b");
    EXPECT_EQ(join_path(t.begin(), t.begin(), '.'), "");
}

TEST(JoinPathTest, TokenizeInvertsJoin) {
    TokenChain t = tokenize("x.[0].y.[12]");
    EXPECT_EQ(tokenize(join_path(t)), t);
}
