#include <gtest/gtest.h>

#include <sstream>
#include <thread>
#include <unordered_set>

#include "token_type.hpp"

using namespace hilex;

// Interning
TEST(TokenTypeTest, SamePathIsSameType) {
    TokenType a = TokenType::intern("Name.Builtin");
    TokenType b = TokenType::root().child("Name").child("Builtin");
    EXPECT_EQ(a, b);
    EXPECT_EQ(a, tok::NameBuiltin);
    EXPECT_EQ(a.hash(), b.hash());
}

TEST(TokenTypeTest, ChildCreatesAncestorsOnDemand) {
    TokenType deep = TokenType::intern("Custom.Deep.Leaf");
    ASSERT_TRUE(deep.parent().has_value());
    EXPECT_EQ(deep.parent()->path(), "Custom.Deep");
    EXPECT_EQ(deep.depth(), 3u);
    EXPECT_EQ(deep.segments(), (std::vector<std::string>{"Custom", "Deep", "Leaf"}));
}

TEST(TokenTypeTest, RootHasNoParent) {
    TokenType root;
    EXPECT_TRUE(root.is_root());
    EXPECT_FALSE(root.parent().has_value());
    EXPECT_EQ(root.path(), "");
    EXPECT_EQ(root.to_string(), "Token");
    EXPECT_EQ(root, tok::Token);
}

TEST(TokenTypeTest, ToStringIncludesRootName) {
    EXPECT_EQ(tok::KeywordConstant.to_string(), "Token.Keyword.Constant");
    std::ostringstream os;
    os << tok::StringDouble;
    EXPECT_EQ(os.str(), "Token.Literal.String.Double");
}

TEST(TokenTypeTest, EmptySegmentsAreIgnored) {
    EXPECT_EQ(TokenType::intern("Keyword..Type"), tok::KeywordType);
    EXPECT_EQ(TokenType::from_segments({"Keyword", "", "Type"}), tok::KeywordType);
}

TEST(TokenTypeTest, ConcurrentInterningYieldsOneNode) {
    std::vector<TokenType> seen(8);
    std::vector<std::thread> threads;
    for (size_t i = 0; i < seen.size(); ++i) {
        threads.emplace_back([&seen, i] { seen[i] = TokenType::intern("Concurrent.Intern.Test"); });
    }
    for (auto& t : threads) t.join();
    for (const auto& t : seen) EXPECT_EQ(t, seen.front());
}

// Subtypes
TEST(TokenTypeTest, SubtypeIsReflexive) {
    EXPECT_TRUE(tok::Keyword.is_subtype_of(tok::Keyword));
    EXPECT_TRUE(tok::Token.is_subtype_of(tok::Token));
}

TEST(TokenTypeTest, EverythingIsSubtypeOfRoot) {
    EXPECT_TRUE(tok::NameBuiltinPseudo.is_subtype_of(tok::Token));
    EXPECT_TRUE(tok::Error.is_subtype_of(tok::Token));
}

TEST(TokenTypeTest, SubtypeIsTransitive) {
    TokenType a = TokenType::intern("Keyword.Constant.Extra");
    EXPECT_TRUE(a.is_subtype_of(tok::KeywordConstant));
    EXPECT_TRUE(tok::KeywordConstant.is_subtype_of(tok::Keyword));
    EXPECT_TRUE(a.is_subtype_of(tok::Keyword));
    EXPECT_TRUE(is_token_subtype(a, tok::Keyword));
}

TEST(TokenTypeTest, SubtypeMatchesWholeSegmentsOnly) {
    TokenType names = TokenType::intern("Names");
    EXPECT_FALSE(names.is_subtype_of(tok::Name));
    EXPECT_FALSE(tok::Keyword.is_subtype_of(tok::KeywordConstant));
    EXPECT_FALSE(tok::NameFunction.is_subtype_of(tok::Keyword));
}

TEST(TokenTypeTest, TypesWorkAsHashKeys) {
    std::unordered_set<TokenType> set{tok::Keyword, TokenType::intern("Keyword"), tok::Name};
    EXPECT_EQ(set.size(), 2u);
}

// string_to_tokentype
TEST(TokenTypeTest, StringToTokenTypeAcceptsBothForms) {
    EXPECT_EQ(string_to_tokentype("Token.Keyword.Reserved"), tok::KeywordReserved);
    EXPECT_EQ(string_to_tokentype("Keyword.Reserved"), tok::KeywordReserved);
    EXPECT_EQ(string_to_tokentype("Token"), tok::Token);
    EXPECT_EQ(string_to_tokentype(""), tok::Token);
}

TEST(TokenTypeTest, StringAndNumberShortcuts) {
    EXPECT_EQ(string_to_tokentype("String.Double"), tok::StringDouble);
    EXPECT_EQ(string_to_tokentype("Number.Hex"), tok::NumberHex);
    EXPECT_EQ(string_to_tokentype("Literal.String"), tok::String);
}

// Short names
TEST(TokenTypeTest, StandardShortNames) {
    EXPECT_EQ(standard_short_name(tok::KeywordConstant), "kc");
    EXPECT_EQ(standard_short_name(tok::NameBuiltinPseudo), "bp");
    EXPECT_EQ(standard_short_name(tok::StringDouble), "s2");
    EXPECT_EQ(standard_short_name(tok::Token), "");
}

TEST(TokenTypeTest, NonStandardTypesExtendNearestAncestor) {
    EXPECT_EQ(standard_short_name(TokenType::intern("Keyword.Constant.Extra")), "kc-Extra");
    EXPECT_EQ(standard_short_name(TokenType::intern("Text.Extra")), "-Extra");
    EXPECT_EQ(standard_short_name(TokenType::intern("Shiny.New")), "-Shiny-New");
}

TEST(TokenTypeTest, StandardTableHasUniqueTypes) {
    std::unordered_set<TokenType> seen;
    for (const auto& entry : standard_types()) {
        EXPECT_TRUE(seen.insert(entry.first).second) << entry.first;
    }
    EXPECT_GE(seen.size(), 70u);
}

// Token
TEST(TokenTest, EndAndPrinting) {
    Token t(4, tok::Keyword, "if");
    EXPECT_EQ(t.end(), 6u);
    EXPECT_EQ(t.debug_string(), "4 Token.Keyword [if]");
    EXPECT_EQ(t, Token(4, tok::Keyword, "if"));
    EXPECT_NE(t, Token(4, tok::Name, "if"));
}
