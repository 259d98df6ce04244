#include <gtest/gtest.h>

#include "compiled_grammar.hpp"
#include "lexer_engine.hpp"

using namespace hilex;

static std::string joined(const std::vector<Token>& tokens) {
    std::string out;
    for (const auto& t : tokens) out += t.value;
    return out;
}

static void expectWellFormed(const std::vector<Token>& tokens, const std::string& text) {
    EXPECT_EQ(joined(tokens), text);
    size_t expected = 0;
    for (const auto& t : tokens) {
        EXPECT_EQ(t.offset, expected) << t;
        EXPECT_FALSE(t.value.empty()) << t;
        expected = t.end();
    }
    EXPECT_EQ(expected, text.size());
}

static std::shared_ptr<const CompiledGrammar> wordsAndComments() {
    Grammar g("basic");
    g.state("root")
        .rule("\\s+", tok::Whitespace)
        .rule("#.*", tok::Comment)
        .rule("\\w+", tok::Name);
    return compile(g);
}

static std::shared_ptr<const CompiledGrammar> quotedStrings() {
    Grammar g("quoted");
    g.state("root")
        .rule("\"", tok::StringDelimiter, "str")
        .rule("[^\"]+", tok::Text);
    g.state("str")
        .rule("[^\"\\\\]+", tok::String)
        .rule("\\\\.", tok::StringEscape)
        .rule("\"", tok::StringDelimiter, "#pop");
    return compile(g);
}

// Basic matching
TEST(LexerEngineTest, WhitespaceCommentAndName) {
    auto tokens = tokenize_all(wordsAndComments(), "a #b");
    std::vector<Token> expected{
        {0, tok::Name, "a"},
        {1, tok::Whitespace, " "},
        {2, tok::Comment, "#b"},
    };
    EXPECT_EQ(tokens, expected);
}

TEST(LexerEngineTest, SilentRulesSwitchStateWithoutEmitting) {
    Grammar g("silent");
    g.state("root").skip("\"", "str");
    g.state("str").rule("[^\"]+", tok::String).skip("\"", "#pop");

    TokenStream stream(compile(g), "\"ab\"");
    auto tokens = stream.drain();
    ASSERT_EQ(tokens.size(), 1u);
    EXPECT_EQ(tokens[0], Token(1, tok::String, "ab"));
    EXPECT_EQ(stream.state_stack(), (std::vector<std::string>{"root"}));
}

TEST(LexerEngineTest, PushAndPopAroundString) {
    TokenStream stream(quotedStrings(), "x \"a\\\"b\" y");
    auto tokens = stream.drain();
    std::vector<Token> expected{
        {0, tok::Text, "x "},
        {2, tok::StringDelimiter, "\""},
        {3, tok::String, "a"},
        {4, tok::StringEscape, "\\\""},
        {6, tok::String, "b"},
        {7, tok::StringDelimiter, "\""},
        {8, tok::Text, " y"},
    };
    EXPECT_EQ(tokens, expected);
    EXPECT_EQ(stream.state_stack(), (std::vector<std::string>{"root"}));
}

TEST(LexerEngineTest, UnterminatedStringLeavesStatePushed) {
    TokenStream stream(quotedStrings(), "\"abc");
    stream.drain();
    EXPECT_EQ(stream.state_stack(), (std::vector<std::string>{"root", "str"}));
}

// Error recovery
TEST(LexerEngineTest, UnmatchedCharacterBecomesErrorToken) {
    Grammar g("digits");
    g.state("root").rule("[0-9]+", tok::Number);
    auto tokens = tokenize_all(compile(g), "1x2");
    std::vector<Token> expected{
        {0, tok::Number, "1"},
        {1, tok::Error, "x"},
        {2, tok::Number, "2"},
    };
    EXPECT_EQ(tokens, expected);
}

TEST(LexerEngineTest, EachUnmatchedCharacterIsItsOwnErrorToken) {
    Grammar g("digits");
    g.state("root").rule("[0-9]+", tok::Number);
    auto tokens = tokenize_all(compile(g), "ab");
    ASSERT_EQ(tokens.size(), 2u);
    EXPECT_EQ(tokens[0], Token(0, tok::Error, "a"));
    EXPECT_EQ(tokens[1], Token(1, tok::Error, "b"));
}

TEST(LexerEngineTest, ErrorTokenCoversWholeUtf8Character) {
    Grammar g("digits");
    g.state("root").rule("[0-9]+", tok::Number);
    const std::string text = "1\xC3\xA9" "2";
    auto tokens = tokenize_all(compile(g), text);
    ASSERT_EQ(tokens.size(), 3u);
    EXPECT_EQ(tokens[1], Token(1, tok::Error, "\xC3\xA9"));
    EXPECT_EQ(tokens[2].offset, 3u);
    expectWellFormed(tokens, text);
}

TEST(LexerEngineTest, EmptyStateProducesOnlyErrors) {
    CompiledGrammar g("empty", {}, {CompiledState{"root", {}}});
    auto tokens = tokenize_all(std::make_shared<const CompiledGrammar>(g), "ok");
    ASSERT_EQ(tokens.size(), 2u);
    EXPECT_EQ(tokens[0].type, tok::Error);
}

TEST(LexerEngineTest, EmptyInputYieldsNothing) {
    TokenStream stream(wordsAndComments(), "");
    EXPECT_TRUE(stream.done());
    EXPECT_FALSE(stream.next().has_value());
}

// Includes
TEST(LexerEngineTest, IncludedRulesRunInPlace) {
    Grammar g("inc");
    g.state("common").rule("\\s+", tok::Whitespace);
    g.state("root").include("common").rule("\\w+", tok::Name);
    auto tokens = tokenize_all(compile(g), "ab cd");
    ASSERT_EQ(tokens.size(), 3u);
    EXPECT_EQ(tokens[1], Token(2, tok::Whitespace, " "));
}

// Stack floor
TEST(LexerEngineTest, PopBeyondRootIsNoOp) {
    Grammar g("pop");
    g.state("root").rule("x", tok::Text, {Pop{5}});
    TokenStream stream(compile(g), "x");
    auto tokens = stream.drain();
    ASSERT_EQ(tokens.size(), 1u);
    EXPECT_EQ(stream.state_stack(), (std::vector<std::string>{"root"}));
}

TEST(LexerEngineTest, StackNeverEmptiesUnderRepeatedPops) {
    Grammar g("pops");
    g.state("root").rule("\\(", tok::Punctuation, "inner").rule("\\)", tok::Punctuation, "#pop:3");
    g.state("inner").rule("\\(", tok::Punctuation, "#push").rule("\\)", tok::Punctuation, "#pop:2");

    TokenStream stream(compile(g), "(()))))");
    while (stream.next()) {
        EXPECT_FALSE(stream.state_stack().empty());
    }
    EXPECT_EQ(stream.state_stack(), (std::vector<std::string>{"root"}));
}

// Transitions
TEST(LexerEngineTest, PushSameNests) {
    Grammar g("nest");
    g.state("root").rule("\\{", tok::Punctuation, "block").rule("[^{}]+", tok::Text);
    g.state("block")
        .rule("\\{", tok::Punctuation, "#push")
        .rule("\\}", tok::Punctuation, "#pop")
        .rule("[^{}]+", tok::Name);

    TokenStream stream(compile(g), "{{a}");
    stream.drain();
    EXPECT_EQ(stream.state_stack(), (std::vector<std::string>{"root", "block"}));
}

TEST(LexerEngineTest, GotoReplacesTop) {
    Grammar g("goto");
    g.state("root").rule("<", tok::Punctuation, "tag").rule("[^<]+", tok::Text);
    g.state("tag").rule("\\w+", tok::NameTag, "#pop#push:attrs");
    g.state("attrs").rule(" ", tok::Whitespace).rule("\\w+", tok::NameAttribute).rule(">", tok::Punctuation, "#pop");

    TokenStream stream(compile(g), "<a href>x");
    std::vector<std::vector<std::string>> stacks;
    std::vector<Token> tokens;
    while (auto t = stream.next()) {
        tokens.push_back(*t);
        stacks.push_back(stream.state_stack());
    }
    ASSERT_EQ(tokens.size(), 6u);
    EXPECT_EQ(tokens[1], Token(1, tok::NameTag, "a"));
    EXPECT_EQ(stacks[1], (std::vector<std::string>{"root", "attrs"}));
    EXPECT_EQ(tokens[3], Token(3, tok::NameAttribute, "href"));
    EXPECT_EQ(stacks[5], (std::vector<std::string>{"root"}));
}

TEST(LexerEngineTest, TransitionsApplyInOrder) {
    Grammar g("order");
    g.state("root").rule("a", tok::Text, {Push{"one"}, Push{"two"}, Pop{1}});
    g.state("one").rule("b", tok::Text);
    g.state("two").rule("b", tok::Keyword);
    TokenStream stream(compile(g), "ab");
    auto tokens = stream.drain();
    ASSERT_EQ(tokens.size(), 2u);
    EXPECT_EQ(tokens[1].type, tok::Text);
    EXPECT_EQ(stream.state_stack(), (std::vector<std::string>{"root", "one"}));
}

TEST(LexerEngineTest, CombinedStateTriesMembersInOrder) {
    Grammar g("combo");
    g.state("root").rule("<", tok::Punctuation, {combined({"names", "numbers"})}).rule("\\s+", tok::Whitespace);
    g.state("names").rule("[a-z]+", tok::Name).rule(">", tok::Punctuation, "#pop");
    g.state("numbers").rule("[0-9]+", tok::Number).rule("[a-z0-9]+", tok::Keyword);

    TokenStream stream(compile(g), "<ab12> ");
    auto tokens = stream.drain();
    std::vector<Token> expected{
        {0, tok::Punctuation, "<"},
        {1, tok::Name, "ab"},
        {3, tok::Number, "12"},
        {5, tok::Punctuation, ">"},
        {6, tok::Whitespace, " "},
    };
    EXPECT_EQ(tokens, expected);
    EXPECT_EQ(stream.state_stack(), (std::vector<std::string>{"root"}));
}

// First-match-wins
TEST(LexerEngineTest, EarlierRuleWinsOverLongerMatch) {
    Grammar g("order");
    g.state("root").rule("if", tok::Keyword).rule("\\w+", tok::Name).rule(" ", tok::Whitespace);
    auto tokens = tokenize_all(compile(g), "iffy if");
    std::vector<Token> expected{
        {0, tok::Keyword, "if"},
        {2, tok::Name, "fy"},
        {4, tok::Whitespace, " "},
        {5, tok::Keyword, "if"},
    };
    EXPECT_EQ(tokens, expected);
}

TEST(LexerEngineTest, WordBoundaryAndLineStartSeePrecedingText) {
    Grammar g("context");
    g.state("root")
        .rule("^#.*", tok::CommentPreproc)
        .rule("\\bif\\b", tok::Keyword)
        .rule("#", tok::Punctuation)
        .rule("\\w", tok::Name)
        .rule("\\n", tok::Whitespace);

    auto tokens = tokenize_all(compile(g), "xif#y\n#z");
    std::vector<Token> expected{
        {0, tok::Name, "x"},
        {1, tok::Name, "i"},
        {2, tok::Name, "f"},
        {3, tok::Punctuation, "#"},
        {4, tok::Name, "y"},
        {5, tok::Whitespace, "\n"},
        {6, tok::CommentPreproc, "#z"},
    };
    EXPECT_EQ(tokens, expected);
}

// Groups
TEST(LexerEngineTest, EmitGroupsSkipsUncapturedGaps) {
    Grammar g("groups");
    g.state("root").rule("(def) (\\w+)", bygroups({tok::Keyword, tok::NameFunction}));
    auto tokens = tokenize_all(compile(g), "def foo");
    std::vector<Token> expected{
        {0, tok::Keyword, "def"},
        {4, tok::NameFunction, "foo"},
    };
    EXPECT_EQ(tokens, expected);
}

TEST(LexerEngineTest, EmitGroupsIgnoresUnmatchedAndEmptyGroups) {
    Grammar g("groups");
    g.state("root").rule("(a)(b)?(c*)", bygroups({tok::Name, tok::Keyword, tok::Number}));
    auto tokens = tokenize_all(compile(g), "a");
    ASSERT_EQ(tokens.size(), 1u);
    EXPECT_EQ(tokens[0], Token(0, tok::Name, "a"));
}

TEST(LexerEngineTest, EmitGroupsMonostateDropsGroup) {
    Grammar g("groups");
    g.state("root").rule("(\\w+)(=)(\\w+)", bygroups({tok::NameAttribute, std::monostate{}, tok::String}));
    auto tokens = tokenize_all(compile(g), "k=v");
    ASSERT_EQ(tokens.size(), 2u);
    EXPECT_EQ(tokens[1], Token(2, tok::String, "v"));
}

// Delegation
static std::shared_ptr<const CompiledGrammar> numbersOnly() {
    Grammar g("numbers");
    g.state("root").rule("[0-9]+", tok::Number).rule(",", tok::Punctuation);
    g.state("hex").rule("[0-9a-f]+", tok::NumberHex);
    return compile(g);
}

TEST(LexerEngineTest, DelegateShiftsOffsets) {
    Grammar g("outer");
    g.state("root")
        .rule("(\\[)([^\\]]*)(\\])", bygroups({tok::Punctuation, using_grammar(numbersOnly()), tok::Punctuation}))
        .rule("\\s+", tok::Whitespace);

    auto tokens = tokenize_all(compile(g), " [1,22]");
    std::vector<Token> expected{
        {0, tok::Whitespace, " "},
        {1, tok::Punctuation, "["},
        {2, tok::Number, "1"},
        {3, tok::Punctuation, ","},
        {4, tok::Number, "22"},
        {6, tok::Punctuation, "]"},
    };
    EXPECT_EQ(tokens, expected);
}

TEST(LexerEngineTest, DelegateStartsInRequestedState) {
    Grammar g("outer");
    g.state("root").rule("#", tok::Punctuation).rule("[0-9a-z]+", using_grammar(numbersOnly(), "hex"));
    auto tokens = tokenize_all(compile(g), "#ff1");
    std::vector<Token> expected{
        {0, tok::Punctuation, "#"},
        {1, tok::NumberHex, "ff1"},
    };
    EXPECT_EQ(tokens, expected);
}

TEST(LexerEngineTest, DelegateErrorsStayInsideMatch) {
    Grammar g("outer");
    g.state("root").rule("\\([^)]*\\)", using_grammar(numbersOnly())).rule(".", tok::Text);
    auto tokens = tokenize_all(compile(g), "(1)");
    std::vector<Token> expected{
        {0, tok::Error, "("},
        {1, tok::Number, "1"},
        {2, tok::Error, ")"},
    };
    EXPECT_EQ(tokens, expected);
}

TEST(LexerEngineTest, WrappedDelegateRetypesPlainText) {
    Grammar inner("inner");
    inner.state("root").rule("[0-9]+", tok::Number).rule("[^0-9]+", tok::Text);

    Delegate d = using_grammar(compile(inner));
    d.wrap = true;
    d.wrap_type = tok::CommentPreproc;

    Grammar g("outer");
    g.state("root").rule(".+", d);
    auto tokens = tokenize_all(compile(g), "ab12");
    std::vector<Token> expected{
        {0, tok::CommentPreproc, "ab"},
        {2, tok::Number, "12"},
    };
    EXPECT_EQ(tokens, expected);
}

TEST(LexerEngineTest, SelfDelegationIntoOtherState) {
    Grammar g("self");
    g.state("root").rule("`([^`]*)`", bygroups({using_this("code")})).rule("[^`]+", tok::Text);
    g.state("code").rule("[a-z]+", tok::Name).rule(" ", tok::Whitespace);

    auto tokens = tokenize_all(compile(g), "x `ab c`");
    std::vector<Token> expected{
        {0, tok::Text, "x "},
        {3, tok::Name, "ab"},
        {5, tok::Whitespace, " "},
        {6, tok::Name, "c"},
    };
    EXPECT_EQ(tokens, expected);
}

TEST(LexerEngineTest, RunawayDelegationIsCut) {
    Grammar g("runaway");
    g.state("root").rule("a+", using_this());
    auto tokens = tokenize_all(compile(g), "aaa");
    ASSERT_EQ(tokens.size(), 1u);
    EXPECT_EQ(tokens[0], Token(0, tok::Other, "aaa"));
}

// Zero-width matches
TEST(LexerEngineTest, LookaheadWithPushConsumesNothing) {
    Grammar g("lookahead");
    g.state("root").skip("(?=[0-9])", "num").rule("[a-z]+", tok::Name);
    g.state("num").rule("[0-9]+", tok::Number, "#pop");

    TokenStream stream(compile(g), "ab12cd");
    auto tokens = stream.drain();
    std::vector<Token> expected{
        {0, tok::Name, "ab"},
        {2, tok::Number, "12"},
        {4, tok::Name, "cd"},
    };
    EXPECT_EQ(tokens, expected);
    EXPECT_EQ(stream.state_stack(), (std::vector<std::string>{"root"}));
}

TEST(LexerEngineTest, DefaultRuleFallsBackToParentState) {
    Grammar g("default");
    g.state("root").rule("@", tok::Operator, "decorator").rule("\\s+", tok::Whitespace).rule("\\w+", tok::Name);
    g.state("decorator").rule("\\w+", tok::NameDecorator, "#pop").default_state("#pop");

    auto tokens = tokenize_all(compile(g), "@x @ y");
    std::vector<Token> expected{
        {0, tok::Operator, "@"},
        {1, tok::NameDecorator, "x"},
        {2, tok::Whitespace, " "},
        {3, tok::Operator, "@"},
        {4, tok::Whitespace, " "},
        {5, tok::Name, "y"},
    };
    EXPECT_EQ(tokens, expected);
}

TEST(LexerEngineTest, ZeroWidthMatchWithoutTransitionStillAdvances) {
    Grammar g("empty");
    g.state("root").rule("x*", tok::Name);
    auto tokens = tokenize_all(compile(g), "xxay");
    std::vector<Token> expected{
        {0, tok::Name, "xx"},
        {2, tok::Error, "a"},
        {3, tok::Error, "y"},
    };
    EXPECT_EQ(tokens, expected);
}

TEST(LexerEngineTest, ZeroWidthTransitionLoopTerminates) {
    Grammar g("spin");
    g.state("root").default_state("other");
    g.state("other").default_state("#pop");
    auto tokens = tokenize_all(compile(g), "ab");
    expectWellFormed(tokens, "ab");
    for (const auto& t : tokens) EXPECT_EQ(t.type, tok::Error);
}

TEST(LexerEngineTest, StalledLookaheadPushDoesNotGrowStack) {
    Grammar g("lookahead");
    g.state("root").skip("(?=a)", "inner").rule("b", tok::Name);
    g.state("inner").include("root");

    const std::string text(1000, 'a');
    TokenStream stream(compile(g), text);
    auto tokens = stream.drain();
    expectWellFormed(tokens, text);
    ASSERT_EQ(tokens.size(), 1000u);
    for (const auto& t : tokens) EXPECT_EQ(t.type, tok::Error);
    EXPECT_EQ(stream.state_stack(), (std::vector<std::string>{"root"}));
}

TEST(LexerEngineTest, PushesBeforeStalledRunSurvive) {
    Grammar g("nested");
    g.state("root").rule("\\{", tok::Punctuation, "block");
    g.state("block").skip("(?=a)", "#push").rule("\\}", tok::Punctuation, "#pop");

    TokenStream stream(compile(g), "{aa");
    auto tokens = stream.drain();
    expectWellFormed(tokens, "{aa");
    EXPECT_EQ(stream.state_stack(), (std::vector<std::string>{"root", "block"}));
}

// Long input
TEST(LexerEngineTest, VeryLongCommentIsOneToken) {
    const std::string text = "#" + std::string(200000, 'a');
    auto tokens = tokenize_all(wordsAndComments(), text);
    ASSERT_EQ(tokens.size(), 1u);
    EXPECT_EQ(tokens[0].type, tok::Comment);
    EXPECT_EQ(tokens[0].value.size(), text.size());
}

TEST(LexerEngineTest, VeryLongStringBody) {
    const std::string body(200000, 'x');
    TokenStream stream(quotedStrings(), "\"" + body + "\"");
    auto tokens = stream.drain();
    ASSERT_EQ(tokens.size(), 3u);
    EXPECT_EQ(tokens[1], Token(1, tok::String, body));
    EXPECT_EQ(stream.state_stack(), (std::vector<std::string>{"root"}));
}

// Stream behavior
TEST(LexerEngineTest, StreamIsLazy) {
    TokenStream stream(wordsAndComments(), "a b c");
    auto first = stream.next();
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first->value, "a");
    EXPECT_EQ(stream.position(), 1u);
    EXPECT_FALSE(stream.done());
}

TEST(LexerEngineTest, RangeForOverStream) {
    TokenStream stream(wordsAndComments(), "a b");
    std::vector<std::string> values;
    for (const Token& t : stream) values.push_back(t.value);
    EXPECT_EQ(values, (std::vector<std::string>{"a", " ", "b"}));
    EXPECT_TRUE(stream.done());
}

TEST(LexerEngineTest, DeterministicOutput) {
    auto g = quotedStrings();
    const std::string text = "say \"hi\\n\" and \"bye";
    EXPECT_EQ(tokenize_all(g, text), tokenize_all(g, text));
}

TEST(LexerEngineTest, RoundTripOnAssortedInputs) {
    auto g = quotedStrings();
    const std::vector<std::string> inputs = {
        "", "\"", "\\", "plain", "\"\\\"\"", "a\"b\"c\"", "\xFF\xFE", "\xE2\x82\xAC\"\xE2\x82\xAC\"", "\n\n\"\n",
    };
    for (const auto& text : inputs) {
        expectWellFormed(tokenize_all(g, text), text);
    }
}

TEST(LexerEngineTest, CustomInitialStack) {
    TokenStream stream(quotedStrings(), "ab\" c", {"root", "str"});
    auto tokens = stream.drain();
    ASSERT_GE(tokens.size(), 2u);
    EXPECT_EQ(tokens[0], Token(0, tok::String, "ab"));
    EXPECT_EQ(tokens[1], Token(2, tok::StringDelimiter, "\""));
}

// Construction failures
TEST(LexerEngineTest, RejectsUnknownInitialState) {
    const std::vector<std::string> unknown{"root", "nope"};
    const std::vector<std::string> empty;
    EXPECT_THROW(TokenStream(quotedStrings(), "x", unknown), MalformedCompiledGrammarError);
    EXPECT_THROW(TokenStream(quotedStrings(), "x", empty), MalformedCompiledGrammarError);
}

TEST(LexerEngineTest, RejectsGrammarWithDanglingTarget) {
    CompiledRule rule;
    rule.pattern = "x";
    rule.regex = std::make_shared<const boost::regex>("x");
    rule.action.transitions.push_back(Goto{"ghost"});
    auto g = std::make_shared<const CompiledGrammar>("hand", std::vector<std::string>{},
        std::vector<CompiledState>{CompiledState{"root", {rule}}});
    EXPECT_THROW(TokenStream(g, "x"), MalformedCompiledGrammarError);
}

TEST(LexerEngineTest, RejectsNullGrammar) {
    EXPECT_THROW(TokenStream(nullptr, "x"), MalformedCompiledGrammarError);
}
