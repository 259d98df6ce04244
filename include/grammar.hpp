#pragma once

#include <functional>
#include <initializer_list>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "token_type.hpp"

namespace hilex {

class CompiledGrammar;

// -----------------------
// State transitions
// -----------------------
struct Push {
    std::string state;
};

// Removes up to `count` entries; the last stack entry is never removed.
struct Pop {
    int count = 1;
};

// Duplicates the current top state ("#push").
struct PushSame {};

// Pop(1) then Push(state), as one move ("#pop#push:state").
struct Goto {
    std::string state;
};

// Pushes an anonymous state made of the listed states' rules, in order.
struct PushCombined {
    std::vector<std::string> states;
};

using StateTransition = std::variant<Push, Pop, PushSame, Goto, PushCombined>;

// Parses the directive shorthand used by grammar authors:
//   "name"            -> Push(name)
//   "#pop", "#pop:3"  -> Pop(1), Pop(3) (consecutive pops merge: "#pop#pop" -> Pop(2))
//   "#push"           -> PushSame
//   "#push:name"      -> Push(name)
//   "#pop#push:name"  -> Goto(name)
// The empty string yields no transitions. Throws InvalidDirectiveError.
std::vector<StateTransition> parse_state_directive(std::string_view directive);
std::vector<StateTransition> parse_state_directives(const std::vector<std::string>& directives);

std::string describe(const StateTransition& t);

// Name of the synthesized state behind PushCombined{states}.
std::string combined_state_name(const std::vector<std::string>& states);

// -----------------------
// Actions
// -----------------------

// Re-lex the matched text with another grammar ("using").
// A null grammar means the grammar that owns the rule.
struct Delegate {
    std::shared_ptr<const CompiledGrammar> grammar;
    std::string state;  // pushed above "root" before lexing; empty means "root" only
    bool wrap = false;  // re-type the delegate's unclassified tokens as wrap_type
    TokenType wrap_type = tok::Other;
};

// Whole match as one token; no type means the match is consumed silently.
struct Emit {
    std::optional<TokenType> type;
};

// One entry per capturing group: monostate skips the group.
using GroupAction = std::variant<std::monostate, TokenType, Delegate>;

struct EmitGroups {
    std::vector<GroupAction> groups;
};

using Emission = std::variant<Emit, EmitGroups, Delegate>;

struct Action {
    Emission emission = Emit{};
    std::vector<StateTransition> transitions;
};

struct Rule {
    std::string pattern;
    Action action;
};

// Inline another state's rules at this position.
struct Include {
    std::string state;
};

using RawRule = std::variant<Rule, Include>;

// -----------------------
// Authoring helpers
// -----------------------
EmitGroups bygroups(std::initializer_list<GroupAction> groups);

Delegate using_grammar(std::shared_ptr<const CompiledGrammar> grammar, std::string state = "");
Delegate using_this(std::string state = "");

// Alternation of literal words, longest first so that first-match regex
// alternation prefers "else if" over "else". Wrapped in a non-capturing group.
std::string words(const std::vector<std::string>& list, const std::string& prefix = "", const std::string& suffix = "");

std::string escape_regex(std::string_view literal);

// Zero-width rule that only changes state ("default" in grammar tables).
Rule default_rule(std::string_view directive);

PushCombined combined(std::vector<std::string> states);

class Grammar;

// Appends rules to one state of a Grammar.
class StateBuilder {
   public:
    StateBuilder(Grammar& grammar, std::string state) : grammar_(grammar), state_(std::move(state)) {}

    StateBuilder& rule(std::string pattern, const TokenType& type, std::string_view directive = {});
    StateBuilder& rule(std::string pattern, const TokenType& type, std::vector<StateTransition> transitions);
    StateBuilder& rule(std::string pattern, Emission emission, std::string_view directive = {});
    StateBuilder& rule(std::string pattern, Emission emission, std::vector<StateTransition> transitions);
    // Match without emitting anything.
    StateBuilder& skip(std::string pattern, std::string_view directive = {});
    StateBuilder& skip(std::string pattern, std::vector<StateTransition> transitions);
    StateBuilder& include(std::string state);
    StateBuilder& default_state(std::string_view directive);

   private:
    std::vector<RawRule>& rules();

    Grammar& grammar_;
    std::string state_;
};

// Declarative lexer definition: named states, each an ordered rule list.
// Matching is first-match-wins in declared order.
class Grammar {
   public:
    static constexpr const char* ROOT = "root";

    Grammar() = default;
    explicit Grammar(std::string grammar_name) : name(std::move(grammar_name)) {}

    StateBuilder state(const std::string& state_name) { return StateBuilder(*this, state_name); }

    bool has_state(const std::string& state_name) const { return states.count(state_name) > 0; }

    std::string name;
    std::vector<std::string> aliases;
    // Grammar-wide; rules carry no flags of their own.
    bool ignore_case = false;
    std::map<std::string, std::vector<RawRule>> states;
    // Optional "how likely is this text mine" heuristic, 0.0 .. 1.0.
    std::function<double(std::string_view)> confidence;
};

}  // namespace hilex
