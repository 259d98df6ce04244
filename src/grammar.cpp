#include "grammar.hpp"

#include <algorithm>
#include <cctype>

#include "HilexError.hpp"

namespace hilex {

namespace {

bool parse_count(std::string_view digits, int& out) {
    if (digits.empty()) return false;
    int value = 0;
    for (char c : digits) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
        value = value * 10 + (c - '0');
        if (value > 1000000) return false;
    }
    out = value;
    return value > 0;
}

void append_pop(std::vector<StateTransition>& out, int count) {
    if (!out.empty()) {
        if (auto* prev = std::get_if<Pop>(&out.back())) {
            prev->count += count;
            return;
        }
    }
    out.push_back(Pop{count});
}

// "#pop" directly followed by "#push:name" becomes Goto(name)
void append_push(std::vector<StateTransition>& out, std::string state) {
    if (!out.empty()) {
        if (auto* prev = std::get_if<Pop>(&out.back())) {
            if (prev->count == 1) {
                out.back() = Goto{std::move(state)};
            } else {
                prev->count -= 1;
                out.push_back(Goto{std::move(state)});
            }
            return;
        }
    }
    out.push_back(Push{std::move(state)});
}

}  // namespace

std::vector<StateTransition> parse_state_directive(std::string_view directive) {
    std::vector<StateTransition> out;
    if (directive.empty()) return out;

    if (directive.front() != '#') {
        if (directive.find('#') != std::string_view::npos) {
            throw InvalidDirectiveError(std::string(directive));
        }
        out.push_back(Push{std::string(directive)});
        return out;
    }

    size_t i = 0;
    while (i < directive.size()) {
        size_t next = directive.find('#', i + 1);
        if (next == std::string_view::npos) next = directive.size();
        std::string_view part = directive.substr(i, next - i);
        i = next;

        if (part == "#pop") {
            append_pop(out, 1);
        } else if (part.rfind("#pop:", 0) == 0) {
            int count = 0;
            if (!parse_count(part.substr(5), count)) throw InvalidDirectiveError(std::string(directive));
            append_pop(out, count);
        } else if (part == "#push") {
            out.push_back(PushSame{});
        } else if (part.rfind("#push:", 0) == 0 && part.size() > 6) {
            append_push(out, std::string(part.substr(6)));
        } else {
            throw InvalidDirectiveError(std::string(directive));
        }
    }
    return out;
}

std::vector<StateTransition> parse_state_directives(const std::vector<std::string>& directives) {
    std::vector<StateTransition> out;
    for (const auto& d : directives) {
        auto parsed = parse_state_directive(d);
        out.insert(out.end(), parsed.begin(), parsed.end());
    }
    return out;
}

std::string describe(const StateTransition& t) {
    if (auto* p = std::get_if<Push>(&t)) return "push " + p->state;
    if (auto* p = std::get_if<Pop>(&t)) return "pop " + std::to_string(p->count);
    if (std::holds_alternative<PushSame>(t)) return "push same";
    if (auto* g = std::get_if<Goto>(&t)) return "goto " + g->state;
    const auto& c = std::get<PushCombined>(t);
    return "push " + combined_state_name(c.states);
}

std::string combined_state_name(const std::vector<std::string>& states) {
    std::string name = "combined(";
    for (size_t i = 0; i < states.size(); ++i) {
        if (i) name += ",";
        name += states[i];
    }
    name += ")";
    return name;
}

EmitGroups bygroups(std::initializer_list<GroupAction> groups) {
    return EmitGroups{std::vector<GroupAction>(groups)};
}

Delegate using_grammar(std::shared_ptr<const CompiledGrammar> grammar, std::string state) {
    Delegate d;
    d.grammar = std::move(grammar);
    d.state = std::move(state);
    return d;
}

Delegate using_this(std::string state) {
    return using_grammar(nullptr, std::move(state));
}

std::string escape_regex(std::string_view literal) {
    static const std::string special = "\\^$.|?*+()[]{}";
    std::string out;
    out.reserve(literal.size() * 2);
    for (char c : literal) {
        if (special.find(c) != std::string::npos) out.push_back('\\');
        out.push_back(c);
    }
    return out;
}

std::string words(const std::vector<std::string>& list, const std::string& prefix, const std::string& suffix) {
    std::vector<std::string> sorted = list;
    // longest first, then alphabetical so the output is stable
    std::sort(sorted.begin(), sorted.end(), [](const std::string& a, const std::string& b) {
        if (a.size() != b.size()) return a.size() > b.size();
        return a < b;
    });
    sorted.erase(std::unique(sorted.begin(), sorted.end()), sorted.end());

    std::string alternation;
    for (size_t i = 0; i < sorted.size(); ++i) {
        if (i) alternation += "|";
        alternation += escape_regex(sorted[i]);
    }
    return prefix + "(?:" + alternation + ")" + suffix;
}

Rule default_rule(std::string_view directive) {
    Rule r;
    r.action.transitions = parse_state_directive(directive);
    return r;
}

PushCombined combined(std::vector<std::string> states) {
    return PushCombined{std::move(states)};
}

// -----------------------
// StateBuilder
// -----------------------
std::vector<RawRule>& StateBuilder::rules() {
    return grammar_.states[state_];
}

StateBuilder& StateBuilder::rule(std::string pattern, const TokenType& type, std::string_view directive) {
    return rule(std::move(pattern), Emission{Emit{type}}, parse_state_directive(directive));
}

StateBuilder& StateBuilder::rule(std::string pattern, const TokenType& type, std::vector<StateTransition> transitions) {
    return rule(std::move(pattern), Emission{Emit{type}}, std::move(transitions));
}

StateBuilder& StateBuilder::rule(std::string pattern, Emission emission, std::string_view directive) {
    return rule(std::move(pattern), std::move(emission), parse_state_directive(directive));
}

StateBuilder& StateBuilder::rule(std::string pattern, Emission emission, std::vector<StateTransition> transitions) {
    Rule r;
    r.pattern = std::move(pattern);
    r.action.emission = std::move(emission);
    r.action.transitions = std::move(transitions);
    rules().emplace_back(std::move(r));
    return *this;
}

StateBuilder& StateBuilder::skip(std::string pattern, std::string_view directive) {
    return rule(std::move(pattern), Emission{Emit{}}, parse_state_directive(directive));
}

StateBuilder& StateBuilder::skip(std::string pattern, std::vector<StateTransition> transitions) {
    return rule(std::move(pattern), Emission{Emit{}}, std::move(transitions));
}

StateBuilder& StateBuilder::include(std::string state) {
    rules().emplace_back(Include{std::move(state)});
    return *this;
}

StateBuilder& StateBuilder::default_state(std::string_view directive) {
    rules().emplace_back(default_rule(directive));
    return *this;
}

}  // namespace hilex
