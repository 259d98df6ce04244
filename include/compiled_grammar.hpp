#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <boost/regex.hpp>

#include "HilexError.hpp"
#include "grammar.hpp"

namespace hilex {

struct CompiledRule {
    std::shared_ptr<const boost::regex> regex;
    std::string pattern;
    // PushCombined transitions are already rewritten to Push of the synthesized state.
    Action action;
    // Where the rule was declared; differs from the owning state for included rules.
    std::string origin_state;
    int origin_index = -1;
};

struct CompiledState {
    std::string name;
    std::vector<CompiledRule> rules;
};

// Immutable, include-free form of a Grammar. Safe to share between threads.
class CompiledGrammar {
   public:
    CompiledGrammar(std::string name,
        std::vector<std::string> aliases,
        std::vector<CompiledState> states,
        std::function<double(std::string_view)> confidence = nullptr);

    const std::string& name() const { return name_; }
    const std::vector<std::string>& aliases() const { return aliases_; }
    const std::vector<CompiledState>& states() const { return states_; }

    std::optional<size_t> state_index(const std::string& state) const;
    const CompiledState& state_at(size_t index) const { return states_[index]; }
    bool has_state(const std::string& state) const { return state_index(state).has_value(); }

    // States referenced by transitions or delegates that this grammar (or the
    // delegate target) does not define. Empty for anything compile() produced.
    const std::vector<std::pair<std::string, GrammarLocation>>& dangling_references() const { return dangling_; }

    bool has_confidence_heuristic() const { return static_cast<bool>(confidence_); }
    double confidence(std::string_view text) const;

    size_t rule_count() const;

   private:
    void collect_dangling_references();

    std::string name_;
    std::vector<std::string> aliases_;
    std::vector<CompiledState> states_;
    std::unordered_map<std::string, size_t> index_;
    std::function<double(std::string_view)> confidence_;
    std::vector<std::pair<std::string, GrammarLocation>> dangling_;
};

// Compiles every state of `grammar`, flattening includes and synthesizing
// combined states. Throws InvalidPatternError, UnknownStateError or
// GrammarCycleError; never returns a partially valid grammar.
std::shared_ptr<const CompiledGrammar> compile(const Grammar& grammar);

// Regex flags applied to every rule: Perl syntax, '^'/'$' at line breaks,
// '.' stops at a newline.
boost::regex::flag_type pattern_flags(bool ignore_case);

}  // namespace hilex
