#include <algorithm>
#include <cmath>
#include <map>
#include <set>

#include "compiled_grammar.hpp"
#include "log.hpp"

namespace hilex {

boost::regex::flag_type pattern_flags(bool ignore_case) {
    boost::regex::flag_type flags = boost::regex::perl | boost::regex::no_mod_s;
    if (ignore_case) flags |= boost::regex::icase;
    return flags;
}

// -----------------------
// CompiledGrammar
// -----------------------
CompiledGrammar::CompiledGrammar(std::string name,
    std::vector<std::string> aliases,
    std::vector<CompiledState> states,
    std::function<double(std::string_view)> confidence)
    : name_(std::move(name)),
      aliases_(std::move(aliases)),
      states_(std::move(states)),
      confidence_(std::move(confidence)) {
    for (size_t i = 0; i < states_.size(); ++i) {
        index_.emplace(states_[i].name, i);
    }
    collect_dangling_references();
}

std::optional<size_t> CompiledGrammar::state_index(const std::string& state) const {
    auto it = index_.find(state);
    if (it == index_.end()) return std::nullopt;
    return it->second;
}

double CompiledGrammar::confidence(std::string_view text) const {
    if (!confidence_) return 0.0;
    double v = confidence_(text);
    if (std::isnan(v)) return 0.0;
    return std::clamp(v, 0.0, 1.0);
}

size_t CompiledGrammar::rule_count() const {
    size_t n = 0;
    for (const auto& s : states_) n += s.rules.size();
    return n;
}

void CompiledGrammar::collect_dangling_references() {
    auto check_delegate = [&](const Delegate& d, const GrammarLocation& loc) {
        if (d.grammar) {
            for (const auto& inner : d.grammar->dangling_references()) dangling_.push_back(inner);
        }
        if (d.state.empty()) return;
        bool ok = d.grammar ? d.grammar->has_state(d.state) : has_state(d.state);
        if (!ok) dangling_.emplace_back(d.state, loc);
    };

    for (const auto& state : states_) {
        for (size_t i = 0; i < state.rules.size(); ++i) {
            const CompiledRule& rule = state.rules[i];
            GrammarLocation loc(name_, state.name, static_cast<int>(i));

            for (const auto& t : rule.action.transitions) {
                std::string target;
                if (auto* p = std::get_if<Push>(&t)) target = p->state;
                else if (auto* g = std::get_if<Goto>(&t)) target = g->state;
                else if (auto* c = std::get_if<PushCombined>(&t)) target = combined_state_name(c->states);
                if (!target.empty() && !has_state(target)) dangling_.emplace_back(target, loc);
            }

            if (auto* d = std::get_if<Delegate>(&rule.action.emission)) {
                check_delegate(*d, loc);
            } else if (auto* groups = std::get_if<EmitGroups>(&rule.action.emission)) {
                for (const auto& g : groups->groups) {
                    if (auto* gd = std::get_if<Delegate>(&g)) check_delegate(*gd, loc);
                }
            }
        }
    }

    if (!has_state(Grammar::ROOT)) dangling_.emplace_back(Grammar::ROOT, GrammarLocation(name_));
}

// -----------------------
// compile()
// -----------------------
namespace {

class RuleCompiler {
   public:
    explicit RuleCompiler(const Grammar& grammar)
        : grammar_(grammar), flags_(pattern_flags(grammar.ignore_case)) {}

    std::shared_ptr<const CompiledGrammar> run() {
        if (!grammar_.has_state(Grammar::ROOT)) {
            throw UnknownStateError(Grammar::ROOT, GrammarLocation(grammar_.name));
        }

        for (const auto& entry : grammar_.states) {
            compile_state(entry.first, GrammarLocation(grammar_.name, entry.first));
        }

        std::vector<CompiledState> states;
        for (const auto& entry : grammar_.states) {
            states.push_back(CompiledState{entry.first, done_.at(entry.first)});
        }
        // combined states only ever reference finished states
        for (const auto& members : pending_combined_) {
            CompiledState combined{combined_state_name(members), {}};
            for (const auto& m : members) {
                const auto& rules = done_.at(m);
                combined.rules.insert(combined.rules.end(), rules.begin(), rules.end());
            }
            states.push_back(std::move(combined));
        }

        auto compiled = std::make_shared<const CompiledGrammar>(grammar_.name, grammar_.aliases, std::move(states), grammar_.confidence);
        log::debug("compiled grammar '", grammar_.name, "': ", compiled->states().size(), " states, ",
            compiled->rule_count(), " rules, ", regex_cache_.size(), " distinct patterns");
        return compiled;
    }

   private:
    const std::vector<CompiledRule>& compile_state(const std::string& name, const GrammarLocation& ref) {
        auto done = done_.find(name);
        if (done != done_.end()) return done->second;

        auto chain_pos = std::find(expanding_.begin(), expanding_.end(), name);
        if (chain_pos != expanding_.end()) {
            std::vector<std::string> cycle(chain_pos, expanding_.end());
            cycle.push_back(name);
            throw GrammarCycleError(cycle, ref);
        }

        auto raw = grammar_.states.find(name);
        if (raw == grammar_.states.end()) throw UnknownStateError(name, ref);

        expanding_.push_back(name);
        std::vector<CompiledRule> rules;
        for (size_t i = 0; i < raw->second.size(); ++i) {
            GrammarLocation loc(grammar_.name, name, static_cast<int>(i));
            const RawRule& entry = raw->second[i];

            if (auto* inc = std::get_if<Include>(&entry)) {
                const auto& included = compile_state(inc->state, loc);
                rules.insert(rules.end(), included.begin(), included.end());
                continue;
            }
            rules.push_back(compile_rule(std::get<Rule>(entry), loc));
        }
        expanding_.pop_back();

        return done_.emplace(name, std::move(rules)).first->second;
    }

    CompiledRule compile_rule(const Rule& rule, const GrammarLocation& loc) {
        CompiledRule out;
        out.pattern = rule.pattern;
        out.regex = compile_pattern(rule.pattern, loc);
        out.action.emission = rule.action.emission;
        out.origin_state = loc.state;
        out.origin_index = loc.rule;

        for (const auto& t : rule.action.transitions) {
            if (auto* p = std::get_if<Push>(&t)) {
                check_target(p->state, loc);
                out.action.transitions.push_back(t);
            } else if (auto* g = std::get_if<Goto>(&t)) {
                check_target(g->state, loc);
                out.action.transitions.push_back(t);
            } else if (auto* c = std::get_if<PushCombined>(&t)) {
                for (const auto& member : c->states) check_target(member, loc);
                register_combined(c->states, loc);
                out.action.transitions.push_back(Push{combined_state_name(c->states)});
            } else {
                out.action.transitions.push_back(t);
            }
        }

        if (auto* d = std::get_if<Delegate>(&rule.action.emission)) {
            check_delegate(*d, loc);
        } else if (auto* groups = std::get_if<EmitGroups>(&rule.action.emission)) {
            for (const auto& g : groups->groups) {
                if (auto* gd = std::get_if<Delegate>(&g)) check_delegate(*gd, loc);
            }
        }
        return out;
    }

    std::shared_ptr<const boost::regex> compile_pattern(const std::string& pattern, const GrammarLocation& loc) {
        auto cached = regex_cache_.find(pattern);
        if (cached != regex_cache_.end()) return cached->second;

        try {
            auto re = std::make_shared<const boost::regex>(pattern, flags_);
            regex_cache_.emplace(pattern, re);
            return re;
        } catch (const boost::regex_error& e) {
            throw InvalidPatternError(pattern, e.what(), loc);
        }
    }

    void check_target(const std::string& target, const GrammarLocation& loc) {
        if (!grammar_.has_state(target)) throw UnknownStateError(target, loc);
    }

    void check_delegate(const Delegate& d, const GrammarLocation& loc) {
        if (d.state.empty()) return;
        if (d.grammar) {
            if (!d.grammar->has_state(d.state)) {
                throw UnknownStateError(d.state, GrammarLocation(d.grammar->name(), loc.state, loc.rule));
            }
            return;
        }
        check_target(d.state, loc);
    }

    void register_combined(const std::vector<std::string>& members, const GrammarLocation& loc) {
        const std::string name = combined_state_name(members);
        if (grammar_.has_state(name)) throw StateNameClashError(name, loc);
        if (std::find(pending_combined_.begin(), pending_combined_.end(), members) == pending_combined_.end()) {
            pending_combined_.push_back(members);
        }
    }

    const Grammar& grammar_;
    boost::regex::flag_type flags_;
    std::map<std::string, std::vector<CompiledRule>> done_;
    std::vector<std::string> expanding_;
    std::map<std::string, std::shared_ptr<const boost::regex>> regex_cache_;
    std::vector<std::vector<std::string>> pending_combined_;
};

}  // namespace

std::shared_ptr<const CompiledGrammar> compile(const Grammar& grammar) {
    try {
        return RuleCompiler(grammar).run();
    } catch (const HilexError& e) {
        log::debug("grammar '", grammar.name, "' rejected: ", e.what());
        throw;
    }
}

}  // namespace hilex
