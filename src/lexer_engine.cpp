#include "lexer_engine.hpp"

#include "log.hpp"
#include "utf8.hpp"

namespace hilex {

TokenStream::TokenStream(std::shared_ptr<const CompiledGrammar> grammar,
    std::string text,
    const std::vector<std::string>& initial_stack)
    : TokenStream(std::move(grammar), std::move(text), initial_stack, 0) {}

TokenStream::TokenStream(std::shared_ptr<const CompiledGrammar> grammar,
    std::string text,
    const std::vector<std::string>& initial_stack,
    size_t depth)
    : grammar_(std::move(grammar)), text_(std::move(text)), depth_(depth) {
    verify(initial_stack);
    for (const auto& name : initial_stack) {
        stack_.push_back(resolve(name));
    }
}

void TokenStream::verify(const std::vector<std::string>& initial_stack) const {
    if (!grammar_) {
        throw MalformedCompiledGrammarError("no grammar given", GrammarLocation());
    }
    const auto& dangling = grammar_->dangling_references();
    if (!dangling.empty()) {
        throw MalformedCompiledGrammarError("state '" + dangling.front().first + "' is referenced but not defined",
            dangling.front().second);
    }
    if (initial_stack.empty()) {
        throw MalformedCompiledGrammarError("initial state stack is empty", GrammarLocation(grammar_->name()));
    }
    for (const auto& name : initial_stack) {
        if (!grammar_->has_state(name)) {
            throw MalformedCompiledGrammarError("initial state '" + name + "' is not defined",
                GrammarLocation(grammar_->name()));
        }
    }
}

size_t TokenStream::resolve(const std::string& state) const {
    return *grammar_->state_index(state);
}

std::vector<std::string> TokenStream::state_stack() const {
    std::vector<std::string> names;
    names.reserve(stack_.size());
    for (size_t idx : stack_) names.push_back(grammar_->state_at(idx).name);
    return names;
}

std::optional<Token> TokenStream::next() {
    while (pending_.empty()) {
        if (pos_ >= text_.size()) return std::nullopt;
        step();
    }
    Token t = std::move(pending_.front());
    pending_.pop_front();
    return t;
}

std::vector<Token> TokenStream::drain() {
    std::vector<Token> out;
    while (auto t = next()) out.push_back(std::move(*t));
    return out;
}

void TokenStream::emit(size_t offset, const TokenType& type, size_t length) {
    if (length == 0) return;
    pending_.emplace_back(offset, type, text_.substr(offset, length));
}

void TokenStream::emit_error_char() {
    size_t len = utf8::sequence_length(text_, pos_);
    emit(pos_, tok::Error, len);
    pos_ += len;
    zero_width_steps_ = 0;
}

void TokenStream::step() {
    const CompiledState& state = grammar_->state_at(stack_.back());

    boost::regex_constants::match_flag_type flags = boost::regex_constants::match_continuous;
    if (pos_ > 0) flags |= boost::regex_constants::match_prev_avail;

    boost::smatch m;
    for (const CompiledRule& rule : state.rules) {
        bool matched = false;
        try {
            matched = boost::regex_search(text_.cbegin() + pos_, text_.cend(), m, *rule.regex, flags);
        } catch (const boost::regex_error& e) {
            // regex engine gave up (complexity / stack); treat as no match
            log::warn("pattern '", rule.pattern, "' in state '", state.name, "' failed at offset ", pos_, ": ", e.what());
            continue;
        }
        if (!matched) continue;

        const size_t start = pos_;
        const size_t length = static_cast<size_t>(m.length(0));

        if (auto* e = std::get_if<Emit>(&rule.action.emission)) {
            if (e->type) emit(start, *e->type, length);
        } else if (auto* groups = std::get_if<EmitGroups>(&rule.action.emission)) {
            for (size_t i = 0; i < groups->groups.size() && i + 1 < m.size(); ++i) {
                const auto& group = m[i + 1];
                if (!group.matched) continue;
                const size_t offset = start + static_cast<size_t>(m.position(i + 1));
                const size_t glen = static_cast<size_t>(group.length());
                const GroupAction& ga = groups->groups[i];
                if (auto* type = std::get_if<TokenType>(&ga)) {
                    emit(offset, *type, glen);
                } else if (auto* d = std::get_if<Delegate>(&ga)) {
                    run_delegate(*d, offset, glen);
                }
            }
        } else {
            run_delegate(std::get<Delegate>(rule.action.emission), start, length);
        }

        if (length == 0 && zero_width_steps_ == 0) zero_width_base_ = stack_;
        for (const auto& t : rule.action.transitions) apply(t);

        if (length > 0) {
            pos_ = start + length;
            zero_width_steps_ = 0;
            return;
        }

        // zero-width: a transition may still move things forward, nothing else does
        if (rule.action.transitions.empty() || ++zero_width_steps_ > MAX_ZERO_WIDTH_STEPS) {
            log::trace("zero-width match of '", rule.pattern, "' in state '", state.name,
                "' made no progress at offset ", pos_);
            // states pushed by the stalled run are dropped with it
            stack_ = zero_width_base_;
            emit_error_char();
        }
        return;
    }

    log::trace("no rule in state '", state.name, "' matches at offset ", pos_);
    emit_error_char();
}

void TokenStream::apply(const StateTransition& t) {
    if (auto* push = std::get_if<Push>(&t)) {
        stack_.push_back(resolve(push->state));
    } else if (auto* pop = std::get_if<Pop>(&t)) {
        for (int i = 0; i < pop->count && stack_.size() > 1; ++i) stack_.pop_back();
    } else if (std::holds_alternative<PushSame>(t)) {
        stack_.push_back(stack_.back());
    } else if (auto* go = std::get_if<Goto>(&t)) {
        if (stack_.size() > 1) stack_.pop_back();
        stack_.push_back(resolve(go->state));
    } else {
        stack_.push_back(resolve(combined_state_name(std::get<PushCombined>(t).states)));
    }
}

void TokenStream::run_delegate(const Delegate& d, size_t offset, size_t length) {
    if (length == 0) return;

    if (depth_ + 1 > MAX_DELEGATE_DEPTH) {
        log::warn("delegate nesting deeper than ", MAX_DELEGATE_DEPTH, " in grammar '", grammar_->name(),
            "'; emitting ", length, " bytes unlexed");
        emit(offset, d.wrap ? d.wrap_type : tok::Other, length);
        return;
    }

    std::vector<std::string> stack{Grammar::ROOT};
    if (!d.state.empty() && d.state != Grammar::ROOT) stack.push_back(d.state);

    TokenStream sub(d.grammar ? d.grammar : grammar_, text_.substr(offset, length), stack, depth_ + 1);
    while (auto t = sub.next()) {
        t->offset += offset;
        if (d.wrap && (t->type == tok::Token || t->type == tok::Text)) t->type = d.wrap_type;
        pending_.push_back(std::move(*t));
    }
}

TokenStream tokenize(std::shared_ptr<const CompiledGrammar> grammar, std::string text) {
    return TokenStream(std::move(grammar), std::move(text));
}

std::vector<Token> tokenize_all(std::shared_ptr<const CompiledGrammar> grammar, std::string text) {
    return TokenStream(std::move(grammar), std::move(text)).drain();
}

}  // namespace hilex
