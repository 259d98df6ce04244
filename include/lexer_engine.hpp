#pragma once

#include <cstddef>
#include <deque>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "compiled_grammar.hpp"
#include "token_type.hpp"

namespace hilex {

// Lazily lexes one text against a compiled grammar.
//
// Tokens come out in textual order and their values concatenate back to the
// input. Unmatched input never throws: each unrecognized character becomes
// one Error token. Dropping the stream at any point is safe.
class TokenStream {
   public:
    // Throws MalformedCompiledGrammarError if the grammar (or the initial
    // stack) references a state the grammar does not define.
    TokenStream(std::shared_ptr<const CompiledGrammar> grammar,
        std::string text,
        const std::vector<std::string>& initial_stack = {Grammar::ROOT});

    // Next token, or nullopt once the whole text has been consumed.
    std::optional<Token> next();

    bool done() const { return pending_.empty() && pos_ >= text_.size(); }

    const std::string& text() const { return text_; }
    size_t position() const { return pos_; }
    std::vector<std::string> state_stack() const;

    class iterator {
       public:
        using iterator_category = std::input_iterator_tag;
        using value_type = Token;
        using difference_type = std::ptrdiff_t;
        using pointer = const Token*;
        using reference = const Token&;

        iterator() = default;
        explicit iterator(TokenStream* stream) : stream_(stream) { advance(); }

        reference operator*() const { return *current_; }
        pointer operator->() const { return &*current_; }
        iterator& operator++() {
            advance();
            return *this;
        }
        void operator++(int) { advance(); }

        friend bool operator==(const iterator& a, const iterator& b) { return a.stream_ == b.stream_; }
        friend bool operator!=(const iterator& a, const iterator& b) { return !(a == b); }

       private:
        void advance() {
            current_ = stream_->next();
            if (!current_) stream_ = nullptr;
        }

        TokenStream* stream_ = nullptr;
        std::optional<Token> current_;
    };

    iterator begin() { return iterator(this); }
    iterator end() { return iterator(); }

    // Collects the remaining tokens.
    std::vector<Token> drain();

    // Maximum nesting of Delegate sub-lexers.
    static constexpr size_t MAX_DELEGATE_DEPTH = 64;
    // Consecutive zero-width matches allowed at one offset before the engine
    // forces progress and restores the stack the run started from.
    static constexpr size_t MAX_ZERO_WIDTH_STEPS = 256;

   private:
    TokenStream(std::shared_ptr<const CompiledGrammar> grammar,
        std::string text,
        const std::vector<std::string>& initial_stack,
        size_t depth);

    void verify(const std::vector<std::string>& initial_stack) const;
    void step();
    void emit(size_t offset, const TokenType& type, size_t length);
    void emit_error_char();
    void run_delegate(const Delegate& d, size_t offset, size_t length);
    void apply(const StateTransition& t);
    size_t resolve(const std::string& state) const;

    std::shared_ptr<const CompiledGrammar> grammar_;
    std::string text_;
    std::vector<size_t> stack_;
    size_t pos_ = 0;
    size_t depth_ = 0;
    size_t zero_width_steps_ = 0;
    // Stack as it was before the current run of zero-width steps.
    std::vector<size_t> zero_width_base_;
    std::deque<Token> pending_;
};

TokenStream tokenize(std::shared_ptr<const CompiledGrammar> grammar, std::string text);
std::vector<Token> tokenize_all(std::shared_ptr<const CompiledGrammar> grammar, std::string text);

}  // namespace hilex
