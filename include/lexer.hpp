#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "compiled_grammar.hpp"
#include "lexer_engine.hpp"
#include "token_type.hpp"

namespace hilex {

// Input normalization applied once, before the engine sees the text.
struct LexerOptions {
    bool strip_leading_trailing_newlines = true;
    // strip all leading/trailing whitespace (wins over the newline-only strip)
    bool strip_all = false;
    bool ensure_trailing_newline = true;
    // 0 = keep tabs
    size_t tab_size = 0;
    // only used by get_tokens_from_bytes: utf-8, latin-1, ascii or guess
    std::string input_encoding = "utf-8";
    // CRLF and lone CR become LF
    bool normalize_newlines = true;
};

class Lexer {
   public:
    // Throws UnknownEncodingError for an unsupported options.input_encoding.
    Lexer(std::shared_ptr<const CompiledGrammar> grammar, LexerOptions options = {});
    virtual ~Lexer() = default;

    const std::string& name() const { return grammar_->name(); }
    const std::vector<std::string>& aliases() const { return grammar_->aliases(); }
    const LexerOptions& options() const { return options_; }
    const std::shared_ptr<const CompiledGrammar>& grammar() const { return grammar_; }

    // Lazy token stream over the normalized text (the stream owns it).
    TokenStream get_tokens(std::string text) const;
    // Decodes raw bytes with options().input_encoding first.
    TokenStream get_tokens_from_bytes(const std::string& bytes) const;

    std::vector<Token> tokenize(std::string text) const;

    std::string preprocess(std::string text) const;
    std::string decode(const std::string& bytes) const;

    // How likely `text` is written in this lexer's language, 0.0 .. 1.0.
    // Uses the grammar's heuristic when it has one.
    virtual double estimate_confidence(std::string_view text) const;

    static bool is_supported_encoding(const std::string& encoding);

   private:
    std::shared_ptr<const CompiledGrammar> grammar_;
    LexerOptions options_;
};

// Column-aware tab expansion; columns restart after every '\n'.
std::string expand_tabs(const std::string& text, size_t tab_size);

}  // namespace hilex
