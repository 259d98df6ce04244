#include "lexer.hpp"

#include <algorithm>
#include <cctype>

#include "HilexError.hpp"
#include "log.hpp"
#include "utf8.hpp"

namespace hilex {

namespace {

std::string normalize_encoding_name(const std::string& encoding) {
    std::string n;
    for (char c : encoding) {
        if (c == '_') c = '-';
        n.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    return n;
}

bool is_strip_space(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

}  // namespace

bool Lexer::is_supported_encoding(const std::string& encoding) {
    const std::string n = normalize_encoding_name(encoding);
    return n == "utf-8" || n == "utf8" || n == "latin-1" || n == "latin1" || n == "iso-8859-1" ||
        n == "ascii" || n == "us-ascii" || n == "guess";
}

Lexer::Lexer(std::shared_ptr<const CompiledGrammar> grammar, LexerOptions options)
    : grammar_(std::move(grammar)), options_(std::move(options)) {
    if (!grammar_) {
        throw MalformedCompiledGrammarError("lexer constructed without a grammar", GrammarLocation());
    }
    if (!is_supported_encoding(options_.input_encoding)) {
        throw UnknownEncodingError(options_.input_encoding);
    }
}

std::string Lexer::decode(const std::string& bytes) const {
    const std::string enc = normalize_encoding_name(options_.input_encoding);
    std::string text;

    if (enc == "latin-1" || enc == "latin1" || enc == "iso-8859-1") {
        return utf8::from_latin1(bytes);
    }

    if (enc == "ascii" || enc == "us-ascii") {
        text = bytes;
        size_t replaced = utf8::sanitize_ascii(text);
        if (replaced) log::warn(name(), ": replaced ", replaced, " non-ASCII bytes");
        return text;
    }

    if (enc == "guess") {
        size_t bad = 0;
        if (utf8::validate(bytes, bad)) return bytes;
        log::debug(name(), ": input is not UTF-8 (offset ", bad, "), decoding as latin-1");
        return utf8::from_latin1(bytes);
    }

    text = bytes;
    size_t replaced = utf8::sanitize(text);
    if (replaced) log::warn(name(), ": replaced ", replaced, " ill-formed UTF-8 bytes");
    return text;
}

std::string Lexer::preprocess(std::string text) const {
    if (utf8::has_bom(text)) text.erase(0, 3);

    if (options_.normalize_newlines && text.find('\r') != std::string::npos) {
        std::string out;
        out.reserve(text.size());
        for (size_t i = 0; i < text.size(); ++i) {
            if (text[i] == '\r') {
                out.push_back('\n');
                if (i + 1 < text.size() && text[i + 1] == '\n') ++i;
            } else {
                out.push_back(text[i]);
            }
        }
        text.swap(out);
    }

    if (options_.strip_all) {
        size_t b = 0;
        while (b < text.size() && is_strip_space(text[b])) ++b;
        size_t e = text.size();
        while (e > b && is_strip_space(text[e - 1])) --e;
        text = text.substr(b, e - b);
    } else if (options_.strip_leading_trailing_newlines) {
        size_t b = text.find_first_not_of('\n');
        if (b == std::string::npos) {
            text.clear();
        } else {
            size_t e = text.find_last_not_of('\n');
            text = text.substr(b, e - b + 1);
        }
    }

    if (options_.tab_size > 0) text = expand_tabs(text, options_.tab_size);

    if (options_.ensure_trailing_newline && (text.empty() || text.back() != '\n')) {
        text.push_back('\n');
    }
    return text;
}

TokenStream Lexer::get_tokens(std::string text) const {
    return TokenStream(grammar_, preprocess(std::move(text)));
}

TokenStream Lexer::get_tokens_from_bytes(const std::string& bytes) const {
    return get_tokens(decode(bytes));
}

std::vector<Token> Lexer::tokenize(std::string text) const {
    return get_tokens(std::move(text)).drain();
}

double Lexer::estimate_confidence(std::string_view text) const {
    return grammar_->confidence(text);
}

std::string expand_tabs(const std::string& text, size_t tab_size) {
    if (tab_size == 0 || text.find('\t') == std::string::npos) return text;

    std::string out;
    out.reserve(text.size() + 16);
    size_t column = 0;
    for (unsigned char c : text) {
        if (c == '\t') {
            size_t spaces = tab_size - (column % tab_size);
            out.append(spaces, ' ');
            column += spaces;
        } else if (c == '\n') {
            out.push_back('\n');
            column = 0;
        } else {
            out.push_back(static_cast<char>(c));
            // continuation bytes don't start a new column
            if ((c & 0xC0) != 0x80) ++column;
        }
    }
    return out;
}

}  // namespace hilex
