#pragma once

#include <functional>
#include <memory>
#include <nlohmann/json_fwd.hpp>
#include <string>

#include "compiled_grammar.hpp"
#include "grammar.hpp"
#include "lexer.hpp"

namespace hilex {

// Looks up the grammar behind a "using" reference. Returns nullptr when the
// name is unknown.
using GrammarResolver = std::function<std::shared_ptr<const CompiledGrammar>(const std::string&)>;

// Builds a Grammar from a JSON grammar document:
//
//   {"name": "...", "aliases": [...], "ignore_case": false,
//    "confidence": [{"regex": "...", "score": 0.5}],
//    "states": {"root": [ rule, ... ], ...}}
//
// where a rule is one of
//   {"include": "state"}
//   {"default": "directive" | [directives]}
//   {"regex": "..." | "words": [...], "prefix": "...", "suffix": "...",
//    "token": "Type" | null, "groups": [...], "using": "name" | "this",
//    "using_state": "...", "wrap": "Type",
//    "state": "directive" | [directives], "combined": [states]}
//
// Throws GrammarFormatError.
Grammar load_grammar(const nlohmann::json& doc, const GrammarResolver& resolver = nullptr);

// load_grammar() on JSON text; syntax errors become GrammarFormatError.
Grammar parse_grammar(const std::string& text, const GrammarResolver& resolver = nullptr);
Grammar load_grammar_file(const std::string& path, const GrammarResolver& resolver = nullptr);

// Overrides fields of `base` with the keys present in `doc`.
LexerOptions load_lexer_options(const nlohmann::json& doc, LexerOptions base = {});

// Grammar file plus its "options" object, compiled into a ready lexer.
std::shared_ptr<Lexer> load_lexer_file(const std::string& path, const GrammarResolver& resolver = nullptr);

}  // namespace hilex
