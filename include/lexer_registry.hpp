#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "grammar_loader.hpp"
#include "lexer.hpp"

namespace hilex {

// Lexers by name and alias. Lookups are case-insensitive.
class LexerRegistry {
   public:
    LexerRegistry() = default;
    LexerRegistry(const LexerRegistry&) = delete;
    LexerRegistry& operator=(const LexerRegistry&) = delete;

    // Process-wide instance.
    static LexerRegistry& global();

    // Registers under name() and every alias. A key that is already taken is
    // overwritten.
    void register_lexer(std::shared_ptr<const Lexer> lexer);

    // Throws LexerNotFoundError.
    std::shared_ptr<const Lexer> get_lexer_by_name(const std::string& alias) const;
    // nullptr when absent.
    std::shared_ptr<const Lexer> find(const std::string& alias) const;
    bool contains(const std::string& alias) const { return find(alias) != nullptr; }

    // Primary names of the registered lexers, sorted.
    std::vector<std::string> names() const;

    // Resolves "using" references in JSON grammars against this registry.
    GrammarResolver resolver() const;

   private:
    mutable std::mutex mu_;
    std::map<std::string, std::shared_ptr<const Lexer>> by_alias_;
};

// LexerRegistry::global().get_lexer_by_name(alias)
std::shared_ptr<const Lexer> get_lexer_by_name(const std::string& alias);

}  // namespace hilex
