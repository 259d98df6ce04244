#include "lexer_registry.hpp"

#include <algorithm>
#include <cctype>
#include <set>

#include "HilexError.hpp"
#include "log.hpp"

namespace hilex {

namespace {

std::string fold(const std::string& s) {
    std::string out = s;
    std::transform(out.begin(), out.end(), out.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

}  // namespace

LexerRegistry& LexerRegistry::global() {
    static LexerRegistry instance;
    return instance;
}

void LexerRegistry::register_lexer(std::shared_ptr<const Lexer> lexer) {
    if (!lexer) return;

    std::vector<std::string> keys{lexer->name()};
    keys.insert(keys.end(), lexer->aliases().begin(), lexer->aliases().end());

    std::lock_guard<std::mutex> lock(mu_);
    for (const auto& key : keys) {
        if (key.empty()) continue;
        auto& slot = by_alias_[fold(key)];
        if (slot && slot != lexer) {
            log::warn("lexer '", lexer->name(), "' replaces '", slot->name(), "' for alias '", key, "'");
        }
        slot = lexer;
    }
    log::debug("registered lexer '", lexer->name(), "' (", keys.size() - 1, " aliases)");
}

std::shared_ptr<const Lexer> LexerRegistry::find(const std::string& alias) const {
    std::lock_guard<std::mutex> lock(mu_);
    auto it = by_alias_.find(fold(alias));
    if (it == by_alias_.end()) return nullptr;
    return it->second;
}

std::shared_ptr<const Lexer> LexerRegistry::get_lexer_by_name(const std::string& alias) const {
    auto lexer = find(alias);
    if (!lexer) throw LexerNotFoundError(alias);
    return lexer;
}

std::vector<std::string> LexerRegistry::names() const {
    std::set<std::string> unique;
    {
        std::lock_guard<std::mutex> lock(mu_);
        for (const auto& entry : by_alias_) unique.insert(entry.second->name());
    }
    return std::vector<std::string>(unique.begin(), unique.end());
}

GrammarResolver LexerRegistry::resolver() const {
    return [this](const std::string& name) -> std::shared_ptr<const CompiledGrammar> {
        auto lexer = find(name);
        return lexer ? lexer->grammar() : nullptr;
    };
}

std::shared_ptr<const Lexer> get_lexer_by_name(const std::string& alias) {
    return LexerRegistry::global().get_lexer_by_name(alias);
}

}  // namespace hilex
