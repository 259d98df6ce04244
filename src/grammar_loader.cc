#include "grammar_loader.hpp"

#include <fstream>
#include <nlohmann/json.hpp>
#include <utility>
#include <vector>

#include "HilexError.hpp"
#include "log.hpp"

namespace hilex {

using json = nlohmann::json;

namespace {

std::string type_name_of(const json& j) {
    return std::string(j.type_name());
}

std::string expect_string(const json& j, const std::string& where) {
    if (!j.is_string()) throw GrammarFormatError(where, "expected a string, got " + type_name_of(j));
    return j.get<std::string>();
}

bool expect_bool(const json& j, const std::string& where) {
    if (!j.is_boolean()) throw GrammarFormatError(where, "expected a boolean, got " + type_name_of(j));
    return j.get<bool>();
}

std::vector<std::string> expect_string_list(const json& j, const std::string& where) {
    if (!j.is_array()) throw GrammarFormatError(where, "expected an array of strings, got " + type_name_of(j));
    std::vector<std::string> out;
    for (size_t i = 0; i < j.size(); ++i) {
        out.push_back(expect_string(j[i], where + "[" + std::to_string(i) + "]"));
    }
    return out;
}

TokenType expect_token_type(const json& j, const std::string& where) {
    return string_to_tokentype(expect_string(j, where));
}

// "state": "#pop" or ["#pop", "tag"]
std::vector<StateTransition> parse_transitions(const json& j, const std::string& where) {
    try {
        if (j.is_string()) return parse_state_directive(j.get<std::string>());
        return parse_state_directives(expect_string_list(j, where));
    } catch (const InvalidDirectiveError& e) {
        throw GrammarFormatError(where, e.what());
    }
}

class GrammarReader {
   public:
    explicit GrammarReader(const GrammarResolver& resolver) : resolver_(resolver) {}

    Grammar read(const json& doc) {
        if (!doc.is_object()) throw GrammarFormatError("<document>", "expected an object, got " + type_name_of(doc));

        Grammar g;
        if (doc.contains("name")) g.name = expect_string(doc["name"], "name");
        if (doc.contains("aliases")) g.aliases = expect_string_list(doc["aliases"], "aliases");
        if (doc.contains("ignore_case")) g.ignore_case = expect_bool(doc["ignore_case"], "ignore_case");

        if (!doc.contains("states")) throw GrammarFormatError("states", "missing");
        const json& states = doc["states"];
        if (!states.is_object()) throw GrammarFormatError("states", "expected an object, got " + type_name_of(states));

        for (auto it = states.begin(); it != states.end(); ++it) {
            const std::string where = "states." + it.key();
            if (!it.value().is_array()) {
                throw GrammarFormatError(where, "expected an array of rules, got " + type_name_of(it.value()));
            }
            auto& rules = g.states[it.key()];
            for (size_t i = 0; i < it.value().size(); ++i) {
                rules.push_back(read_rule(it.value()[i], where + "[" + std::to_string(i) + "]"));
            }
        }

        if (doc.contains("confidence")) g.confidence = read_confidence(doc["confidence"], g.ignore_case);

        log::debug("loaded grammar '", g.name, "' with ", g.states.size(), " states");
        return g;
    }

   private:
    RawRule read_rule(const json& r, const std::string& where) {
        if (!r.is_object()) throw GrammarFormatError(where, "expected a rule object, got " + type_name_of(r));

        if (r.contains("include")) {
            if (r.size() != 1) throw GrammarFormatError(where, "'include' takes no other keys");
            return Include{expect_string(r["include"], where + ".include")};
        }

        if (r.contains("default")) {
            if (r.size() != 1) throw GrammarFormatError(where, "'default' takes no other keys");
            Rule rule;
            rule.action.transitions = parse_transitions(r["default"], where + ".default");
            return rule;
        }

        Rule rule;
        rule.pattern = read_pattern(r, where);

        int emitters = static_cast<int>(r.contains("token")) + static_cast<int>(r.contains("groups")) +
            static_cast<int>(r.contains("using"));
        if (emitters > 1) throw GrammarFormatError(where, "'token', 'groups' and 'using' are mutually exclusive");

        if (r.contains("token")) {
            const json& t = r["token"];
            if (!t.is_null()) rule.action.emission = Emit{expect_token_type(t, where + ".token")};
        } else if (r.contains("groups")) {
            rule.action.emission = read_groups(r["groups"], where + ".groups");
        } else if (r.contains("using")) {
            rule.action.emission = read_delegate(r, where);
        }

        if (r.contains("state")) rule.action.transitions = parse_transitions(r["state"], where + ".state");
        if (r.contains("combined")) {
            auto members = expect_string_list(r["combined"], where + ".combined");
            if (members.empty()) throw GrammarFormatError(where + ".combined", "needs at least one state");
            rule.action.transitions.push_back(combined(std::move(members)));
        }

        for (auto it = r.begin(); it != r.end(); ++it) {
            static const char* known[] = {"regex", "words", "prefix", "suffix", "token", "groups", "using",
                "using_state", "wrap", "state", "combined"};
            bool ok = false;
            for (const char* k : known) ok = ok || it.key() == k;
            if (!ok) throw GrammarFormatError(where, "unknown key '" + it.key() + "'");
        }
        return rule;
    }

    std::string read_pattern(const json& r, const std::string& where) {
        if (r.contains("regex") == r.contains("words")) {
            throw GrammarFormatError(where, "a rule needs exactly one of 'regex' or 'words'");
        }
        if (r.contains("regex")) return expect_string(r["regex"], where + ".regex");

        std::string prefix, suffix;
        if (r.contains("prefix")) prefix = expect_string(r["prefix"], where + ".prefix");
        if (r.contains("suffix")) suffix = expect_string(r["suffix"], where + ".suffix");
        auto list = expect_string_list(r["words"], where + ".words");
        if (list.empty()) throw GrammarFormatError(where + ".words", "needs at least one word");
        return words(list, prefix, suffix);
    }

    EmitGroups read_groups(const json& j, const std::string& where) {
        if (!j.is_array()) throw GrammarFormatError(where, "expected an array, got " + type_name_of(j));
        EmitGroups groups;
        for (size_t i = 0; i < j.size(); ++i) {
            const std::string at = where + "[" + std::to_string(i) + "]";
            const json& g = j[i];
            if (g.is_null()) {
                groups.groups.emplace_back(std::monostate{});
            } else if (g.is_string()) {
                groups.groups.emplace_back(string_to_tokentype(g.get<std::string>()));
            } else if (g.is_object() && g.contains("using")) {
                groups.groups.emplace_back(read_delegate(g, at));
            } else {
                throw GrammarFormatError(at, "expected a token type, null or {\"using\": ...}");
            }
        }
        return groups;
    }

    Delegate read_delegate(const json& r, const std::string& where) {
        const std::string target = expect_string(r["using"], where + ".using");
        std::string state;
        if (r.contains("using_state")) state = expect_string(r["using_state"], where + ".using_state");

        Delegate d;
        if (target == "this") {
            d = using_this(state);
        } else {
            std::shared_ptr<const CompiledGrammar> other = resolver_ ? resolver_(target) : nullptr;
            if (!other) throw GrammarFormatError(where + ".using", "unknown grammar '" + target + "'");
            d = using_grammar(std::move(other), state);
        }

        if (r.contains("wrap")) {
            const json& w = r["wrap"];
            if (w.is_boolean()) {
                d.wrap = w.get<bool>();
            } else {
                d.wrap = true;
                d.wrap_type = expect_token_type(w, where + ".wrap");
            }
        }
        return d;
    }

    std::function<double(std::string_view)> read_confidence(const json& j, bool ignore_case) {
        if (!j.is_array()) throw GrammarFormatError("confidence", "expected an array, got " + type_name_of(j));

        std::vector<std::pair<boost::regex, double>> checks;
        for (size_t i = 0; i < j.size(); ++i) {
            const std::string where = "confidence[" + std::to_string(i) + "]";
            const json& c = j[i];
            if (!c.is_object() || !c.contains("regex") || !c.contains("score")) {
                throw GrammarFormatError(where, "expected {\"regex\": ..., \"score\": ...}");
            }
            if (!c["score"].is_number()) throw GrammarFormatError(where + ".score", "expected a number");
            const std::string pattern = expect_string(c["regex"], where + ".regex");
            try {
                checks.emplace_back(boost::regex(pattern, pattern_flags(ignore_case)), c["score"].get<double>());
            } catch (const boost::regex_error& e) {
                throw GrammarFormatError(where + ".regex", std::string("cannot compile '") + pattern + "': " + e.what());
            }
        }

        return [checks = std::move(checks)](std::string_view text) {
            double best = 0.0;
            for (const auto& [re, score] : checks) {
                if (score <= best) continue;
                try {
                    if (boost::regex_search(text.begin(), text.end(), re)) best = score;
                } catch (const boost::regex_error& e) {
                    log::warn("confidence pattern '", re.str(), "' failed: ", e.what());
                }
            }
            return best;
        };
    }

    const GrammarResolver& resolver_;
};

}  // namespace

Grammar load_grammar(const json& doc, const GrammarResolver& resolver) {
    return GrammarReader(resolver).read(doc);
}

Grammar parse_grammar(const std::string& text, const GrammarResolver& resolver) {
    json doc;
    try {
        doc = json::parse(text);
    } catch (const json::parse_error& e) {
        throw GrammarFormatError("<document>", e.what());
    }
    return load_grammar(doc, resolver);
}

namespace {

json read_json_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) throw GrammarFormatError(path, "cannot open file");
    try {
        return json::parse(file);
    } catch (const json::parse_error& e) {
        throw GrammarFormatError(path, e.what());
    }
}

}  // namespace

Grammar load_grammar_file(const std::string& path, const GrammarResolver& resolver) {
    json doc = read_json_file(path);
    try {
        return load_grammar(doc, resolver);
    } catch (const GrammarFormatError& e) {
        log::debug("grammar file '", path, "' rejected: ", e.what());
        throw;
    }
}

LexerOptions load_lexer_options(const json& doc, LexerOptions base) {
    if (!doc.is_object()) throw GrammarFormatError("options", "expected an object, got " + type_name_of(doc));

    for (auto it = doc.begin(); it != doc.end(); ++it) {
        const std::string& key = it.key();
        const std::string where = "options." + key;
        const json& v = it.value();

        if (key == "strip_leading_trailing_newlines" || key == "stripnl") {
            base.strip_leading_trailing_newlines = expect_bool(v, where);
        } else if (key == "strip_all" || key == "stripall") {
            base.strip_all = expect_bool(v, where);
        } else if (key == "ensure_trailing_newline" || key == "ensurenl") {
            base.ensure_trailing_newline = expect_bool(v, where);
        } else if (key == "normalize_newlines") {
            base.normalize_newlines = expect_bool(v, where);
        } else if (key == "tab_size" || key == "tabsize") {
            if (!v.is_number_integer() || v.get<long long>() < 0) {
                throw GrammarFormatError(where, "expected a non-negative integer");
            }
            base.tab_size = v.get<size_t>();
        } else if (key == "input_encoding" || key == "encoding") {
            base.input_encoding = expect_string(v, where);
        } else {
            log::warn("ignoring unknown lexer option '", key, "'");
        }
    }
    return base;
}

std::shared_ptr<Lexer> load_lexer_file(const std::string& path, const GrammarResolver& resolver) {
    json doc = read_json_file(path);
    Grammar grammar = load_grammar(doc, resolver);
    LexerOptions options;
    if (doc.contains("options")) options = load_lexer_options(doc["options"]);
    log::info("loaded lexer '", grammar.name, "' from ", path);
    return std::make_shared<Lexer>(compile(grammar), options);
}

}  // namespace hilex
