#include "token_type.hpp"

#include <memory>
#include <mutex>
#include <unordered_map>

namespace hilex {

struct TokenType::Node {
    std::vector<std::string> segments;
    std::string path;
    const Node* parent = nullptr;
    size_t depth = 0;
    size_t hash = 0;
};

namespace {

// Append-only: nodes are never removed or mutated once published, so the
// lock only guards the map itself and Node pointers stay valid forever.
struct InternTable {
    std::mutex mutex;
    std::unordered_map<std::string, std::unique_ptr<TokenType::Node>> by_path;
    TokenType::Node root;

    InternTable() {
        root.hash = std::hash<std::string>{}(root.path);
    }
};

InternTable& table() {
    static InternTable t;
    return t;
}

std::vector<std::string> split_dotted(std::string_view dotted) {
    std::vector<std::string> parts;
    size_t start = 0;
    while (start <= dotted.size()) {
        size_t dot = dotted.find('.', start);
        if (dot == std::string_view::npos) dot = dotted.size();
        if (dot > start) parts.emplace_back(dotted.substr(start, dot - start));
        start = dot + 1;
    }
    return parts;
}

}  // namespace

TokenType::TokenType() : node_(&table().root) {}

TokenType TokenType::root() {
    return TokenType(&table().root);
}

TokenType TokenType::from_segments(const std::vector<std::string>& segments) {
    InternTable& t = table();
    std::lock_guard<std::mutex> lock(t.mutex);

    const Node* current = &t.root;
    for (const auto& seg : segments) {
        if (seg.empty()) continue;
        std::string path = current->path.empty() ? seg : current->path + "." + seg;
        auto it = t.by_path.find(path);
        if (it != t.by_path.end()) {
            current = it->second.get();
            continue;
        }
        auto node = std::make_unique<Node>();
        node->segments = current->segments;
        node->segments.push_back(seg);
        node->path = path;
        node->parent = current;
        node->depth = current->depth + 1;
        node->hash = std::hash<std::string>{}(path);
        current = node.get();
        t.by_path.emplace(std::move(path), std::move(node));
    }
    return TokenType(current);
}

TokenType TokenType::intern(std::string_view dotted) {
    return from_segments(split_dotted(dotted));
}

TokenType TokenType::child(std::string_view name) const {
    std::vector<std::string> segs = node_->segments;
    for (auto& part : split_dotted(name)) segs.push_back(std::move(part));
    return from_segments(segs);
}

std::optional<TokenType> TokenType::parent() const {
    if (!node_->parent) return std::nullopt;
    return TokenType(node_->parent);
}

bool TokenType::is_root() const {
    return node_->parent == nullptr;
}

size_t TokenType::depth() const {
    return node_->depth;
}

const std::vector<std::string>& TokenType::segments() const {
    return node_->segments;
}

const std::string& TokenType::path() const {
    return node_->path;
}

std::string TokenType::to_string() const {
    return node_->path.empty() ? "Token" : "Token." + node_->path;
}

bool TokenType::is_subtype_of(const TokenType& other) const {
    if (node_->depth < other.node_->depth) return false;
    const Node* n = node_;
    while (n->depth > other.node_->depth) n = n->parent;
    return n == other.node_ || n->path == other.node_->path;
}

size_t TokenType::hash() const {
    return node_->hash;
}

bool operator==(const TokenType& a, const TokenType& b) {
    return a.node_ == b.node_ || a.node_->path == b.node_->path;
}

bool operator<(const TokenType& a, const TokenType& b) {
    return a.node_->path < b.node_->path;
}

std::ostream& operator<<(std::ostream& os, const TokenType& t) {
    return os << t.to_string();
}

std::ostream& operator<<(std::ostream& os, const Token& t) {
    return os << "(" << t.offset << ", " << t.type << ", \"" << t.value << "\")";
}

TokenType string_to_tokentype(std::string_view s) {
    std::vector<std::string> parts = split_dotted(s);
    if (!parts.empty() && parts.front() == "Token") parts.erase(parts.begin());
    if (!parts.empty() && (parts.front() == "String" || parts.front() == "Number")) {
        parts.insert(parts.begin(), "Literal");
    }
    return TokenType::from_segments(parts);
}

const std::vector<std::pair<TokenType, std::string>>& standard_types() {
    static const std::vector<std::pair<TokenType, std::string>> types = {
        {tok::Token, ""},
        {tok::Text, ""},
        {tok::Whitespace, "w"},
        {tok::Escape, "esc"},
        {tok::Error, "err"},
        {tok::Other, "x"},

        {tok::Keyword, "k"},
        {tok::KeywordConstant, "kc"},
        {tok::KeywordDeclaration, "kd"},
        {tok::KeywordNamespace, "kn"},
        {tok::KeywordPseudo, "kp"},
        {tok::KeywordReserved, "kr"},
        {tok::KeywordType, "kt"},

        {tok::Name, "n"},
        {tok::NameAttribute, "na"},
        {tok::NameBuiltin, "nb"},
        {tok::NameBuiltinPseudo, "bp"},
        {tok::NameClass, "nc"},
        {tok::NameConstant, "no"},
        {tok::NameDecorator, "nd"},
        {tok::NameEntity, "ni"},
        {tok::NameException, "ne"},
        {tok::NameFunction, "nf"},
        {tok::NameFunctionMagic, "fm"},
        {tok::NameProperty, "py"},
        {tok::NameLabel, "nl"},
        {tok::NameNamespace, "nn"},
        {tok::NameOther, "nx"},
        {tok::NameTag, "nt"},
        {tok::NameVariable, "nv"},
        {tok::NameVariableClass, "vc"},
        {tok::NameVariableGlobal, "vg"},
        {tok::NameVariableInstance, "vi"},
        {tok::NameVariableMagic, "vm"},

        {tok::Literal, "l"},
        {tok::LiteralDate, "ld"},

        {tok::String, "s"},
        {tok::StringAffix, "sa"},
        {tok::StringBacktick, "sb"},
        {tok::StringChar, "sc"},
        {tok::StringDelimiter, "dl"},
        {tok::StringDoc, "sd"},
        {tok::StringDouble, "s2"},
        {tok::StringEscape, "se"},
        {tok::StringHeredoc, "sh"},
        {tok::StringInterpol, "si"},
        {tok::StringOther, "sx"},
        {tok::StringRegex, "sr"},
        {tok::StringSingle, "s1"},
        {tok::StringSymbol, "ss"},

        {tok::Number, "m"},
        {tok::NumberBin, "mb"},
        {tok::NumberFloat, "mf"},
        {tok::NumberHex, "mh"},
        {tok::NumberInteger, "mi"},
        {tok::NumberIntegerLong, "il"},
        {tok::NumberOct, "mo"},

        {tok::Operator, "o"},
        {tok::OperatorWord, "ow"},

        {tok::Punctuation, "p"},
        {tok::PunctuationMarker, "pm"},

        {tok::Comment, "c"},
        {tok::CommentHashbang, "ch"},
        {tok::CommentMultiline, "cm"},
        {tok::CommentPreproc, "cp"},
        {tok::CommentPreprocFile, "cpf"},
        {tok::CommentSingle, "c1"},
        {tok::CommentSpecial, "cs"},

        {tok::Generic, "g"},
        {tok::GenericDeleted, "gd"},
        {tok::GenericEmph, "ge"},
        {tok::GenericError, "gr"},
        {tok::GenericHeading, "gh"},
        {tok::GenericInserted, "gi"},
        {tok::GenericOutput, "go"},
        {tok::GenericPrompt, "gp"},
        {tok::GenericStrong, "gs"},
        {tok::GenericSubheading, "gu"},
        {tok::GenericTraceback, "gt"},
    };
    return types;
}

std::string standard_short_name(const TokenType& t) {
    static const std::unordered_map<TokenType, std::string> names = [] {
        std::unordered_map<TokenType, std::string> m;
        for (const auto& entry : standard_types()) m.emplace(entry.first, entry.second);
        return m;
    }();

    std::string suffix;
    TokenType current = t;
    while (true) {
        auto it = names.find(current);
        if (it != names.end()) return it->second + suffix;
        suffix = "-" + current.segments().back() + suffix;
        current = *current.parent();
    }
}

}  // namespace hilex
