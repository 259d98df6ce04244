#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace hilex {

// Token types form a tree identified by dotted paths ("Keyword.Constant").
// Every node lives in a process-wide intern table, so a TokenType is just a
// handle to its node: cheap to copy, compared and hashed by path.
class TokenType {
   public:
    // The root type ("Token").
    TokenType();

    static TokenType root();

    // Canonical node for `segments`; ancestors are created and linked as needed.
    // Empty segments are ignored.
    static TokenType from_segments(const std::vector<std::string>& segments);
    // Dotted form, e.g. "Name.Builtin.Pseudo". The empty string is the root.
    static TokenType intern(std::string_view dotted);

    TokenType child(std::string_view name) const;

    // Empty for the root.
    std::optional<TokenType> parent() const;
    bool is_root() const;
    size_t depth() const;

    const std::vector<std::string>& segments() const;
    // Dotted path without the "Token" prefix; empty for the root.
    const std::string& path() const;
    // "Token.Keyword.Constant", or "Token" for the root.
    std::string to_string() const;

    // True iff `other`'s path is a whole-segment prefix of this path.
    // Reflexive: every type is a subtype of itself and of the root.
    bool is_subtype_of(const TokenType& other) const;

    size_t hash() const;

    friend bool operator==(const TokenType& a, const TokenType& b);
    friend bool operator!=(const TokenType& a, const TokenType& b) { return !(a == b); }
    friend bool operator<(const TokenType& a, const TokenType& b);

    struct Node;

   private:
    explicit TokenType(const Node* n) : node_(n) {}

    const Node* node_;
};

std::ostream& operator<<(std::ostream& os, const TokenType& t);

inline bool is_token_subtype(const TokenType& ttype, const TokenType& other) {
    return ttype.is_subtype_of(other);
}

// Parses "Token.Keyword.Reserved", "Keyword.Reserved", "Token" or "".
// "String" and "Number" at the top level resolve to their Literal.* nodes.
TokenType string_to_tokentype(std::string_view s);

// Short CSS-style class of the nearest standard ancestor, with any remaining
// segments appended after '-' ("Keyword.Constant" -> "kc",
// "Keyword.Constant.Extra" -> "kc-Extra", "Text.Extra" -> "-Extra",
// root -> "").
std::string standard_short_name(const TokenType& t);

// Every standard type with its short name, in table order.
const std::vector<std::pair<TokenType, std::string>>& standard_types();

// Standard token types.
namespace tok {
inline const TokenType Token = TokenType::root();

inline const TokenType Text = TokenType::intern("Text");
inline const TokenType Whitespace = TokenType::intern("Text.Whitespace");
inline const TokenType Escape = TokenType::intern("Escape");
inline const TokenType Error = TokenType::intern("Error");
inline const TokenType Other = TokenType::intern("Other");

inline const TokenType Keyword = TokenType::intern("Keyword");
inline const TokenType KeywordConstant = TokenType::intern("Keyword.Constant");
inline const TokenType KeywordDeclaration = TokenType::intern("Keyword.Declaration");
inline const TokenType KeywordNamespace = TokenType::intern("Keyword.Namespace");
inline const TokenType KeywordPseudo = TokenType::intern("Keyword.Pseudo");
inline const TokenType KeywordReserved = TokenType::intern("Keyword.Reserved");
inline const TokenType KeywordType = TokenType::intern("Keyword.Type");

inline const TokenType Name = TokenType::intern("Name");
inline const TokenType NameAttribute = TokenType::intern("Name.Attribute");
inline const TokenType NameBuiltin = TokenType::intern("Name.Builtin");
inline const TokenType NameBuiltinPseudo = TokenType::intern("Name.Builtin.Pseudo");
inline const TokenType NameClass = TokenType::intern("Name.Class");
inline const TokenType NameConstant = TokenType::intern("Name.Constant");
inline const TokenType NameDecorator = TokenType::intern("Name.Decorator");
inline const TokenType NameEntity = TokenType::intern("Name.Entity");
inline const TokenType NameException = TokenType::intern("Name.Exception");
inline const TokenType NameFunction = TokenType::intern("Name.Function");
inline const TokenType NameFunctionMagic = TokenType::intern("Name.Function.Magic");
inline const TokenType NameProperty = TokenType::intern("Name.Property");
inline const TokenType NameLabel = TokenType::intern("Name.Label");
inline const TokenType NameNamespace = TokenType::intern("Name.Namespace");
inline const TokenType NameOther = TokenType::intern("Name.Other");
inline const TokenType NameTag = TokenType::intern("Name.Tag");
inline const TokenType NameVariable = TokenType::intern("Name.Variable");
inline const TokenType NameVariableClass = TokenType::intern("Name.Variable.Class");
inline const TokenType NameVariableGlobal = TokenType::intern("Name.Variable.Global");
inline const TokenType NameVariableInstance = TokenType::intern("Name.Variable.Instance");
inline const TokenType NameVariableMagic = TokenType::intern("Name.Variable.Magic");

inline const TokenType Literal = TokenType::intern("Literal");
inline const TokenType LiteralDate = TokenType::intern("Literal.Date");

inline const TokenType String = TokenType::intern("Literal.String");
inline const TokenType StringAffix = TokenType::intern("Literal.String.Affix");
inline const TokenType StringBacktick = TokenType::intern("Literal.String.Backtick");
inline const TokenType StringChar = TokenType::intern("Literal.String.Char");
inline const TokenType StringDelimiter = TokenType::intern("Literal.String.Delimiter");
inline const TokenType StringDoc = TokenType::intern("Literal.String.Doc");
inline const TokenType StringDouble = TokenType::intern("Literal.String.Double");
inline const TokenType StringEscape = TokenType::intern("Literal.String.Escape");
inline const TokenType StringHeredoc = TokenType::intern("Literal.String.Heredoc");
inline const TokenType StringInterpol = TokenType::intern("Literal.String.Interpol");
inline const TokenType StringOther = TokenType::intern("Literal.String.Other");
inline const TokenType StringRegex = TokenType::intern("Literal.String.Regex");
inline const TokenType StringSingle = TokenType::intern("Literal.String.Single");
inline const TokenType StringSymbol = TokenType::intern("Literal.String.Symbol");

inline const TokenType Number = TokenType::intern("Literal.Number");
inline const TokenType NumberBin = TokenType::intern("Literal.Number.Bin");
inline const TokenType NumberFloat = TokenType::intern("Literal.Number.Float");
inline const TokenType NumberHex = TokenType::intern("Literal.Number.Hex");
inline const TokenType NumberInteger = TokenType::intern("Literal.Number.Integer");
inline const TokenType NumberIntegerLong = TokenType::intern("Literal.Number.Integer.Long");
inline const TokenType NumberOct = TokenType::intern("Literal.Number.Oct");

inline const TokenType Operator = TokenType::intern("Operator");
inline const TokenType OperatorWord = TokenType::intern("Operator.Word");

inline const TokenType Punctuation = TokenType::intern("Punctuation");
inline const TokenType PunctuationMarker = TokenType::intern("Punctuation.Marker");

inline const TokenType Comment = TokenType::intern("Comment");
inline const TokenType CommentHashbang = TokenType::intern("Comment.Hashbang");
inline const TokenType CommentMultiline = TokenType::intern("Comment.Multiline");
inline const TokenType CommentPreproc = TokenType::intern("Comment.Preproc");
inline const TokenType CommentPreprocFile = TokenType::intern("Comment.PreprocFile");
inline const TokenType CommentSingle = TokenType::intern("Comment.Single");
inline const TokenType CommentSpecial = TokenType::intern("Comment.Special");

inline const TokenType Generic = TokenType::intern("Generic");
inline const TokenType GenericDeleted = TokenType::intern("Generic.Deleted");
inline const TokenType GenericEmph = TokenType::intern("Generic.Emph");
inline const TokenType GenericError = TokenType::intern("Generic.Error");
inline const TokenType GenericHeading = TokenType::intern("Generic.Heading");
inline const TokenType GenericInserted = TokenType::intern("Generic.Inserted");
inline const TokenType GenericOutput = TokenType::intern("Generic.Output");
inline const TokenType GenericPrompt = TokenType::intern("Generic.Prompt");
inline const TokenType GenericStrong = TokenType::intern("Generic.Strong");
inline const TokenType GenericSubheading = TokenType::intern("Generic.Subheading");
inline const TokenType GenericTraceback = TokenType::intern("Generic.Traceback");
}  // namespace tok

// A single lexed token: byte offset into the lexed text, type and exact text.
struct Token {
    size_t offset = 0;
    TokenType type;
    std::string value;

    Token() = default;
    Token(size_t off, const TokenType& t, std::string v)
        : offset(off), type(t), value(std::move(v)) {}

    size_t end() const { return offset + value.size(); }

    std::string debug_string() const {
        return std::to_string(offset) + " " + type.to_string() + " [" + value + "]";
    }

    friend bool operator==(const Token& a, const Token& b) {
        return a.offset == b.offset && a.type == b.type && a.value == b.value;
    }
    friend bool operator!=(const Token& a, const Token& b) { return !(a == b); }
};

std::ostream& operator<<(std::ostream& os, const Token& t);

}  // namespace hilex

namespace std {
template <>
struct hash<hilex::TokenType> {
    size_t operator()(const hilex::TokenType& t) const noexcept { return t.hash(); }
};
}  // namespace std
