#include "print_tokens.hpp"

#include <string>

namespace hilex {

static std::string escaped(const std::string& value) {
    std::string out;
    for (char c : value) {
        switch (c) {
            case '\n': out += "\\n"; break;
            case '\t': out += "\\t"; break;
            case '\r': out += "\\r"; break;
            case '\'': out += "\\'"; break;
            default: out += c;
        }
    }
    return out;
}

void print_tokens(std::ostream& os, const std::vector<Token>& tokens) {
    os << "---- TOKEN DUMP (" << tokens.size() << " tokens) ----\n";
    for (size_t i = 0; i < tokens.size(); ++i) {
        const Token& tok = tokens[i];
        const std::string short_name = standard_short_name(tok.type);
        os << i << ": " << tok.type.to_string();
        if (!short_name.empty()) os << " (" << short_name << ")";
        os << " value='" << escaped(tok.value) << "'"
           << " offset=" << tok.offset << "\n";
    }
    os << "---- END TOKEN DUMP ----\n";
}

}  // namespace hilex
