#pragma once
#include <ostream>
#include <vector>

#include "token_type.hpp"

namespace hilex {

// Debug dump of a token list, one token per line.
void print_tokens(std::ostream& os, const std::vector<Token>& tokens);

}  // namespace hilex
