/***
 * Name: spindle::lex::Token / spindle::lex::TokenStream
 * Purpose: Tokens of one expression fragment and the stream interface the
 *          expression parser reads them through.
 */
#pragma once

#include <cstddef>
#include <string>
#include "lexer/TokenKind.h"

namespace spindle::lex {

struct Token {
    TokenKind kind{TokenKind::End};
    std::string text{}; // number text, variable name with '$', identifier, or unescaped string contents
    std::string file{};
    int line{1}; // 1-based line in the script
    int col{1};  // 1-based column in that line, not in the fragment

    bool is(TokenKind k) const { return kind == k; }
};

class TokenStream {
public:
    virtual ~TokenStream() = default;

    // Token `lookahead` positions ahead; End once the fragment is exhausted.
    virtual const Token& peek(std::size_t lookahead = 0) = 0;
    virtual Token next() = 0;
};

} // namespace spindle::lex
