/**
 * Name: spindle::lex::Lexer
 * Purpose: Tokenize one expression fragment (the inside of `{...}` or of a
 *          `<<...>>` statement) into a token stream.
 * Theory of Operation:
 *   The fragment is scanned eagerly when pushed; columns are reported relative
 *   to the enclosing source line via the column offset. Unknown characters and
 *   unterminated strings throw exceptions::ParseError, which the parser turns
 *   into a diagnostic for the line.
 */
#pragma once

#include <cstddef>
#include <string>
#include <vector>
#include "lexer/Token.h"

namespace spindle::lex {

class Lexer : public TokenStream {
public:
    Lexer() = default;

    // `col` is the 1-based column of text[0] within its source line.
    void pushString(const std::string& text, const std::string& file, int line, int col);

    // TokenStream
    const Token& peek(size_t lookahead = 0) override;

    Token next() override;

    std::vector<Token> tokens() const { return tokens_; }

private:
    std::vector<Token> tokens_{};
    size_t pos_{0};
    Token end_{};
};

} // namespace spindle::lex
