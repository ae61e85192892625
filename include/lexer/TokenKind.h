/**
 * Name: spindle::lex::TokenKind
 * Purpose: Token kinds for the expression lexer.
 */
#pragma once

namespace spindle::lex {

enum class TokenKind {
    End, // end of expression text

    Number, // 12, 3.5
    String, // "text" (text holds the unescaped contents)
    Variable, // $name
    Ident, // function name, node name, type name
    True, // true
    False, // false

    LParen, // (
    RParen, // )
    Comma, // ,
    Equal, // = (set/declare)
    To, // to (set)
    As, // as (declare)

    Plus, // +
    Minus, // -
    Star, // *
    Slash, // /
    Percent, // %

    Not, // ! not
    And, // && and
    Or, // || or
    Xor, // ^ xor
    EqEq, // == is eq
    NotEq, // != neq
    Lt, // < lt
    Le, // <= lte
    Gt, // > gt
    Ge // >= gte
};

// Convert TokenKind to a stable string for diagnostics/logging
const char* to_string(TokenKind k);

} // namespace spindle::lex
