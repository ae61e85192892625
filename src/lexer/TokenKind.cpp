/***
 * Name: spindle::lex::to_string(TokenKind)
 * Purpose: Stable token kind names for diagnostics.
 */
#include "lexer/TokenKind.h"

namespace spindle::lex {

const char* to_string(const TokenKind k) {
  switch (k) {
    case TokenKind::End: return "End";
    case TokenKind::Number: return "Number";
    case TokenKind::String: return "String";
    case TokenKind::Variable: return "Variable";
    case TokenKind::Ident: return "Ident";
    case TokenKind::True: return "True";
    case TokenKind::False: return "False";
    case TokenKind::LParen: return "LParen";
    case TokenKind::RParen: return "RParen";
    case TokenKind::Comma: return "Comma";
    case TokenKind::Equal: return "Equal";
    case TokenKind::To: return "To";
    case TokenKind::As: return "As";
    case TokenKind::Plus: return "Plus";
    case TokenKind::Minus: return "Minus";
    case TokenKind::Star: return "Star";
    case TokenKind::Slash: return "Slash";
    case TokenKind::Percent: return "Percent";
    case TokenKind::Not: return "Not";
    case TokenKind::And: return "And";
    case TokenKind::Or: return "Or";
    case TokenKind::Xor: return "Xor";
    case TokenKind::EqEq: return "EqEq";
    case TokenKind::NotEq: return "NotEq";
    case TokenKind::Lt: return "Lt";
    case TokenKind::Le: return "Le";
    case TokenKind::Gt: return "Gt";
    case TokenKind::Ge: return "Ge";
    default: return "Unknown";
  }
}

} // namespace spindle::lex
