/***
 * Name: spindle::sema::tagLastLines
 * Purpose: Mark the narrative line that immediately precedes an option group.
 * Theory of Operation:
 *   Embedders show that line together with the choices, so it receives the
 *   `lastline` hashtag. Runs over every statement list, including option
 *   bodies and if/else arms.
 */
#pragma once

#include "ast/File.h"

namespace spindle::sema {

inline constexpr const char* kLastLineTag = "lastline";

void tagLastLines(ast::File& file);

} // namespace spindle::sema
