/***
 * Name: spindle::compiler::StringInfo
 * Purpose: One entry of the string table: an author-visible line and where it came from.
 */
#pragma once

#include <map>
#include <string>
#include <vector>

namespace spindle::compiler {

struct StringInfo {
    std::string text;          // with `{0}`-style substitution markers
    std::string nodeName;
    int lineNumber{0};
    std::string fileName;
    bool isImplicitTag{false}; // id was generated rather than written as #line:
    std::vector<std::string> metadata; // hashtags other than #line:

    bool operator==(const StringInfo& o) const {
        return text == o.text && nodeName == o.nodeName && lineNumber == o.lineNumber && fileName == o.fileName &&
               isImplicitTag == o.isImplicitTag && metadata == o.metadata;
    }
};

// Keyed by line id ("line:...").
using StringTable = std::map<std::string, StringInfo>;

} // namespace spindle::compiler
