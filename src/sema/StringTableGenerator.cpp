/***
 * Name: spindle::sema::StringTableGenerator (impl)
 * Purpose: Assign line ids and fill the string table.
 */
#include "sema/StringTableGenerator.h"
#include "sema/detail/Helpers.h"

#include <string>
#include <utility>
#include <vector>

namespace spindle::sema {

static constexpr const char* kLineTagPrefix = "line:";

void StringTableGenerator::generate(const ast::File& file) {
  fileName_ = file.file;
  file.accept(*this);
}

void StringTableGenerator::visit(const ast::NodeDecl& n) {
  nodeName_ = n.title;
  implicitCounter_ = 0;
  if (n.hasTag("rawText")) {
    compiler::StringInfo info;
    info.text = n.rawBody;
    info.nodeName = n.title;
    info.lineNumber = n.bodyLine;
    info.fileName = fileName_;
    info.isImplicitTag = true;
    table_[std::string(kLineTagPrefix) + n.title] = std::move(info);
    return;
  }
  ast::Walker::visit(n);
}

void StringTableGenerator::visit(const ast::LineStmt& s) {
  s.lineId = assignId(s, s.text, s.hashtags);
  ast::Walker::visit(s);
}

void StringTableGenerator::visit(const ast::OptionItem& o) {
  o.lineId = assignId(o, o.text, o.hashtags);
  ast::Walker::visit(o);
}

std::string StringTableGenerator::assignId(const ast::Node& at, const ast::InterpolatedText& text,
                                           const std::vector<std::string>& hashtags) {
  compiler::StringInfo info;
  info.text = text.text;
  info.nodeName = nodeName_;
  info.lineNumber = at.line;
  info.fileName = fileName_;

  std::string id;
  for (const auto& tag : hashtags) {
    if (tag.rfind(kLineTagPrefix, 0) == 0) {
      if (tag == kLineTagPrefix) {
        addDiag(diags_, Severity::Error, "line id '#" + tag + "' is empty", &at);
        continue;
      }
      id = tag;
    } else {
      info.metadata.push_back(tag);
    }
  }
  if (id.empty()) {
    id = std::string(kLineTagPrefix) + fileName_ + "-" + nodeName_ + "-" + std::to_string(implicitCounter_++);
    info.isImplicitTag = true;
    implicit_ = true;
  }

  const auto existing = table_.find(id);
  if (existing != table_.end()) {
    addDiag(diags_, Severity::Error,
            "duplicate line id '" + id + "' (first used at " + existing->second.fileName + ":" +
                std::to_string(existing->second.lineNumber) + ")",
            &at);
    return id;
  }
  table_.emplace(id, std::move(info));
  return id;
}

} // namespace spindle::sema
