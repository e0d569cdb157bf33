// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <map>
#include <string>
#include <vector>

namespace cartograph {
namespace discovery {

// One parsed row: template field name -> value ("NEIGHBOR_NAME" -> "sw2")
using RawRecord = std::map<std::string, std::string>;

struct ParseResult {
  std::string template_name;  // template actually used (best match)
  std::vector<RawRecord> records;
  int score{0};  // parser confidence; higher is better
};

/**
 * TemplateParser - text parsing collaborator
 *
 * Turns raw CLI output into records using a named template (or the best
 * template in the family the name selects). Never throws for unparseable
 * text; a score of 0 with no records signals no match.
 */
class TemplateParser {
public:
  virtual ~TemplateParser() = default;

  virtual ParseResult Parse(const std::string& text, const std::string& template_name) = 0;
};

}  // namespace discovery
}  // namespace cartograph
