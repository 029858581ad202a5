#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace docqa_core {

struct Heading {
  size_t offset = 0;  // byte offset of the leading '#'
  size_t length = 0;  // length of the heading line, excluding the newline
  int level = 0;
  std::string title;
};

// A cleaned Markdown document plus its heading outline.
struct Document {
  std::string source_path;  // relative to the corpus root
  std::string content_hash;
  std::string text;
  std::vector<Heading> headings;
};

}  // namespace docqa_core
