#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "docqa_core/types/document.hpp"

namespace fs = std::filesystem;

namespace docqa_core {

class IngestionError : public std::exception {
 public:
  explicit IngestionError(const std::string& message) : message_(message) {}
  const char* what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

/**
 * @class MarkdownExtractor
 * @brief Turns a Markdown file into a cleaned Document with its heading outline.
 *
 * Cleaning is deliberately light: it only strips artifacts of HTML to Markdown
 * conversion (pandoc anchors, "headerlink" residue) and normalises whitespace,
 * so offsets stay meaningful to a reader of the source file.
 */
class MarkdownExtractor {
 public:
  // Checks if this extractor can handle the given file extension
  bool can_handle(const fs::path& file_path) const;

  /**
   * @brief Reads, hashes and cleans a file.
   * @param file_path Absolute or relative path of the Markdown file.
   * @param corpus_root Root the document's source_path is made relative to.
   * @throw IngestionError if the file cannot be read or is not valid UTF-8.
   */
  Document extract(const fs::path& file_path, const fs::path& corpus_root) const;

  // Builds a document from already-loaded raw Markdown.
  Document from_text(const std::string& source_path, const std::string& raw) const;

  // Hex SHA-256 of the given bytes
  std::string compute_hash_from_content(const std::string& content) const;

  static std::string clean_markdown(const std::string& raw);
  static std::vector<Heading> outline(const std::string& cleaned);

 protected:
  std::string get_string_content(const fs::path& file_path) const;
};

}  // namespace docqa_core
