#include "docqa_core/extractors/markdown_extractor.hpp"

#include <openssl/evp.h>
#include <utf8.h>

#include <fstream>
#include <iomanip>
#include <regex>
#include <sstream>

namespace docqa_core {

bool MarkdownExtractor::can_handle(const fs::path& file_path) const {
  return file_path.extension() == ".md";
}

Document MarkdownExtractor::extract(const fs::path& file_path, const fs::path& corpus_root) const {
  std::string raw = get_string_content(file_path);
  std::string source_path = file_path.lexically_relative(corpus_root).generic_string();
  if (source_path.empty() || source_path.rfind("..", 0) == 0) {
    source_path = file_path.filename().generic_string();
  }
  return from_text(source_path, raw);
}

Document MarkdownExtractor::from_text(const std::string& source_path, const std::string& raw) const {
  if (!utf8::is_valid(raw.begin(), raw.end())) {
    throw IngestionError("Document is not valid UTF-8: " + source_path);
  }
  Document document;
  document.source_path = source_path;
  // Hash the raw bytes so the fingerprint changes even when cleaning would hide it
  document.content_hash = compute_hash_from_content(raw);
  document.text = clean_markdown(raw);
  document.headings = outline(document.text);
  return document;
}

std::string MarkdownExtractor::clean_markdown(const std::string& raw) {
  static const std::regex crlf_regex("\r\n?");
  static const std::regex anchor_regex(R"(\{#.*?\})");
  static const std::regex headerlink_regex("headerlink", std::regex_constants::ECMAScript |
                                                             std::regex_constants::icase);
  static const std::regex blank_lines_regex(R"(\n{3,})");
  static const std::regex spaces_regex(R"([ \t]+)");

  std::string text = std::regex_replace(raw, crlf_regex, "\n");
  text = std::regex_replace(text, anchor_regex, "");
  text = std::regex_replace(text, headerlink_regex, "");
  text = std::regex_replace(text, blank_lines_regex, "\n\n");
  text = std::regex_replace(text, spaces_regex, " ");

  const char* whitespace = " \t\n";
  size_t first = text.find_first_not_of(whitespace);
  if (first == std::string::npos) {
    return "";
  }
  size_t last = text.find_last_not_of(whitespace);
  return text.substr(first, last - first + 1);
}

std::vector<Heading> MarkdownExtractor::outline(const std::string& cleaned) {
  static const std::regex heading_regex(R"(^(#{1,6}) (.*)$)");
  std::vector<Heading> headings;
  bool in_fence = false;

  size_t line_start = 0;
  while (line_start < cleaned.size()) {
    size_t line_end = cleaned.find('\n', line_start);
    if (line_end == std::string::npos) {
      line_end = cleaned.size();
    }
    std::string line = cleaned.substr(line_start, line_end - line_start);

    // '#' lines inside fenced code are shell comments, not headings
    if (line.rfind("```", 0) == 0 || line.rfind("~~~", 0) == 0) {
      in_fence = !in_fence;
    } else if (!in_fence) {
      std::smatch match;
      if (std::regex_match(line, match, heading_regex)) {
        Heading heading;
        heading.offset = line_start;
        heading.length = line.size();
        heading.level = static_cast<int>(match[1].length());
        heading.title = match[2].str();
        while (!heading.title.empty() &&
               (heading.title.back() == '#' || heading.title.back() == ' ')) {
          heading.title.pop_back();
        }
        headings.push_back(std::move(heading));
      }
    }
    line_start = line_end + 1;
  }
  return headings;
}

std::string MarkdownExtractor::get_string_content(const fs::path& file_path) const {
  std::ifstream file_stream(file_path, std::ios::binary);
  if (!file_stream.is_open()) {
    throw IngestionError("Could not open file: " + file_path.string());
  }

  std::stringstream buffer;
  buffer << file_stream.rdbuf();
  if (file_stream.bad()) {
    throw IngestionError("Failed while reading file: " + file_path.string());
  }
  return buffer.str();
}

std::string MarkdownExtractor::compute_hash_from_content(const std::string& content) const {
  EVP_MD_CTX* mdctx = EVP_MD_CTX_new();
  if (!mdctx) {
    throw IngestionError("Failed to create EVP context for hashing");
  }

  if (EVP_DigestInit_ex(mdctx, EVP_sha256(), nullptr) != 1) {
    EVP_MD_CTX_free(mdctx);
    throw IngestionError("Failed to initialize SHA256 digest");
  }

  if (EVP_DigestUpdate(mdctx, content.data(), content.length()) != 1) {
    EVP_MD_CTX_free(mdctx);
    throw IngestionError("Failed to update SHA256 digest");
  }

  unsigned char hash[EVP_MAX_MD_SIZE];
  unsigned int hash_len;
  if (EVP_DigestFinal_ex(mdctx, hash, &hash_len) != 1) {
    EVP_MD_CTX_free(mdctx);
    throw IngestionError("Failed to finalize SHA256 digest");
  }

  EVP_MD_CTX_free(mdctx);

  std::stringstream ss;
  for (unsigned int i = 0; i < hash_len; i++) {
    ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);
  }

  return ss.str();
}

}  // namespace docqa_core
