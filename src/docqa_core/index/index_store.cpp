#include "docqa_core/index/index_store.hpp"

#include <faiss/impl/FaissException.h>
#include <faiss/index_io.h>
#include <fcntl.h>
#include <sqlite_modern_cpp.h>
#include <unistd.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>

#include "docqa_core/db/sqlite_error_utils.hpp"
#include "docqa_core/db/transaction.hpp"
#include "docqa_core/services/compression_service.hpp"

namespace fs = std::filesystem;

namespace docqa_core {

IndexStore::IndexStore(fs::path root, size_t generations_to_keep)
    : root_(std::move(root)), generations_to_keep_(std::max<size_t>(1, generations_to_keep)) {}

std::string IndexStore::time_point_to_string(const std::chrono::system_clock::time_point &tp) {
  auto time_t = std::chrono::system_clock::to_time_t(tp);
  std::stringstream ss;
  ss << std::put_time(std::gmtime(&time_t), "%Y-%m-%d %H:%M:%S");
  return ss.str();
}

std::chrono::system_clock::time_point IndexStore::string_to_time_point(const std::string &time_str) {
  std::tm tm_struct = {};
  std::stringstream ss(time_str);
  ss >> std::get_time(&tm_struct, "%Y-%m-%d %H:%M:%S");
  if (ss.fail()) {
    throw IndexStoreError("Failed to parse time string: " + time_str +
                          ". Expected format YYYY-MM-DD HH:MM:SS.");
  }
  // We stored GMT time.
  return std::chrono::system_clock::from_time_t(timegm(&tm_struct));
}

std::string IndexStore::next_generation_id() const {
  auto now = std::chrono::system_clock::now();
  auto time_t = std::chrono::system_clock::to_time_t(now);
  auto millis =
      std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;
  std::stringstream ss;
  ss << std::put_time(std::gmtime(&time_t), "%Y%m%dT%H%M%S") << '-' << std::setw(3)
     << std::setfill('0') << millis;
  std::string base = ss.str();

  std::string id = base;
  for (int suffix = 1; fs::exists(generations_dir() / id) ||
                       fs::exists(generations_dir() / (id + ".partial"));
       ++suffix) {
    id = base + "." + std::to_string(suffix);
  }
  return id;
}

std::string IndexStore::save(const VectorIndex &index, IndexManifest &manifest) {
  if (index.empty()) {
    throw IndexStoreError("Refusing to persist an empty index");
  }

  const std::string generation = next_generation_id();
  const fs::path partial_dir = generations_dir() / (generation + ".partial");
  const fs::path final_dir = generations_dir() / generation;

  manifest.generation = generation;
  manifest.dimension = index.dimension();
  manifest.chunk_count = index.size();
  if (manifest.embedding_model.empty()) {
    manifest.embedding_model = index.embedding_model();
  }

  try {
    fs::create_directories(partial_dir);
    write_vectors(index, partial_dir / VECTORS_FILE);
    write_sidecar(index, manifest, partial_dir / METADATA_FILE);
    sync_to_disk(partial_dir / VECTORS_FILE);
    sync_to_disk(partial_dir / METADATA_FILE);
    sync_to_disk(partial_dir);
    fs::rename(partial_dir, final_dir);
    sync_to_disk(generations_dir());
  } catch (const fs::filesystem_error &e) {
    std::error_code ec;
    fs::remove_all(partial_dir, ec);
    throw IndexStoreError("Failed to write generation " + generation + ": " + e.what());
  } catch (const IndexStoreError &) {
    std::error_code ec;
    fs::remove_all(partial_dir, ec);
    throw;
  }

  std::cout << "IndexStore: wrote generation " << generation << " (" << manifest.chunk_count
            << " chunks, dim " << manifest.dimension << ")" << std::endl;
  return generation;
}

void IndexStore::publish(const std::string &generation) {
  if (!fs::is_directory(generations_dir() / generation)) {
    throw IndexStoreError("Cannot publish unknown generation: " + generation);
  }
  const fs::path tmp = root_ / (std::string(CURRENT_FILE) + ".tmp");
  {
    std::ofstream out(tmp, std::ios::trunc);
    if (!out.is_open()) {
      throw IndexStoreError("Failed to open " + tmp.string() + " for writing");
    }
    out << generation << '\n';
    out.flush();
    if (!out) {
      throw IndexStoreError("Failed to write " + tmp.string());
    }
  }
  sync_to_disk(tmp);
  std::error_code ec;
  fs::rename(tmp, root_ / CURRENT_FILE, ec);
  if (ec) {
    throw IndexStoreError("Failed to publish generation " + generation + ": " + ec.message());
  }
  sync_to_disk(root_);
}

void IndexStore::sync_to_disk(const fs::path &path) {
  int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
  if (fd < 0) {
    throw IndexStoreError("Failed to open " + path.string() + " for sync: " +
                          std::strerror(errno));
  }
  if (::fsync(fd) != 0) {
    int error = errno;
    ::close(fd);
    throw IndexStoreError("Failed to sync " + path.string() + ": " + std::strerror(error));
  }
  ::close(fd);
}

std::optional<std::string> IndexStore::current_generation() const {
  std::ifstream in(root_ / CURRENT_FILE);
  if (!in.is_open()) {
    return std::nullopt;
  }
  std::string generation;
  std::getline(in, generation);
  while (!generation.empty() && std::isspace(static_cast<unsigned char>(generation.back()))) {
    generation.pop_back();
  }
  if (generation.empty()) {
    return std::nullopt;
  }
  return generation;
}

std::vector<std::string> IndexStore::list_generations() const {
  std::vector<std::string> generations;
  std::error_code ec;
  if (!fs::is_directory(generations_dir(), ec)) {
    return generations;
  }
  for (const auto &entry : fs::directory_iterator(generations_dir())) {
    if (!entry.is_directory()) {
      continue;
    }
    std::string name = entry.path().filename().string();
    if (name.size() > 8 && name.compare(name.size() - 8, 8, ".partial") == 0) {
      continue;
    }
    generations.push_back(name);
  }
  std::sort(generations.begin(), generations.end());
  return generations;
}

std::optional<StoredIndex> IndexStore::load_current() const {
  auto generation = current_generation();
  if (!generation) {
    return std::nullopt;
  }
  return load(*generation);
}

StoredIndex IndexStore::load(const std::string &generation) const {
  const fs::path dir = generations_dir() / generation;
  if (!fs::is_directory(dir)) {
    throw IndexStoreError("Generation directory missing: " + dir.string());
  }

  std::vector<Chunk> chunks;
  IndexManifest manifest = read_sidecar(dir / METADATA_FILE, chunks);
  manifest.generation = generation;
  std::unique_ptr<faiss::IndexFlatIP> vectors = read_vectors(dir / VECTORS_FILE);

  if (static_cast<int>(vectors->d) != manifest.dimension) {
    throw IndexStoreError("Generation " + generation + " dimension mismatch: vectors have " +
                          std::to_string(vectors->d) + ", manifest says " +
                          std::to_string(manifest.dimension));
  }
  try {
    auto index = std::make_shared<const VectorIndex>(std::move(vectors), std::move(chunks),
                                                     manifest.embedding_model);
    return {index, manifest};
  } catch (const VectorIndexError &e) {
    throw IndexStoreError("Generation " + generation + " is inconsistent: " + e.what());
  }
}

void IndexStore::prune() {
  std::error_code ec;
  if (!fs::is_directory(generations_dir(), ec)) {
    return;
  }
  // Leftovers of interrupted builds
  for (const auto &entry : fs::directory_iterator(generations_dir())) {
    std::string name = entry.path().filename().string();
    if (name.size() > 8 && name.compare(name.size() - 8, 8, ".partial") == 0) {
      fs::remove_all(entry.path(), ec);
    }
  }

  auto current = current_generation();
  std::vector<std::string> generations = list_generations();
  size_t kept = 0;
  for (auto it = generations.rbegin(); it != generations.rend(); ++it) {
    bool is_current = current && *current == *it;
    if (is_current || kept < generations_to_keep_) {
      ++kept;
      continue;
    }
    fs::remove_all(generations_dir() / *it, ec);
    if (ec) {
      std::cerr << "Warning: failed to remove stale generation " << *it << ": " << ec.message()
                << std::endl;
    } else {
      std::cout << "IndexStore: pruned generation " << *it << std::endl;
    }
  }
}

void IndexStore::write_vectors(const VectorIndex &index, const fs::path &path) const {
  try {
    faiss::write_index(index.faiss_index(), path.string().c_str());
  } catch (const faiss::FaissException &e) {
    throw IndexStoreError("Failed to write vector store " + path.string() + ": " + e.what());
  }
}

std::unique_ptr<faiss::IndexFlatIP> IndexStore::read_vectors(const fs::path &path) const {
  if (!fs::exists(path)) {
    throw IndexStoreError("Vector store missing: " + path.string());
  }
  std::unique_ptr<faiss::Index> raw;
  try {
    raw.reset(faiss::read_index(path.string().c_str()));
  } catch (const faiss::FaissException &e) {
    throw IndexStoreError("Failed to read vector store " + path.string() + ": " + e.what());
  }
  auto *flat = dynamic_cast<faiss::IndexFlatIP *>(raw.get());
  if (!flat) {
    throw IndexStoreError("Vector store " + path.string() + " is not an inner-product flat index");
  }
  raw.release();
  return std::unique_ptr<faiss::IndexFlatIP>(flat);
}

void IndexStore::write_sidecar(const VectorIndex &index,
                               const IndexManifest &manifest,
                               const fs::path &path) const {
  try {
    sqlite::database db(path.string());
    db << "PRAGMA journal_mode = DELETE;";

    db << R"(
        CREATE TABLE manifest (
            key TEXT PRIMARY KEY,
            value TEXT NOT NULL
        )
      )";
    db << R"(
        CREATE TABLE documents (
            source_path TEXT PRIMARY KEY,
            content_hash TEXT NOT NULL,
            chunk_count INTEGER NOT NULL
        )
      )";
    // row is the faiss row of the chunk's vector
    db << R"(
        CREATE TABLE chunks (
            row INTEGER PRIMARY KEY,
            chunk_id TEXT UNIQUE NOT NULL,
            source_path TEXT NOT NULL,
            section_heading TEXT NOT NULL,
            ordinal INTEGER NOT NULL,
            start_offset INTEGER NOT NULL,
            end_offset INTEGER NOT NULL,
            content BLOB NOT NULL
        )
      )";

    with_transaction(db, [&]() {
      auto put = [&db](const std::string &key, const std::string &value) {
        db << "INSERT INTO manifest (key, value) VALUES (?, ?)" << key << value;
      };
      put("embedding_model", manifest.embedding_model);
      put("dimension", std::to_string(manifest.dimension));
      put("chunk_count", std::to_string(manifest.chunk_count));
      put("corpus_fingerprint", manifest.corpus_fingerprint);
      put("built_at", time_point_to_string(manifest.built_at));

      for (const auto &document : manifest.documents) {
        db << "INSERT INTO documents (source_path, content_hash, chunk_count) VALUES (?, ?, ?)"
           << document.source_path << document.content_hash << document.chunk_count;
      }

      const auto &chunks = index.chunks();
      for (size_t row = 0; row < chunks.size(); ++row) {
        const Chunk &chunk = chunks[row];
        db << "INSERT INTO chunks (row, chunk_id, source_path, section_heading, ordinal, "
              "start_offset, end_offset, content) VALUES (?, ?, ?, ?, ?, ?, ?, ?)"
           << static_cast<int64_t>(row) << chunk.id << chunk.source_path << chunk.section_heading
           << chunk.ordinal << static_cast<int64_t>(chunk.start_offset)
           << static_cast<int64_t>(chunk.end_offset) << CompressionService::compress(chunk.text);
      }
    });
  } catch (const sqlite::sqlite_exception &e) {
    throw IndexStoreError(describe_sidecar_error("Writing metadata sidecar", path.string(), e));
  } catch (const std::runtime_error &e) {
    throw IndexStoreError("Failed to compress chunk content for " + path.string() + ": " +
                          e.what());
  }
}

IndexManifest IndexStore::read_sidecar(const fs::path &path, std::vector<Chunk> &chunks) const {
  if (!fs::exists(path)) {
    throw IndexStoreError("Metadata sidecar missing: " + path.string());
  }
  IndexManifest manifest;
  try {
    sqlite::database db(path.string());

    db << "SELECT key, value FROM manifest" >> [&](std::string key, std::string value) {
      if (key == "embedding_model") {
        manifest.embedding_model = value;
      } else if (key == "dimension") {
        manifest.dimension = std::stoi(value);
      } else if (key == "chunk_count") {
        manifest.chunk_count = static_cast<size_t>(std::stoull(value));
      } else if (key == "corpus_fingerprint") {
        manifest.corpus_fingerprint = value;
      } else if (key == "built_at") {
        manifest.built_at = string_to_time_point(value);
      }
    };

    db << "SELECT source_path, content_hash, chunk_count FROM documents ORDER BY source_path" >>
        [&](std::string source_path, std::string content_hash, int chunk_count) {
          manifest.documents.push_back({source_path, content_hash, chunk_count});
        };

    db << "SELECT row, chunk_id, source_path, section_heading, ordinal, start_offset, "
          "end_offset, content FROM chunks ORDER BY row" >>
        [&](int64_t row, std::string chunk_id, std::string source_path,
            std::string section_heading, int ordinal, int64_t start_offset, int64_t end_offset,
            std::vector<char> content) {
          if (row != static_cast<int64_t>(chunks.size())) {
            throw IndexStoreError("Metadata sidecar has a gap at row " + std::to_string(row));
          }
          Chunk chunk;
          chunk.id = std::move(chunk_id);
          chunk.source_path = std::move(source_path);
          chunk.section_heading = std::move(section_heading);
          chunk.ordinal = ordinal;
          chunk.start_offset = static_cast<size_t>(start_offset);
          chunk.end_offset = static_cast<size_t>(end_offset);
          chunk.text = CompressionService::decompress(content);
          chunks.push_back(std::move(chunk));
        };
  } catch (const sqlite::sqlite_exception &e) {
    throw IndexStoreError(describe_sidecar_error("Reading metadata sidecar", path.string(), e));
  } catch (const std::logic_error &e) {
    throw IndexStoreError("Malformed manifest in " + path.string() + ": " + e.what());
  } catch (const std::runtime_error &e) {
    throw IndexStoreError("Corrupt chunk content in " + path.string() + ": " + e.what());
  }

  if (manifest.chunk_count != chunks.size()) {
    throw IndexStoreError("Manifest lists " + std::to_string(manifest.chunk_count) +
                          " chunks but sidecar holds " + std::to_string(chunks.size()));
  }
  return manifest;
}

}  // namespace docqa_core
