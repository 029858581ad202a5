#pragma once

#include <sqlite_modern_cpp.h>

#include <iostream>

namespace docqa_core {

// Runs `body` inside one transaction. Commits when it returns, rolls back and
// rethrows when it throws, so a sidecar is either fully written or left empty.
template <typename Body>
void with_transaction(sqlite::database& db, Body&& body) {
  db << "BEGIN EXCLUSIVE;";
  try {
    body();
  } catch (...) {
    try {
      db << "ROLLBACK;";
    } catch (const sqlite::sqlite_exception& e) {
      std::cerr << "Warning: rollback failed: " << e.what() << std::endl;
    }
    throw;
  }
  db << "COMMIT;";
}

}  // namespace docqa_core
