#pragma once

#include <sqlite3.h>
#include <sqlite_modern_cpp.h>

#include <string>

namespace docqa_core {

// What went wrong with a metadata sidecar, as far as the operator can act on it.
enum class SidecarFault { Unreadable, Corrupt, Incompatible, OutOfSpace, Busy, Other };

inline SidecarFault classify_sidecar_fault(int primary_code) {
  switch (primary_code) {
    case SQLITE_CANTOPEN:
    case SQLITE_READONLY:
    case SQLITE_PERM:
    case SQLITE_IOERR:
      return SidecarFault::Unreadable;
    case SQLITE_CORRUPT:
    case SQLITE_NOTADB:
      return SidecarFault::Corrupt;
    case SQLITE_ERROR:
    case SQLITE_SCHEMA:
    case SQLITE_MISMATCH:
      return SidecarFault::Incompatible;
    case SQLITE_FULL:
      return SidecarFault::OutOfSpace;
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return SidecarFault::Busy;
    default:
      return SidecarFault::Other;
  }
}

inline const char* sidecar_fault_hint(SidecarFault fault) {
  switch (fault) {
    case SidecarFault::Unreadable: return "check permissions on the index directory";
    case SidecarFault::Corrupt: return "the generation is damaged, rebuild the index";
    case SidecarFault::Incompatible: return "unexpected sidecar layout, rebuild the index";
    case SidecarFault::OutOfSpace: return "the disk is full";
    case SidecarFault::Busy: return "another process holds the sidecar";
    default: return "see the sqlite message";
  }
}

// "<operation> failed for <path>: <sqlite message> (<hint>) [code=N, xcode=M]"
inline std::string describe_sidecar_error(const std::string& operation,
                                          const std::string& path,
                                          const sqlite::sqlite_exception& e) {
  const SidecarFault fault = classify_sidecar_fault(e.get_code());
  return operation + " failed for " + path + ": " + e.what() + " (" + sidecar_fault_hint(fault) +
         ") [code=" + std::to_string(e.get_code()) +
         ", xcode=" + std::to_string(e.get_extended_code()) + "]";
}

}  // namespace docqa_core
