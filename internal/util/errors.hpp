#pragma once

#include <stdexcept>
#include <string>

namespace quire::util {

/*
  Central error types.

  Restore maps each of these onto a fatal outcome: the transaction is
  rolled back and the exception reaches the caller unchanged.
  Duplicate-key conflicts are NOT exceptions; they travel as
  db::Result codes and the affected row is skipped.
*/

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Unreadable or corrupt container. Raised before any transaction opens.
class ArchiveFormatError : public std::runtime_error {
 public:
  explicit ArchiveFormatError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Malformed per-table payload (bad document length, invalid JSON, ...).
class DecodeError : public std::runtime_error {
 public:
  explicit DecodeError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class SchemaIntrospectionError : public std::runtime_error {
 public:
  explicit SchemaIntrospectionError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// begin / commit / rollback failures.
class TransactionError : public std::runtime_error {
 public:
  explicit TransactionError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Any other write failure during restore (non-duplicate insert, delete, option write).
class RestoreError : public std::runtime_error {
 public:
  explicit RestoreError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Backend read failure surfaced by a repository.
class DatabaseError : public std::runtime_error {
 public:
  explicit DatabaseError(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace quire::util
