#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "internal/util/time.hpp"

struct archive;

namespace quire::archive {

/*
  Zip container access (libarchive).

  Archives are small enough to live in memory: the reader inflates
  every regular file up front and the writer produces one buffer.
*/

struct ZipEntry {
  std::string name;
  std::string data;
  std::string error; // non-empty when this entry could not be read or failed its CRC
  bool        Readable() const {
    return error.empty();
  }
};

// Throws util::ArchiveFormatError when the container itself is unreadable.
std::vector<ZipEntry> ReadZipArchive(std::string_view bytes);

class ZipWriter {
 public:
  // Throws util::ArchiveFormatError when libarchive refuses to initialize.
  ZipWriter();
  ~ZipWriter();

  ZipWriter(const ZipWriter&)            = delete;
  ZipWriter& operator=(const ZipWriter&) = delete;

  // Throws util::ArchiveFormatError.
  void Add(const std::string& name, std::string_view data, util::TimePoint mtime);

  // Writes the central directory and returns the archive bytes.
  // The writer cannot be reused afterwards.
  std::string Finish();

 private:
  struct ArchiveDeleter {
    void operator()(struct ::archive* a) const;
  };

  // declared before archive_: closing an unfinished writer still flushes into it
  std::string                                       buffer_;
  std::unique_ptr<struct ::archive, ArchiveDeleter> archive_;
  bool                                              finished_ = false;
};

} // namespace quire::archive
