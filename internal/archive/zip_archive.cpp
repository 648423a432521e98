#include "internal/archive/zip_archive.hpp"

#include <archive.h>
#include <archive_entry.h>

#include "internal/util/errors.hpp"

namespace quire::archive {

namespace {

struct ReadHandle {
  struct ::archive* a = nullptr;

  ReadHandle() : a(archive_read_new()) {
  }
  ~ReadHandle() {
    if (a != nullptr) {
      archive_read_close(a);
      archive_read_free(a);
    }
  }
};

std::string ErrorString(struct ::archive* a, const char* fallback) {
  const char* msg = archive_error_string(a);
  return msg != nullptr ? std::string(msg) : std::string(fallback);
}

la_ssize_t AppendToBuffer(struct ::archive*, void* client_data, const void* buffer, size_t length) {
  static_cast<std::string*>(client_data)->append(static_cast<const char*>(buffer), length);
  return static_cast<la_ssize_t>(length);
}

} // namespace

std::vector<ZipEntry> ReadZipArchive(std::string_view bytes) {
  if (bytes.empty()) {
    throw util::ArchiveFormatError("zip: empty archive");
  }

  ReadHandle handle;
  if (handle.a == nullptr) {
    throw util::ArchiveFormatError("zip: archive_read_new failed");
  }
  archive_read_support_format_zip(handle.a);

  if (archive_read_open_memory(handle.a, bytes.data(), bytes.size()) != ARCHIVE_OK) {
    throw util::ArchiveFormatError("zip: " + ErrorString(handle.a, "cannot open archive"));
  }

  std::vector<ZipEntry> entries;
  for (;;) {
    struct archive_entry* header = nullptr;
    const int             rc     = archive_read_next_header(handle.a, &header);
    if (rc == ARCHIVE_EOF) break;
    if (rc < ARCHIVE_WARN) {
      throw util::ArchiveFormatError("zip: " + ErrorString(handle.a, "corrupt entry header"));
    }
    if (archive_entry_filetype(header) != AE_IFREG) {
      archive_read_data_skip(handle.a);
      continue;
    }

    ZipEntry entry;
    const char* name = archive_entry_pathname(header);
    if (name == nullptr) name = archive_entry_pathname_utf8(header);
    entry.name = name != nullptr ? name : "";

    char buf[16384];
    for (;;) {
      const la_ssize_t n = archive_read_data(handle.a, buf, sizeof(buf));
      if (n == 0) break;
      if (n < 0) {
        if (n == ARCHIVE_FATAL) {
          throw util::ArchiveFormatError("zip: " + ErrorString(handle.a, "fatal read error") + " in " + entry.name);
        }
        // ARCHIVE_WARN here is a CRC or size mismatch
        entry.error = ErrorString(handle.a, "read error");
        entry.data.clear();
        break;
      }
      entry.data.append(buf, static_cast<std::size_t>(n));
    }
    entries.push_back(std::move(entry));
  }
  return entries;
}

void ZipWriter::ArchiveDeleter::operator()(struct ::archive* a) const {
  archive_write_free(a);
}

ZipWriter::ZipWriter() : archive_(archive_write_new()) {
  if (!archive_) {
    throw util::ArchiveFormatError("zip: archive_write_new failed");
  }
  if (archive_write_set_format_zip(archive_.get()) != ARCHIVE_OK ||
      archive_write_set_bytes_in_last_block(archive_.get(), 1) != ARCHIVE_OK ||
      archive_write_open(archive_.get(), &buffer_, nullptr, &AppendToBuffer, nullptr) != ARCHIVE_OK) {
    throw util::ArchiveFormatError("zip: " + ErrorString(archive_.get(), "cannot initialize writer"));
  }
}

ZipWriter::~ZipWriter() = default;

void ZipWriter::Add(const std::string& name, std::string_view data, util::TimePoint mtime) {
  if (finished_) {
    throw util::ArchiveFormatError("zip: writer already finished");
  }

  std::unique_ptr<struct archive_entry, decltype(&archive_entry_free)> entry(archive_entry_new(), &archive_entry_free);
  if (!entry) {
    throw util::ArchiveFormatError("zip: archive_entry_new failed");
  }
  archive_entry_set_pathname(entry.get(), name.c_str());
  archive_entry_set_filetype(entry.get(), AE_IFREG);
  archive_entry_set_perm(entry.get(), 0644);
  archive_entry_set_size(entry.get(), static_cast<la_int64_t>(data.size()));
  const auto seconds = std::chrono::floor<std::chrono::seconds>(mtime).time_since_epoch().count();
  archive_entry_set_mtime(entry.get(), static_cast<time_t>(seconds), 0);

  if (archive_write_header(archive_.get(), entry.get()) < ARCHIVE_WARN) {
    throw util::ArchiveFormatError("zip: " + ErrorString(archive_.get(), "cannot write header") + " for " + name);
  }

  std::size_t offset = 0;
  while (offset < data.size()) {
    const la_ssize_t n = archive_write_data(archive_.get(), data.data() + offset, data.size() - offset);
    if (n <= 0) {
      throw util::ArchiveFormatError("zip: " + ErrorString(archive_.get(), "cannot write data") + " for " + name);
    }
    offset += static_cast<std::size_t>(n);
  }

  if (archive_write_finish_entry(archive_.get()) < ARCHIVE_WARN) {
    throw util::ArchiveFormatError("zip: " + ErrorString(archive_.get(), "cannot finish entry") + " for " + name);
  }
}

std::string ZipWriter::Finish() {
  if (finished_) {
    throw util::ArchiveFormatError("zip: writer already finished");
  }
  finished_ = true;
  if (archive_write_close(archive_.get()) != ARCHIVE_OK) {
    throw util::ArchiveFormatError("zip: " + ErrorString(archive_.get(), "cannot close archive"));
  }
  return std::move(buffer_);
}

} // namespace quire::archive
