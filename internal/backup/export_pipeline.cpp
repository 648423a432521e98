#include "internal/backup/export_pipeline.hpp"

#include <stdexcept>

#include "google/protobuf/util/json_util.h"
#include "internal/archive/zip_archive.hpp"
#include "internal/backup/table_registry.hpp"
#include "internal/codec/row_codec.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace quire::backup {

using observability::IntField;
using observability::StringField;

quire::backup::v1::BackupManifest BuildManifest(const std::string& engine, util::TimePoint created_at,
                                                const std::vector<std::string>& tables) {
  quire::backup::v1::BackupManifest manifest;
  manifest.set_format(kArchiveFormat);
  manifest.set_version(kArchiveVersion);
  manifest.set_engine(engine);
  *manifest.mutable_created_at() = util::ToProto(created_at);
  for (const auto& table : tables) {
    manifest.add_tables(table);
  }
  return manifest;
}

std::string RenderManifestJson(const quire::backup::v1::BackupManifest& manifest) {
  google::protobuf::util::JsonPrintOptions options;
  options.preserve_proto_field_names    = true;
  options.always_print_primitive_fields = true;

  std::string out;
  auto        status = google::protobuf::util::MessageToJsonString(manifest, &out, options);
  if (!status.ok()) {
    throw std::runtime_error("manifest encode failed: " + std::string(status.message()));
  }
  return out;
}

ExportPipeline::ExportPipeline(db::Repository& repo) : repo_(repo) {
}

ExportResult ExportPipeline::Export(util::TimePoint now) {
  ExportResult      result;
  archive::ZipWriter writer;

  for (const auto& table : CanonicalTables()) {
    std::string payload;
    try {
      payload = codec::EncodeBsonRows(repo_.SelectAll(table));
    } catch (const util::DatabaseError& e) {
      QUIRE_LOG_WARN("export skipped table", {StringField("table", table), StringField("error", e.what())});
      result.skipped.push_back(table);
      continue;
    } catch (const std::logic_error& e) {
      QUIRE_LOG_WARN("export skipped table", {StringField("table", table), StringField("error", e.what())});
      result.skipped.push_back(table);
      continue;
    }

    writer.Add(TableEntryPath(table), payload, now);
    result.tables.push_back(table);
  }

  const auto manifest = BuildManifest(repo_.Dialect(), now, result.tables);
  writer.Add(kManifestPath, RenderManifestJson(manifest), now);
  result.archive = writer.Finish();

  QUIRE_LOG_INFO("export finished", {IntField("tables", static_cast<std::int64_t>(result.tables.size())),
                                     IntField("skipped", static_cast<std::int64_t>(result.skipped.size())),
                                     IntField("bytes", static_cast<std::int64_t>(result.archive.size()))});
  return result;
}

} // namespace quire::backup
