#include "internal/db/sql/cms_schema.hpp"

#include "internal/util/strings.hpp"

namespace quire::db::sql {

namespace {

using T = ColumnType;

// id, created_at, updated_at, deleted_at followed by the table's own columns.
TableSpec WithBase(std::string name, std::vector<ColumnSpec> own, std::vector<std::string> unique_together = {}) {
  TableSpec spec;
  spec.name = std::move(name);
  spec.columns.push_back({"id", T::Id, kNotNull});
  spec.columns.push_back({"created_at", T::Timestamp});
  spec.columns.push_back({"updated_at", T::Timestamp});
  spec.columns.push_back({"deleted_at", T::Timestamp});
  for (auto& c : own) spec.columns.push_back(std::move(c));
  spec.unique_together = std::move(unique_together);
  return spec;
}

// title/text/images shared by posts, notes and pages
std::vector<ColumnSpec> WriteBase(std::vector<ColumnSpec> own) {
  std::vector<ColumnSpec> cols = {
      {"title", T::String, kNotNull},
      {"text", T::LongText},
      {"images", T::Json},
  };
  for (auto& c : own) cols.push_back(std::move(c));
  return cols;
}

std::vector<TableSpec> BuildTables() {
  std::vector<TableSpec> t;

  t.push_back(WithBase("users", {
                                    {"username", T::String, kNotNull | kUnique},
                                    {"name", T::String},
                                    {"introduce", T::LongText},
                                    {"avatar", T::String},
                                    {"password", T::String, kNotNull},
                                    {"mail", T::String},
                                    {"url", T::String},
                                    {"social_ids", T::LongText},
                                    {"last_login_time", T::Timestamp},
                                    {"last_login_ip", T::String},
                                }));
  t.push_back(WithBase("user_sessions", {
                                            {"user_id", T::String, kNotNull},
                                            {"ip", T::String},
                                            {"ua", T::LongText},
                                            {"expires_at", T::Timestamp, kNotNull},
                                            {"revoked_at", T::Timestamp},
                                        }));
  t.push_back(WithBase("api_tokens", {
                                         {"user_id", T::String, kNotNull},
                                         {"token", T::String, kNotNull | kUnique},
                                         {"name", T::String},
                                         {"expired_at", T::Timestamp},
                                     }));
  t.push_back(WithBase("oauth2_tokens", {
                                            {"user_id", T::String, kNotNull},
                                            {"provider", T::String, kNotNull},
                                            {"provider_uid", T::String},
                                            {"access_token", T::LongText},
                                            {"last_used", T::Timestamp},
                                        }));
  t.push_back(WithBase("authn_credentials", {
                                                {"name", T::String, kNotNull | kUnique},
                                                {"credential_id", T::Blob},
                                                {"credential_public_key", T::Blob},
                                                {"counter", T::Integer},
                                                {"credential_device_type", T::String},
                                                {"credential_backed_up", T::Boolean},
                                            }));
  t.push_back(WithBase("readers", {
                                      {"email", T::String, kUnique},
                                      {"name", T::String},
                                      {"handle", T::String},
                                      {"image", T::String},
                                      {"is_owner", T::Boolean},
                                  }));
  t.push_back(WithBase("categories", {
                                         {"name", T::String, kNotNull | kUnique},
                                         {"slug", T::String, kNotNull | kUnique},
                                         {"type", T::Integer, kNone, "0"},
                                     }));
  t.push_back(WithBase("topics", {
                                     {"name", T::String, kNotNull | kUnique},
                                     {"slug", T::String, kNotNull | kUnique},
                                     {"description", T::String},
                                     {"introduce", T::String},
                                     {"icon", T::String},
                                 }));
  t.push_back(WithBase("posts", WriteBase({
                                    {"slug", T::String, kNotNull | kUnique},
                                    {"summary", T::String},
                                    {"category_id", T::String, kNone, "", "categories(id)"},
                                    {"copyright", T::Boolean, kNone, "TRUE"},
                                    {"is_published", T::Boolean, kNone, "FALSE"},
                                    {"tags", T::Json},
                                    {"read_count", T::Integer, kNone, "0"},
                                    {"like_count", T::Integer, kNone, "0"},
                                    {"pin", T::Boolean, kNone, "FALSE"},
                                    {"pin_order", T::Integer, kNone, "0"},
                                })));
  t.push_back(WithBase("notes", WriteBase({
                                    {"n_id", T::Integer, kNotNull | kUnique},
                                    {"is_published", T::Boolean, kNone, "FALSE"},
                                    {"password_hash", T::String},
                                    {"public_at", T::Timestamp},
                                    {"mood", T::String},
                                    {"weather", T::String},
                                    {"bookmark", T::Boolean, kNone, "FALSE"},
                                    {"coordinates", T::Json},
                                    {"location", T::String},
                                    {"read_count", T::Integer, kNone, "0"},
                                    {"like_count", T::Integer, kNone, "0"},
                                    {"topic_id", T::String, kNone, "", "topics(id)"},
                                })));
  t.push_back(WithBase("pages", WriteBase({
                                    {"slug", T::String, kNotNull | kUnique},
                                    {"subtitle", T::String},
                                    {"order_num", T::Integer, kNone, "0"},
                                    {"meta", T::Json},
                                    {"allow_comment", T::Boolean, kNone, "TRUE"},
                                    {"comments_index", T::Integer, kNone, "0"},
                                    {"read_count", T::Integer, kNone, "0"},
                                })));
  t.push_back(WithBase("comments", {
                                       {"ref_type", T::String, kNotNull},
                                       {"ref_id", T::String, kNotNull},
                                       {"author", T::String, kNotNull},
                                       {"mail", T::String},
                                       {"url", T::String},
                                       {"text", T::LongText, kNotNull},
                                       {"state", T::Integer, kNone, "0"},
                                       {"parent_id", T::String},
                                       {"comments_index", T::Integer, kNone, "0"},
                                       {"key", T::String},
                                       {"ip", T::String},
                                       {"agent", T::String},
                                       {"pin", T::Boolean, kNone, "FALSE"},
                                       {"is_whispers", T::Boolean, kNone, "FALSE"},
                                       {"avatar", T::String},
                                       {"location", T::String},
                                       {"meta", T::Json},
                                       {"reader_id", T::String},
                                       {"edited_at", T::Timestamp},
                                       {"source", T::String},
                                   }));
  t.push_back(WithBase("recentlies", {
                                         {"content", T::LongText, kNotNull},
                                         {"ref_type", T::String},
                                         {"ref_id", T::String},
                                         {"up_count", T::Integer, kNone, "0"},
                                         {"down_count", T::Integer, kNone, "0"},
                                         {"comments_index", T::Integer, kNone, "0"},
                                         {"allow_comment", T::Boolean, kNone, "TRUE"},
                                     }));
  t.push_back(WithBase("drafts", {
                                     {"ref_type", T::String},
                                     {"ref_id", T::String},
                                     {"title", T::String},
                                     {"text", T::LongText},
                                     {"images", T::Json},
                                     {"meta", T::Json},
                                     {"type_specific_data", T::Json},
                                     {"version", T::Integer, kNone, "0"},
                                     {"published_version", T::Integer},
                                 }));
  t.push_back(WithBase("draft_histories", {
                                              {"draft_id", T::String, kNotNull},
                                              {"version", T::Integer},
                                              {"title", T::String},
                                              {"text", T::LongText},
                                              {"type_specific_data", T::Json},
                                              {"saved_at", T::Timestamp},
                                              {"is_full_snapshot", T::Boolean, kNone, "TRUE"},
                                              {"ref_version", T::Integer},
                                              {"base_version", T::Integer},
                                          }));
  t.push_back(WithBase("ai_summaries", {
                                           {"hash", T::String, kNotNull | kUnique},
                                           {"summary", T::LongText, kNotNull},
                                           {"ref_id", T::String, kNotNull},
                                           {"lang", T::String, kNone, "'default'"},
                                       }));
  t.push_back(WithBase("ai_deep_readings", {
                                               {"hash", T::String, kNotNull | kUnique},
                                               {"ref_id", T::String, kNotNull},
                                               {"key_points", T::Json},
                                               {"critical_analysis", T::LongText},
                                               {"content", T::LongText, kNotNull},
                                           }));
  t.push_back(WithBase("analyzes", {
                                       {"ip", T::String},
                                       {"ua", T::Json},
                                       {"country", T::String},
                                       {"path", T::String},
                                       {"referer", T::String},
                                       {"timestamp", T::Timestamp},
                                   }));
  t.push_back(WithBase("activities", {
                                         {"type", T::String, kNotNull},
                                         {"payload", T::Json},
                                     }));
  t.push_back(WithBase("slug_trackers", {
                                            {"slug", T::String, kNotNull},
                                            {"type", T::String, kNotNull},
                                            {"target_id", T::String, kNotNull},
                                        }));
  t.push_back(WithBase("file_references", {
                                              {"file_url", T::String, kNotNull},
                                              {"file_name", T::String},
                                              {"status", T::String, kNone, "'pending'"},
                                              {"ref_id", T::String},
                                              {"ref_type", T::String},
                                          }));
  t.push_back(WithBase("webhooks", {
                                       {"payload_url", T::String, kNotNull},
                                       {"events", T::Json},
                                       {"enabled", T::Boolean, kNone, "TRUE"},
                                       {"secret", T::String, kNotNull},
                                       {"scope", T::String},
                                   }));
  t.push_back(WithBase("webhook_events", {
                                             {"hook_id", T::String, kNotNull},
                                             {"event", T::String, kNotNull},
                                             {"headers", T::Json},
                                             {"payload", T::Json},
                                             {"response", T::Json},
                                             {"success", T::Boolean},
                                             {"status", T::Integer},
                                             {"timestamp", T::Timestamp},
                                         }));
  t.push_back(WithBase("snippets", {
                                       {"type", T::String, kNotNull},
                                       {"private", T::Boolean, kNone, "FALSE"},
                                       {"raw", T::LongText},
                                       {"name", T::String, kNotNull},
                                       {"reference", T::String, kNotNull},
                                       {"comment", T::String},
                                       {"metatype", T::String},
                                       {"schema", T::LongText},
                                       {"method", T::String},
                                       {"secret", T::String},
                                       {"enable", T::Boolean, kNone, "TRUE"},
                                       {"built_in", T::Boolean, kNone, "FALSE"},
                                   }));
  t.push_back(WithBase("projects", {
                                       {"name", T::String, kNotNull | kUnique},
                                       {"preview_url", T::String},
                                       {"doc_url", T::String},
                                       {"project_url", T::String},
                                       {"images", T::LongText},
                                       {"description", T::String},
                                       {"avatar", T::String},
                                       {"text", T::LongText},
                                   }));
  t.push_back(WithBase("links", {
                                    {"name", T::String, kNotNull | kUnique},
                                    {"url", T::String, kNotNull | kUnique},
                                    {"avatar", T::String},
                                    {"description", T::String},
                                    {"type", T::Integer, kNone, "0"},
                                    {"state", T::Integer, kNone, "1"},
                                    {"email", T::String},
                                }));
  t.push_back(WithBase("says", {
                                   {"text", T::LongText, kNotNull},
                                   {"source", T::String},
                                   {"author", T::String},
                               }));
  t.push_back(WithBase("subscribes", {
                                         {"email", T::String, kNotNull | kUnique},
                                         {"cancel_token", T::String, kUnique},
                                         {"subscribe", T::Integer, kNone, "0"},
                                         {"verified", T::Boolean, kNone, "FALSE"},
                                     }));
  t.push_back(WithBase("meta_presets", {
                                           {"key", T::String, kNotNull | kUnique},
                                           {"label", T::String, kNotNull},
                                           {"type", T::String, kNotNull},
                                           {"description", T::String},
                                           {"placeholder", T::String},
                                           {"scope", T::String, kNone, "'both'"},
                                           {"options", T::Json},
                                           {"allow_custom_option", T::Boolean},
                                           {"children", T::Json},
                                           {"is_builtin", T::Boolean},
                                           {"order", T::Integer, kNone, "0"},
                                           {"enabled", T::Boolean, kNone, "TRUE"},
                                       }));
  t.push_back(WithBase("serverless_storages",
                       {
                           {"namespace", T::String, kNotNull},
                           {"key", T::String, kNotNull},
                           {"value", T::LongText},
                       },
                       {"namespace", "key"}));

  TableSpec options;
  options.name    = "options";
  options.columns = {
      {"id", T::Serial, kNotNull},
      {"name", T::String, kNotNull | kUnique},
      {"value", T::LongText},
  };
  t.push_back(std::move(options));

  return t;
}

std::string RenderType(ColumnType type, SqlDialect dialect) {
  const bool pg = dialect == SqlDialect::Postgres;
  switch (type) {
    case T::Id:
      return "VARCHAR(36) PRIMARY KEY";
    case T::Serial:
      return pg ? "BIGSERIAL PRIMARY KEY" : "INTEGER PRIMARY KEY AUTOINCREMENT";
    case T::String:
      return "VARCHAR(255)";
    case T::LongText:
      return "TEXT";
    case T::Json:
      return pg ? "JSONB" : "JSON";
    case T::Integer:
      return pg ? "BIGINT" : "INTEGER";
    case T::Boolean:
      return "BOOLEAN";
    case T::Timestamp:
      return pg ? "TIMESTAMPTZ" : "DATETIME";
    case T::Blob:
      return pg ? "BYTEA" : "BLOB";
  }
  return "TEXT";
}

} // namespace

const std::vector<TableSpec>& CmsTables() {
  static const std::vector<TableSpec> kTables = BuildTables();
  return kTables;
}

std::string RenderCreateTable(const TableSpec& table, SqlDialect dialect) {
  std::string sql = "CREATE TABLE IF NOT EXISTS " + util::QuoteIdentifier(table.name) + " (";

  bool first = true;
  for (const auto& col : table.columns) {
    if (!first) sql += ", ";
    first = false;

    sql += util::QuoteIdentifier(col.name) + " " + RenderType(col.type, dialect);
    const bool primary = col.type == T::Id || col.type == T::Serial;
    if ((col.flags & kNotNull) && !primary) sql += " NOT NULL";
    if (col.flags & kUnique) sql += " UNIQUE";
    if (!col.default_sql.empty()) sql += " DEFAULT " + col.default_sql;
    if (!col.references.empty()) {
      sql += " REFERENCES " + col.references;
      // SET CONSTRAINTS only reaches deferrable constraints
      if (dialect == SqlDialect::Postgres) sql += " DEFERRABLE INITIALLY IMMEDIATE";
    }
  }

  if (!table.unique_together.empty()) {
    sql += ", UNIQUE (";
    for (std::size_t i = 0; i < table.unique_together.size(); ++i) {
      if (i > 0) sql += ", ";
      sql += util::QuoteIdentifier(table.unique_together[i]);
    }
    sql += ")";
  }

  sql += ");";
  return sql;
}

std::vector<std::string> RenderCmsSchema(SqlDialect dialect) {
  std::vector<std::string> out;
  out.reserve(CmsTables().size());
  for (const auto& table : CmsTables()) {
    out.push_back(RenderCreateTable(table, dialect));
  }
  return out;
}

} // namespace quire::db::sql
