#include "internal/backup/unified_config.hpp"

#include <stdexcept>

#include "internal/codec/json_value.hpp"

namespace quire::backup {

namespace {

constexpr std::string_view kDefaultConfig = R"json({
  "seo": {"title": "My little world", "description": "Hello, welcome", "keywords": []},
  "url": {
    "ws_url": "http://localhost:2333",
    "admin_url": "http://localhost:2333/proxy/qaqdmin",
    "server_url": "http://localhost:2333",
    "web_url": "http://localhost:2323"
  },
  "mail_options": {
    "enable": false,
    "provider": "smtp",
    "from": "",
    "smtp": {"user": "", "pass": "", "options": {"host": "", "port": 465, "secure": true}},
    "resend": {"api_key": ""}
  },
  "comment_options": {
    "anti_spam": false,
    "ai_review": false,
    "ai_review_type": "binary",
    "ai_review_threshold": 5,
    "test_ai_review": "__action__",
    "disable_comment": false,
    "spam_keywords": [],
    "block_ips": [],
    "disable_no_chinese": false,
    "comment_should_audit": false,
    "record_ip_location": true
  },
  "backup_options": {"enable": false, "path": "backups/{Y}/{m}/backup-{Y}{m}{d}-{h}{i}{s}.zip"},
  "baidu_search_options": {"enable": false, "token": null},
  "algolia_search_options": {"enable": false, "app_id": "", "api_key": "", "index_name": "", "max_truncate_size": 10000},
  "admin_extra": {"enable_admin_proxy": true, "gaodemap_key": null, "background": ""},
  "friend_link_options": {"allow_apply": true, "allow_sub_path": false, "enable_avatar_internalization": true},
  "s3_options": {
    "endpoint": "",
    "access_key_id": "",
    "secret_access_key": "",
    "bucket": "",
    "region": "",
    "custom_domain": "",
    "path_style_access": false
  },
  "image_bed_options": {
    "enable": false,
    "path": "images/{Y}/{m}/{uuid}.{ext}",
    "allowed_formats": "jpg,jpeg,png,gif,webp",
    "max_size_mb": 10
  },
  "image_storage_options": {
    "enable": false,
    "sync_on_publish": false,
    "delete_local_after_sync": false,
    "endpoint": null,
    "secret_id": null,
    "secret_key": null,
    "bucket": null,
    "region": "auto",
    "custom_domain": "",
    "prefix": ""
  },
  "third_party_service_integration": {"github_token": ""},
  "text_options": {"macros": true},
  "bing_search_options": {"enable": false, "token": null},
  "meili_search_options": {"enable": true, "index_name": "mx-space", "search_cache_ttl": 300},
  "feature_list": {"email_subscribe": false},
  "bark_options": {
    "enable": false,
    "key": "",
    "server_url": "https://api.day.app",
    "enable_comment": true,
    "enable_throttle_guard": false
  },
  "auth_security": {"disable_password_login": false},
  "ai": {
    "providers": [],
    "enable_summary": false,
    "enable_auto_generate_summary": false,
    "ai_summary_target_language": "auto"
  },
  "oauth": {"providers": [], "secrets": {}, "public": {}}
})json";

} // namespace

std::string_view DefaultUnifiedConfigJson() {
  return kDefaultConfig;
}

db::model::Map DefaultUnifiedConfig() {
  auto parsed = codec::ParseJson(kDefaultConfig);
  if (!parsed || parsed->kind_case() != google::protobuf::Value::kStructValue) {
    throw std::logic_error("default unified config is not a JSON object");
  }
  auto value = codec::FromProtoValue(*parsed);
  return std::move(*value.As<db::model::Map>());
}

} // namespace quire::backup
