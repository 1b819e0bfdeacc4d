#include "migrations.hpp"

namespace streamgate::db::sql {

void RunMigrations(MigrationExecutor& executor, const std::vector<std::string>& ordered_sql) {
  for (const auto& sql : ordered_sql) {
    executor.ExecuteSQL(sql);
  }
}

const std::vector<std::string>& SqliteSchema() {
  static const std::vector<std::string> kSchema = {
      "CREATE TABLE IF NOT EXISTS media_reference (token TEXT PRIMARY KEY, chat_id INTEGER NOT NULL, message_id INTEGER NOT NULL, "
      "fallback_locator TEXT NOT NULL, unique_id TEXT NOT NULL, file_name TEXT, mime_type TEXT, size_bytes INTEGER, media_kind INTEGER NOT NULL, "
      "access_tier INTEGER NOT NULL, created_at_ms INTEGER NOT NULL, section_id TEXT, section_name TEXT, expires_at_ms INTEGER NOT NULL DEFAULT 0);",
      "CREATE INDEX IF NOT EXISTS media_reference_expiry ON media_reference(expires_at_ms) WHERE expires_at_ms > 0;",
      "CREATE TABLE IF NOT EXISTS history (seq INTEGER PRIMARY KEY AUTOINCREMENT, token TEXT NOT NULL UNIQUE);",
      "CREATE TABLE IF NOT EXISTS section (id TEXT PRIMARY KEY, name TEXT NOT NULL UNIQUE, created_at_ms INTEGER NOT NULL);",
      "CREATE TABLE IF NOT EXISTS section_member (section_id TEXT NOT NULL REFERENCES section(id) ON DELETE CASCADE, seq INTEGER NOT NULL, "
      "token TEXT NOT NULL, PRIMARY KEY (section_id, token));",
      "CREATE INDEX IF NOT EXISTS section_member_seq ON section_member(section_id, seq);",
      "CREATE TABLE IF NOT EXISTS setting (key TEXT PRIMARY KEY, value TEXT NOT NULL);",
      "CREATE TABLE IF NOT EXISTS credit_balance (user_id INTEGER PRIMARY KEY, balance INTEGER NOT NULL CHECK (balance >= 0));",
      "CREATE TABLE IF NOT EXISTS payment_request (id INTEGER PRIMARY KEY AUTOINCREMENT, user_id INTEGER NOT NULL, amount_minor INTEGER NOT NULL, "
      "credits INTEGER NOT NULL, status INTEGER NOT NULL, note TEXT NOT NULL DEFAULT '', handled_by INTEGER NOT NULL DEFAULT 0, "
      "created_at_ms INTEGER NOT NULL, updated_at_ms INTEGER NOT NULL);",
      "CREATE INDEX IF NOT EXISTS payment_request_status ON payment_request(status, id);",
      "CREATE INDEX IF NOT EXISTS payment_request_created ON payment_request(created_at_ms);",
      "CREATE TABLE IF NOT EXISTS pending_submission (user_id INTEGER PRIMARY KEY, request_id INTEGER NOT NULL, expires_at_ms INTEGER NOT NULL);",
      "CREATE TABLE IF NOT EXISTS view_counter (token TEXT PRIMARY KEY, total INTEGER NOT NULL);",
      "CREATE TABLE IF NOT EXISTS view_viewer (token TEXT NOT NULL, fingerprint TEXT NOT NULL, PRIMARY KEY (token, fingerprint));",
      "CREATE TABLE IF NOT EXISTS reaction (token TEXT NOT NULL, user_id INTEGER NOT NULL, choice INTEGER NOT NULL, PRIMARY KEY (token, user_id));",
      "CREATE TABLE IF NOT EXISTS premium_user (user_id INTEGER PRIMARY KEY, expires_at_ms INTEGER);",
  };
  return kSchema;
}

const std::vector<std::string>& PostgresSchema() {
  static const std::vector<std::string> kSchema = {
      "CREATE TABLE IF NOT EXISTS media_reference (token TEXT PRIMARY KEY, chat_id BIGINT NOT NULL, message_id BIGINT NOT NULL, "
      "fallback_locator TEXT NOT NULL, unique_id TEXT NOT NULL, file_name TEXT, mime_type TEXT, size_bytes BIGINT, media_kind SMALLINT NOT NULL, "
      "access_tier SMALLINT NOT NULL, created_at_ms BIGINT NOT NULL, section_id TEXT, section_name TEXT, expires_at_ms BIGINT NOT NULL DEFAULT 0);",
      "CREATE INDEX IF NOT EXISTS media_reference_expiry ON media_reference(expires_at_ms) WHERE expires_at_ms > 0;",
      "CREATE TABLE IF NOT EXISTS history (seq BIGSERIAL PRIMARY KEY, token TEXT NOT NULL UNIQUE);",
      "CREATE TABLE IF NOT EXISTS section (id TEXT PRIMARY KEY, name TEXT NOT NULL UNIQUE, created_at_ms BIGINT NOT NULL);",
      "CREATE TABLE IF NOT EXISTS section_member (section_id TEXT NOT NULL REFERENCES section(id) ON DELETE CASCADE, seq BIGINT NOT NULL, "
      "token TEXT NOT NULL, PRIMARY KEY (section_id, token));",
      "CREATE INDEX IF NOT EXISTS section_member_seq ON section_member(section_id, seq);",
      "CREATE TABLE IF NOT EXISTS setting (key TEXT PRIMARY KEY, value TEXT NOT NULL);",
      "CREATE TABLE IF NOT EXISTS credit_balance (user_id BIGINT PRIMARY KEY, balance BIGINT NOT NULL CHECK (balance >= 0));",
      "CREATE TABLE IF NOT EXISTS payment_request (id BIGSERIAL PRIMARY KEY, user_id BIGINT NOT NULL, amount_minor BIGINT NOT NULL, "
      "credits BIGINT NOT NULL, status SMALLINT NOT NULL, note TEXT NOT NULL DEFAULT '', handled_by BIGINT NOT NULL DEFAULT 0, "
      "created_at_ms BIGINT NOT NULL, updated_at_ms BIGINT NOT NULL);",
      "CREATE INDEX IF NOT EXISTS payment_request_status ON payment_request(status, id);",
      "CREATE INDEX IF NOT EXISTS payment_request_created ON payment_request(created_at_ms);",
      "CREATE TABLE IF NOT EXISTS pending_submission (user_id BIGINT PRIMARY KEY, request_id BIGINT NOT NULL, expires_at_ms BIGINT NOT NULL);",
      "CREATE TABLE IF NOT EXISTS view_counter (token TEXT PRIMARY KEY, total BIGINT NOT NULL);",
      "CREATE TABLE IF NOT EXISTS view_viewer (token TEXT NOT NULL, fingerprint TEXT NOT NULL, PRIMARY KEY (token, fingerprint));",
      "CREATE TABLE IF NOT EXISTS reaction (token TEXT NOT NULL, user_id BIGINT NOT NULL, choice SMALLINT NOT NULL, PRIMARY KEY (token, user_id));",
      "CREATE TABLE IF NOT EXISTS premium_user (user_id BIGINT PRIMARY KEY, expires_at_ms BIGINT);",
  };
  return kSchema;
}

} // namespace streamgate::db::sql
