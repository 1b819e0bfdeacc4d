#pragma once

#include <string>
#include <vector>

namespace streamgate::db::sql {

/*
  Backend-agnostic migration execution.

  Each backend implements ExecuteSQL(). Statements are idempotent
  (CREATE ... IF NOT EXISTS) and safe to replay on every start.
*/

class MigrationExecutor {
 public:
  virtual ~MigrationExecutor() = default;

  virtual void ExecuteSQL(const std::string& sql) = 0;
};

// Runs statements in order; the first failure propagates.
void RunMigrations(MigrationExecutor& executor, const std::vector<std::string>& ordered_sql);

const std::vector<std::string>& SqliteSchema();
const std::vector<std::string>& PostgresSchema();

} // namespace streamgate::db::sql
