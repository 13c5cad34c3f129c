#pragma once

#include <functional>
#include <string>
#include <vector>

namespace flightline::db::sql {

// Executes one DDL statement on the backend's connection.
using StatementRunner = std::function<void(const std::string& statement)>;

/*
  Runs the schema statements in order. Every statement is idempotent
  (CREATE ... IF NOT EXISTS) so bootstrap runs on every start.
*/
void RunMigrations(const std::vector<std::string>& ordered_sql, const StatementRunner& run);

// dimensions first, then facts, weather and pipeline metadata
const std::vector<std::string>& SqliteSchema();
const std::vector<std::string>& PostgresSchema();

} // namespace flightline::db::sql
