#pragma once

#include "dt_logging.hpp"
#include "duckdb.hpp"

#include <string>

/// Owns the DuckDB instance behind a TableGateway and hands out one
/// short-lived connection per operation. The database is opened and checked
/// eagerly, so an unreachable database fails at construction with
/// dt_error::ConnectionFailure.
class ConnectionFactory {
public:
  ConnectionFactory(const std::string &database_path_, dtlog::Logger &logger_);

  duckdb::Connection CreateConnection();

  /// Runs the liveness check on a fresh connection.
  void CheckConnection();

  const std::string &GetDatabasePath() const { return database_path; }
  /// Catalog name DuckDB assigned to the database, e.g. "memory".
  const std::string &GetCatalogName() const { return catalog_name; }

private:
  std::string database_path;
  dtlog::Logger &logger;
  duckdb::DuckDB db;
  std::string catalog_name;
};
