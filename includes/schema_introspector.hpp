#pragma once

#include "dt_logging.hpp"
#include "duckdb.hpp"
#include "schema_types.hpp"

#include <string>
#include <vector>

/// Reads table structure from the live DuckDB catalog. Nothing is cached:
/// every call sees columns added by other connections in the meantime.
class SchemaIntrospector {
public:
  explicit SchemaIntrospector(dtlog::Logger &logger_);

  /// Throws dt_error::TableNotFound if neither a table nor a view with that
  /// name exists in the schema.
  table_handle resolve(duckdb::Connection &con, const table_def &table);

  /// Only reports base tables. Never throws, catalog errors are logged and
  /// reported as false.
  bool exists(duckdb::Connection &con, const table_def &table);

  std::vector<std::string> columns(duckdb::Connection &con,
                                   const table_def &table);

  std::vector<std::string> tables(duckdb::Connection &con,
                                  const std::string &db_name,
                                  const std::string &schema_name);
  std::vector<std::string> views(duckdb::Connection &con,
                                 const std::string &db_name,
                                 const std::string &schema_name);

private:
  dtlog::Logger &logger;

  std::vector<column_def> describe_columns(duckdb::Connection &con,
                                           const table_def &table);
  void describe_constraints(duckdb::Connection &con, table_handle &handle);
  std::vector<std::string> list_relations(duckdb::Connection &con,
                                          const std::string &query,
                                          const std::string &db_name,
                                          const std::string &schema_name);
};
