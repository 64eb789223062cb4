#pragma once

#include "dt_logging.hpp"
#include "duckdb.hpp"
#include "schema_introspector.hpp"
#include "schema_types.hpp"

#include <string>
#include <vector>

struct create_table_options {
  std::vector<std::string> primary_key;
  // one single-column UNIQUE constraint per entry
  std::vector<std::string> unique_columns;
  bool check_existing = true;
  bool verbose = false;
};

/// Creates tables and adds columns. Never drops, renames or retypes anything.
class SchemaEvolution {
public:
  SchemaEvolution(SchemaIntrospector &introspector_, dtlog::Logger &logger_);

  /// With check_existing, an existing table only gets the columns of
  /// columns that it does not have yet.
  void create_table(duckdb::Connection &con, const table_def &table,
                    const std::vector<column_spec> &columns,
                    const create_table_options &options);

  /// Throws dt_error::ColumnAlreadyExists if the column is already there.
  void add_column(duckdb::Connection &con, const table_def &table,
                  const column_spec &column, bool verbose);

  /// Column specs whose name is not a column of the table, in input order.
  static std::vector<column_spec>
  missing_columns(const table_handle &existing,
                  const std::vector<column_spec> &columns);

private:
  SchemaIntrospector &introspector;
  dtlog::Logger &logger;

  void run_query(duckdb::Connection &con, const std::string &log_prefix,
                 const std::string &query, const std::string &error_message,
                 bool verbose);
  void create_fresh(duckdb::Connection &con, const table_def &table,
                    const std::vector<column_spec> &columns,
                    const create_table_options &options);
  void alter_add_column(duckdb::Connection &con, const table_def &table,
                        const column_spec &column, bool verbose);
};
