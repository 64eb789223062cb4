#pragma once

#include "dt_logging.hpp"
#include "duckdb.hpp"
#include "predicate.hpp"
#include "record.hpp"
#include "schema_types.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

struct select_options {
  // empty means all columns, in table order
  std::vector<std::string> columns;
  std::vector<predicate> where;
  std::optional<duckdb::idx_t> limit;
  std::optional<duckdb::idx_t> offset;
  std::optional<std::string> sort_by;
  bool descending = false;
  bool verbose = false;
};

std::vector<Record> to_records(duckdb::MaterializedQueryResult &result);

/// Writes the quoted column names through print_str, separated by separator.
void write_joined(
    std::ostringstream &sql, const std::vector<std::string> &columns,
    std::function<void(const std::string &, std::ostringstream &)> print_str,
    const std::string &separator = ", ");

/// Builds and runs the DML statements against a table resolved by the
/// SchemaIntrospector. All values are bound as parameters. When verbose is
/// set the statement text is logged before it is executed.
class DtSqlGenerator {

public:
  explicit DtSqlGenerator(dtlog::Logger &logger_);

  std::vector<Record> select(duckdb::Connection &con, const table_handle &table,
                             const select_options &options);

  duckdb::idx_t count(duckdb::Connection &con, const table_handle &table,
                      const std::vector<predicate> &where, bool verbose);

  /// Returns the number of rows actually modified.
  std::int64_t update_rows(duckdb::Connection &con, const table_handle &table,
                           const std::vector<Record> &records,
                           const std::vector<std::string> &match_fields,
                           bool verbose);

  /// An empty where deletes every row of the table.
  void delete_rows(duckdb::Connection &con, const table_handle &table,
                   const std::vector<predicate> &where, bool verbose);

  /// Inserts records[begin, end) with one statement, resolving primary key
  /// conflicts per column. Returns the primary key of every record in input
  /// order.
  std::vector<Record> upsert_chunk(duckdb::Connection &con,
                                   const table_handle &table,
                                   const std::vector<Record> &records,
                                   std::size_t begin, std::size_t end,
                                   bool overwrite_with_null, bool verbose);

  std::vector<Record> execute_raw(duckdb::Connection &con,
                                  const std::string &query, bool verbose);

private:
  dtlog::Logger &logger;

  duckdb::unique_ptr<duckdb::MaterializedQueryResult>
  run_prepared(duckdb::Connection &con, const std::string &log_prefix,
               const std::string &query, duckdb::vector<duckdb::Value> &params,
               const std::string &error_message, bool verbose);
};
