#pragma once

#include "config.hpp"
#include "connection_factory.hpp"
#include "dt_logging.hpp"
#include "duckdb.hpp"
#include "predicate.hpp"
#include "record.hpp"
#include "schema_evolution.hpp"
#include "schema_introspector.hpp"
#include "schema_types.hpp"
#include "sql_generator.hpp"
#include "upsert_batch.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

/// Generic access to the tables of one DuckDB database, without static
/// record types. Every operation opens its own connection, resolves the
/// table from the live catalog, and closes the connection before returning,
/// so one TableGateway can be used from several threads.
class TableGateway {
public:
  /// Throws dt_error::ConnectionFailure if the database cannot be opened.
  explicit TableGateway(
      const config::TableGatewayConfiguration &configuration_,
      dtlog::Logger logger_ = dtlog::Logger::CreateStdoutLogger());

  TableGateway(const TableGateway &) = delete;
  TableGateway &operator=(const TableGateway &) = delete;

  std::vector<Record> get(const std::string &table_name,
                          const select_options &options = {});

  duckdb::idx_t get_table_count(const std::string &table_name,
                                const std::vector<predicate> &where = {},
                                bool verbose = false);

  /// Each record holds every match field plus the columns to set. Returns
  /// the number of rows modified.
  std::int64_t update(const std::string &table_name,
                      const std::vector<Record> &records,
                      const std::vector<std::string> &match_fields,
                      bool verbose = false);
  std::int64_t update(const std::string &table_name, const Record &record,
                      const std::string &match_field, bool verbose = false);

  /// Without a filter, every row of the table is deleted.
  void delete_rows(const std::string &table_name,
                   const std::vector<predicate> &where = {},
                   bool verbose = false);

  /// Returns the primary key of every record, in input order. Chunks are
  /// not rolled back when a later chunk fails; running the same records
  /// again is safe.
  std::vector<Record> upsert(const std::string &table_name,
                             const std::vector<Record> &records,
                             std::optional<upsert_options> options = {});
  Record upsert(const std::string &table_name, const Record &record,
                std::optional<upsert_options> options = {});

  void create_table(const std::string &table_name,
                    const std::vector<column_spec> &columns,
                    const create_table_options &options = {});

  void add_column(const std::string &table_name, const column_spec &column,
                  bool verbose = false);
  void add_column(const std::string &table_name,
                  const std::string &column_name,
                  duckdb::LogicalTypeId column_type, bool verbose = false);

  bool table_exists(const std::string &table_name,
                    const std::optional<std::string> &schema_name = {});
  table_handle describe_table(const std::string &table_name);
  std::vector<std::string> get_table_columns(const std::string &table_name);
  std::vector<std::string>
  get_tables(const std::optional<std::string> &schema_name = {});
  std::vector<std::string>
  get_views(const std::optional<std::string> &schema_name = {});

  /// Runs trusted SQL as is. Not for statements built from user input.
  std::vector<Record> execute_raw(const std::string &query,
                                  bool verbose = false);

  void check_connection();

  std::string to_string() const;
  const config::TableGatewayConfiguration &GetConfiguration() const {
    return configuration;
  }

private:
  table_def make_table_def(const std::string &table_name,
                           const std::optional<std::string> &schema_name =
                               std::nullopt) const;
  upsert_options default_upsert_options() const;

  config::TableGatewayConfiguration configuration;
  // referenced by the members below, so it has to be declared first
  dtlog::Logger logger;
  ConnectionFactory connection_factory;
  SchemaIntrospector introspector;
  DtSqlGenerator generator;
  SchemaEvolution evolution;
};
