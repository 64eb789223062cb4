#include "table_gateway.hpp"

#include "config.hpp"
#include "dt_error.hpp"
#include "dt_logging.hpp"
#include "duckdb.hpp"
#include "upsert_batch.hpp"

#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

TableGateway::TableGateway(
    const config::TableGatewayConfiguration &configuration_,
    dtlog::Logger logger_)
    : configuration(configuration_), logger(std::move(logger_)),
      connection_factory(configuration.database, logger), introspector(logger),
      generator(logger), evolution(introspector, logger) {}

table_def TableGateway::make_table_def(
    const std::string &table_name,
    const std::optional<std::string> &schema_name) const {
  if (table_name.empty()) {
    throw std::invalid_argument("Table name cannot be empty");
  }
  return table_def{connection_factory.GetCatalogName(),
                   schema_name.value_or(configuration.schema_name),
                   table_name};
}

upsert_options TableGateway::default_upsert_options() const {
  upsert_options options;
  options.chunk_size = configuration.chunk_size;
  options.verbose = configuration.verbose;
  return options;
}

std::vector<Record> TableGateway::get(const std::string &table_name,
                                      const select_options &options) {
  auto con = connection_factory.CreateConnection();
  const auto table = introspector.resolve(con, make_table_def(table_name));

  auto effective_options = options;
  effective_options.verbose = options.verbose || configuration.verbose;
  return generator.select(con, table, effective_options);
}

duckdb::idx_t
TableGateway::get_table_count(const std::string &table_name,
                              const std::vector<predicate> &where,
                              bool verbose) {
  auto con = connection_factory.CreateConnection();
  const auto table = introspector.resolve(con, make_table_def(table_name));
  return generator.count(con, table, where, verbose || configuration.verbose);
}

std::int64_t TableGateway::update(const std::string &table_name,
                                  const std::vector<Record> &records,
                                  const std::vector<std::string> &match_fields,
                                  bool verbose) {
  auto con = connection_factory.CreateConnection();
  const auto table = introspector.resolve(con, make_table_def(table_name));
  return generator.update_rows(con, table, records, match_fields,
                               verbose || configuration.verbose);
}

std::int64_t TableGateway::update(const std::string &table_name,
                                  const Record &record,
                                  const std::string &match_field,
                                  bool verbose) {
  return update(table_name, std::vector<Record>{record},
                std::vector<std::string>{match_field}, verbose);
}

void TableGateway::delete_rows(const std::string &table_name,
                               const std::vector<predicate> &where,
                               bool verbose) {
  auto con = connection_factory.CreateConnection();
  const auto table = introspector.resolve(con, make_table_def(table_name));
  generator.delete_rows(con, table, where, verbose || configuration.verbose);
}

std::vector<Record> TableGateway::upsert(const std::string &table_name,
                                         const std::vector<Record> &records,
                                         std::optional<upsert_options> options) {
  auto effective_options = options.value_or(default_upsert_options());
  effective_options.verbose = effective_options.verbose || configuration.verbose;

  auto con = connection_factory.CreateConnection();
  const auto table = introspector.resolve(con, make_table_def(table_name));
  if (table.primary_key.empty()) {
    throw dt_error::NoPrimaryKey(table_name);
  }

  const UpsertBatch batch(records, effective_options.chunk_size);
  return batch.run(con, generator, table, effective_options, logger);
}

Record TableGateway::upsert(const std::string &table_name, const Record &record,
                            std::optional<upsert_options> options) {
  auto keys = upsert(table_name, std::vector<Record>{record}, options);
  if (keys.size() != 1) {
    throw std::runtime_error("Upsert of a single record into table <" +
                             table_name + "> returned " +
                             std::to_string(keys.size()) + " keys");
  }
  return std::move(keys.front());
}

void TableGateway::create_table(const std::string &table_name,
                                const std::vector<column_spec> &columns,
                                const create_table_options &options) {
  auto con = connection_factory.CreateConnection();
  auto effective_options = options;
  effective_options.verbose = options.verbose || configuration.verbose;
  evolution.create_table(con, make_table_def(table_name), columns,
                         effective_options);
}

void TableGateway::add_column(const std::string &table_name,
                              const column_spec &column, bool verbose) {
  auto con = connection_factory.CreateConnection();
  evolution.add_column(con, make_table_def(table_name), column,
                       verbose || configuration.verbose);
}

void TableGateway::add_column(const std::string &table_name,
                              const std::string &column_name,
                              duckdb::LogicalTypeId column_type,
                              bool verbose) {
  column_spec column;
  column.name = column_name;
  column.type = column_type;
  add_column(table_name, column, verbose);
}

bool TableGateway::table_exists(const std::string &table_name,
                                const std::optional<std::string> &schema_name) {
  auto con = connection_factory.CreateConnection();
  return introspector.exists(con, make_table_def(table_name, schema_name));
}

table_handle TableGateway::describe_table(const std::string &table_name) {
  auto con = connection_factory.CreateConnection();
  return introspector.resolve(con, make_table_def(table_name));
}

std::vector<std::string>
TableGateway::get_table_columns(const std::string &table_name) {
  auto con = connection_factory.CreateConnection();
  return introspector.columns(con, make_table_def(table_name));
}

std::vector<std::string>
TableGateway::get_tables(const std::optional<std::string> &schema_name) {
  auto con = connection_factory.CreateConnection();
  return introspector.tables(con, connection_factory.GetCatalogName(),
                             schema_name.value_or(configuration.schema_name));
}

std::vector<std::string>
TableGateway::get_views(const std::optional<std::string> &schema_name) {
  auto con = connection_factory.CreateConnection();
  return introspector.views(con, connection_factory.GetCatalogName(),
                            schema_name.value_or(configuration.schema_name));
}

std::vector<Record> TableGateway::execute_raw(const std::string &query,
                                              bool verbose) {
  auto con = connection_factory.CreateConnection();
  return generator.execute_raw(con, query, verbose || configuration.verbose);
}

void TableGateway::check_connection() { connection_factory.CheckConnection(); }

std::string TableGateway::to_string() const {
  return "TableGateway(" + configuration.database +
         ", schema=" + configuration.schema_name + ")";
}
