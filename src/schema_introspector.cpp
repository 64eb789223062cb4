#include "schema_introspector.hpp"

#include "dt_error.hpp"
#include "dt_logging.hpp"
#include "duckdb.hpp"
#include "schema_types.hpp"

#include <cstdint>
#include <exception>
#include <stdexcept>
#include <string>
#include <vector>

namespace {
duckdb::unique_ptr<duckdb::QueryResult>
run_catalog_query(duckdb::Connection &con, const std::string &query,
                  duckdb::vector<duckdb::Value> params,
                  const std::string &err) {
  auto statement = con.Prepare(query);
  if (statement->HasError()) {
    throw std::runtime_error(err + " (at bind step): " + statement->GetError());
  }
  auto result = statement->Execute(params, false);
  if (result->HasError()) {
    throw std::runtime_error(err + ": " + result->GetError());
  }
  return result;
}
} // namespace

SchemaIntrospector::SchemaIntrospector(dtlog::Logger &logger_)
    : logger(logger_) {}

bool SchemaIntrospector::exists(duckdb::Connection &con,
                                const table_def &table) {
  const std::string query =
      "SELECT table_name FROM duckdb_tables() WHERE "
      "database_name=? AND schema_name=? AND table_name=?";
  const std::string err =
      "Could not find whether table <" + table.to_escaped_string() + "> exists";
  try {
    auto result = run_catalog_query(con, query,
                                    {duckdb::Value(table.db_name),
                                     duckdb::Value(table.schema_name),
                                     duckdb::Value(table.table_name)},
                                    err);
    auto &materialized_result =
        result->Cast<duckdb::MaterializedQueryResult>();
    return materialized_result.RowCount() > 0;
  } catch (const std::exception &ex) {
    logger.warning(ex.what());
    return false;
  }
}

std::vector<column_def>
SchemaIntrospector::describe_columns(duckdb::Connection &con,
                                     const table_def &table) {
  const std::string query = "SELECT "
                            "column_name, "
                            "data_type_id, "
                            "is_nullable, "
                            "numeric_precision, "
                            "numeric_scale "
                            "FROM duckdb_columns() "
                            "WHERE database_name=? "
                            "AND schema_name=? "
                            "AND table_name=? "
                            "ORDER BY column_index";
  const std::string err =
      "Could not describe table <" + table.to_escaped_string() + ">";
  auto result = run_catalog_query(con, query,
                                  {duckdb::Value(table.db_name),
                                   duckdb::Value(table.schema_name),
                                   duckdb::Value(table.table_name)},
                                  err);
  auto &materialized_result = result->Cast<duckdb::MaterializedQueryResult>();

  std::vector<column_def> columns;
  for (duckdb::idx_t row = 0; row < materialized_result.RowCount(); row++) {
    const auto type_id = materialized_result.GetValue(1, row).GetValue<int64_t>();
    column_def col;
    col.name = materialized_result.GetValue(0, row).GetValue<std::string>();
    col.type =
        static_cast<duckdb::LogicalTypeId>(static_cast<std::uint8_t>(type_id));
    col.nullable = materialized_result.GetValue(2, row).GetValue<bool>();
    if (col.type == duckdb::LogicalTypeId::DECIMAL) {
      col.width = materialized_result.GetValue(3, row).GetValue<uint32_t>();
      col.scale = materialized_result.GetValue(4, row).GetValue<uint32_t>();
    }
    columns.push_back(col);
  }
  return columns;
}

void SchemaIntrospector::describe_constraints(duckdb::Connection &con,
                                              table_handle &handle) {
  const std::string query =
      "SELECT constraint_type, constraint_column_names "
      "FROM duckdb_constraints() "
      "WHERE database_name=? AND schema_name=? AND table_name=? "
      "AND constraint_type IN ('PRIMARY KEY', 'UNIQUE') "
      "ORDER BY constraint_index";
  const std::string err = "Could not read constraints of table <" +
                          handle.table.to_escaped_string() + ">";
  auto result = run_catalog_query(con, query,
                                  {duckdb::Value(handle.table.db_name),
                                   duckdb::Value(handle.table.schema_name),
                                   duckdb::Value(handle.table.table_name)},
                                  err);
  auto &materialized_result = result->Cast<duckdb::MaterializedQueryResult>();

  for (duckdb::idx_t row = 0; row < materialized_result.RowCount(); row++) {
    const auto constraint_type =
        materialized_result.GetValue(0, row).GetValue<std::string>();
    const auto column_names_value = materialized_result.GetValue(1, row);

    std::vector<std::string> column_names;
    for (const auto &name : duckdb::ListValue::GetChildren(column_names_value)) {
      column_names.push_back(name.GetValue<std::string>());
    }

    if (constraint_type == "PRIMARY KEY") {
      handle.primary_key = column_names;
    } else {
      handle.unique_constraints.push_back(column_names);
    }
  }

  for (auto &col : handle.columns) {
    col.primary_key = handle.is_primary_key(col.name);
  }
}

table_handle SchemaIntrospector::resolve(duckdb::Connection &con,
                                         const table_def &table) {
  table_handle handle;
  handle.table = table;
  handle.columns = describe_columns(con, table);
  if (handle.columns.empty()) {
    throw dt_error::TableNotFound(table.schema_name, table.table_name);
  }
  describe_constraints(con, handle);
  return handle;
}

std::vector<std::string> SchemaIntrospector::columns(duckdb::Connection &con,
                                                     const table_def &table) {
  return resolve(con, table).column_names();
}

std::vector<std::string> SchemaIntrospector::list_relations(
    duckdb::Connection &con, const std::string &query,
    const std::string &db_name, const std::string &schema_name) {
  const std::string err = "Could not list relations in schema <" +
                          schema_name + "> of database <" + db_name + ">";
  auto result = run_catalog_query(
      con, query, {duckdb::Value(db_name), duckdb::Value(schema_name)}, err);
  auto &materialized_result = result->Cast<duckdb::MaterializedQueryResult>();

  std::vector<std::string> names;
  for (duckdb::idx_t row = 0; row < materialized_result.RowCount(); row++) {
    names.push_back(materialized_result.GetValue(0, row).GetValue<std::string>());
  }
  return names;
}

std::vector<std::string>
SchemaIntrospector::tables(duckdb::Connection &con, const std::string &db_name,
                           const std::string &schema_name) {
  return list_relations(con,
                        "SELECT table_name FROM duckdb_tables() "
                        "WHERE database_name=? AND schema_name=? "
                        "AND NOT internal ORDER BY table_name",
                        db_name, schema_name);
}

std::vector<std::string>
SchemaIntrospector::views(duckdb::Connection &con, const std::string &db_name,
                          const std::string &schema_name) {
  return list_relations(con,
                        "SELECT view_name FROM duckdb_views() "
                        "WHERE database_name=? AND schema_name=? "
                        "AND NOT internal ORDER BY view_name",
                        db_name, schema_name);
}
