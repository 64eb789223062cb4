#include "schema_evolution.hpp"

#include "dt_error.hpp"
#include "dt_logging.hpp"
#include "duckdb.hpp"
#include "schema_introspector.hpp"
#include "sql_generator.hpp"
#include "transaction_scope.hpp"

#include <algorithm>
#include <set>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

using duckdb::KeywordHelper;

namespace {

const auto print_column = [](const std::string &quoted_col,
                             std::ostringstream &out) { out << quoted_col; };

std::string sequence_name(const table_def &table, const column_spec &col) {
  return table.table_name + "_" + col.name + "_seq";
}

std::string absolute_sequence_name(const table_def &table,
                                   const column_spec &col) {
  return table_def{table.db_name, table.schema_name, sequence_name(table, col)}
      .to_escaped_string();
}

void write_default(std::ostringstream &ddl, const table_def &table,
                   const column_spec &col) {
  if (col.autoincrement) {
    ddl << " DEFAULT nextval("
        << KeywordHelper::WriteQuoted(absolute_sequence_name(table, col), '\'')
        << ")";
  } else if (col.server_default.has_value()) {
    ddl << " DEFAULT (" << col.server_default.value() << ")";
  } else if (col.default_value.has_value()) {
    ddl << " DEFAULT " << col.default_value->ToSQLString();
  }
}

void validate_specs(const table_def &table,
                    const std::vector<column_spec> &columns,
                    const create_table_options &options) {
  const std::string absolute_table_name = table.to_escaped_string();
  if (columns.empty()) {
    throw std::invalid_argument("Cannot create table <" + absolute_table_name +
                                "> without columns");
  }

  std::set<std::string> names;
  for (const auto &col : columns) {
    if (!names.insert(col.name).second) {
      throw std::invalid_argument("Column <" + col.name +
                                  "> is defined twice for table <" +
                                  absolute_table_name + ">");
    }
    const int default_sources = (col.autoincrement ? 1 : 0) +
                                (col.server_default.has_value() ? 1 : 0) +
                                (col.default_value.has_value() ? 1 : 0);
    if (default_sources > 1) {
      throw std::invalid_argument(
          "Column <" + col.name + "> of table <" + absolute_table_name +
          "> may only have one of autoincrement, server default or default");
    }
  }

  for (const auto &pk : options.primary_key) {
    if (names.find(pk) == names.end()) {
      throw std::invalid_argument("Primary key column <" + pk +
                                  "> is not a column of table <" +
                                  absolute_table_name + ">");
    }
  }
  for (const auto &unique : options.unique_columns) {
    if (names.find(unique) == names.end()) {
      throw std::invalid_argument("Unique column <" + unique +
                                  "> is not a column of table <" +
                                  absolute_table_name + ">");
    }
  }
}

} // namespace

SchemaEvolution::SchemaEvolution(SchemaIntrospector &introspector_,
                                 dtlog::Logger &logger_)
    : introspector(introspector_), logger(logger_) {}

void SchemaEvolution::run_query(duckdb::Connection &con,
                                const std::string &log_prefix,
                                const std::string &query,
                                const std::string &error_message,
                                bool verbose) {
  if (verbose) {
    logger.info(log_prefix + ": " + query);
  }
  auto result = con.Query(query);
  if (result->HasError()) {
    throw std::runtime_error(error_message + ": " + result->GetError());
  }
}

std::vector<column_spec>
SchemaEvolution::missing_columns(const table_handle &existing,
                                 const std::vector<column_spec> &columns) {
  std::vector<column_spec> missing;
  for (const auto &col : columns) {
    if (!existing.has_column(col.name)) {
      missing.push_back(col);
    }
  }
  return missing;
}

void SchemaEvolution::create_table(duckdb::Connection &con,
                                   const table_def &table,
                                   const std::vector<column_spec> &columns,
                                   const create_table_options &options) {
  if (options.check_existing && introspector.exists(con, table)) {
    const auto absolute_table_name = table.to_escaped_string();
    const auto existing = introspector.resolve(con, table);
    const auto missing = missing_columns(existing, columns);
    if (options.verbose) {
      logger.info("create_table: table " + absolute_table_name +
                  " exists, adding " + std::to_string(missing.size()) +
                  " missing column(s)");
    }
    if (missing.empty()) {
      return;
    }

    TransactionScope transaction(con, logger,
                                 "altering table <" + absolute_table_name +
                                     ">");
    for (const auto &col : missing) {
      alter_add_column(con, table, col, options.verbose);
    }
    transaction.Commit();
    return;
  }

  create_fresh(con, table, columns, options);
}

void SchemaEvolution::create_fresh(duckdb::Connection &con,
                                   const table_def &table,
                                   const std::vector<column_spec> &columns,
                                   const create_table_options &options) {
  validate_specs(table, columns, options);
  const std::string absolute_table_name = table.to_escaped_string();

  TransactionScope transaction(con, logger,
                               "creating table <" + absolute_table_name + ">");

  for (const auto &col : columns) {
    if (!col.autoincrement) {
      continue;
    }
    run_query(con, "create_table sequence",
              "CREATE SEQUENCE IF NOT EXISTS " +
                  absolute_sequence_name(table, col),
              "Could not create sequence for column <" + col.name +
                  "> of table <" + absolute_table_name + ">",
              options.verbose);
  }

  std::ostringstream ddl;
  ddl << "CREATE TABLE ";
  if (options.check_existing) {
    ddl << "IF NOT EXISTS ";
  }
  ddl << absolute_table_name << " (";

  bool first = true;
  for (const auto &col : columns) {
    if (first) {
      first = false;
    } else {
      ddl << ", ";
    }
    ddl << quote_identifier(col.name) << " " << col;
    write_default(ddl, table, col);
  }

  if (!options.primary_key.empty()) {
    ddl << ", PRIMARY KEY (";
    write_joined(ddl, options.primary_key, print_column);
    ddl << ")";
  }

  for (const auto &unique : options.unique_columns) {
    ddl << ", UNIQUE (" << quote_identifier(unique) << ")";
  }

  for (const auto &col : columns) {
    if (!col.foreign_key.has_value()) {
      continue;
    }
    ddl << ", FOREIGN KEY (" << quote_identifier(col.name) << ") REFERENCES "
        << quote_identifier(col.foreign_key->table_name) << " ("
        << quote_identifier(col.foreign_key->column_name) << ")";
  }

  ddl << ")";

  run_query(con, "create_table", ddl.str(),
            "Could not create table <" + absolute_table_name + ">",
            options.verbose);
  transaction.Commit();
}

void SchemaEvolution::add_column(duckdb::Connection &con,
                                 const table_def &table,
                                 const column_spec &column, bool verbose) {
  const auto existing = introspector.resolve(con, table);
  if (existing.has_column(column.name)) {
    throw dt_error::ColumnAlreadyExists(table.table_name, column.name);
  }
  alter_add_column(con, table, column, verbose);
}

void SchemaEvolution::alter_add_column(duckdb::Connection &con,
                                       const table_def &table,
                                       const column_spec &column,
                                       bool verbose) {
  const std::string absolute_table_name = table.to_escaped_string();
  if (column.autoincrement || column.foreign_key.has_value()) {
    logger.warning("Column <" + column.name + "> is added to existing table " +
                   absolute_table_name +
                   " without its autoincrement or foreign key");
  }

  std::ostringstream out;
  out << "ALTER TABLE " << absolute_table_name << " ADD COLUMN "
      << quote_identifier(column.name) << " " << column;
  if (column.server_default.has_value()) {
    out << " DEFAULT (" << column.server_default.value() << ")";
  } else if (column.default_value.has_value()) {
    out << " DEFAULT " << column.default_value->ToSQLString();
  }

  run_query(con, "alter_table add", out.str(),
            "Could not add column <" + column.name + "> to table <" +
                absolute_table_name + ">",
            verbose);
}
