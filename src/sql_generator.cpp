#include "sql_generator.hpp"

#include "dt_error.hpp"
#include "dt_logging.hpp"
#include "predicate.hpp"
#include "transaction_scope.hpp"

#include <algorithm>
#include <functional>
#include <map>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

// Utility

const auto print_column = [](const std::string &quoted_col,
                             std::ostringstream &out) { out << quoted_col; };

void write_joined(
    std::ostringstream &sql, const std::vector<std::string> &columns,
    std::function<void(const std::string &, std::ostringstream &)> print_str,
    const std::string &separator) {
  bool first = true;
  for (const auto &col : columns) {
    if (first) {
      first = false;
    } else {
      sql << separator;
    }
    print_str(quote_identifier(col), sql);
  }
}

namespace {

void write_where(std::ostringstream &sql, const compiled_condition &condition) {
  if (!condition.empty()) {
    sql << " WHERE " << condition.sql;
  }
}

void require_columns(const table_handle &table,
                     const std::vector<std::string> &columns) {
  for (const auto &col : columns) {
    if (!table.has_column(col)) {
      throw dt_error::UnknownColumn(table.table.table_name, col);
    }
  }
}

// Keys of records[begin], which every record of the range has to share.
std::vector<std::string> chunk_columns(const std::vector<Record> &records,
                                       std::size_t begin, std::size_t end,
                                       const std::string &absolute_table_name) {
  auto columns = records[begin].keys();
  for (std::size_t i = begin + 1; i < end; i++) {
    const auto &record = records[i];
    const bool same_keys =
        record.size() == columns.size() &&
        std::all_of(columns.begin(), columns.end(),
                    [&record](const std::string &col) {
                      return record.contains(col);
                    });
    if (!same_keys) {
      throw std::invalid_argument(
          "Record " + std::to_string(i) + " for table <" +
          absolute_table_name + "> has different columns than record " +
          std::to_string(begin));
    }
  }
  return columns;
}

bool is_simple_type(duckdb::LogicalTypeId type) {
  switch (type) {
  case duckdb::LogicalTypeId::STRUCT:
  case duckdb::LogicalTypeId::LIST:
  case duckdb::LogicalTypeId::MAP:
  case duckdb::LogicalTypeId::UNION:
  case duckdb::LogicalTypeId::ARRAY:
  case duckdb::LogicalTypeId::ENUM:
  case duckdb::LogicalTypeId::USER:
  case duckdb::LogicalTypeId::INVALID:
  case duckdb::LogicalTypeId::UNKNOWN:
    return false;
  default:
    return true;
  }
}

// Renders a key value the way it looks once stored in the column, so that
// input records can be matched with the rows of a RETURNING clause.
std::string key_string(const column_def &col, const duckdb::Value &value) {
  if (value.IsNull()) {
    return "\x01NULL";
  }
  if (is_simple_type(col.type)) {
    const auto target = col.type == duckdb::LogicalTypeId::DECIMAL
                            ? duckdb::LogicalType::DECIMAL(col.width, col.scale)
                            : duckdb::LogicalType(col.type);
    duckdb::Value cast_value;
    std::string error;
    if (value.DefaultTryCastAs(target, cast_value, &error)) {
      return cast_value.ToString();
    }
  }
  return value.ToString();
}

std::string record_key(const table_handle &table, const Record &record) {
  std::string key;
  for (const auto &pk : table.primary_key) {
    const auto *value = record.find(pk);
    key += key_string(table.column(pk), value ? *value : duckdb::Value());
    key += '\x1f';
  }
  return key;
}

Record primary_key_of(const table_handle &table, const Record &record) {
  Record key;
  for (const auto &pk : table.primary_key) {
    const auto *value = record.find(pk);
    key.set(pk, value ? *value : duckdb::Value());
  }
  return key;
}

} // namespace

std::vector<Record> to_records(duckdb::MaterializedQueryResult &result) {
  std::vector<Record> records;
  records.reserve(result.RowCount());
  for (duckdb::idx_t row = 0; row < result.RowCount(); row++) {
    Record record;
    for (duckdb::idx_t col = 0; col < result.ColumnCount(); col++) {
      record.set(result.names[col], result.GetValue(col, row));
    }
    records.push_back(std::move(record));
  }
  return records;
}

DtSqlGenerator::DtSqlGenerator(dtlog::Logger &logger_) : logger(logger_) {}

duckdb::unique_ptr<duckdb::MaterializedQueryResult>
DtSqlGenerator::run_prepared(duckdb::Connection &con,
                             const std::string &log_prefix,
                             const std::string &query,
                             duckdb::vector<duckdb::Value> &params,
                             const std::string &error_message, bool verbose) {
  if (verbose) {
    logger.info(log_prefix + ": " + query);
  }
  auto statement = con.Prepare(query);
  if (statement->HasError()) {
    throw std::runtime_error(error_message +
                             " (at bind step): " + statement->GetError());
  }
  auto result = statement->Execute(params, false);
  if (result->HasError()) {
    throw std::runtime_error(error_message + ": " + result->GetError());
  }
  return duckdb::unique_ptr_cast<duckdb::QueryResult,
                                 duckdb::MaterializedQueryResult>(
      std::move(result));
}

std::vector<Record> DtSqlGenerator::select(duckdb::Connection &con,
                                           const table_handle &table,
                                           const select_options &options) {
  const std::string absolute_table_name = table.table.to_escaped_string();
  require_columns(table, options.columns);
  const auto condition = compile_predicates(options.where, table);

  std::ostringstream sql;
  sql << "SELECT ";
  write_joined(sql,
               options.columns.empty() ? table.column_names() : options.columns,
               print_column);
  sql << " FROM " << absolute_table_name;
  write_where(sql, condition);
  if (options.sort_by.has_value()) {
    if (!table.has_column(options.sort_by.value())) {
      throw dt_error::UnknownColumn(table.table.table_name,
                                    options.sort_by.value());
    }
    sql << " ORDER BY " << quote_identifier(options.sort_by.value())
        << (options.descending ? " DESC" : " ASC");
  }
  if (options.limit.has_value()) {
    sql << " LIMIT " << options.limit.value();
  }
  if (options.offset.has_value()) {
    sql << " OFFSET " << options.offset.value();
  }

  auto params = condition.params;
  auto result = run_prepared(con, "select", sql.str(), params,
                             "Could not select from table <" +
                                 absolute_table_name + ">",
                             options.verbose);
  return to_records(*result);
}

duckdb::idx_t DtSqlGenerator::count(duckdb::Connection &con,
                                    const table_handle &table,
                                    const std::vector<predicate> &where,
                                    bool verbose) {
  const std::string absolute_table_name = table.table.to_escaped_string();
  const auto condition = compile_predicates(where, table);

  std::ostringstream sql;
  sql << "SELECT count(*) FROM " << absolute_table_name;
  write_where(sql, condition);

  auto params = condition.params;
  auto result = run_prepared(con, "count", sql.str(), params,
                             "Could not count rows of table <" +
                                 absolute_table_name + ">",
                             verbose);
  return static_cast<duckdb::idx_t>(result->GetValue(0, 0).GetValue<int64_t>());
}

std::int64_t
DtSqlGenerator::update_rows(duckdb::Connection &con, const table_handle &table,
                            const std::vector<Record> &records,
                            const std::vector<std::string> &match_fields,
                            bool verbose) {
  const std::string absolute_table_name = table.table.to_escaped_string();
  if (match_fields.empty()) {
    throw std::invalid_argument("Update of table <" + absolute_table_name +
                                "> needs at least one match field");
  }
  require_columns(table, match_fields);

  // validate everything up front so that nothing runs for a bad batch
  std::vector<std::vector<std::string>> set_columns_per_record;
  set_columns_per_record.reserve(records.size());
  for (std::size_t i = 0; i < records.size(); i++) {
    const auto &record = records[i];
    for (const auto &field : match_fields) {
      if (!record.contains(field)) {
        throw dt_error::MissingMatchField(table.table.table_name, field, i);
      }
    }
    std::vector<std::string> set_columns;
    for (const auto &f : record) {
      if (std::find(match_fields.begin(), match_fields.end(), f.first) ==
          match_fields.end()) {
        set_columns.push_back(f.first);
      }
    }
    if (set_columns.empty()) {
      throw std::invalid_argument("Record " + std::to_string(i) +
                                  " for table <" + absolute_table_name +
                                  "> has no columns to update");
    }
    require_columns(table, set_columns);
    set_columns_per_record.push_back(std::move(set_columns));
  }

  if (records.empty()) {
    return 0;
  }

  std::ostringstream where;
  write_joined(
      where, match_fields,
      [](const std::string &quoted_col, std::ostringstream &out) {
        out << quoted_col << " = ?";
      },
      " AND ");
  const std::string where_clause = where.str();

  // records with the same set of columns share one prepared statement
  std::map<std::vector<std::string>, duckdb::unique_ptr<duckdb::PreparedStatement>>
      statements;
  std::int64_t rows_affected = 0;
  const std::string err = "Could not update table <" + absolute_table_name + ">";

  TransactionScope transaction(con, logger,
                               "update of table <" + absolute_table_name + ">");
  for (std::size_t i = 0; i < records.size(); i++) {
    const auto &record = records[i];
    const auto &set_columns = set_columns_per_record[i];

    auto statement_it = statements.find(set_columns);
    if (statement_it == statements.end()) {
      std::ostringstream sql;
      sql << "UPDATE " << absolute_table_name << " SET ";
      write_joined(sql, set_columns,
                   [](const std::string &quoted_col, std::ostringstream &out) {
                     out << quoted_col << " = ?";
                   });
      sql << " WHERE " << where_clause;

      const auto query = sql.str();
      if (verbose) {
        logger.info("update: " + query);
      }
      auto statement = con.Prepare(query);
      if (statement->HasError()) {
        throw std::runtime_error(err +
                                 " (at bind step): " + statement->GetError());
      }
      statement_it =
          statements.emplace(set_columns, std::move(statement)).first;
    }

    duckdb::vector<duckdb::Value> params;
    for (const auto &col : set_columns) {
      params.push_back(record.get(col));
    }
    for (const auto &col : match_fields) {
      params.push_back(record.get(col));
    }

    auto result = statement_it->second->Execute(params, false);
    if (result->HasError()) {
      throw std::runtime_error(err + ": " + result->GetError());
    }
    auto &materialized_result = result->Cast<duckdb::MaterializedQueryResult>();
    rows_affected += materialized_result.GetValue(0, 0).GetValue<int64_t>();
  }
  transaction.Commit();

  return rows_affected;
}

void DtSqlGenerator::delete_rows(duckdb::Connection &con,
                                 const table_handle &table,
                                 const std::vector<predicate> &where,
                                 bool verbose) {
  const std::string absolute_table_name = table.table.to_escaped_string();
  const auto condition = compile_predicates(where, table);

  std::ostringstream sql;
  sql << "DELETE FROM " << absolute_table_name;
  write_where(sql, condition);

  auto params = condition.params;
  run_prepared(con, "delete_rows", sql.str(), params,
               "Error deleting rows from table <" + absolute_table_name + ">",
               verbose);
}

std::vector<Record> DtSqlGenerator::upsert_chunk(
    duckdb::Connection &con, const table_handle &table,
    const std::vector<Record> &records, std::size_t begin, std::size_t end,
    bool overwrite_with_null, bool verbose) {
  const std::string absolute_table_name = table.table.to_escaped_string();
  if (table.primary_key.empty()) {
    throw dt_error::NoPrimaryKey(table.table.table_name);
  }
  if (begin >= end) {
    return {};
  }

  const auto columns =
      chunk_columns(records, begin, end, absolute_table_name);
  if (columns.empty()) {
    throw std::invalid_argument("Cannot upsert empty records into table <" +
                                absolute_table_name + ">");
  }
  require_columns(table, columns);

  // DuckDB cannot assign to indexed columns in DO UPDATE, so key and unique
  // columns keep their stored value on conflict
  std::vector<std::string> columns_regular;
  bool all_keys_supplied = true;
  for (const auto &col : columns) {
    if (!table.is_indexed(col)) {
      columns_regular.push_back(col);
    }
  }
  for (const auto &pk : table.primary_key) {
    if (std::find(columns.begin(), columns.end(), pk) == columns.end()) {
      all_keys_supplied = false;
    }
  }

  std::ostringstream sql;
  sql << "INSERT INTO " << absolute_table_name << " (";
  write_joined(sql, columns, print_column);
  sql << ") VALUES ";

  duckdb::vector<duckdb::Value> params;
  params.reserve((end - begin) * columns.size());
  for (std::size_t i = begin; i < end; i++) {
    if (i > begin) {
      sql << ", ";
    }
    sql << "(";
    for (std::size_t c = 0; c < columns.size(); c++) {
      sql << (c == 0 ? "?" : ", ?");
      params.push_back(records[i].get(columns[c]));
    }
    sql << ")";
  }

  sql << " ON CONFLICT (";
  write_joined(sql, table.primary_key, print_column);
  sql << ")";
  if (columns_regular.empty()) {
    sql << " DO NOTHING";
  } else {
    sql << " DO UPDATE SET ";
    write_joined(sql, columns_regular,
                 [overwrite_with_null](const std::string &quoted_col,
                                       std::ostringstream &out) {
                   if (overwrite_with_null) {
                     out << quoted_col << " = excluded." << quoted_col;
                   } else {
                     out << quoted_col << " = COALESCE(excluded." << quoted_col
                         << ", " << quoted_col << ")";
                   }
                 });
  }
  sql << " RETURNING ";
  write_joined(sql, table.primary_key, print_column);

  auto result = run_prepared(con, "upsert", sql.str(), params,
                             "Could not upsert table <" + absolute_table_name +
                                 ">",
                             verbose);
  auto returned = to_records(*result);

  std::vector<Record> keys;
  keys.reserve(end - begin);
  if (!all_keys_supplied) {
    // no record supplies a key, all of them come from column defaults and
    // rows are returned in VALUES order
    if (returned.size() != end - begin) {
      throw std::runtime_error(
          "Upsert into table <" + absolute_table_name + "> returned " +
          std::to_string(returned.size()) + " keys for " +
          std::to_string(end - begin) + " records");
    }
    return returned;
  }

  std::unordered_map<std::string, std::vector<std::size_t>> returned_by_key;
  for (std::size_t r = 0; r < returned.size(); r++) {
    returned_by_key[record_key(table, returned[r])].push_back(r);
  }
  for (std::size_t i = begin; i < end; i++) {
    auto it = returned_by_key.find(record_key(table, records[i]));
    if (it != returned_by_key.end() && !it->second.empty()) {
      keys.push_back(returned[it->second.front()]);
      it->second.erase(it->second.begin());
    } else {
      // conflicting row under DO NOTHING, its key is the one we sent
      keys.push_back(primary_key_of(table, records[i]));
    }
  }
  return keys;
}

std::vector<Record> DtSqlGenerator::execute_raw(duckdb::Connection &con,
                                                const std::string &query,
                                                bool verbose) {
  if (verbose) {
    logger.info("execute_raw: " + query);
  }
  auto result = con.Query(query);
  if (result->HasError()) {
    throw std::runtime_error("Could not execute query: " + result->GetError());
  }
  return to_records(*result);
}
