#include "schema_types.hpp"

#include "dt_error.hpp"
#include "duckdb.hpp"

#include <algorithm>
#include <sstream>
#include <string>
#include <vector>

namespace {
void write_type(std::ostream &os, duckdb::LogicalTypeId type,
                std::uint32_t width, std::uint32_t scale) {
  os << duckdb::EnumUtil::ToChars(type);
  if (type == duckdb::LogicalTypeId::DECIMAL) {
    os << " (" << width << "," << scale << ")";
  }
}
} // namespace

std::string quote_identifier(const std::string &identifier) {
  return duckdb::KeywordHelper::WriteQuoted(identifier, '"');
}

std::string table_def::to_escaped_string() const {
  std::ostringstream out;
  out << quote_identifier(db_name) << "." << quote_identifier(schema_name)
      << "." << quote_identifier(table_name);
  return out.str();
}

std::ostream &operator<<(std::ostream &os, const column_def &col) {
  write_type(os, col.type, col.width, col.scale);
  return os;
}

std::ostream &operator<<(std::ostream &os, const column_spec &col) {
  write_type(os, col.type, col.width, col.scale);
  return os;
}

bool table_handle::has_column(const std::string &column_name) const {
  return std::any_of(columns.begin(), columns.end(),
                     [&column_name](const column_def &col) {
                       return col.name == column_name;
                     });
}

const column_def &table_handle::column(const std::string &column_name) const {
  for (const auto &col : columns) {
    if (col.name == column_name) {
      return col;
    }
  }
  throw dt_error::UnknownColumn(table.table_name, column_name);
}

std::vector<std::string> table_handle::column_names() const {
  std::vector<std::string> names;
  names.reserve(columns.size());
  for (const auto &col : columns) {
    names.push_back(col.name);
  }
  return names;
}

bool table_handle::is_primary_key(const std::string &column_name) const {
  return std::find(primary_key.begin(), primary_key.end(), column_name) !=
         primary_key.end();
}

bool table_handle::is_indexed(const std::string &column_name) const {
  if (is_primary_key(column_name)) {
    return true;
  }
  return std::any_of(unique_constraints.begin(), unique_constraints.end(),
                     [&column_name](const std::vector<std::string> &unique) {
                       return std::find(unique.begin(), unique.end(),
                                        column_name) != unique.end();
                     });
}
