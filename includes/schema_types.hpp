#pragma once

#include "duckdb.hpp"

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

/// A column as found in the live catalog.
struct column_def {
  std::string name;
  duckdb::LogicalTypeId type;
  bool primary_key = false;
  std::uint32_t width = 0;
  std::uint32_t scale = 0;
  bool nullable = true;
};

struct table_def {
  std::string db_name;
  std::string schema_name;
  std::string table_name;

  [[nodiscard]] std::string to_escaped_string() const;
};

struct foreign_key_ref {
  std::string table_name;
  std::string column_name;
};

/// A column to be created. Only used by CREATE TABLE and ADD COLUMN.
struct column_spec {
  std::string name;
  duckdb::LogicalTypeId type;
  std::uint32_t width = 18;
  std::uint32_t scale = 3;
  std::optional<duckdb::Value> default_value;
  // SQL expression, written into the DDL as is. Must come from the
  // application, never from end-user input.
  std::optional<std::string> server_default;
  bool autoincrement = false;
  std::optional<foreign_key_ref> foreign_key;
};

/// Structure of one table, resolved from the catalog for a single call.
struct table_handle {
  table_def table;
  std::vector<column_def> columns;
  // in key order
  std::vector<std::string> primary_key;
  std::vector<std::vector<std::string>> unique_constraints;

  [[nodiscard]] bool has_column(const std::string &column_name) const;
  [[nodiscard]] const column_def &column(const std::string &column_name) const;
  [[nodiscard]] std::vector<std::string> column_names() const;
  [[nodiscard]] bool is_primary_key(const std::string &column_name) const;
  /// Part of the primary key or of a unique constraint.
  [[nodiscard]] bool is_indexed(const std::string &column_name) const;
};

std::ostream &operator<<(std::ostream &os, const column_def &col);
std::ostream &operator<<(std::ostream &os, const column_spec &col);

std::string quote_identifier(const std::string &identifier);
