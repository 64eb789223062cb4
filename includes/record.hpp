#pragma once

#include "duckdb.hpp"

#include <cstddef>
#include <initializer_list>
#include <string>
#include <utility>
#include <vector>

/// One row of an arbitrary table: column names mapped to values, in
/// insertion order. Used both for the rows passed to writes and for the rows
/// returned by reads.
class Record {
public:
  using field = std::pair<std::string, duckdb::Value>;
  using const_iterator = std::vector<field>::const_iterator;

  Record() = default;
  Record(std::initializer_list<field> fields_);

  /// Replaces the value of an existing key in place, otherwise appends.
  void set(const std::string &name, duckdb::Value value);

  /// Throws std::out_of_range for unknown keys.
  const duckdb::Value &get(const std::string &name) const;
  const duckdb::Value *find(const std::string &name) const;
  bool contains(const std::string &name) const;

  std::vector<std::string> keys() const;
  std::size_t size() const { return fields.size(); }
  bool empty() const { return fields.empty(); }

  const_iterator begin() const { return fields.begin(); }
  const_iterator end() const { return fields.end(); }

  /// Same keys in the same order, with values that are not distinct
  /// (NULL equals NULL).
  bool operator==(const Record &other) const;
  bool operator!=(const Record &other) const { return !(*this == other); }

  std::string ToString() const;

private:
  std::vector<field> fields;
};
