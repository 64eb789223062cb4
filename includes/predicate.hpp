#pragma once

#include "duckdb.hpp"
#include "record.hpp"
#include "schema_types.hpp"

#include <string>
#include <vector>

enum class predicate_op {
  equals,
  in,
  not_in,
  like,
  not_like,
  is_null,
  is_not_null,
  between,
  not_between,
  // operator text is applied literally, see is_safe_operator
  custom,
};

/// One filter leaf. A list of predicates is always combined with AND.
struct predicate {
  std::string field;
  predicate_op op = predicate_op::equals;
  std::vector<duckdb::Value> values;
  // only set for predicate_op::custom
  std::string custom_operator;
};

/// A condition ready to be placed after WHERE. Parameters are positional and
/// appear in the order of their placeholders in sql.
struct compiled_condition {
  std::string sql;
  duckdb::vector<duckdb::Value> params;

  [[nodiscard]] bool empty() const { return sql.empty(); }
};

namespace filter {
predicate equals(const std::string &field, duckdb::Value value);
predicate in(const std::string &field, std::vector<duckdb::Value> values);
predicate not_in(const std::string &field, std::vector<duckdb::Value> values);
predicate like(const std::string &field, const std::string &pattern);
predicate not_like(const std::string &field, const std::string &pattern);
predicate is_null(const std::string &field);
predicate is_not_null(const std::string &field);
predicate between(const std::string &field, duckdb::Value low,
                  duckdb::Value high);
predicate not_between(const std::string &field, duckdb::Value low,
                      duckdb::Value high);

/// Named operators ("in", "not like", ...) map to their fast path, anything
/// else becomes a custom operator.
predicate op(const std::string &field, const std::string &operator_name,
             duckdb::Value value);

/// Turns the mapping form of a filter into predicates. Plain values mean
/// equality. A STRUCT value with exactly the children "operator" and "value"
/// is an operator-tagged leaf; a LIST "value" carries several values.
std::vector<predicate> from_record(const Record &where);
std::vector<predicate> from_records(const std::vector<Record> &where);
} // namespace filter

predicate_op parse_operator(const std::string &operator_name);
std::string operator_name(predicate_op op);

/// Symbolic operators of at most three characters, or a known keyword
/// operator such as ILIKE or IS DISTINCT FROM.
bool is_safe_operator(const std::string &operator_text);

compiled_condition compile_predicates(const std::vector<predicate> &predicates,
                                      const table_handle &table);
