#include "predicate.hpp"

#include "dt_error.hpp"
#include "duckdb.hpp"
#include "record.hpp"
#include "schema_types.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <sstream>
#include <string>
#include <vector>

namespace {

const std::array<const char *, 8> KEYWORD_OPERATORS = {
    "ILIKE",      "NOT ILIKE",      "GLOB",
    "NOT GLOB",   "SIMILAR TO",     "NOT SIMILAR TO",
    "IS DISTINCT FROM", "IS NOT DISTINCT FROM"};

const std::string SYMBOL_OPERATOR_CHARS = "<>=!~@#%^&|*+-/";

std::string trim(const std::string &str) {
  const auto first = str.find_first_not_of(" \t\n");
  if (first == std::string::npos) {
    return "";
  }
  const auto last = str.find_last_not_of(" \t\n");
  return str.substr(first, last - first + 1);
}

// upper case, runs of whitespace collapsed to a single space
std::string normalize_operator(const std::string &operator_text) {
  std::string result;
  bool in_space = false;
  for (const char c : trim(operator_text)) {
    if (std::isspace(static_cast<unsigned char>(c))) {
      in_space = true;
      continue;
    }
    if (in_space) {
      result += ' ';
      in_space = false;
    }
    result += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
  }
  return result;
}

void write_placeholders(std::ostringstream &sql, std::size_t count) {
  for (std::size_t i = 0; i < count; i++) {
    if (i > 0) {
      sql << ", ";
    }
    sql << "?";
  }
}

void require_value_count(const predicate &pred, std::size_t expected) {
  if (pred.values.size() != expected) {
    throw dt_error::InvalidPredicate(
        pred.field, "operator <" + operator_name(pred.op) + "> expects " +
                        std::to_string(expected) + " value(s), got " +
                        std::to_string(pred.values.size()));
  }
}

std::vector<duckdb::Value> values_of(const duckdb::Value &value) {
  if (!value.IsNull() && value.type().id() == duckdb::LogicalTypeId::LIST) {
    const auto &children = duckdb::ListValue::GetChildren(value);
    return std::vector<duckdb::Value>(children.begin(), children.end());
  }
  return {value};
}

predicate leaf_from_struct(const std::string &field,
                           const duckdb::Value &value) {
  const auto &child_types = duckdb::StructType::GetChildTypes(value.type());
  const auto &children = duckdb::StructValue::GetChildren(value);

  const duckdb::Value *operator_value = nullptr;
  const duckdb::Value *operand = nullptr;
  for (std::size_t i = 0; i < child_types.size(); i++) {
    if (child_types[i].first == "operator") {
      operator_value = &children[i];
    } else if (child_types[i].first == "value") {
      operand = &children[i];
    } else {
      throw dt_error::UnsafeValue(field, "unexpected key <" +
                                             child_types[i].first +
                                             "> in operator filter");
    }
  }
  if (operator_value == nullptr) {
    throw dt_error::UnsafeValue(field,
                                "structured filter is missing an operator");
  }
  if (operator_value->IsNull() ||
      operator_value->type().id() != duckdb::LogicalTypeId::VARCHAR) {
    throw dt_error::UnsafeValue(field, "operator must be a string");
  }

  predicate pred;
  pred.field = field;
  const auto operator_text = operator_value->GetValue<std::string>();
  pred.op = parse_operator(operator_text);
  if (pred.op == predicate_op::custom) {
    pred.custom_operator = operator_text;
  }
  if (operand == nullptr || pred.op == predicate_op::is_null ||
      pred.op == predicate_op::is_not_null) {
    return pred;
  }
  // a custom operator gets its operand as is, lists included
  if (pred.op == predicate_op::custom) {
    pred.values = {*operand};
  } else {
    pred.values = values_of(*operand);
  }
  return pred;
}

std::string compile_leaf(const predicate &pred, const table_handle &table,
                         duckdb::vector<duckdb::Value> &params) {
  if (!table.has_column(pred.field)) {
    throw dt_error::UnknownColumn(table.table.table_name, pred.field);
  }
  const std::string column = quote_identifier(pred.field);
  std::ostringstream sql;

  switch (pred.op) {
  case predicate_op::equals:
    require_value_count(pred, 1);
    if (pred.values[0].IsNull()) {
      sql << column << " IS NULL";
    } else {
      sql << column << " = ?";
      params.push_back(pred.values[0]);
    }
    break;
  case predicate_op::in:
  case predicate_op::not_in:
    if (pred.values.empty()) {
      throw dt_error::InvalidPredicate(
          pred.field, "operator <" + operator_name(pred.op) +
                          "> expects a non-empty list of values");
    }
    sql << column << (pred.op == predicate_op::in ? " IN (" : " NOT IN (");
    write_placeholders(sql, pred.values.size());
    sql << ")";
    params.insert(params.end(), pred.values.begin(), pred.values.end());
    break;
  case predicate_op::like:
  case predicate_op::not_like:
    require_value_count(pred, 1);
    sql << column << (pred.op == predicate_op::like ? " LIKE ?" : " NOT LIKE ?");
    params.push_back(pred.values[0]);
    break;
  case predicate_op::is_null:
    sql << column << " IS NULL";
    break;
  case predicate_op::is_not_null:
    sql << column << " IS NOT NULL";
    break;
  case predicate_op::between:
    require_value_count(pred, 2);
    sql << column << " BETWEEN ? AND ?";
    params.push_back(pred.values[0]);
    params.push_back(pred.values[1]);
    break;
  case predicate_op::not_between:
    require_value_count(pred, 2);
    sql << "NOT (" << column << " BETWEEN ? AND ?)";
    params.push_back(pred.values[0]);
    params.push_back(pred.values[1]);
    break;
  case predicate_op::custom: {
    if (!is_safe_operator(pred.custom_operator)) {
      throw dt_error::UnsafeValue(pred.field, "operator <" +
                                                  pred.custom_operator +
                                                  "> is not allowed");
    }
    require_value_count(pred, 1);
    const auto normalized = normalize_operator(pred.custom_operator);
    sql << column << " " << normalized << " ?";
    params.push_back(pred.values[0]);
    break;
  }
  }
  return sql.str();
}

} // namespace

predicate_op parse_operator(const std::string &operator_name) {
  const auto normalized = normalize_operator(operator_name);
  if (normalized == "IN") {
    return predicate_op::in;
  } else if (normalized == "NOT IN") {
    return predicate_op::not_in;
  } else if (normalized == "LIKE") {
    return predicate_op::like;
  } else if (normalized == "NOT LIKE") {
    return predicate_op::not_like;
  } else if (normalized == "IS NULL") {
    return predicate_op::is_null;
  } else if (normalized == "IS NOT NULL") {
    return predicate_op::is_not_null;
  } else if (normalized == "BETWEEN") {
    return predicate_op::between;
  } else if (normalized == "NOT BETWEEN") {
    return predicate_op::not_between;
  }
  return predicate_op::custom;
}

std::string operator_name(predicate_op op) {
  switch (op) {
  case predicate_op::equals:
    return "equals";
  case predicate_op::in:
    return "in";
  case predicate_op::not_in:
    return "not in";
  case predicate_op::like:
    return "like";
  case predicate_op::not_like:
    return "not like";
  case predicate_op::is_null:
    return "is null";
  case predicate_op::is_not_null:
    return "is not null";
  case predicate_op::between:
    return "between";
  case predicate_op::not_between:
    return "not between";
  case predicate_op::custom:
    return "custom";
  }
  return "unknown";
}

bool is_safe_operator(const std::string &operator_text) {
  const auto normalized = normalize_operator(operator_text);
  if (normalized.empty()) {
    return false;
  }
  for (const auto *keyword : KEYWORD_OPERATORS) {
    if (normalized == keyword) {
      return true;
    }
  }
  if (normalized.size() > 3) {
    return false;
  }
  // comment starters would swallow the rest of the statement
  if (normalized.find("--") != std::string::npos ||
      normalized.find("/*") != std::string::npos) {
    return false;
  }
  return std::all_of(normalized.begin(), normalized.end(), [](char c) {
    return SYMBOL_OPERATOR_CHARS.find(c) != std::string::npos;
  });
}

namespace filter {

predicate equals(const std::string &field, duckdb::Value value) {
  return predicate{field, predicate_op::equals, {std::move(value)}, ""};
}

predicate in(const std::string &field, std::vector<duckdb::Value> values) {
  return predicate{field, predicate_op::in, std::move(values), ""};
}

predicate not_in(const std::string &field, std::vector<duckdb::Value> values) {
  return predicate{field, predicate_op::not_in, std::move(values), ""};
}

predicate like(const std::string &field, const std::string &pattern) {
  return predicate{field, predicate_op::like, {duckdb::Value(pattern)}, ""};
}

predicate not_like(const std::string &field, const std::string &pattern) {
  return predicate{field, predicate_op::not_like, {duckdb::Value(pattern)},
                   ""};
}

predicate is_null(const std::string &field) {
  return predicate{field, predicate_op::is_null, {}, ""};
}

predicate is_not_null(const std::string &field) {
  return predicate{field, predicate_op::is_not_null, {}, ""};
}

predicate between(const std::string &field, duckdb::Value low,
                  duckdb::Value high) {
  return predicate{
      field, predicate_op::between, {std::move(low), std::move(high)}, ""};
}

predicate not_between(const std::string &field, duckdb::Value low,
                      duckdb::Value high) {
  return predicate{
      field, predicate_op::not_between, {std::move(low), std::move(high)}, ""};
}

predicate op(const std::string &field, const std::string &operator_name,
             duckdb::Value value) {
  predicate pred;
  pred.field = field;
  pred.op = parse_operator(operator_name);
  switch (pred.op) {
  case predicate_op::is_null:
  case predicate_op::is_not_null:
    break;
  case predicate_op::custom:
    pred.custom_operator = operator_name;
    pred.values = {std::move(value)};
    break;
  default:
    pred.values = values_of(value);
  }
  return pred;
}

std::vector<predicate> from_record(const Record &where) {
  std::vector<predicate> predicates;
  for (const auto &f : where) {
    const auto &value = f.second;
    if (!value.IsNull() &&
        value.type().id() == duckdb::LogicalTypeId::STRUCT) {
      predicates.push_back(leaf_from_struct(f.first, value));
    } else {
      predicates.push_back(equals(f.first, value));
    }
  }
  return predicates;
}

std::vector<predicate> from_records(const std::vector<Record> &where) {
  std::vector<predicate> predicates;
  for (const auto &record : where) {
    auto leaves = from_record(record);
    predicates.insert(predicates.end(), leaves.begin(), leaves.end());
  }
  return predicates;
}

} // namespace filter

compiled_condition compile_predicates(const std::vector<predicate> &predicates,
                                      const table_handle &table) {
  compiled_condition condition;
  std::ostringstream sql;
  bool first = true;
  for (const auto &pred : predicates) {
    const auto leaf_sql = compile_leaf(pred, table, condition.params);
    if (first) {
      first = false;
    } else {
      sql << " AND ";
    }
    sql << "(" << leaf_sql << ")";
  }
  condition.sql = sql.str();
  return condition;
}
