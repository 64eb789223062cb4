#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace dt_error {

/// Base class of every error raised by the table access layer itself.
/// Failures reported by DuckDB while running a statement are raised as
/// plain std::runtime_error with the DuckDB message appended.
class TableAccessError : public std::runtime_error {
public:
  explicit TableAccessError(const std::string &msg) : runtime_error(msg) {}
};

/// The database could not be opened or did not answer the liveness check.
class ConnectionFailure : public TableAccessError {
public:
  explicit ConnectionFailure(const std::string &msg) : TableAccessError(msg) {}
};

class TableNotFound : public TableAccessError {
public:
  TableNotFound(const std::string &schema_name, const std::string &table_name);

  const std::string schema_name;
  const std::string table_name;
};

class NoPrimaryKey : public TableAccessError {
public:
  explicit NoPrimaryKey(const std::string &table_name);

  const std::string table_name;
};

class MissingMatchField : public TableAccessError {
public:
  MissingMatchField(const std::string &table_name, const std::string &field,
                    std::size_t record_index);

  const std::string table_name;
  const std::string field;
};

class ColumnAlreadyExists : public TableAccessError {
public:
  ColumnAlreadyExists(const std::string &table_name,
                      const std::string &column_name);

  const std::string table_name;
  const std::string column_name;
};

class UnknownColumn : public TableAccessError {
public:
  UnknownColumn(const std::string &table_name, const std::string &column_name);

  const std::string table_name;
  const std::string column_name;
};

/// Raised by the predicate compiler when a filter is not a structured
/// predicate or carries an operator that cannot be passed through safely.
class UnsafeValue : public TableAccessError {
public:
  UnsafeValue(const std::string &field, const std::string &reason);

  const std::string field;
};

/// Predicate with the wrong number of values for its operator.
class InvalidPredicate : public TableAccessError {
public:
  InvalidPredicate(const std::string &field, const std::string &reason);

  const std::string field;
};

} // namespace dt_error
