#pragma once

#include "dt_logging.hpp"
#include "duckdb.hpp"
#include <string>

/// Explicit transaction that is rolled back when it goes out of scope
/// without Commit(). Its lifetime must be shorter than the connection.
class TransactionScope final {
public:
  TransactionScope(duckdb::Connection &_con, dtlog::Logger &_logger,
                   const std::string &_description);
  ~TransactionScope();

  TransactionScope(const TransactionScope &) = delete;
  TransactionScope &operator=(const TransactionScope &) = delete;

  void Commit();

private:
  duckdb::Connection &con;
  dtlog::Logger &logger;
  std::string description;
  bool finished = false;
};
