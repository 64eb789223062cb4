#include "transaction_scope.hpp"

#include "dt_logging.hpp"
#include "duckdb.hpp"

#include <stdexcept>
#include <string>

TransactionScope::TransactionScope(duckdb::Connection &_con,
                                   dtlog::Logger &_logger,
                                   const std::string &_description)
    : con(_con), logger(_logger), description(_description) {
  const auto begin_res = con.Query("BEGIN TRANSACTION");
  if (begin_res->HasError()) {
    throw std::runtime_error("Could not begin transaction for " + description +
                             ": " + begin_res->GetError());
  }
}

void TransactionScope::Commit() {
  finished = true;
  const auto commit_res = con.Query("COMMIT");
  if (commit_res->HasError()) {
    throw std::runtime_error("Could not commit transaction for " +
                             description + ": " + commit_res->GetError());
  }
}

TransactionScope::~TransactionScope() {
  if (finished || !con.HasActiveTransaction()) {
    return;
  }
  // Only log errors during ROLLBACK, the failing statement already threw
  const auto rollback_res = con.Query("ROLLBACK");
  if (rollback_res->HasError()) {
    logger.warning("Failed to roll back transaction for " + description +
                   ": " + rollback_res->GetError());
  } else {
    logger.warning("Rolled back transaction for " + description);
  }
}
