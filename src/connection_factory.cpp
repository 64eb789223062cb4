#include "connection_factory.hpp"

#include "config.hpp"
#include "dt_error.hpp"
#include "duckdb.hpp"

#include <exception>
#include <string>

#ifndef DYNTABLE_VERSION
#define DYNTABLE_VERSION "dev"
#endif

namespace {
duckdb::DuckDB open_database(const std::string &database_path,
                             dtlog::Logger &logger) {
  duckdb::DBConfig db_config;
  db_config.SetOptionByName("custom_user_agent",
                         std::string("dyntable/") + DYNTABLE_VERSION);

  const char *path = database_path == config::IN_MEMORY_DATABASE
                         ? nullptr
                         : database_path.c_str();
  try {
    logger.info("open_database: creating database instance for <" +
                database_path + ">");
    return duckdb::DuckDB(path, &db_config);
  } catch (const std::exception &ex) {
    const duckdb::ErrorData error(ex);
    throw dt_error::ConnectionFailure("Could not connect to database <" +
                                      database_path +
                                      ">: " + error.Message());
  }
}

void check_alive(duckdb::Connection &con, const std::string &database_path) {
  const auto result = con.Query("SELECT 1 AS is_alive");
  if (result->HasError()) {
    throw dt_error::ConnectionFailure("Could not connect to database <" +
                                      database_path +
                                      ">: " + result->GetError());
  }
}
} // namespace

ConnectionFactory::ConnectionFactory(const std::string &database_path_,
                                     dtlog::Logger &logger_)
    : database_path(database_path_), logger(logger_),
      db(open_database(database_path_, logger_)) {
  duckdb::Connection con(db);
  check_alive(con, database_path);

  const auto result = con.Query("SELECT current_database()");
  if (result->HasError()) {
    throw dt_error::ConnectionFailure(
        "Could not determine the catalog name of database <" + database_path +
        ">: " + result->GetError());
  }
  catalog_name = result->GetValue(0, 0).ToString();
  logger.info("ConnectionFactory: connected to catalog <" + catalog_name +
              ">");
}

duckdb::Connection ConnectionFactory::CreateConnection() {
  return duckdb::Connection(db);
}

void ConnectionFactory::CheckConnection() {
  auto con = CreateConnection();
  check_alive(con, database_path);
}
