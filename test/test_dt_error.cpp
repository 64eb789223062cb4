#include "dt_error.hpp"

#include <catch2/catch_test_macros.hpp>
#include <stdexcept>
#include <string>

TEST_CASE("Test dt_error messages", "[dt_error]") {
  SECTION("TableNotFound") {
    const dt_error::TableNotFound error("main", "orders");
    CHECK(std::string(error.what()) ==
          "Table <orders> does not exist in schema <main>");
    CHECK(error.schema_name == "main");
    CHECK(error.table_name == "orders");
  }

  SECTION("NoPrimaryKey") {
    const dt_error::NoPrimaryKey error("events");
    CHECK(std::string(error.what()) ==
          "No primary key found for table <events>");
  }

  SECTION("MissingMatchField") {
    const dt_error::MissingMatchField error("orders", "id", 3);
    CHECK(std::string(error.what()) ==
          "Record 3 for table <orders> is missing match field <id>");
    CHECK(error.field == "id");
  }

  SECTION("ColumnAlreadyExists") {
    const dt_error::ColumnAlreadyExists error("orders", "note");
    CHECK(std::string(error.what()) ==
          "Column <note> already exists in table <orders>");
  }

  SECTION("UnsafeValue") {
    const dt_error::UnsafeValue error("status", "operator <;> is not allowed");
    CHECK(std::string(error.what()) ==
          "Unsafe filter on field <status>: operator <;> is not allowed");
  }
}

TEST_CASE("Test dt_error hierarchy", "[dt_error]") {
  REQUIRE_THROWS_AS(throw dt_error::ConnectionFailure("down"),
                    dt_error::TableAccessError);
  REQUIRE_THROWS_AS(throw dt_error::UnknownColumn("t", "c"),
                    dt_error::TableAccessError);
  REQUIRE_THROWS_AS(throw dt_error::InvalidPredicate("c", "no values"),
                    std::runtime_error);
}
