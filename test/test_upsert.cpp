#include "dt_error.hpp"
#include "duckdb.hpp"
#include "predicate.hpp"
#include "record.hpp"
#include "table_gateway.hpp"
#include "test_helpers.hpp"
#include "upsert_batch.hpp"

#include <catch2/catch_test_macros.hpp>
#include <catch2/generators/catch_generators.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace test_helpers;
using Catch::Matchers::ContainsSubstring;

namespace {
Record order(TableGateway &gateway, int32_t id) {
  select_options options;
  options.where = {filter::equals("id", duckdb::Value::INTEGER(id))};
  const auto rows = gateway.get("orders", options);
  REQUIRE(rows.size() == 1);
  return rows[0];
}

std::vector<Record> numbered_orders(int count) {
  std::vector<Record> records;
  for (int i = 1; i <= count; i++) {
    records.push_back(Record{{"id", duckdb::Value::INTEGER(i)},
                             {"total", duckdb::Value::INTEGER(i * 10)}});
  }
  return records;
}
} // namespace

TEST_CASE("Upsert keeps stored values for NULL input", "[upsert]") {
  auto gateway = make_gateway();
  create_orders_table(*gateway);

  gateway->upsert("orders", Record{{"id", duckdb::Value::INTEGER(1)},
                                   {"total", duckdb::Value::INTEGER(10)},
                                   {"note", duckdb::Value()}});
  gateway->execute_raw("UPDATE orders SET note = 'keep me' WHERE id = 1");

  const auto key =
      gateway->upsert("orders", Record{{"id", duckdb::Value::INTEGER(1)},
                                       {"total", duckdb::Value::INTEGER(20)}});
  CHECK(key == Record{{"id", duckdb::Value::INTEGER(1)}});

  const auto row = order(*gateway, 1);
  CHECK(row.get("total") == duckdb::Value::INTEGER(20));
  CHECK(row.get("note") == duckdb::Value("keep me"));
  CHECK(gateway->get_table_count("orders") == 1);
}

TEST_CASE("Upsert is idempotent", "[upsert]") {
  auto gateway = make_gateway();
  create_orders_table(*gateway);

  const std::vector<Record> records{
      Record{{"id", duckdb::Value::INTEGER(1)},
             {"total", duckdb::Value::INTEGER(10)},
             {"note", duckdb::Value("one")}},
      Record{{"id", duckdb::Value::INTEGER(2)},
             {"total", duckdb::Value()},
             {"note", duckdb::Value("two")}}};
  gateway->upsert("orders", records);
  select_options options;
  options.sort_by = "id";
  const auto once = gateway->get("orders", options);

  gateway->upsert("orders", records);
  CHECK(gateway->get("orders", options) == once);

  // a second application with NULLs leaves stored values alone
  gateway->upsert("orders",
                  std::vector<Record>{Record{{"id", duckdb::Value::INTEGER(1)},
                                             {"total", duckdb::Value()},
                                             {"note", duckdb::Value()}}});
  CHECK(gateway->get("orders", options) == once);
}

TEST_CASE("Upsert overwrites with NULL on request", "[upsert]") {
  auto gateway = make_gateway();
  create_orders_table(*gateway);
  gateway->execute_raw("INSERT INTO orders VALUES (1, 10, 'a', 'new')");

  upsert_options options;
  options.overwrite_with_null = true;
  gateway->upsert("orders",
                  Record{{"id", duckdb::Value::INTEGER(1)},
                         {"note", duckdb::Value()}},
                  options);

  const auto row = order(*gateway, 1);
  CHECK(row.get("note").IsNull());
  CHECK(row.get("total") == duckdb::Value::INTEGER(10));
}

TEST_CASE("Upsert runs one statement per chunk", "[upsert]") {
  const int record_count = GENERATE(0, 1, 3, 7, 10);
  const uint32_t chunk_size = GENERATE(1u, 3u, 1000u);
  CAPTURE(record_count, chunk_size);

  std::ostringstream out;
  auto gateway = make_logging_gateway(out);
  create_orders_table(*gateway);

  upsert_options options;
  options.chunk_size = chunk_size;
  options.verbose = true;
  const auto records = numbered_orders(record_count);
  const auto keys = gateway->upsert("orders", records, options);

  const auto expected_chunks =
      (static_cast<std::size_t>(record_count) + chunk_size - 1) / chunk_size;
  CHECK(count_occurrences(out.str(), "upsert: INSERT INTO") ==
        expected_chunks);
  CHECK(count_occurrences(out.str(), "Loading chunk") == expected_chunks);

  REQUIRE(keys.size() == records.size());
  for (std::size_t i = 0; i < keys.size(); i++) {
    CHECK(keys[i] == Record{{"id", records[i].get("id")}});
  }
  CHECK(gateway->get_table_count("orders") ==
        static_cast<duckdb::idx_t>(record_count));
}

TEST_CASE("Upsert chunk size defaults to the configuration", "[upsert]") {
  std::ostringstream out;
  auto configuration = config::TableGatewayConfiguration::InMemory();
  configuration.chunk_size = 2;
  configuration.verbose = true;
  auto gateway = make_logging_gateway(out, configuration);
  create_orders_table(*gateway);

  gateway->upsert("orders", numbered_orders(5));
  CHECK(count_occurrences(out.str(), "upsert: INSERT INTO") == 3);
}

TEST_CASE("Upsert returns keys in input order", "[upsert]") {
  auto gateway = make_gateway();
  gateway->execute_raw(
      "CREATE TABLE accounts (id BIGINT PRIMARY KEY, name VARCHAR)");
  gateway->execute_raw("INSERT INTO accounts VALUES (3, 'existing')");

  const std::vector<Record> records{
      Record{{"id", duckdb::Value::INTEGER(5)}, {"name", duckdb::Value("e")}},
      Record{{"id", duckdb::Value::INTEGER(3)}, {"name", duckdb::Value("c")}},
      Record{{"id", duckdb::Value::INTEGER(1)}, {"name", duckdb::Value("a")}}};
  const auto keys = gateway->upsert("accounts", records);

  REQUIRE(keys.size() == 3);
  CHECK(keys[0].get("id").GetValue<int64_t>() == 5);
  CHECK(keys[1].get("id").GetValue<int64_t>() == 3);
  CHECK(keys[2].get("id").GetValue<int64_t>() == 1);
  CHECK(gateway->get_table_count("accounts") == 3);
}

TEST_CASE("Upsert with a composite key", "[upsert]") {
  auto gateway = make_gateway();
  gateway->execute_raw("CREATE TABLE stock (sku VARCHAR, region VARCHAR, "
                       "quantity INTEGER, PRIMARY KEY (sku, region))");

  const std::vector<Record> records{
      Record{{"sku", duckdb::Value("a")},
             {"region", duckdb::Value("eu")},
             {"quantity", duckdb::Value::INTEGER(1)}},
      Record{{"region", duckdb::Value("us")},
             {"sku", duckdb::Value("a")},
             {"quantity", duckdb::Value::INTEGER(2)}}};
  const auto keys = gateway->upsert("stock", records);

  REQUIRE(keys.size() == 2);
  CHECK(keys[0] == Record{{"sku", duckdb::Value("a")},
                          {"region", duckdb::Value("eu")}});
  CHECK(keys[1] == Record{{"sku", duckdb::Value("a")},
                          {"region", duckdb::Value("us")}});
}

TEST_CASE("Upsert only touching key columns", "[upsert]") {
  auto gateway = make_gateway();
  gateway->execute_raw("CREATE TABLE tags (name VARCHAR PRIMARY KEY)");
  gateway->execute_raw("INSERT INTO tags VALUES ('red')");

  const auto keys = gateway->upsert(
      "tags", std::vector<Record>{Record{{"name", duckdb::Value("red")}},
                                  Record{{"name", duckdb::Value("blue")}}});
  REQUIRE(keys.size() == 2);
  CHECK(keys[0] == Record{{"name", duckdb::Value("red")}});
  CHECK(keys[1] == Record{{"name", duckdb::Value("blue")}});
  CHECK(gateway->get_table_count("tags") == 2);
}

TEST_CASE("Upsert returns generated keys", "[upsert]") {
  auto gateway = make_gateway();
  column_spec id = spec("id", duckdb::LogicalTypeId::BIGINT);
  id.autoincrement = true;
  create_table_options options;
  options.primary_key = {"id"};
  gateway->create_table("notes",
                        {id, spec("body", duckdb::LogicalTypeId::VARCHAR)},
                        options);

  const auto keys = gateway->upsert(
      "notes", std::vector<Record>{Record{{"body", duckdb::Value("x")}},
                                   Record{{"body", duckdb::Value("y")}}});
  REQUIRE(keys.size() == 2);
  CHECK(keys[0].get("id").GetValue<int64_t>() == 1);
  CHECK(keys[1].get("id").GetValue<int64_t>() == 2);
}

TEST_CASE("Upsert validation", "[upsert]") {
  auto gateway = make_gateway();
  create_orders_table(*gateway);

  SECTION("Table without primary key") {
    gateway->execute_raw("CREATE TABLE events (name VARCHAR)");
    REQUIRE_THROWS_AS(
        gateway->upsert("events", Record{{"name", duckdb::Value("x")}}),
        dt_error::NoPrimaryKey);
    CHECK(gateway->get_table_count("events") == 0);
  }

  SECTION("Unknown column in a later chunk writes nothing") {
    auto records = numbered_orders(4);
    records.push_back(Record{{"id", duckdb::Value::INTEGER(5)},
                             {"colour", duckdb::Value("red")}});
    upsert_options options;
    options.chunk_size = 1;
    REQUIRE_THROWS_AS(gateway->upsert("orders", records, options),
                      dt_error::UnknownColumn);
    CHECK(gateway->get_table_count("orders") == 0);
  }

  SECTION("Empty record") {
    REQUIRE_THROWS_AS(gateway->upsert("orders", Record()),
                      std::invalid_argument);
  }

  SECTION("Chunk size of zero") {
    upsert_options options;
    options.chunk_size = 0;
    REQUIRE_THROWS_AS(gateway->upsert("orders", numbered_orders(1), options),
                      std::invalid_argument);
  }

  SECTION("Unknown table") {
    REQUIRE_THROWS_AS(gateway->upsert("ghost", numbered_orders(1)),
                      dt_error::TableNotFound);
  }
}

TEST_CASE("Failing chunk leaves earlier chunks applied", "[upsert]") {
  std::ostringstream out;
  auto gateway = make_logging_gateway(out);
  create_orders_table(*gateway);

  auto records = numbered_orders(4);
  records[2].set("total", duckdb::Value("not a number"));
  upsert_options options;
  options.chunk_size = 2;
  REQUIRE_THROWS_AS(gateway->upsert("orders", records, options),
                    std::runtime_error);

  CHECK(gateway->get_table_count("orders") == 2);
  CHECK_THAT(out.str(), ContainsSubstring("\"level\":\"SEVERE\""));
  CHECK_THAT(out.str(), ContainsSubstring("failed at chunk 2 of 2"));

  // running the corrected batch again completes it
  records[2].set("total", duckdb::Value::INTEGER(30));
  CHECK(gateway->upsert("orders", records, options).size() == 4);
  CHECK(gateway->get_table_count("orders") == 4);
}

TEST_CASE("Upsert batches split records into ranges", "[upsert]") {
  const auto records = numbered_orders(7);
  const UpsertBatch batch(records, 3);
  CHECK(batch.chunk_count() == 3);
  CHECK(batch.ranges() == std::vector<UpsertBatch::chunk_range>{
                              {0, 3}, {3, 6}, {6, 7}});

  const std::vector<Record> none;
  CHECK(UpsertBatch(none, 3).chunk_count() == 0);
  REQUIRE_THROWS_AS(UpsertBatch(records, 0), std::invalid_argument);
}

TEST_CASE("Upsert rejects records with different columns", "[upsert]") {
  const uint32_t chunk_size = GENERATE(1u, 2u);
  CAPTURE(chunk_size);

  auto gateway = make_gateway();
  create_orders_table(*gateway);
  gateway->execute_raw("INSERT INTO orders VALUES (2, 5, 'keep', 'new')");

  upsert_options options;
  options.chunk_size = chunk_size;
  options.overwrite_with_null = true;
  const std::vector<Record> records{
      Record{{"id", duckdb::Value::INTEGER(1)},
             {"total", duckdb::Value::INTEGER(1)},
             {"note", duckdb::Value("a")}},
      Record{{"id", duckdb::Value::INTEGER(2)},
             {"total", duckdb::Value::INTEGER(7)}}};
  REQUIRE_THROWS_WITH(gateway->upsert("orders", records, options),
                      ContainsSubstring("has different columns"));

  // nothing is written, whatever the chunk size
  CHECK(gateway->get_table_count("orders") == 1);
  const auto row = order(*gateway, 2);
  CHECK(row.get("note") == duckdb::Value("keep"));
  CHECK(row.get("total") == duckdb::Value::INTEGER(5));
}

TEST_CASE("Upsert rejects mixing supplied and generated keys", "[upsert]") {
  auto gateway = make_gateway();
  column_spec id = spec("id", duckdb::LogicalTypeId::BIGINT);
  id.autoincrement = true;
  create_table_options options;
  options.primary_key = {"id"};
  gateway->create_table("notes",
                        {id, spec("body", duckdb::LogicalTypeId::VARCHAR)},
                        options);

  REQUIRE_THROWS_AS(
      gateway->upsert("notes",
                      std::vector<Record>{
                          Record{{"body", duckdb::Value("generated")}},
                          Record{{"id", duckdb::Value::BIGINT(10)},
                                 {"body", duckdb::Value("supplied")}}}),
      std::invalid_argument);
  CHECK(gateway->get_table_count("notes") == 0);
}
