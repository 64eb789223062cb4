#include "predicate.hpp"

#include "dt_error.hpp"
#include "duckdb.hpp"
#include "record.hpp"
#include "schema_types.hpp"
#include "test_helpers.hpp"

#include <catch2/catch_test_macros.hpp>
#include <catch2/generators/catch_generators.hpp>
#include <string>
#include <vector>

using Catch::Generators::as;
using test_helpers::op_value;
using test_helpers::varchar_list;

namespace {
table_handle orders_handle() {
  table_handle handle;
  handle.table = table_def{"memory", "main", "orders"};
  handle.columns = {
      column_def{.name = "id", .type = duckdb::LogicalTypeId::INTEGER,
                 .primary_key = true},
      column_def{.name = "status", .type = duckdb::LogicalTypeId::VARCHAR},
      column_def{.name = "total", .type = duckdb::LogicalTypeId::INTEGER},
      column_def{.name = "tags", .type = duckdb::LogicalTypeId::LIST},
  };
  handle.primary_key = {"id"};
  return handle;
}
} // namespace

TEST_CASE("Compile named operators", "[predicate]") {
  const auto table = orders_handle();

  SECTION("No predicates compile to an empty condition") {
    const auto condition = compile_predicates({}, table);
    CHECK(condition.empty());
    CHECK(condition.params.empty());
  }

  SECTION("Equality") {
    const auto condition = compile_predicates(
        {filter::equals("status", duckdb::Value("open"))}, table);
    CHECK(condition.sql == "(\"status\" = ?)");
    REQUIRE(condition.params.size() == 1);
    CHECK(condition.params[0] == duckdb::Value("open"));
  }

  SECTION("Equality with NULL") {
    const auto condition =
        compile_predicates({filter::equals("status", duckdb::Value())}, table);
    CHECK(condition.sql == "(\"status\" IS NULL)");
    CHECK(condition.params.empty());
  }

  SECTION("Leaves are combined with AND in order") {
    const auto condition = compile_predicates(
        {filter::in("status", {duckdb::Value("x"), duckdb::Value("y")}),
         filter::between("total", duckdb::Value::INTEGER(1),
                         duckdb::Value::INTEGER(9)),
         filter::is_not_null("id")},
        table);
    CHECK(condition.sql == "(\"status\" IN (?, ?)) AND (\"total\" BETWEEN ? "
                           "AND ?) AND (\"id\" IS NOT NULL)");
    REQUIRE(condition.params.size() == 4);
    CHECK(condition.params[0] == duckdb::Value("x"));
    CHECK(condition.params[3] == duckdb::Value::INTEGER(9));
  }

  SECTION("Negated operators") {
    const auto condition = compile_predicates(
        {filter::not_in("status", {duckdb::Value("x")}),
         filter::not_like("status", "a%"),
         filter::not_between("total", duckdb::Value::INTEGER(1),
                             duckdb::Value::INTEGER(2)),
         filter::is_null("total")},
        table);
    CHECK(condition.sql ==
          "(\"status\" NOT IN (?)) AND (\"status\" NOT LIKE ?) AND (NOT "
          "(\"total\" BETWEEN ? AND ?)) AND (\"total\" IS NULL)");
    CHECK(condition.params.size() == 4);
  }
}

TEST_CASE("Compile filters given as records", "[predicate]") {
  const auto table = orders_handle();

  SECTION("Plain values mean equality") {
    const Record where{{"id", duckdb::Value::INTEGER(1)},
                       {"status", duckdb::Value("open")}};
    const auto condition = compile_predicates(filter::from_record(where), table);
    CHECK(condition.sql == "(\"id\" = ?) AND (\"status\" = ?)");
    CHECK(condition.params.size() == 2);
  }

  SECTION("Operator-tagged values") {
    const Record where{{"status", op_value("in", varchar_list({"x", "y"}))},
                       {"total", op_value(">=", duckdb::Value::INTEGER(5))}};
    const auto condition = compile_predicates(filter::from_record(where), table);
    CHECK(condition.sql == "(\"status\" IN (?, ?)) AND (\"total\" >= ?)");
    REQUIRE(condition.params.size() == 3);
    CHECK(condition.params[2] == duckdb::Value::INTEGER(5));
  }

  SECTION("Keyword operators are normalized") {
    const auto condition = compile_predicates(
        {filter::op("status", "ilike", duckdb::Value("%OPEN%"))}, table);
    CHECK(condition.sql == "(\"status\" ILIKE ?)");
  }

  SECTION("Custom operators keep a list operand whole") {
    const auto tags = duckdb::Value::LIST(
        duckdb::LogicalType::INTEGER,
        {duckdb::Value::INTEGER(1), duckdb::Value::INTEGER(2)});
    const auto from_mapping = compile_predicates(
        filter::from_record(Record{{"tags", op_value("@>", tags)}}), table);
    const auto from_builder =
        compile_predicates({filter::op("tags", "@>", tags)}, table);

    CHECK(from_mapping.sql == "(\"tags\" @> ?)");
    CHECK(from_mapping.sql == from_builder.sql);
    REQUIRE(from_mapping.params.size() == 1);
    CHECK(from_mapping.params[0].type().id() == duckdb::LogicalTypeId::LIST);
    CHECK(from_mapping.params[0].ToString() == tags.ToString());
    CHECK(from_builder.params[0].ToString() == tags.ToString());
  }

  SECTION("Named operators through op take the fast path") {
    const auto pred = filter::op("status", "Not In", varchar_list({"a"}));
    CHECK(pred.op == predicate_op::not_in);
    CHECK(pred.values.size() == 1);
  }

  SECTION("Several records are flattened") {
    const auto predicates = filter::from_records(
        {Record{{"id", duckdb::Value::INTEGER(1)}},
         Record{{"total", op_value("between",
                                   duckdb::Value::LIST(
                                       duckdb::LogicalType::INTEGER,
                                       {duckdb::Value::INTEGER(1),
                                        duckdb::Value::INTEGER(3)}))}}});
    const auto condition = compile_predicates(predicates, table);
    CHECK(condition.sql == "(\"id\" = ?) AND (\"total\" BETWEEN ? AND ?)");
  }
}

TEST_CASE("Reject unsafe operators", "[predicate]") {
  const auto table = orders_handle();
  const std::string operator_text =
      GENERATE(as<std::string>{}, "; DROP TABLE orders", "--", "/*", "OR 1=1 OR", "<<<<", "=;",
               "");
  CAPTURE(operator_text);

  CHECK_FALSE(is_safe_operator(operator_text));
  REQUIRE_THROWS_AS(
      compile_predicates(
          {filter::op("status", operator_text, duckdb::Value("x"))}, table),
      dt_error::UnsafeValue);
}

TEST_CASE("Accept known operators", "[predicate]") {
  const std::string operator_text =
      GENERATE(as<std::string>{}, "<", "<=", "<>", "!=", "~", "@>", "similar to",
               "IS NOT DISTINCT FROM", "not   glob");
  CAPTURE(operator_text);
  CHECK(is_safe_operator(operator_text));
}

TEST_CASE("Reject malformed structured filters", "[predicate]") {
  const auto table = orders_handle();

  SECTION("Unexpected key") {
    duckdb::child_list_t<duckdb::Value> children;
    children.emplace_back("operator", duckdb::Value("="));
    children.emplace_back("value", duckdb::Value("x"));
    children.emplace_back("extra", duckdb::Value("1; DROP TABLE orders"));
    const Record where{{"status", duckdb::Value::STRUCT(std::move(children))}};
    REQUIRE_THROWS_AS(filter::from_record(where), dt_error::UnsafeValue);
  }

  SECTION("Missing operator") {
    duckdb::child_list_t<duckdb::Value> children;
    children.emplace_back("value", duckdb::Value("x"));
    const Record where{{"status", duckdb::Value::STRUCT(std::move(children))}};
    REQUIRE_THROWS_AS(filter::from_record(where), dt_error::UnsafeValue);
  }

  SECTION("Operator is not a string") {
    duckdb::child_list_t<duckdb::Value> children;
    children.emplace_back("operator", duckdb::Value::INTEGER(1));
    children.emplace_back("value", duckdb::Value("x"));
    const Record where{{"status", duckdb::Value::STRUCT(std::move(children))}};
    REQUIRE_THROWS_AS(filter::from_record(where), dt_error::UnsafeValue);
  }
}

TEST_CASE("Reject predicates with the wrong arity", "[predicate]") {
  const auto table = orders_handle();

  REQUIRE_THROWS_AS(compile_predicates({filter::in("status", {})}, table),
                    dt_error::InvalidPredicate);
  REQUIRE_THROWS_AS(
      compile_predicates({predicate{"total", predicate_op::between,
                                    {duckdb::Value::INTEGER(1)}, ""}},
                         table),
      dt_error::InvalidPredicate);
  REQUIRE_THROWS_AS(
      compile_predicates({predicate{"status", predicate_op::equals, {}, ""}},
                         table),
      dt_error::InvalidPredicate);
}

TEST_CASE("Reject unknown fields", "[predicate]") {
  const auto table = orders_handle();
  REQUIRE_THROWS_AS(
      compile_predicates({filter::equals("nope", duckdb::Value(1))}, table),
      dt_error::UnknownColumn);
}
