#include "upsert_batch.hpp"

#include "dt_error.hpp"
#include "dt_logging.hpp"
#include "sql_generator.hpp"

#include <algorithm>
#include <exception>
#include <iterator>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

UpsertBatch::UpsertBatch(const std::vector<Record> &records_,
                         std::uint32_t chunk_size)
    : records(records_) {
  if (chunk_size == 0) {
    throw std::invalid_argument("Upsert chunk size must be greater than 0");
  }
  for (std::size_t begin = 0; begin < records.size(); begin += chunk_size) {
    chunks.emplace_back(begin, std::min(begin + chunk_size, records.size()));
  }
}

std::vector<Record> UpsertBatch::run(duckdb::Connection &con,
                                     DtSqlGenerator &generator,
                                     const table_handle &table,
                                     const upsert_options &options,
                                     dtlog::Logger &logger) const {
  if (table.primary_key.empty()) {
    throw dt_error::NoPrimaryKey(table.table.table_name);
  }
  // bad records are rejected before the first chunk is written
  std::vector<std::string> first_keys;
  for (std::size_t i = 0; i < records.size(); i++) {
    const auto &record = records[i];
    if (record.empty()) {
      throw std::invalid_argument("Cannot upsert an empty record into table " +
                                  table.table.to_escaped_string());
    }
    for (const auto &f : record) {
      if (!table.has_column(f.first)) {
        throw dt_error::UnknownColumn(table.table.table_name, f.first);
      }
    }
    auto keys = record.keys();
    std::sort(keys.begin(), keys.end());
    if (i == 0) {
      first_keys = std::move(keys);
    } else if (keys != first_keys) {
      throw std::invalid_argument(
          "Record " + std::to_string(i) + " for table " +
          table.table.to_escaped_string() +
          " has different columns than record 0, all records of an upsert "
          "must have the same columns");
    }
  }

  std::vector<Record> results;
  results.reserve(records.size());
  for (std::size_t number = 0; number < chunks.size(); number++) {
    if (options.verbose) {
      logger.info("Loading chunk " + std::to_string(number + 1) + " of " +
                  std::to_string(chunks.size()));
    }
    const auto &range = chunks[number];
    std::vector<Record> keys;
    try {
      keys = generator.upsert_chunk(con, table, records, range.first,
                                    range.second, options.overwrite_with_null,
                                    options.verbose);
    } catch (const std::runtime_error &ex) {
      if (number == 0) {
        throw;
      }
      logger.severe("Upsert into table " + table.table.to_escaped_string() +
                    " failed at chunk " + std::to_string(number + 1) + " of " +
                    std::to_string(chunks.size()) + ", chunks 1 to " +
                    std::to_string(number) + " stay applied: " + ex.what());
      throw;
    }
    results.insert(results.end(), std::make_move_iterator(keys.begin()),
                   std::make_move_iterator(keys.end()));
  }
  return results;
}
