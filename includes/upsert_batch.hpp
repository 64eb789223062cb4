#pragma once

#include "dt_logging.hpp"
#include "duckdb.hpp"
#include "record.hpp"
#include "schema_types.hpp"
#include "sql_generator.hpp"

#include <cstddef>
#include <cstdint>
#include <utility>
#include <vector>

struct upsert_options {
  // records per INSERT statement
  std::uint32_t chunk_size = 1000;
  // when false, a NULL in the input never replaces a stored value
  bool overwrite_with_null = false;
  bool verbose = false;
};

/// Splits a list of records into consecutive ranges of at most chunk_size
/// records. Lives only for the duration of one upsert call.
class UpsertBatch {
public:
  using chunk_range = std::pair<std::size_t, std::size_t>;

  UpsertBatch(const std::vector<Record> &records_, std::uint32_t chunk_size);

  std::size_t chunk_count() const { return chunks.size(); }
  const std::vector<chunk_range> &ranges() const { return chunks; }

  /// Runs the chunks one after another in submission order and collects the
  /// returned keys. A failing chunk does not undo the chunks before it.
  std::vector<Record> run(duckdb::Connection &con, DtSqlGenerator &generator,
                          const table_handle &table,
                          const upsert_options &options,
                          dtlog::Logger &logger) const;

private:
  const std::vector<Record> &records;
  std::vector<chunk_range> chunks;
};
