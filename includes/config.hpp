#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>

namespace config {
inline constexpr const char *PROP_DATABASE = "database";
inline constexpr const char *PROP_SCHEMA = "schema";
inline constexpr const char *PROP_CHUNK_SIZE = "chunk_size";
inline constexpr const char *PROP_VERBOSE = "verbose";

inline constexpr const char *IN_MEMORY_DATABASE = ":memory:";
inline constexpr const char *DEFAULT_SCHEMA = "main";

// Keeps a single upsert statement well below the parameter count at which
// binding starts to dominate execution time for wide tables.
inline constexpr std::uint32_t DEFAULT_CHUNK_SIZE = 1000;

template <typename MapLike>
std::string find_property(const MapLike &config,
                          const std::string &property_name) {
  const auto token_it = config.find(property_name);
  if (token_it == config.end()) {
    throw std::invalid_argument("Missing property " + property_name);
  }
  return token_it->second;
}

template <typename MapLike>
std::optional<std::string> find_optional_property(const MapLike &config,
                                   const std::string &property_name) {
    const auto token_it = config.find(property_name);
    if (token_it == config.end()) {
        return std::nullopt;
    }
    return token_it->second;
}

std::uint32_t parse_chunk_size(const std::string &value);
bool parse_flag(const std::string &property_name, const std::string &value);

/// Settings of a TableGateway. The chunk size and verbosity are defaults
/// that single operations may override.
class TableGatewayConfiguration {
public:
  template <typename MapLike>
  static TableGatewayConfiguration FromMap(const MapLike &properties) {
    TableGatewayConfiguration configuration;
    configuration.database = find_property(properties, PROP_DATABASE);
    if (configuration.database.empty()) {
      throw std::invalid_argument("Invalid value for property " +
                                  std::string(PROP_DATABASE) +
                                  ": must not be empty.");
    }

    const auto schema = find_optional_property(properties, PROP_SCHEMA);
    if (schema.has_value()) {
      if (schema->empty()) {
        throw std::invalid_argument("Invalid value for property " +
                                    std::string(PROP_SCHEMA) +
                                    ": must not be empty.");
      }
      configuration.schema_name = schema.value();
    }

    const auto chunk_size = find_optional_property(properties, PROP_CHUNK_SIZE);
    if (chunk_size.has_value()) {
      configuration.chunk_size = parse_chunk_size(chunk_size.value());
    }

    const auto verbose = find_optional_property(properties, PROP_VERBOSE);
    if (verbose.has_value()) {
      configuration.verbose = parse_flag(PROP_VERBOSE, verbose.value());
    }
    return configuration;
  }

  static TableGatewayConfiguration InMemory();

  std::string database = IN_MEMORY_DATABASE;
  std::string schema_name = DEFAULT_SCHEMA;
  std::uint32_t chunk_size = DEFAULT_CHUNK_SIZE;
  bool verbose = false;
};
} // namespace config
