#include "config.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>

namespace config {

std::uint32_t parse_chunk_size(const std::string &value) {
  long long numeric_input;
  std::size_t consumed = 0;
  try {
    numeric_input = std::stoll(value, &consumed);
  } catch (std::logic_error &ex) {
    throw std::invalid_argument("Invalid value for property " +
                                std::string(PROP_CHUNK_SIZE) + ": " + value +
                                ". Must be an unsigned integer.");
  }
  if (consumed != value.size()) {
    throw std::invalid_argument("Invalid value for property " +
                                std::string(PROP_CHUNK_SIZE) + ": " + value +
                                ". Must be an unsigned integer.");
  }
  if (numeric_input <= 0) {
    throw std::invalid_argument("Invalid value for property " +
                                std::string(PROP_CHUNK_SIZE) + ": " + value +
                                ". Must be greater than 0.");
  }
  constexpr auto max_chunk_size = std::numeric_limits<std::uint32_t>::max();
  if (numeric_input > static_cast<long long>(max_chunk_size)) {
    throw std::invalid_argument(
        "Invalid value for property " + std::string(PROP_CHUNK_SIZE) + ": " +
        value + ". Must be less than or equal to " +
        std::to_string(max_chunk_size) + ".");
  }
  return static_cast<std::uint32_t>(numeric_input);
}

bool parse_flag(const std::string &property_name, const std::string &value) {
  std::string lowered = value;
  std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  if (lowered == "true" || lowered == "1") {
    return true;
  }
  if (lowered == "false" || lowered == "0") {
    return false;
  }
  throw std::invalid_argument("Invalid value for property " + property_name +
                              ": " + value + ". Must be true or false.");
}

TableGatewayConfiguration TableGatewayConfiguration::InMemory() {
  return TableGatewayConfiguration();
}

} // namespace config
