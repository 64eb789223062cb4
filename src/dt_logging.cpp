#include "dt_logging.hpp"

#include <cstdio>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>

namespace dtlog {

namespace {
std::string escape_json(const std::string &str) {
  std::string result;
  result.reserve(str.size());
  for (const char c : str) {
    switch (c) {
    case '"':
      result += "\\\"";
      break;
    case '\\':
      result += "\\\\";
      break;
    case '\n':
      result += "\\n";
      break;
    case '\r':
      result += "\\r";
      break;
    case '\t':
      result += "\\t";
      break;
    default:
      if (static_cast<unsigned char>(c) < 0x20) {
        char buf[8];
        std::snprintf(buf, sizeof(buf), "\\u%04x", c);
        result += buf;
      } else {
        result += c;
      }
    }
  }
  return result;
}
} // namespace

Logger::Logger(std::ostream *out_)
    : out(out_), out_mutex(std::make_shared<std::mutex>()) {}

Logger Logger::CreateStdoutLogger() { return Logger(&std::cout); }

Logger Logger::CreateStreamLogger(std::ostream &out) { return Logger(&out); }

Logger Logger::CreateNullLogger() { return Logger(nullptr); }

void Logger::log_to_stream(const std::string &level,
                           const std::string &message) {
  if (out == nullptr) {
    return;
  }
  std::lock_guard<std::mutex> lock(*out_mutex);
  *out << "{\"level\":\"" << escape_json(level) << "\","
       << "\"message\":\"" << escape_json(message) << "\","
       << "\"message-origin\":\"dyntable\"}" << std::endl;
}

void Logger::log(const std::string &level, const std::string &message) {
  log_to_stream(level, message);
}

void Logger::info(const std::string &message) { log("INFO", message); }

void Logger::warning(const std::string &message) { log("WARNING", message); }

void Logger::severe(const std::string &message) { log("SEVERE", message); }

} // namespace dtlog
