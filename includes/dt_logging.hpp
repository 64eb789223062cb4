#pragma once

#include <iosfwd>
#include <memory>
#include <mutex>
#include <string>

namespace dtlog {

/// JSON-lines logger. Copies share the same sink, and writes to the sink are
/// serialized, so one logger may be handed to several threads.
class Logger {
public:
  static Logger CreateStdoutLogger();
  /// Logs to a caller-owned stream, which has to outlive the logger.
  static Logger CreateStreamLogger(std::ostream &out);
  static Logger CreateNullLogger();

  void log(const std::string &level, const std::string &message);

  void info(const std::string &message);
  void warning(const std::string &message);
  void severe(const std::string &message);

private:
  explicit Logger(std::ostream *out_);

  void log_to_stream(const std::string &level, const std::string &message);

  std::ostream *out;
  std::shared_ptr<std::mutex> out_mutex;
};

} // namespace dtlog
