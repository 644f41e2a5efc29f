#ifndef UTIL_LOG_MANAGER_HPP
#define UTIL_LOG_MANAGER_HPP
#include <kj/debug.h>
#include <kj/exception.h>
#include <ostream>
#include "backward.hpp"

namespace util {

// Formats kj log messages and exceptions of the current thread, writing them
// to Flags::log_file (or to stderr if it is empty) while it is alive.
class LogManager : public kj::ExceptionCallback {
 public:
  explicit LogManager(kj::LogSeverity min_severity = kj::LogSeverity::WARNING);
  void logMessage(kj::LogSeverity severity, const char* file, int line,
                  int contextDepth, kj::String&& text) override;
  void onRecoverableException(kj::Exception&& exception) override;
  void onFatalException(kj::Exception&& exception) override;
  StackTraceMode stackTraceMode() override { return StackTraceMode::NONE; }

 private:
  void PrintStackTrace();

  std::ostream& out;
};
}  // namespace util

#endif
