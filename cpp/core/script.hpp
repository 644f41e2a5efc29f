#ifndef CORE_SCRIPT_HPP
#define CORE_SCRIPT_HPP

#include <cstdint>
#include <string>

#include "core/execution_result.hpp"
#include "sandbox/sandbox.hpp"

namespace core {

// A Python program written into a working directory, together with the files
// that capture its output. Used by both the direct and the isolated paths.
class Script {
 public:
  static const constexpr char* kProgramName = "program.py";
  static const constexpr char* kStdoutName = "stdout";
  static const constexpr char* kStderrName = "stderr";

  // Writes source into dir. Throws std::system_error on failure.
  Script(std::string dir, const std::string& source);

  // Options that run the program with the given interpreter (an absolute
  // path) and wall-clock deadline.
  sandbox::ExecutionOptions Options(const std::string& interpreter,
                                    int64_t timeout_millis) const;

  // Builds the result of a run. started is the return value of
  // Sandbox::Execute, error_msg the message it set on failure.
  ExecutionResult Collect(bool started, const sandbox::ExecutionInfo& info,
                          const std::string& error_msg,
                          int64_t timeout_millis) const;

  const std::string& Dir() const { return dir_; }

 private:
  std::string ReadCapture(const std::string& path) const;

  std::string dir_;
  std::string program_;
  std::string stdout_;
  std::string stderr_;
};

}  // namespace core

#endif
