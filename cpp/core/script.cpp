#include "core/script.hpp"

#include <cstring>
#include <system_error>

#include <kj/debug.h>
#include "absl/strings/str_cat.h"
#include "util/file.hpp"
#include "util/flags.hpp"

namespace core {

Script::Script(std::string dir, const std::string& source)
    : dir_(std::move(dir)),
      program_(util::File::JoinPath(dir_, kProgramName)),
      stdout_(util::File::JoinPath(dir_, kStdoutName)),
      stderr_(util::File::JoinPath(dir_, kStderrName)) {
  util::File::Write(program_, source, /*overwrite=*/true);
}

sandbox::ExecutionOptions Script::Options(const std::string& interpreter,
                                          int64_t timeout_millis) const {
  sandbox::ExecutionOptions options(dir_, interpreter);
  // Isolated mode, unbuffered output (so that it survives a kill), and no
  // bytecode files.
  options.args = {"-I", "-u", "-B", kProgramName};
  options.wall_limit_millis = timeout_millis;
  options.stdout_file = stdout_;
  options.stderr_file = stderr_;
  return options;
}

std::string Script::ReadCapture(const std::string& path) const {
  uint64_t limit = static_cast<uint64_t>(Flags::max_output_kb) * 1024;
  bool truncated = false;
  try {
    std::string data = util::File::Read(path, limit, &truncated);
    if (truncated) KJ_LOG(WARNING, "Captured output truncated", path, limit);
    return data;
  } catch (const std::system_error& exc) {
    KJ_LOG(WARNING, "Cannot read captured output", exc.what());
    return "";
  }
}

ExecutionResult Script::Collect(bool started,
                                const sandbox::ExecutionInfo& info,
                                const std::string& error_msg,
                                int64_t timeout_millis) const {
  if (!started) {
    return ExecutionResult::Failure(
        ErrorKind::INTERNAL,
        absl::StrCat("Failed to start the interpreter: ", error_msg));
  }
  std::string out = ReadCapture(stdout_);
  std::string err = ReadCapture(stderr_);
  if (info.timed_out) {
    return ExecutionResult::Failure(
        ErrorKind::TIMEOUT,
        absl::StrCat("Execution timed out after ", timeout_millis / 1000.0,
                     " seconds"),
        std::move(out));
  }
  if (info.signal != 0) {
    std::string reason =
        absl::StrCat("Process killed by signal: ", strsignal(info.signal));
    if (!err.empty()) reason = absl::StrCat(err, "\n", reason);
    return ExecutionResult::Failure(ErrorKind::RUNTIME, std::move(reason),
                                    std::move(out));
  }
  if (info.status_code != 0) {
    if (err.empty()) {
      err = absl::StrCat("Process exited with status ", info.status_code);
    }
    return ExecutionResult::Failure(ErrorKind::RUNTIME, std::move(err),
                                    std::move(out));
  }
  return ExecutionResult::Success(std::move(out));
}

}  // namespace core
