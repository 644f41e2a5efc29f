#include "executor/direct_executor.hpp"

#include <exception>
#include <memory>
#include <system_error>

#include <kj/debug.h>
#include "core/script.hpp"
#include "sandbox/sandbox.hpp"
#include "util/file.hpp"
#include "util/flags.hpp"
#include "util/which.hpp"

namespace executor {

core::ExecutionResult DirectExecutor::Run(const std::string& source,
                                          int64_t timeout_millis) const {
  std::string interpreter;
  try {
    interpreter = util::which(interpreter_);
  } catch (const std::exception& exc) {
    return core::ExecutionResult::Failure(core::ErrorKind::INTERNAL,
                                          exc.what());
  }
  if (interpreter.empty()) {
    return core::ExecutionResult::Failure(
        core::ErrorKind::INTERNAL, "Interpreter not found: " + interpreter_);
  }
  std::unique_ptr<sandbox::Sandbox> sb = sandbox::Sandbox::Create();
  if (!sb) {
    return core::ExecutionResult::Failure(core::ErrorKind::INTERNAL,
                                          "No sandbox available");
  }
  try {
    util::TempDir tmp(temp_directory_);
    if (Flags::keep_sandboxes) tmp.Keep();
    core::Script script(tmp.Path(), source);
    KJ_LOG(INFO, "Running program", script.Dir(), timeout_millis);
    sandbox::ExecutionInfo info;
    std::string error_msg;
    bool started =
        sb->Execute(script.Options(interpreter, timeout_millis), &info,
                    &error_msg);
    return script.Collect(started, info, error_msg, timeout_millis);
  } catch (const std::system_error& exc) {
    return core::ExecutionResult::Failure(core::ErrorKind::INTERNAL,
                                          exc.what());
  }
}

}  // namespace executor
