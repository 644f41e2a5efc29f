#ifndef EXECUTOR_DIRECT_EXECUTOR_HPP
#define EXECUTOR_DIRECT_EXECUTOR_HPP

#include <cstdint>
#include <string>
#include <utility>

#include "core/execution_result.hpp"

namespace executor {

// Runs programs in a fresh, unconstrained worker process, one per call. The
// only limit is the wall-clock deadline. Calls are independent and may run
// concurrently.
class DirectExecutor {
 public:
  DirectExecutor(std::string interpreter, std::string temp_directory)
      : interpreter_(std::move(interpreter)),
        temp_directory_(std::move(temp_directory)) {}
  virtual ~DirectExecutor() = default;

  virtual core::ExecutionResult Run(const std::string& source,
                                    int64_t timeout_millis) const;

 private:
  std::string interpreter_;
  std::string temp_directory_;
};

}  // namespace executor

#endif
