#include "util/which.hpp"
#include <unistd.h>
#include <cstdlib>
#include <mutex>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>
#include "absl/strings/str_split.h"
#include "util/file.hpp"

namespace {
std::mutex cmd_cache_mutex;
std::unordered_map<std::string, std::string> cmd_cache;

bool IsExecutable(const std::string& path) {
  return util::File::Exists(path) && access(path.c_str(), X_OK) == 0;
}
}  // namespace

namespace util {

std::string which(const std::string& cmd, bool use_cache) {
  std::lock_guard<std::mutex> lck(cmd_cache_mutex);
  if (use_cache && cmd_cache.count(cmd) > 0) return cmd_cache[cmd];

  if (cmd.find('/') != std::string::npos) {
    return cmd_cache[cmd] = IsExecutable(cmd) ? cmd : "";
  }

  const char* path = std::getenv("PATH");
  if (path == nullptr) throw std::runtime_error("PATH is not set");
  std::vector<std::string> dirs =
      absl::StrSplit(path, ':', absl::SkipEmpty());

  for (const std::string& dir : dirs) {
    std::string fullpath = util::File::JoinPath(dir, cmd);
    if (IsExecutable(fullpath)) return cmd_cache[cmd] = fullpath;
  }

  return cmd_cache[cmd] = "";
}

}  // namespace util
