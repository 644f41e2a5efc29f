#ifndef UTIL_FLAGS_HPP
#define UTIL_FLAGS_HPP

#include <cstdint>
#include <string>

struct Flags {
  // Common flags
  static std::string log_file;
  static std::string temp_directory;
  static bool keep_sandboxes;

  // Execution flags
  static std::string interpreter;
  static double timeout_seconds;
  static int32_t max_output_kb;

  // Isolation flags
  static bool isolate;
  static bool keep_environment;
  static int32_t memory_limit_mb;
  static double cpu_limit;
  static int32_t provision_attempts;
  static std::string cgroup_root;
};

#endif
