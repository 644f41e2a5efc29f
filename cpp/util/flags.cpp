#include "util/flags.hpp"

std::string Flags::log_file;
std::string Flags::temp_directory = "/tmp/runbox";
bool Flags::keep_sandboxes = false;

std::string Flags::interpreter = "python3";
double Flags::timeout_seconds = 30;
int32_t Flags::max_output_kb = 1024;

bool Flags::isolate = true;
bool Flags::keep_environment = false;
int32_t Flags::memory_limit_mb = 128;
double Flags::cpu_limit = 0.5;
int32_t Flags::provision_attempts = 1;
std::string Flags::cgroup_root = "/sys/fs/cgroup/runbox";
