#include "isolation/environment.hpp"

#include <cerrno>
#include <system_error>

#include <kj/debug.h>
#include "util/which.hpp"

namespace isolation {

Environment::store_t* Environment::Environments_() {
  static store_t* environments = new store_t;
  return environments;
}

void Environment::Register_(Environment::create_t create,
                            Environment::score_t score) {
  Environments_()->emplace_back(create, score);
}

std::unique_ptr<Environment> Environment::Create() {
  const store_t& environments = *Environments_();
  int best_score = 0;
  unsigned best = -1U;
  for (unsigned i = 0; i < environments.size(); i++) {
    int score = environments[i].second();
    if (score > best_score) {
      best_score = score;
      best = i;
    }
  }
  if (best == -1U) {
    KJ_LOG(ERROR, "No isolated environment could be found");
    return nullptr;
  }
  return std::unique_ptr<Environment>(environments[best].first());
}

const std::string& Environment::Workspace() const {
  KJ_REQUIRE(workspace_ != nullptr, "Environment not provisioned");
  return workspace_->Path();
}

bool Environment::PrepareTemplate(const EnvironmentConfig& config,
                                  std::string* error_msg) {
  try {
    interpreter_ = util::which(config.interpreter);
  } catch (const std::exception& exc) {
    *error_msg = std::string("interpreter lookup: ") + exc.what();
    return false;
  }
  if (interpreter_.empty()) {
    *error_msg = "Interpreter not found: " + config.interpreter;
    return false;
  }
  try {
    workspace_ = std::make_unique<util::TempDir>(config.temp_directory);
  } catch (const std::system_error& exc) {
    *error_msg = std::string("workspace: ") + exc.what();
    return false;
  }
  return true;
}

bool Environment::RemoveWorkspace(std::string* error_msg) {
  if (!workspace_) return true;
  std::string path = workspace_->Path();
  workspace_->Keep();
  workspace_.reset();
  try {
    util::File::RemoveTree(path);
  } catch (const std::system_error& exc) {
    if (exc.code().value() == ENOENT) return true;
    *error_msg = exc.what();
    return false;
  }
  return true;
}

}  // namespace isolation
