// Engine initialization
#include "warden/warden.hpp"

#include <spdlog/spdlog.h>

#include "core/version.hpp"
#include "log/log.h"

namespace warden {

void init(const Config& config) {
  init_log(config.log_file ? config.log_file->string() : "", 10 * 1024 * 1024, 10, config.log_level);
  spdlog::info("[Warden] {} starting in {}", version(), config.working_dir.string());
}

void shutdown() {
  spdlog::info("[Warden] Shutting down");
  spdlog::shutdown();
}

std::string version() {
  return WARDEN_VERSION_STRING;
}

}  // namespace warden
