#include "log/log.h"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/spdlog.h>

#include <filesystem>
#include <iostream>

#include "core/config.hpp"

namespace warden {

namespace {

namespace fs = std::filesystem;

fs::path rotated_name(const fs::path& log_dir, const std::string& stem, size_t index) {
  return log_dir / (stem + "." + std::to_string(index) + ".log");
}

// warden.log -> warden.0.log -> ... -> warden.{max_files-1}.log, oldest dropped
void rotate_logs_on_startup(const fs::path& current_log, size_t max_files) {
  if (max_files == 0 || !fs::exists(current_log)) {
    return;
  }

  auto log_dir = current_log.parent_path();
  auto stem = current_log.stem().string();
  std::error_code ec;

  auto oldest = rotated_name(log_dir, stem, max_files - 1);
  if (fs::exists(oldest)) {
    fs::remove(oldest, ec);
  }

  for (int i = static_cast<int>(max_files) - 2; i >= 0; --i) {
    auto old_name = rotated_name(log_dir, stem, static_cast<size_t>(i));
    if (fs::exists(old_name)) {
      fs::rename(old_name, rotated_name(log_dir, stem, static_cast<size_t>(i) + 1), ec);
    }
  }

  fs::rename(current_log, rotated_name(log_dir, stem, 0), ec);
}

spdlog::level::level_enum parse_level(const std::string& level) {
  auto parsed = spdlog::level::from_str(level);
  // from_str maps unknown names to off
  if (parsed == spdlog::level::off && level != "off") {
    return spdlog::level::info;
  }
  return parsed;
}

}  // namespace

void init_log(const std::string& log_path, size_t /* max_size */, size_t max_files, const std::string& level) {
  try {
    fs::path actual_path = log_path.empty() ? config_paths::config_dir() / "log" / "warden.log" : fs::path(log_path);
    auto log_dir = actual_path.parent_path();

    std::error_code ec;
    fs::create_directories(log_dir, ec);
    if (ec) {
      std::cerr << "Failed to create log directory: " << ec.message() << "\n";
      return;
    }

    rotate_logs_on_startup(actual_path, max_files);

    auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(actual_path.string(), true);
    auto logger = std::make_shared<spdlog::logger>("warden", file_sink);

    logger->set_level(parse_level(level));
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v");
    logger->flush_on(spdlog::level::info);

    spdlog::drop("warden");
    spdlog::register_logger(logger);
    spdlog::set_default_logger(logger);

    spdlog::info("=== warden started (log: {}) ===", actual_path.string());
  } catch (const spdlog::spdlog_ex& ex) {
    std::cerr << "Failed to init logger: " << ex.what() << "\n";
  }
}

}  // namespace warden
