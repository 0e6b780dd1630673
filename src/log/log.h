#ifndef WARDEN_LOG_H
#define WARDEN_LOG_H

#include <cstddef>
#include <string>

namespace warden {

/**
 * Initialize logging
 *
 * Rotation happens once per start:
 * - the previous warden.log becomes warden.0.log
 * - older files shift up: warden.0.log -> warden.1.log -> ... -> warden.{max_files-1}.log
 * - the oldest file is removed
 *
 * @param log_path log file (default ~/.config/warden/log/warden.log)
 * @param max_size reserved, unused
 * @param max_files number of rotated files kept
 * @param level trace, debug, info, warn, err, critical or off
 */
void init_log(const std::string& log_path = "", size_t max_size = 10 * 1024 * 1024, size_t max_files = 10, const std::string& level = "debug");

}  // namespace warden

#endif  // WARDEN_LOG_H
