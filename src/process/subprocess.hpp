#pragma once

#include <sys/types.h>

#include <chrono>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace warden {

struct ProcessSpec {
  std::string command;
  std::vector<std::string> args;

  // Added to the inherited environment
  std::map<std::string, std::string> env;

  std::filesystem::path working_dir;

  // Connect stdin/stdout to pipes; otherwise /dev/null
  bool pipe_stdin = true;
  bool pipe_stdout = true;
};

// A child process with its stdin and stdout on pipes. Owns the pid and the
// pipe ends; the destructor kills and reaps a child that is still running.
class Subprocess {
 public:
  // Throws ProcessError when the pipes cannot be created, fork fails or the
  // command cannot be executed
  static std::unique_ptr<Subprocess> spawn(const ProcessSpec& spec);

  ~Subprocess();

  Subprocess(const Subprocess&) = delete;
  Subprocess& operator=(const Subprocess&) = delete;

  pid_t pid() const {
    return pid_;
  }

  // Hand the non-blocking stdout read end to the caller, who closes it
  int release_stdout();

  // Write everything, blocking as needed. Throws ProcessError when stdin is
  // closed or the child went away.
  void write(std::string_view data);

  void close_stdin();

  // Signal the child's process group; no-op once it has exited
  void signal(int sig);

  // Reap without blocking; false once the child has exited
  bool running();

  std::optional<int> exit_code() const {
    return exit_code_;
  }

  // SIGTERM, wait up to grace, then SIGKILL. Returns the exit code
  // (128 + signal for a signalled child).
  int terminate(std::chrono::milliseconds grace);

 private:
  Subprocess() = default;

  void record_status(int status);

  pid_t pid_ = -1;
  int stdin_fd_ = -1;
  int stdout_fd_ = -1;
  std::optional<int> exit_code_;
};

}  // namespace warden
