#include "process/subprocess.hpp"

#include <fcntl.h>
#include <signal.h>
#include <spdlog/spdlog.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <mutex>
#include <thread>

#include "core/errors.hpp"

namespace warden {

namespace {

std::string errno_message(const std::string& what) {
  return what + ": " + std::string(strerror(errno));
}

void close_fd(int& fd) {
  if (fd >= 0) {
    close(fd);
    fd = -1;
  }
}

void ignore_sigpipe() {
  static std::once_flag once;
  std::call_once(once, [] { ::signal(SIGPIPE, SIG_IGN); });
}

}  // namespace

std::unique_ptr<Subprocess> Subprocess::spawn(const ProcessSpec& spec) {
  if (spec.command.empty()) {
    throw ProcessError("No command to spawn");
  }
  ignore_sigpipe();

  // Build argv before forking
  std::vector<std::string> argv_storage;
  argv_storage.push_back(spec.command);
  argv_storage.insert(argv_storage.end(), spec.args.begin(), spec.args.end());
  std::vector<char*> argv;
  for (auto& arg : argv_storage) {
    argv.push_back(arg.data());
  }
  argv.push_back(nullptr);

  int stdin_pipe[2] = {-1, -1};
  int stdout_pipe[2] = {-1, -1};
  int exec_pipe[2] = {-1, -1};

  auto close_all = [&] {
    for (int* p : {stdin_pipe, stdout_pipe, exec_pipe}) {
      close_fd(p[0]);
      close_fd(p[1]);
    }
  };

  if ((spec.pipe_stdin && pipe(stdin_pipe) == -1) || (spec.pipe_stdout && pipe(stdout_pipe) == -1) ||
      pipe2(exec_pipe, O_CLOEXEC) == -1) {
    auto message = errno_message("Failed to create pipe");
    close_all();
    throw ProcessError(message);
  }

  pid_t pid = fork();
  if (pid == -1) {
    auto message = errno_message("Failed to fork process");
    close_all();
    throw ProcessError(message);
  }

  if (pid == 0) {
    // ---- Child process ----
    int null_fd = open("/dev/null", O_RDWR);

    dup2(spec.pipe_stdin ? stdin_pipe[0] : null_fd, STDIN_FILENO);
    dup2(spec.pipe_stdout ? stdout_pipe[1] : null_fd, STDOUT_FILENO);

    for (int fd : {stdin_pipe[0], stdin_pipe[1], stdout_pipe[0], stdout_pipe[1], exec_pipe[0], null_fd}) {
      if (fd > STDERR_FILENO) close(fd);
    }

    // Own process group so signals reach the agent's children too
    setpgid(0, 0);

    for (const auto& [key, value] : spec.env) {
      setenv(key.c_str(), value.c_str(), 1);
    }

    if (!spec.working_dir.empty() && chdir(spec.working_dir.c_str()) != 0) {
      int err = errno;
      (void)!::write(exec_pipe[1], &err, sizeof(err));
      _exit(127);
    }

    execvp(argv[0], argv.data());

    // exec failed: report errno through the close-on-exec pipe
    int err = errno;
    (void)!::write(exec_pipe[1], &err, sizeof(err));
    _exit(127);
  }

  // ---- Parent process ----
  close_fd(stdin_pipe[0]);
  close_fd(stdout_pipe[1]);
  close_fd(exec_pipe[1]);

  // EOF means exec succeeded; an int means it did not
  int child_errno = 0;
  ssize_t n;
  do {
    n = read(exec_pipe[0], &child_errno, sizeof(child_errno));
  } while (n == -1 && errno == EINTR);
  close_fd(exec_pipe[0]);

  if (n == sizeof(child_errno)) {
    waitpid(pid, nullptr, 0);
    close_all();
    throw ProcessError("Failed to execute " + spec.command + ": " + strerror(child_errno), 127);
  }

  if (stdout_pipe[0] >= 0) {
    int flags = fcntl(stdout_pipe[0], F_GETFL, 0);
    fcntl(stdout_pipe[0], F_SETFL, flags | O_NONBLOCK);
  }

  std::unique_ptr<Subprocess> process(new Subprocess());
  process->pid_ = pid;
  process->stdin_fd_ = stdin_pipe[1];
  process->stdout_fd_ = stdout_pipe[0];

  spdlog::debug("[Process] Spawned {} (pid {})", spec.command, pid);
  return process;
}

Subprocess::~Subprocess() {
  close_fd(stdin_fd_);
  close_fd(stdout_fd_);
  if (running()) {
    kill(-pid_, SIGKILL);
    int status = 0;
    if (waitpid(pid_, &status, 0) == pid_) {
      record_status(status);
    }
  }
}

int Subprocess::release_stdout() {
  int fd = stdout_fd_;
  stdout_fd_ = -1;
  return fd;
}

void Subprocess::write(std::string_view data) {
  if (stdin_fd_ < 0) {
    throw ProcessError("Process stdin is closed");
  }

  size_t written = 0;
  while (written < data.size()) {
    ssize_t n = ::write(stdin_fd_, data.data() + written, data.size() - written);
    if (n == -1) {
      if (errno == EINTR) continue;
      throw ProcessError(errno_message("Failed to write to process"));
    }
    written += static_cast<size_t>(n);
  }
}

void Subprocess::close_stdin() {
  close_fd(stdin_fd_);
}

void Subprocess::record_status(int status) {
  if (WIFEXITED(status)) {
    exit_code_ = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    exit_code_ = 128 + WTERMSIG(status);
  }
}

void Subprocess::signal(int sig) {
  if (running()) {
    kill(-pid_, sig);
  }
}

bool Subprocess::running() {
  if (pid_ <= 0 || exit_code_) return false;

  int status = 0;
  pid_t ret = waitpid(pid_, &status, WNOHANG);
  if (ret == pid_) {
    record_status(status);
    return false;
  }
  if (ret == -1) {
    // Reaped elsewhere
    exit_code_ = -1;
    return false;
  }
  return true;
}

int Subprocess::terminate(std::chrono::milliseconds grace) {
  close_fd(stdin_fd_);

  if (running()) {
    kill(-pid_, SIGTERM);

    auto deadline = std::chrono::steady_clock::now() + grace;
    while (running() && std::chrono::steady_clock::now() < deadline) {
      std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }

    if (running()) {
      spdlog::warn("[Process] pid {} ignored SIGTERM for {}ms, sending SIGKILL", pid_, grace.count());
      kill(-pid_, SIGKILL);
      int status = 0;
      if (waitpid(pid_, &status, 0) == pid_) {
        record_status(status);
      }
    }
  }

  return exit_code_.value_or(-1);
}

}  // namespace warden
