#include "process_capture.h"

#include <chrono>
#include <optional>
#include <system_error>
#include <thread>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <absl/strings/str_cat.h>
#include <glog/logging.h>

#include "capture_error.h"
#include "common/scoped_fd.h"
#include "invocation.h"

namespace TraceDiff {

namespace {

using Clock = std::chrono::steady_clock;

constexpr size_t kReadChunk = 4096;
constexpr auto kReapPollInterval = std::chrono::milliseconds(5);

struct ChildProcess {
    pid_t pid = -1;
    ScopedFd output;
};

[[noreturn]] void ThrowSpawnError(const std::string& what, int err) {
    throw CaptureError(CaptureError::Kind::kSpawn,
                       absl::StrCat(what, ": ", std::generic_category().message(err)));
}

ChildProcess SpawnShell(const std::string& command) {
    int fds[2];
    // O_CLOEXEC keeps concurrently spawned children from inheriting each
    // other's write ends, which would delay EOF.
    if (::pipe2(fds, O_CLOEXEC) != 0) {
        ThrowSpawnError("pipe2 failed", errno);
    }
    ScopedFd read_end(fds[0]);
    ScopedFd write_end(fds[1]);

    ScopedFd dev_null(::open("/dev/null", O_RDONLY | O_CLOEXEC));
    if (!dev_null.valid()) {
        ThrowSpawnError("open /dev/null failed", errno);
    }

    const char* shell_command = command.c_str();
    pid_t pid = ::fork();
    if (pid < 0) {
        ThrowSpawnError("fork failed", errno);
    }
    if (pid == 0) {
        // Child: async-signal-safe calls only until exec.
        ::setpgid(0, 0);
        ::dup2(dev_null.get(), STDIN_FILENO);
        ::dup2(write_end.get(), STDOUT_FILENO);
        ::dup2(write_end.get(), STDERR_FILENO);
        ::execl("/bin/sh", "sh", "-c", shell_command, static_cast<char*>(nullptr));
        _exit(127);
    }

    // Also set from the parent so a kill right after fork reaches the group.
    // EACCES here only means the child already exec'd and did it itself.
    if (::setpgid(pid, pid) != 0 && errno != EACCES) {
        VLOG(2) << "setpgid(" << pid << ") from parent failed: "
                << std::generic_category().message(errno);
    }

    ChildProcess child;
    child.pid = pid;
    child.output = std::move(read_end);
    return child;
}

// Returns false when the deadline passes before EOF.
bool DrainUntilEof(int fd, const std::optional<Clock::time_point>& deadline, std::string& out) {
    char buf[kReadChunk];
    for (;;) {
        int wait_ms = -1;
        if (deadline) {
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                *deadline - Clock::now()).count();
            if (remaining <= 0) return false;
            wait_ms = static_cast<int>(remaining);
        }

        struct pollfd pfd{fd, POLLIN, 0};
        int rc = ::poll(&pfd, 1, wait_ms);
        if (rc < 0) {
            if (errno == EINTR) continue;
            throw std::system_error(errno, std::generic_category(), "poll on capture pipe");
        }
        if (rc == 0) continue;

        ssize_t n = ::read(fd, buf, sizeof(buf));
        if (n > 0) {
            out.append(buf, static_cast<size_t>(n));
            continue;
        }
        if (n == 0) return true;
        if (errno == EINTR || errno == EAGAIN) continue;
        throw std::system_error(errno, std::generic_category(), "read on capture pipe");
    }
}

// Returns the raw wait status, or nullopt when the deadline passes first.
std::optional<int> WaitForExit(pid_t pid, const std::optional<Clock::time_point>& deadline) {
    int status = 0;
    for (;;) {
        pid_t rc = ::waitpid(pid, &status, deadline ? WNOHANG : 0);
        if (rc == pid) return status;
        if (rc < 0) {
            if (errno == EINTR) continue;
            throw std::system_error(errno, std::generic_category(), "waitpid");
        }
        // rc == 0: still running after closing its output
        if (Clock::now() >= *deadline) return std::nullopt;
        std::this_thread::sleep_for(kReapPollInterval);
    }
}

void KillAndReap(pid_t pid) {
    ::kill(-pid, SIGKILL);
    ::kill(pid, SIGKILL);
    int status = 0;
    while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
    }
}

std::string DescribeStatus(int status) {
    if (WIFEXITED(status)) {
        return absl::StrCat("exited with status ", WEXITSTATUS(status));
    }
    if (WIFSIGNALED(status)) {
        return absl::StrCat("was killed by signal ", WTERMSIG(status));
    }
    return absl::StrCat("ended with wait status ", status);
}

} // namespace

ProcessCaptureRunner::ProcessCaptureRunner(Options options) : options_(std::move(options)) {}

ProcessCaptureRunner::ProcessCaptureRunner(const Configuration& config) {
    options_.driver = config.getDriver();
    options_.flags = config.getFlags();
    options_.timeout_ms = config.getCaptureTimeoutMs();
    options_.require_zero_exit = config.config().capture.require_zero_exit.get();
}

std::string ProcessCaptureRunner::Capture(int trace, const std::string& program_path, ExecutionMode mode) {
    const std::string command = BuildCommand(options_.driver, trace, program_path, options_.flags);
    VLOG(1) << "Capturing " << TraceFileName(trace) << " (" << ExecutionModeName(mode) << "): " << command;
    return CaptureCommand(command);
}

std::string ProcessCaptureRunner::CaptureCommand(const std::string& command) const {
    std::optional<Clock::time_point> deadline;
    if (options_.timeout_ms > 0) {
        deadline = Clock::now() + std::chrono::milliseconds(options_.timeout_ms);
    }

    ChildProcess child = SpawnShell(command);
    std::string output;

    bool reached_eof = false;
    try {
        reached_eof = DrainUntilEof(child.output.get(), deadline, output);
    } catch (const std::system_error& e) {
        KillAndReap(child.pid);
        throw CaptureError(CaptureError::Kind::kStream,
                           absl::StrCat("Reading output of '", command, "' failed: ", e.what()),
                           output);
    }

    std::optional<int> status;
    if (reached_eof) {
        try {
            status = WaitForExit(child.pid, deadline);
        } catch (const std::system_error& e) {
            throw CaptureError(CaptureError::Kind::kExit,
                               absl::StrCat("Reaping '", command, "' failed: ", e.what()),
                               output);
        }
    }

    if (!status) {
        KillAndReap(child.pid);
        LOG(WARNING) << "Killed '" << command << "' after " << options_.timeout_ms << " ms";
        throw CaptureError(CaptureError::Kind::kTimeout,
                           absl::StrCat("'", command, "' did not finish within ",
                                        options_.timeout_ms, " ms"),
                           output);
    }

    if (WIFEXITED(*status) && WEXITSTATUS(*status) == 0) {
        VLOG(2) << "'" << command << "' produced " << output.size() << " bytes";
        return output;
    }

    const std::string description = DescribeStatus(*status);
    if (options_.require_zero_exit) {
        throw CaptureError(CaptureError::Kind::kExit,
                           absl::StrCat("'", command, "' ", description),
                           output, *status);
    }
    LOG(WARNING) << "'" << command << "' " << description << "; comparing its output anyway";
    return output;
}

} // namespace TraceDiff
