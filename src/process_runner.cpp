#include "process_runner.hpp"
#include "snapadb_log.hpp"

#include <spawn.h>
#include <fcntl.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>

extern char** environ;

namespace snapadb {

namespace {

// RAII wrapper for a pipe fd
struct UniqueFd {
    int fd = -1;
    UniqueFd() = default;
    explicit UniqueFd(int f) : fd(f) {}
    ~UniqueFd() { reset(); }
    UniqueFd(const UniqueFd&) = delete;
    UniqueFd& operator=(const UniqueFd&) = delete;
    void reset() {
        if (fd >= 0) ::close(fd);
        fd = -1;
    }
};

struct FileActions {
    posix_spawn_file_actions_t actions;
    FileActions() { posix_spawn_file_actions_init(&actions); }
    ~FileActions() { posix_spawn_file_actions_destroy(&actions); }
};

constexpr size_t kMaxStderrBytes = 64 * 1024;

} // anonymous namespace

AdbResult<ProcessResult> runProcess(const std::string& path, const std::vector<std::string>& args) {
    struct stat st;
    if (::stat(path.c_str(), &st) != 0 || !S_ISREG(st.st_mode)) {
        return AdbError::adbNotFound("adb binary not found at " + path);
    }

    int pipe_fds[2];
    if (::pipe(pipe_fds) != 0) {
        return AdbError::serverUnavailable(std::string("pipe failed: ") + std::strerror(errno));
    }
    UniqueFd read_end(pipe_fds[0]);
    UniqueFd write_end(pipe_fds[1]);
    ::fcntl(read_end.fd, F_SETFD, FD_CLOEXEC);

    FileActions fa;
    posix_spawn_file_actions_addopen(&fa.actions, STDIN_FILENO, "/dev/null", O_RDONLY, 0);
    posix_spawn_file_actions_addopen(&fa.actions, STDOUT_FILENO, "/dev/null", O_WRONLY, 0);
    posix_spawn_file_actions_adddup2(&fa.actions, write_end.fd, STDERR_FILENO);
    posix_spawn_file_actions_addclose(&fa.actions, write_end.fd);

    std::vector<std::string> argv_storage;
    argv_storage.reserve(args.size() + 1);
    argv_storage.push_back(path);
    argv_storage.insert(argv_storage.end(), args.begin(), args.end());
    std::vector<char*> argv;
    for (auto& a : argv_storage) argv.push_back(const_cast<char*>(a.c_str()));
    argv.push_back(nullptr);

    pid_t pid = 0;
    int rc = posix_spawn(&pid, path.c_str(), &fa.actions, nullptr, argv.data(), environ);
    write_end.reset();
    if (rc != 0) {
        if (rc == ENOENT) return AdbError::adbNotFound("adb binary not found at " + path);
        return AdbError::serverUnavailable("spawn " + path + " failed: " + std::strerror(rc));
    }

    SLOG_DEBUG("adb-server", "spawned %s (pid %d)", path.c_str(), (int)pid);

    ProcessResult result;
    char buffer[4096];
    while (true) {
        ssize_t n = ::read(read_end.fd, buffer, sizeof(buffer));
        if (n > 0) {
            if (result.stderr_text.size() < kMaxStderrBytes) {
                result.stderr_text.append(buffer, static_cast<size_t>(n));
            }
            continue;
        }
        if (n < 0 && errno == EINTR) continue;
        break;
    }

    int status = 0;
    pid_t waited;
    do {
        waited = ::waitpid(pid, &status, 0);
    } while (waited < 0 && errno == EINTR);
    if (waited < 0) {
        return AdbError::serverUnavailable(std::string("waitpid failed: ") + std::strerror(errno));
    }

    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.term_signal = WTERMSIG(status);
        result.exit_code = 128 + result.term_signal;
    }
    return result;
}

} // namespace snapadb
