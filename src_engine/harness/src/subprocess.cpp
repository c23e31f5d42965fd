#include "tst_engine/subprocess.hpp"
#include "tst_engine/errors.hpp"

#include <algorithm>
#include <array>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <string>
#include <system_error>
#include <thread>
#include <utility>
#include <vector>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <spawn.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <spdlog/spdlog.h>

extern char** environ;

namespace {

using Clock = std::chrono::steady_clock;
using tst::engine::SpawnError;

constexpr std::size_t kReadChunk = 64 * 1024;
constexpr auto kReapPollInterval = std::chrono::milliseconds(5);
constexpr std::chrono::milliseconds::rep kMaxPollSliceMs = 1000;

class UniqueFd {
public:
    UniqueFd() = default;
    explicit UniqueFd(int fd) : fd_{fd} {}
    UniqueFd(const UniqueFd&) = delete;
    UniqueFd& operator=(const UniqueFd&) = delete;
    UniqueFd(UniqueFd&& other) noexcept : fd_{std::exchange(other.fd_, -1)} {}
    UniqueFd& operator=(UniqueFd&& other) noexcept {
        if (this != &other) {
            reset();
            fd_ = std::exchange(other.fd_, -1);
        }
        return *this;
    }
    ~UniqueFd() { reset(); }

    [[nodiscard]] int get() const noexcept { return fd_; }
    [[nodiscard]] bool is_open() const noexcept { return fd_ != -1; }

    void reset() noexcept {
        if (fd_ != -1) {
            ::close(fd_);
            fd_ = -1;
        }
    }

private:
    int fd_{-1};
};

struct Pipe {
    UniqueFd read_end;
    UniqueFd write_end;
};

std::string errno_message(const std::string& what, int code) {
    return what + ": " + std::strerror(code);
}

Pipe make_pipe() {
    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) == -1) {
        const int code = errno;
        throw SpawnError(errno_message("pipe", code), code);
    }
    return Pipe{UniqueFd{fds[0]}, UniqueFd{fds[1]}};
}

void set_nonblocking(int fd) {
    const int flags = ::fcntl(fd, F_GETFL, 0);
    if (flags != -1) {
        (void)::fcntl(fd, F_SETFL, flags | O_NONBLOCK);
    }
}

// Blocks SIGPIPE on the calling thread only and drops any SIGPIPE the
// thread raised by writing to a child that already exited.
class ScopedSigpipeBlock {
public:
    ScopedSigpipeBlock() {
        sigemptyset(&set_);
        sigaddset(&set_, SIGPIPE);
        pthread_sigmask(SIG_BLOCK, &set_, &previous_);
    }
    ScopedSigpipeBlock(const ScopedSigpipeBlock&) = delete;
    ScopedSigpipeBlock& operator=(const ScopedSigpipeBlock&) = delete;
    ~ScopedSigpipeBlock() {
        const timespec zero{0, 0};
        while (sigtimedwait(&set_, nullptr, &zero) > 0) {
        }
        pthread_sigmask(SIG_SETMASK, &previous_, nullptr);
    }

private:
    sigset_t set_{};
    sigset_t previous_{};
};

// Owns a spawned child; kills its process group and reaps it unless the
// caller already collected the exit status.
class ChildGuard {
public:
    explicit ChildGuard(pid_t pid) : pid_{pid} {}
    ChildGuard(const ChildGuard&) = delete;
    ChildGuard& operator=(const ChildGuard&) = delete;
    ~ChildGuard() {
        if (!reaped_) {
            (void)kill_and_reap();
        }
    }

    [[nodiscard]] pid_t pid() const noexcept { return pid_; }

    // Non-blocking; true once the child has exited.
    bool try_reap(int& status) {
        const pid_t r = ::waitpid(pid_, &status, WNOHANG);
        if (r == pid_) {
            reaped_ = true;
            return true;
        }
        if (r == -1 && errno != EINTR) {
            reaped_ = true;
            status = 0;
            return true;
        }
        return false;
    }

    // Background processes the child left behind share its group.
    void kill_group() const noexcept { ::kill(-pid_, SIGKILL); }

    int kill_and_reap() {
        ::kill(-pid_, SIGKILL);
        ::kill(pid_, SIGKILL);
        int status = 0;
        while (::waitpid(pid_, &status, 0) == -1 && errno == EINTR) {
        }
        reaped_ = true;
        return status;
    }

private:
    pid_t pid_;
    bool reaped_{false};
};

class SpawnAttributes {
public:
    SpawnAttributes() {
        posix_spawnattr_init(&attr_);
        posix_spawn_file_actions_init(&actions_);
    }
    SpawnAttributes(const SpawnAttributes&) = delete;
    SpawnAttributes& operator=(const SpawnAttributes&) = delete;
    ~SpawnAttributes() {
        posix_spawn_file_actions_destroy(&actions_);
        posix_spawnattr_destroy(&attr_);
    }

    posix_spawnattr_t* attr() noexcept { return &attr_; }
    posix_spawn_file_actions_t* actions() noexcept { return &actions_; }

private:
    posix_spawnattr_t attr_{};
    posix_spawn_file_actions_t actions_{};
};

int decode_wait_status(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return -WTERMSIG(status);
    }
    return -1;
}

// now + timeout, saturated at the clock's upper bound.
Clock::time_point deadline_after(std::chrono::milliseconds timeout) {
    const auto now = Clock::now();
    if (timeout.count() <= 0) {
        return now;
    }
    const auto headroom = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::time_point::max() - now);
    return timeout >= headroom ? Clock::time_point::max() : now + timeout;
}

struct Capture {
    UniqueFd fd;
    std::string* sink;
};

// Drains \p capture until EAGAIN. Returns false once the stream hit EOF.
bool drain(Capture& capture, std::size_t limit, bool& truncated) {
    char buffer[kReadChunk];
    while (true) {
        const ssize_t n = ::read(capture.fd.get(), buffer, sizeof(buffer));
        if (n > 0) {
            const auto room = limit > capture.sink->size() ? limit - capture.sink->size() : 0;
            const auto take = std::min<std::size_t>(room, static_cast<std::size_t>(n));
            capture.sink->append(buffer, take);
            if (take < static_cast<std::size_t>(n)) {
                truncated = true;
            }
            continue;
        }
        if (n == 0) {
            return false;
        }
        if (errno == EINTR) {
            continue;
        }
        return errno == EAGAIN || errno == EWOULDBLOCK;
    }
}

}  // namespace

namespace tst::engine {

SpawnError::SpawnError(const std::string& what, int error_code)
    : std::runtime_error(what), error_code_{error_code} {}

bool SpawnError::transient() const noexcept {
    switch (error_code_) {
        case EAGAIN:
        case ENOMEM:
        case EMFILE:
        case ENFILE:
        case EINTR:
        case ETXTBSY:
            return true;
        default:
            return false;
    }
}

ProcessResult ProcessSupervisor::run(const ProcessRequest& request) const {
    if (request.argv.empty()) {
        throw SpawnError("empty command line", EINVAL);
    }

    const auto deadline = deadline_after(request.timeout);

    Pipe in_pipe = make_pipe();
    Pipe out_pipe = make_pipe();
    Pipe err_pipe = make_pipe();

    SpawnAttributes spawn;
    posix_spawn_file_actions_adddup2(spawn.actions(), in_pipe.read_end.get(), STDIN_FILENO);
    posix_spawn_file_actions_adddup2(spawn.actions(), out_pipe.write_end.get(), STDOUT_FILENO);
    posix_spawn_file_actions_adddup2(spawn.actions(), err_pipe.write_end.get(), STDERR_FILENO);
    if (!request.working_directory.empty()) {
        posix_spawn_file_actions_addchdir_np(spawn.actions(), request.working_directory.c_str());
    }

    sigset_t empty_mask;
    sigemptyset(&empty_mask);
    sigset_t default_signals;
    sigemptyset(&default_signals);
    sigaddset(&default_signals, SIGPIPE);
    posix_spawnattr_setflags(spawn.attr(),
                             POSIX_SPAWN_SETPGROUP | POSIX_SPAWN_SETSIGMASK | POSIX_SPAWN_SETSIGDEF);
    posix_spawnattr_setpgroup(spawn.attr(), 0);
    posix_spawnattr_setsigmask(spawn.attr(), &empty_mask);
    posix_spawnattr_setsigdefault(spawn.attr(), &default_signals);

    std::vector<char*> argv;
    argv.reserve(request.argv.size() + 1);
    for (const auto& arg : request.argv) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    pid_t pid = -1;
    const int rc = ::posix_spawnp(&pid, argv[0], spawn.actions(), spawn.attr(), argv.data(), environ);
    if (rc != 0) {
        throw SpawnError(errno_message(request.argv.front(), rc), rc);
    }
    ChildGuard child{pid};

    // Parent keeps only its own ends.
    in_pipe.read_end.reset();
    out_pipe.write_end.reset();
    err_pipe.write_end.reset();

    ProcessResult result;
    UniqueFd stdin_fd = std::move(in_pipe.write_end);
    std::array<Capture, 2> captures{Capture{std::move(out_pipe.read_end), &result.stdout_text},
                                    Capture{std::move(err_pipe.read_end), &result.stderr_text}};
    for (auto& capture : captures) {
        set_nonblocking(capture.fd.get());
    }
    set_nonblocking(stdin_fd.get());

    std::size_t written = 0;
    if (request.input.empty()) {
        stdin_fd.reset();
    }

    auto expire = [&]() {
        (void)child.kill_and_reap();
        spdlog::info("{}: killed after {} ms", request.argv.front(), request.timeout.count());
        ProcessResult expired;
        expired.timed_out = true;
        return expired;
    };

    ScopedSigpipeBlock sigpipe_block;

    while (stdin_fd.is_open() || captures[0].fd.is_open() || captures[1].fd.is_open()) {
        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
        if (remaining.count() <= 0) {
            return expire();
        }

        std::array<pollfd, 3> fds{};
        std::array<int, 3> roles{};  // 0, 1: capture index; 2: stdin
        nfds_t count = 0;
        for (int i = 0; i < 2; ++i) {
            if (captures[i].fd.is_open()) {
                fds[count] = pollfd{captures[i].fd.get(), POLLIN, 0};
                roles[count++] = i;
            }
        }
        if (stdin_fd.is_open()) {
            fds[count] = pollfd{stdin_fd.get(), POLLOUT, 0};
            roles[count++] = 2;
        }

        const auto slice = std::min(remaining.count() + 1, kMaxPollSliceMs);
        const int ready = ::poll(fds.data(), count, static_cast<int>(slice));
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            throw std::system_error(errno, std::generic_category(), "poll");
        }

        for (nfds_t i = 0; i < count; ++i) {
            if (fds[i].revents == 0) {
                continue;
            }
            if (roles[i] == 2) {
                if ((fds[i].revents & (POLLERR | POLLHUP)) != 0) {
                    stdin_fd.reset();
                    continue;
                }
                const ssize_t n = ::write(stdin_fd.get(), request.input.data() + written,
                                          request.input.size() - written);
                if (n > 0) {
                    written += static_cast<std::size_t>(n);
                } else if (n < 0 && errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR) {
                    stdin_fd.reset();
                    continue;
                }
                if (written == request.input.size()) {
                    stdin_fd.reset();
                }
                continue;
            }
            auto& capture = captures[roles[i]];
            if (!drain(capture, request.max_output_bytes, result.output_truncated)) {
                capture.fd.reset();
            }
        }
    }

    int status = 0;
    while (!child.try_reap(status)) {
        const auto remaining = deadline - Clock::now();
        if (remaining <= Clock::duration::zero()) {
            return expire();
        }
        std::this_thread::sleep_for(std::min<Clock::duration>(remaining, kReapPollInterval));
    }

    child.kill_group();

    result.exit_status = decode_wait_status(status);
    if (result.output_truncated) {
        spdlog::warn("{}: output exceeded {} bytes and was truncated", request.argv.front(),
                     request.max_output_bytes);
    }
    return result;
}

}  // namespace tst::engine
