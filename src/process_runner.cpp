#include "process_runner.hpp"
#include "brew_error.hpp"
#include "console.hpp"
#include <array>
#include <cerrno>
#include <condition_variable>
#include <csignal>
#include <cstring>
#include <deque>
#include <fcntl.h>
#include <future>
#include <mutex>
#include <poll.h>
#include <sstream>
#include <sys/stat.h>
#include <sys/wait.h>
#include <system_error>
#include <thread>
#include <unistd.h>

namespace {

[[noreturn]] void throw_errno(const char* what) {
    throw std::system_error(errno, std::generic_category(), what);
}

struct Fd {
    int fd{-1};
    Fd() = default;
    explicit Fd(int f) : fd(f) {}
    Fd(const Fd&) = delete;
    Fd& operator=(const Fd&) = delete;
    Fd(Fd&& o) noexcept : fd(o.fd) { o.fd = -1; }
    Fd& operator=(Fd&& o) noexcept {
        if (this != &o) { reset(); fd = o.fd; o.fd = -1; }
        return *this;
    }
    ~Fd() { reset(); }
    void reset() { if (fd >= 0) ::close(fd); fd = -1; }
    int get() const { return fd; }
};

struct Pipe { Fd r, w; };

// Held across fork() and, where pipe2 is missing, across pipe creation, so a
// child never inherits a pipe end that is not yet close-on-exec.
std::mutex fork_mutex;

// How often the stream reader checks for child exit while the pipe is quiet.
constexpr int EXIT_POLL_MS = 50;

#if defined(__linux__)
// Both ends close on exec so concurrent spawns never leak each other's pipes.
Pipe make_pipe() {
    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) < 0) throw_errno("pipe2");
    return Pipe{Fd{fds[0]}, Fd{fds[1]}};
}
#else
void set_cloexec(int fd) {
    int flags = ::fcntl(fd, F_GETFD);
    if (flags < 0 || ::fcntl(fd, F_SETFD, flags | FD_CLOEXEC) < 0) throw_errno("fcntl");
}

Pipe make_pipe() {
    std::lock_guard<std::mutex> lock(fork_mutex);
    int fds[2];
    if (::pipe(fds) < 0) throw_errno("pipe");
    Pipe p{Fd{fds[0]}, Fd{fds[1]}};
    set_cloexec(p.r.get());
    set_cloexec(p.w.get());
    return p;
}
#endif

std::vector<char*> make_argv(std::vector<std::string>& storage) {
    std::vector<char*> argv;
    argv.reserve(storage.size() + 1);
    for (auto& s : storage) argv.push_back(s.data());
    argv.push_back(nullptr);
    return argv;
}

int decode_status(int status) {
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return -1;
}

int wait_for(pid_t pid) {
    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) throw_errno("waitpid");
    }
    return decode_status(status);
}

// Forks and execs the command with out_fd/err_fd as stdout/stderr and
// /dev/null as stdin. A failed execve is reported back through a close-on-exec
// pipe, so a launch failure is known before this returns.
pid_t spawn(const CommandSpec& command, const Environment& env, int out_fd, int err_fd) {
    std::string path = resolve_executable(command.executable(), env);

    std::vector<std::string> arg_storage;
    arg_storage.reserve(command.arguments().size() + 1);
    arg_storage.push_back(command.executable());
    for (const auto& arg : command.arguments()) arg_storage.push_back(arg);
    std::vector<std::string> env_storage = to_envp(env);
    std::vector<char*> argv = make_argv(arg_storage);
    std::vector<char*> envp = make_argv(env_storage);

    Fd dev_null{::open("/dev/null", O_RDONLY | O_CLOEXEC)};
    if (dev_null.get() < 0) throw_errno("open(/dev/null)");
    Pipe exec_status = make_pipe();

    pid_t pid;
    {
        std::lock_guard<std::mutex> lock(fork_mutex);
        pid = ::fork();
    }
    if (pid < 0) throw_errno("fork");

    if (pid == 0) {
        if (::dup2(dev_null.get(), STDIN_FILENO) < 0 ||
            ::dup2(out_fd, STDOUT_FILENO) < 0 ||
            ::dup2(err_fd, STDERR_FILENO) < 0) {
            int error = errno;
            (void)!::write(exec_status.w.get(), &error, sizeof(error));
            _exit(127);
        }
        ::signal(SIGPIPE, SIG_DFL);
        ::execve(path.c_str(), argv.data(), envp.data());
        int error = errno;
        (void)!::write(exec_status.w.get(), &error, sizeof(error));
        _exit(127);
    }

    exec_status.w.reset();
    int child_errno = 0;
    ssize_t n;
    do {
        n = ::read(exec_status.r.get(), &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);

    if (n == static_cast<ssize_t>(sizeof(child_errno))) {
        wait_for(pid);
        throw LaunchFailure(command.executable(), child_errno);
    }
    return pid;
}

std::string read_all(int fd) {
    std::string output;
    std::array<char, 4096> buffer;
    while (true) {
        ssize_t n = ::read(fd, buffer.data(), buffer.size());
        if (n < 0) {
            if (errno == EINTR) continue;
            throw_errno("read");
        }
        if (n == 0) break;
        output.append(buffer.data(), static_cast<size_t>(n));
    }
    return output;
}

// Shared between the consumer and the reader thread; outlives the stream
// object when the consumer walks away early.
struct Channel {
    std::mutex mutex;
    std::condition_variable ready;
    std::deque<std::string> chunks;
    bool exited = false;
    bool finished = false;
    bool abandoned = false;
    int exit_code = -1;
};

// True once the child has exited. The child is left unreaped.
bool has_exited(pid_t pid) {
    siginfo_t info{};
    while (::waitid(P_PID, static_cast<id_t>(pid), &info, WEXITED | WNOHANG | WNOWAIT) < 0) {
        if (errno != EINTR) return true;
    }
    return info.si_pid == pid;
}

// Appends a chunk unless the consumer has gone. Returns false when it has.
bool deliver(Channel& channel, const char* data, size_t size) {
    std::lock_guard<std::mutex> lock(channel.mutex);
    if (channel.abandoned) return false;
    channel.chunks.emplace_back(data, size);
    channel.ready.notify_one();
    return true;
}

void debug_unless_abandoned(Channel& channel, const std::string& message) {
    {
        std::lock_guard<std::mutex> lock(channel.mutex);
        if (channel.abandoned) return;
    }
    print_debug(message);
}

// Reads whatever is already buffered in the pipe without waiting for writers
// that outlived the child.
void drain_available(Channel& channel, int fd) {
    int flags = ::fcntl(fd, F_GETFL);
    if (flags < 0 || ::fcntl(fd, F_SETFL, flags | O_NONBLOCK) < 0) {
        debug_unless_abandoned(channel, "cannot drain stream: " + std::string(std::strerror(errno)));
        return;
    }
    std::array<char, 4096> buffer;
    while (true) {
        ssize_t n = ::read(fd, buffer.data(), buffer.size());
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) break;
        deliver(channel, buffer.data(), static_cast<size_t>(n));
    }
}

// The feed ends when the child exits, even if a background process it left
// behind still holds the write end of the pipe.
void pump(std::shared_ptr<Channel> channel, Fd pipe_read, pid_t pid) {
    std::array<char, 4096> buffer;
    pollfd readable{pipe_read.get(), POLLIN, 0};
    while (true) {
        int ready = ::poll(&readable, 1, EXIT_POLL_MS);
        if (ready < 0) {
            if (errno == EINTR) continue;
            debug_unless_abandoned(*channel, "stream poll failed: " + std::string(std::strerror(errno)));
            break;
        }
        if (ready > 0) {
            ssize_t n = ::read(pipe_read.get(), buffer.data(), buffer.size());
            if (n < 0) {
                if (errno == EINTR) continue;
                debug_unless_abandoned(*channel, "stream read failed: " + std::string(std::strerror(errno)));
                break;
            }
            if (n == 0) break;
            deliver(*channel, buffer.data(), static_cast<size_t>(n));
        }
        if (has_exited(pid)) {
            drain_available(*channel, pipe_read.get());
            break;
        }
    }
    pipe_read.reset();

    // Wait without reaping first so terminate() can never signal a recycled pid.
    siginfo_t info{};
    while (::waitid(P_PID, static_cast<id_t>(pid), &info, WEXITED | WNOWAIT) < 0 && errno == EINTR) {}
    {
        std::lock_guard<std::mutex> lock(channel->mutex);
        channel->exited = true;
    }

    int status = 0;
    int exit_code = -1;
    while (true) {
        if (::waitpid(pid, &status, 0) >= 0) {
            exit_code = decode_status(status);
            break;
        }
        if (errno != EINTR) {
            debug_unless_abandoned(*channel, "waitpid failed: " + std::string(std::strerror(errno)));
            break;
        }
    }

    std::lock_guard<std::mutex> lock(channel->mutex);
    channel->exit_code = exit_code;
    channel->finished = true;
    channel->ready.notify_all();
}

class ProcessOutputStream final : public OutputStream {
public:
    ProcessOutputStream(Fd pipe_read, pid_t pid)
        : channel_(std::make_shared<Channel>()), pid_(pid) {
        reader_ = std::thread(pump, channel_, std::move(pipe_read), pid);
    }

    // Abandoning the stream stops delivery only. The reader keeps draining
    // and discarding output so the child is neither blocked nor killed by
    // SIGPIPE, then reaps it.
    ~ProcessOutputStream() override {
        bool finished;
        {
            std::lock_guard<std::mutex> lock(channel_->mutex);
            channel_->abandoned = true;
            channel_->chunks.clear();
            finished = channel_->finished;
        }
        if (finished) {
            reader_.join();
        } else {
            reader_.detach();
        }
    }

    std::optional<std::string> next() override {
        std::unique_lock<std::mutex> lock(channel_->mutex);
        channel_->ready.wait(lock, [this] {
            return !channel_->chunks.empty() || channel_->finished;
        });
        if (channel_->chunks.empty()) return std::nullopt;
        std::string chunk = std::move(channel_->chunks.front());
        channel_->chunks.pop_front();
        return chunk;
    }

    void terminate() override {
        std::lock_guard<std::mutex> lock(channel_->mutex);
        if (!channel_->exited) {
            ::kill(pid_, SIGTERM);
        }
    }

    std::optional<int> exit_code() const override {
        std::lock_guard<std::mutex> lock(channel_->mutex);
        if (!channel_->finished) return std::nullopt;
        return channel_->exit_code;
    }

private:
    std::shared_ptr<Channel> channel_;
    pid_t pid_;
    std::thread reader_;
};

} // namespace

std::string ExecutionResult::trimmed_output() const {
    const char* whitespace = " \t\r\n";
    size_t begin = std_out.find_first_not_of(whitespace);
    if (begin == std::string::npos) return "";
    size_t end = std_out.find_last_not_of(whitespace);
    return std_out.substr(begin, end - begin + 1);
}

TextOutputStream::TextOutputStream(std::vector<std::string> chunks)
    : chunks_(std::move(chunks)) {}

std::optional<std::string> TextOutputStream::next() {
    if (position_ >= chunks_.size()) return std::nullopt;
    return chunks_[position_++];
}

std::string collect(OutputStream& stream) {
    std::string text;
    while (auto chunk = stream.next()) {
        text += *chunk;
    }
    return text;
}

std::string resolve_executable(const std::string& name, const Environment& env) {
    if (name.empty()) throw LaunchFailure(name, ENOENT);
    if (name.find('/') != std::string::npos) return name;

    auto path = env.find("PATH");
    if (path != env.end()) {
        std::stringstream dirs(path->second);
        std::string dir;
        while (std::getline(dirs, dir, ':')) {
            if (dir.empty()) continue;
            std::string candidate = dir + "/" + name;
            struct stat st;
            if (::stat(candidate.c_str(), &st) == 0 && S_ISREG(st.st_mode) &&
                ::access(candidate.c_str(), X_OK) == 0) {
                return candidate;
            }
        }
    }
    throw LaunchFailure(name, ENOENT);
}

LocalProcessRunner::LocalProcessRunner(RunnerOptions options)
    : options_(std::move(options)) {}

void LocalProcessRunner::set_proxy_environment(Environment proxy) {
    options_.proxy = std::move(proxy);
}

Environment LocalProcessRunner::environment_for(const CommandSpec& command) const {
    return build_environment(current_environment(), options_.proxy,
                             command.environment(), options_.path_prefixes);
}

ExecutionResult LocalProcessRunner::execute(const CommandSpec& command) {
    print_debug("exec: " + command.to_string());
    Environment env = environment_for(command);

    Pipe out = make_pipe();
    Pipe err = make_pipe();
    pid_t pid = spawn(command, env, out.w.get(), err.w.get());

    // The write ends must be closed here or the readers never see EOF.
    out.w.reset();
    err.w.reset();

    // Drain both pipes at once; reading one after the other deadlocks when
    // the child fills the other pipe's buffer.
    auto future_stdout = std::async(std::launch::async, read_all, out.r.get());
    auto future_stderr = std::async(std::launch::async, read_all, err.r.get());

    ExecutionResult result;
    try {
        result.std_out = future_stdout.get();
        result.std_err = future_stderr.get();
    } catch (const std::system_error&) {
        wait_for(pid);
        throw;
    }
    result.exit_code = wait_for(pid);
    print_debug("exit " + std::to_string(result.exit_code) + ": " + command.executable());
    return result;
}

OutputStreamPtr LocalProcessRunner::stream(const CommandSpec& command) {
    print_debug("stream: " + command.to_string());
    Environment env = environment_for(command);

    Pipe combined = make_pipe();
    pid_t pid = spawn(command, env, combined.w.get(), combined.w.get());
    combined.w.reset();

    return std::make_unique<ProcessOutputStream>(std::move(combined.r), pid);
}
