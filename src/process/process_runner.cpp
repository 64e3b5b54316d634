#include "process/process_runner.h"
#include "core/logging.h"

#include <cerrno>
#include <chrono>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/ioctl.h>
#include <sys/wait.h>
#include <termios.h>
#include <unistd.h>

#if defined(__APPLE__)
#include <util.h>
#elif defined(__linux__)
#include <pty.h>
#endif

extern char** environ;

namespace easel {

namespace {

constexpr size_t READ_CHUNK = 4096;

winsize window_size(int rows, int cols) {
    winsize ws{};
    ws.ws_row = static_cast<unsigned short>(rows);
    ws.ws_col = static_cast<unsigned short>(cols);
    return ws;
}

// The parent environment with terminal defaults, then the caller's overrides.
std::vector<std::string> child_environment(const std::map<std::string, std::string>& overrides) {
    std::map<std::string, std::string> vars;
    for (char** entry = environ; entry && *entry; ++entry) {
        std::string text(*entry);
        auto eq = text.find('=');
        if (eq != std::string::npos) {
            vars[text.substr(0, eq)] = text.substr(eq + 1);
        }
    }
    vars["TERM"] = "xterm-256color";
    vars["COLORTERM"] = "truecolor";
    vars.emplace("LANG", "en_US.UTF-8");
    for (const auto& [key, value] : overrides) {
        vars[key] = value;
    }

    std::vector<std::string> out;
    out.reserve(vars.size());
    for (const auto& [key, value] : vars) {
        out.push_back(key + "=" + value);
    }
    return out;
}

std::vector<char*> c_strings(std::vector<std::string>& values) {
    std::vector<char*> out;
    out.reserve(values.size() + 1);
    for (auto& value : values) {
        out.push_back(value.data());
    }
    out.push_back(nullptr);
    return out;
}

int decode_status(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return -1;
}

}

ProcessRunner::~ProcessRunner() {
    detach();
    if (running_.load()) {
        kill();
    }
    if (io_thread_.joinable()) {
        io_thread_.join();
    }
}

bool ProcessRunner::start(const ProcessConfig& config, ProcessCallbacks callbacks) {
    if (running_.load() || config.argv.empty()) {
        return false;
    }
    if (io_thread_.joinable()) {
        io_thread_.join();
    }

    // Everything the child needs is built before fork.
    std::vector<std::string> args = config.argv;
    std::vector<std::string> env = child_environment(config.env);
    std::vector<char*> argv = c_strings(args);
    std::vector<char*> envp = c_strings(env);
    std::string chdir_error = "cannot enter " + config.working_dir + "\n";
    std::string exec_error = "cannot execute " + args.front() + "\n";
    winsize ws = window_size(config.rows, config.cols);

    int fd = -1;
    pid_t pid = forkpty(&fd, nullptr, nullptr, &ws);
    if (pid < 0) {
        log::get("process")->error("forkpty failed for {}: {}", args.front(), std::strerror(errno));
        return false;
    }

    if (pid == 0) {
        if (!config.working_dir.empty() && chdir(config.working_dir.c_str()) != 0) {
            ::write(STDERR_FILENO, chdir_error.data(), chdir_error.size());
            _exit(127);
        }
        environ = envp.data();
        execvp(argv[0], argv.data());
        ::write(STDERR_FILENO, exec_error.data(), exec_error.size());
        _exit(127);
    }

    fcntl(fd, F_SETFL, fcntl(fd, F_GETFL) | O_NONBLOCK);
    {
        std::lock_guard<std::mutex> lock(callbacks_mutex_);
        callbacks_ = std::move(callbacks);
    }
    fd_ = fd;
    pid_ = pid;
    stop_requested_ = false;
    running_ = true;
    io_thread_ = std::thread(&ProcessRunner::io_loop, this);

    log::get("process")->debug("Started {} as pid {} in {}", args.front(), pid,
                               config.working_dir.empty() ? std::string(".") : config.working_dir);
    return true;
}

void ProcessRunner::kill() {
    stop_requested_ = true;
    pid_t pid = pid_.load();
    if (pid > 0) {
        ::kill(-pid, SIGKILL);
    }
}

bool ProcessRunner::write(const std::string& data) {
    int fd = fd_.load();
    if (!running_.load() || fd < 0) {
        return false;
    }

    size_t offset = 0;
    while (offset < data.size()) {
        ssize_t n = ::write(fd, data.data() + offset, data.size() - offset);
        if (n >= 0) {
            offset += static_cast<size_t>(n);
        } else if (errno == EAGAIN || errno == EINTR) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        } else {
            log::get("process")->warn("Write to pid {} failed: {}", pid_.load(), std::strerror(errno));
            return false;
        }
    }
    return true;
}

void ProcessRunner::resize(int rows, int cols) {
    int fd = fd_.load();
    if (fd < 0) {
        return;
    }
    winsize ws = window_size(rows, cols);
    ioctl(fd, TIOCSWINSZ, &ws);
}

void ProcessRunner::detach() {
    std::lock_guard<std::mutex> lock(callbacks_mutex_);
    callbacks_ = {};
}

void ProcessRunner::io_loop() {
    char buffer[READ_CHUNK];
    pollfd pfd{fd_.load(), POLLIN, 0};
    int exit_code = -1;
    bool reaped = false;

    while (!stop_requested_.load()) {
        int ready = ::poll(&pfd, 1, 100);
        if (ready < 0) {
            if (errno == EINTR) continue;
            break;
        }

        bool closed = ready > 0 && (pfd.revents & (POLLHUP | POLLERR));
        if (ready > 0 && (pfd.revents & (POLLIN | POLLHUP))) {
            closed = read_available(buffer, sizeof(buffer)) == ReadResult::Closed || closed;
        }

        if (reap(false, exit_code)) {
            reaped = true;
            // Output written just before exit can still sit in the pty.
            for (int i = 0; i < 20 && read_available(buffer, sizeof(buffer)) == ReadResult::Drained; ++i) {
                std::this_thread::sleep_for(std::chrono::milliseconds(10));
            }
            break;
        }
        if (closed) {
            break;
        }
    }

    close_fd();
    if (!reaped && !reap(true, exit_code)) {
        pid_t pid = pid_.load();
        if (pid > 0) {
            ::kill(-pid, SIGKILL);
            ::kill(pid, SIGKILL);
        }
        reap(true, exit_code);
    }
    pid_ = -1;
    running_ = false;

    std::lock_guard<std::mutex> lock(callbacks_mutex_);
    if (callbacks_.on_exit) {
        callbacks_.on_exit(exit_code);
    }
}

ProcessRunner::ReadResult ProcessRunner::read_available(char* buffer, size_t size) {
    int fd = fd_.load();
    if (fd < 0) {
        return ReadResult::Closed;
    }
    while (true) {
        ssize_t n = ::read(fd, buffer, size);
        if (n > 0) {
            emit_output(std::string(buffer, static_cast<size_t>(n)));
        } else if (n < 0 && errno == EINTR) {
            continue;
        } else if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            return ReadResult::Drained;
        } else {
            // EOF, or EIO once the child side of the pty is gone.
            return ReadResult::Closed;
        }
    }
}

bool ProcessRunner::reap(bool block_briefly, int& exit_code) {
    pid_t pid = pid_.load();
    if (pid <= 0) {
        return false;
    }

    int attempts = block_briefly ? 10 : 1;
    for (int i = 0; i < attempts; ++i) {
        int status = 0;
        pid_t result = waitpid(pid, &status, WNOHANG);
        if (result == pid) {
            exit_code = decode_status(status);
            pid_ = -1;
            return true;
        }
        if (result < 0) {
            pid_ = -1;
            return false;
        }
        if (block_briefly) {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
    }
    return false;
}

void ProcessRunner::emit_output(const std::string& data) {
    std::lock_guard<std::mutex> lock(callbacks_mutex_);
    if (callbacks_.on_output) {
        callbacks_.on_output(data);
    }
}

void ProcessRunner::close_fd() {
    int fd = fd_.exchange(-1);
    if (fd >= 0) {
        close(fd);
    }
}

}
