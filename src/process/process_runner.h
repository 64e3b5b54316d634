#pragma once

#include <atomic>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include <sys/types.h>

namespace easel {

struct ProcessConfig {
    // argv[0] is looked up on PATH.
    std::vector<std::string> argv;
    std::string working_dir;
    std::map<std::string, std::string> env;
    int rows = 24;
    int cols = 80;
};

struct ProcessCallbacks {
    std::function<void(const std::string& data)> on_output;
    // Exit status, or 128 + signal number when the child was killed.
    std::function<void(int exit_code)> on_exit;
};

// One child process on a pseudo-terminal in its own process group. Output and
// exit are reported from an io thread.
class ProcessRunner {
public:
    ProcessRunner() = default;
    ~ProcessRunner();

    ProcessRunner(const ProcessRunner&) = delete;
    ProcessRunner& operator=(const ProcessRunner&) = delete;

    bool start(const ProcessConfig& config, ProcessCallbacks callbacks);
    // SIGKILL to the whole process group.
    void kill();

    bool write(const std::string& data);
    void resize(int rows, int cols);

    // After this returns no callback is running or will run again.
    void detach();

    bool is_running() const { return running_.load(); }
    pid_t pid() const { return pid_.load(); }

private:
    enum class ReadResult { Drained, Closed };

    void io_loop();
    ReadResult read_available(char* buffer, size_t size);
    bool reap(bool block_briefly, int& exit_code);
    void emit_output(const std::string& data);
    void close_fd();

    std::atomic<pid_t> pid_{-1};
    std::atomic<int> fd_{-1};
    std::atomic<bool> running_{false};
    std::atomic<bool> stop_requested_{false};
    std::thread io_thread_;

    std::mutex callbacks_mutex_;
    ProcessCallbacks callbacks_;
};

}
