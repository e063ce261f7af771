#pragma once

#include <stdint.h>

#include <atomic>
#include <chrono>
#include <optional>
#include <string>
#include <vector>

class CancelToken {
    std::atomic<bool> cancelled;
    std::atomic<int64_t> deadline_ns; // steady_clock epoch, 0 = none
public:
    CancelToken() : cancelled(false), deadline_ns(0) {}
    void cancel() { cancelled.store(true); }
    void set_deadline(std::chrono::steady_clock::time_point deadline) {
        deadline_ns.store(std::chrono::duration_cast<std::chrono::nanoseconds>(deadline.time_since_epoch()).count());
    }
    bool is_cancelled() const;
};

struct RunResult {
    int exit_code = -1;
    std::string out;
    std::string err;
    bool truncated = false;
    bool timed_out = false;
    bool cancelled = false;
    std::optional<int> signal = std::nullopt;

    bool succeeded() const { return exit_code == 0 && !timed_out && !cancelled; }
};

// Runs one argument vector without a shell. Returns as soon as the direct child
// has exited, so children that daemonize do not keep the call pending.
class ProcessRunner {
    size_t output_cap;
    std::chrono::milliseconds kill_grace;
    bool syslog;
public:
    ProcessRunner(size_t _output_cap, std::chrono::milliseconds _kill_grace, bool _syslog = false)
        : output_cap(_output_cap), kill_grace(_kill_grace), syslog(_syslog) {}
    virtual ~ProcessRunner() = default;

    virtual RunResult run(const std::vector<std::string>& cmdline, std::chrono::milliseconds timeout, const CancelToken* cancel = nullptr) const;
};
