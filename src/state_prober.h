#pragma once

#include <sys/types.h>
#include <stdint.h>

#include <filesystem>
#include <optional>
#include <string>

#include "spec.h"
#include "state_dir.h"

enum class ProbedState { absent, present_stopped, present_running };

const char* to_string(ProbedState state);

struct ProbeResult {
    ProbedState state = ProbedState::absent;
    std::optional<ImageFormat> format = std::nullopt;
    uint64_t size = 0;
    std::optional<pid_t> pid = std::nullopt; // set only when running

    bool present() const { return state != ProbedState::absent; }
    bool running() const { return state == ProbedState::present_running; }
};

bool is_process_alive(pid_t pid);
bool process_has_argument(pid_t pid, const std::string& arg);
// qcow2 is recognized by its header magic; everything else is raw
std::optional<ImageFormat> detect_image_format(const std::filesystem::path& path);

// Read-only view of images on disk and of instances recorded in the state directory.
class StateProber {
    StateDir state_dir;
public:
    explicit StateProber(const StateDir& _state_dir) : state_dir(_state_dir) {}

    ProbeResult probe_image(const std::filesystem::path& path) const;
    ProbeResult probe_instance(const std::filesystem::path& disk) const;
    ProbeResult probe(const std::filesystem::path& id, ResourceKind kind) const;
    bool is_instance_process(pid_t pid, const std::filesystem::path& disk) const;
};
