#pragma once

#include <sys/types.h>

#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

#include "config.h"
#include "spec.h"

struct StopStep {
    std::vector<std::string> cmdline;
    std::chrono::milliseconds grace; // how long to wait for the process to exit after this step
};

// Builds argument vectors for one hypervisor platform. Builders never touch
// the filesystem or spawn anything; invalid input throws KvmError(InvalidSpec).
class HypervisorDriver {
public:
    virtual ~HypervisorDriver() = default;

    virtual std::vector<std::string> create_image(const ImageSpec& spec, const std::filesystem::path& target) const = 0;
    virtual std::vector<std::string> create_instance(const InstanceSpec& spec, const std::filesystem::path& target) const = 0;
    virtual std::vector<std::string> boot_instance(const std::filesystem::path& disk, const BootParams& params, const std::filesystem::path& pidfile) const = 0;
    virtual std::vector<std::string> inspect(const std::filesystem::path& target, bool force_share) const = 0;
    virtual std::vector<StopStep> stop_instance(pid_t pid) const = 0;
};

class QemuDriver : public HypervisorDriver {
    Config config;
public:
    explicit QemuDriver(const Config& _config) : config(_config) {}

    std::vector<std::string> create_image(const ImageSpec& spec, const std::filesystem::path& target) const override;
    std::vector<std::string> create_instance(const InstanceSpec& spec, const std::filesystem::path& target) const override;
    std::vector<std::string> boot_instance(const std::filesystem::path& disk, const BootParams& params, const std::filesystem::path& pidfile) const override;
    std::vector<std::string> inspect(const std::filesystem::path& target, bool force_share) const override;
    std::vector<StopStep> stop_instance(pid_t pid) const override;
};

// qemu option values use ',' as separator; a literal comma is written as ",,".
std::string escape_qemu_option_value(const std::string& value);
