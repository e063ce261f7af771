#pragma once

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>

static const std::filesystem::path default_config_path("/etc/kvmctl/kvmctl.ini");

struct Config {
    std::string qemu_img = "qemu-img";
    std::string qemu_kvm = "qemu-kvm";
    std::string kill = "kill";
    std::filesystem::path state_dir = "/run/kvmctl";
    std::chrono::milliseconds command_timeout = std::chrono::seconds(600);
    std::chrono::milliseconds boot_timeout = std::chrono::seconds(60);
    std::chrono::milliseconds stop_grace = std::chrono::seconds(30);
    std::chrono::milliseconds kill_grace = std::chrono::seconds(5);
    std::chrono::milliseconds lock_wait = std::chrono::milliseconds(0);
    size_t output_cap = 1024 * 1024;
    std::string default_display = "sdl";
    std::string default_cdrom = "cloud-init/default/default-cidata.iso";
    bool syslog = false;
};

// An explicitly given path must exist; the default path is optional.
Config load_config(const std::optional<std::filesystem::path>& path = std::nullopt);
