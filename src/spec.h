#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <variant>

enum class ImageFormat { qcow2, raw, ami, aki, ari };

std::optional<ImageFormat> parse_image_format(const std::string& name);
const char* to_string(ImageFormat format);
// qemu block driver name. ami/aki/ari are raw-layout images.
const char* qemu_format_name(ImageFormat format);

struct BackingImage {
    std::filesystem::path path;
    std::optional<ImageFormat> format = std::nullopt;
};

struct ImageSpec {
    std::filesystem::path path;
    std::optional<ImageFormat> format = ImageFormat::qcow2;
    std::optional<BackingImage> backing = std::nullopt;
    std::optional<std::string> size = std::nullopt;
};

struct BootParams {
    std::optional<std::string> cpu_model = std::nullopt;
    std::optional<int> vcpus = std::nullopt;
    std::optional<int> ram_mib = std::nullopt;
    std::optional<std::string> vnc = std::nullopt;
    std::optional<std::string> display = std::nullopt;
    std::optional<std::filesystem::path> cdrom = std::nullopt;
};

struct InstanceSpec {
    ImageSpec disk;
    BootParams boot;
};

enum class Ensure { present, absent };
enum class ResourceKind { image, instance };

struct DesiredState {
    Ensure ensure = Ensure::present;
    ResourceKind kind = ResourceKind::instance;
    std::variant<ImageSpec,InstanceSpec> spec;
    bool running = false; // instance only: boot after ensuring the disk
    bool purge = true;    // instance only: absent also deletes the disk

    const std::filesystem::path& id() const;
};

// All throw KvmError(InvalidSpec).
void validate(const ImageSpec& spec);
void validate(const BootParams& params);
void validate(const InstanceSpec& spec);
void validate(const DesiredState& desired);

std::filesystem::path normalize_path(const std::filesystem::path& path);
ImageSpec normalized(const ImageSpec& spec);
BootParams normalized(const BootParams& params);
InstanceSpec normalized(const InstanceSpec& spec);
