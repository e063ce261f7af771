#pragma once

#include <sys/types.h>
#include <stdint.h>

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

struct InstanceRecord {
    pid_t pid = 0;
    std::filesystem::path disk;
    int64_t booted_at = 0; // seconds since epoch
};

std::string serialize(const InstanceRecord& record);
InstanceRecord deserialize_instance_record(const std::string& json);

// Per-resource files under the state directory, keyed by the resource's absolute path:
//   <key>.lock      advisory lock
//   <key>.json      sidecar record of a booted instance
//   <key>.qemu.pid  pidfile written by the hypervisor itself
class StateDir {
    std::filesystem::path root;
public:
    explicit StateDir(const std::filesystem::path& _root) : root(_root) {}

    const std::filesystem::path& path() const { return root; }
    std::string key(const std::filesystem::path& id) const;
    std::filesystem::path lock_path(const std::filesystem::path& id) const;
    std::filesystem::path record_path(const std::filesystem::path& id) const;
    std::filesystem::path pidfile_path(const std::filesystem::path& id) const;

    std::optional<InstanceRecord> load_record(const std::filesystem::path& id) const;
    void save_record(const std::filesystem::path& id, const InstanceRecord& record) const;
    bool remove_record(const std::filesystem::path& id) const;
    std::vector<InstanceRecord> records() const;

    std::optional<pid_t> read_pidfile(const std::filesystem::path& id) const;
    void remove_pidfile(const std::filesystem::path& id) const;
};
