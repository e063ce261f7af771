#include <ctype.h>
#include <stdio.h>

#include <iostream>

#include "state_dir.h"
#include "common.h"
#include "error.h"
#include "yajl_value.h"

std::string serialize(const InstanceRecord& record)
{
    auto gen = new_json_gen();
    yajl_gen_map_open(gen.get());
    gen_key_integer(gen.get(), "pid", record.pid);
    gen_key_string(gen.get(), "disk", record.disk.string());
    gen_key_integer(gen.get(), "booted_at", record.booted_at);
    yajl_gen_map_close(gen.get());
    return gen_to_string(gen.get());
}

InstanceRecord deserialize_instance_record(const std::string& json)
{
    auto tree = parse_json(json);
    InstanceRecord record;
    auto obj = get<std::map<std::string,yajl_val>>(tree.get());
    auto pid = get<int64_t>(obj.at("pid"));
    if (pid <= 0) throw std::runtime_error("Invalid pid " + std::to_string(pid));
    record.pid = (pid_t)pid;
    record.disk = get<std::string>(obj.at("disk"));
    record.booted_at = get<int64_t>(obj.at("booted_at"));
    return record;
}

std::string StateDir::key(const std::filesystem::path& id) const
{
    // FNV-1a over the full path keeps keys distinct; the readable prefix is for humans
    uint64_t hash = 14695981039346656037ULL;
    for (unsigned char c:id.string()) {
        hash ^= c;
        hash *= 1099511628211ULL;
    }
    std::string prefix;
    for (auto c:id.filename().string()) {
        if (prefix.length() >= 48) break;
        prefix += (isalnum((unsigned char)c) || c == '.' || c == '-' || c == '_')? c : '_';
    }
    if (prefix.empty() || prefix[0] == '.') prefix = "_" + prefix;
    char hex[17];
    snprintf(hex, sizeof(hex), "%016llx", (unsigned long long)hash);
    return prefix + '-' + hex;
}

std::filesystem::path StateDir::lock_path(const std::filesystem::path& id) const
{
    return root / (key(id) + ".lock");
}

std::filesystem::path StateDir::record_path(const std::filesystem::path& id) const
{
    return root / (key(id) + ".json");
}

std::filesystem::path StateDir::pidfile_path(const std::filesystem::path& id) const
{
    return root / (key(id) + ".qemu.pid");
}

std::optional<InstanceRecord> StateDir::load_record(const std::filesystem::path& id) const
{
    auto path = record_path(id);
    auto content = read_file(path);
    if (!content) return std::nullopt;
    //else
    try {
        return deserialize_instance_record(content.value());
    }
    catch (const std::exception& e) {
        throw KvmError(ErrorKind::IOError, "Corrupt instance record " + path.string() + ": " + e.what());
    }
}

void StateDir::save_record(const std::filesystem::path& id, const InstanceRecord& record) const
{
    std::filesystem::create_directories(root);
    write_file_atomically(record_path(id), serialize(record));
}

bool StateDir::remove_record(const std::filesystem::path& id) const
{
    return std::filesystem::remove(record_path(id));
}

std::vector<InstanceRecord> StateDir::records() const
{
    std::vector<InstanceRecord> records;
    if (!std::filesystem::exists(root) || !std::filesystem::is_directory(root)) return records;
    //else
    for (const auto& d : std::filesystem::directory_iterator(root)) {
        if (!d.is_regular_file() || d.path().extension() != ".json") continue;
        auto content = read_file(d.path());
        if (!content) continue;
        try {
            records.push_back(deserialize_instance_record(content.value()));
        }
        catch (const std::exception& ex) {
            std::cerr << d.path().string() << ": " << ex.what() << std::endl;
        }
    }
    return records;
}

std::optional<pid_t> StateDir::read_pidfile(const std::filesystem::path& id) const
{
    auto content = read_file(pidfile_path(id));
    if (!content) return std::nullopt;
    //else
    try {
        size_t idx = 0;
        auto pid = std::stol(content.value(), &idx);
        if (pid <= 0) return std::nullopt;
        for (auto i = idx; i < content->length(); i++) {
            if (!isspace((unsigned char)(*content)[i])) return std::nullopt;
        }
        return (pid_t)pid;
    }
    catch (const std::logic_error&) { // invalid_argument, out_of_range
        return std::nullopt;
    }
}

void StateDir::remove_pidfile(const std::filesystem::path& id) const
{
    std::filesystem::remove(pidfile_path(id));
}
