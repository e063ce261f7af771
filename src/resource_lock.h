#pragma once

#include <sys/file.h>
#include <unistd.h>

#include <chrono>
#include <filesystem>
#include <functional>
#include <string>

#include "common.h"

// Opens lock_path and takes an exclusive flock(2) on it, retrying until wait
// expires. Throws KvmError(ResourceBusy) on contention. The fd is close-on-exec.
int acquire_resource_lock(const std::filesystem::path& lock_path, const std::string& resource, std::chrono::milliseconds wait);
void release_resource_lock(int fd);

template <typename T> T with_resource_lock(const std::filesystem::path& lock_path, const std::string& resource, std::chrono::milliseconds wait, std::function<T(void)> func)
{
    auto fd = acquire_resource_lock(lock_path, resource, wait);
    return with_finally_clause<T>([&func]() {
        return func();
    }, [fd]() {
        release_resource_lock(fd);
    });
}
