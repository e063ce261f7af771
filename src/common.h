#pragma once

#include <unistd.h>
#include <stdint.h>

#include <vector>
#include <string>
#include <functional>
#include <filesystem>
#include <optional>

extern bool debug;

pid_t fork(std::function<void(void)> func);
std::string join_cmdline(const std::vector<std::string>& cmdline, const std::string& sep = " ");
void log_command(const std::vector<std::string>& cmdline, bool to_syslog);
std::optional<std::string> read_file(const std::filesystem::path& path);
void write_file_atomically(const std::filesystem::path& path, const std::string& content);
std::filesystem::path temp_path_for(const std::filesystem::path& path);
std::string human_readable(uint64_t size);

template <typename T> T with_finally_clause(std::function<T(void)> func,std::function<void(void)> finally)
{
    class finalizer {
        std::function<void(void)>& finally;
    public:
        finalizer(std::function<void(void)>& _finally) : finally(_finally) {}
        ~finalizer() { finally(); }
    };
    finalizer f(finally);
    return func();
}

void with_finally_clause(std::function<void(void)> func,std::function<void(void)> finally);
