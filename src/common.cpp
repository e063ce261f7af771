#include <iostream>
#include <fstream>
#include <sstream>

#include <stdio.h>
#include <string.h>
#include <errno.h>
#include <fcntl.h>
#include <syslog.h>
#include <sys/stat.h>

#include "common.h"
#include "error.h"

bool debug = false;

// Runs func in a child process that exits 0 when func returns and 1 when it throws.
pid_t fork(std::function<void(void)> func)
{
    auto pid = ::fork();
    if (pid < 0) throw std::runtime_error("fork() failed");
    if (pid > 0) return pid;

    //else(child process)
    try {
        func();
    }
    catch (const std::exception& e) {
        std::cerr << e.what() << std::endl;
        _exit(1);
    }
    _exit(0);
}

std::string join_cmdline(const std::vector<std::string>& cmdline, const std::string& sep/* = " "*/)
{
    std::string joined;
    for (const auto& arg:cmdline) {
        if (!joined.empty()) joined += sep;
        joined += arg;
    }
    return joined;
}

void log_command(const std::vector<std::string>& cmdline, bool to_syslog)
{
    if (debug) {
        std::cerr << "+ " << join_cmdline(cmdline) << std::endl;
    }
    if (to_syslog) {
        openlog("kvmctl", LOG_PID, LOG_USER);
        syslog(LOG_NOTICE, "Command %s", join_cmdline(cmdline, "|").c_str());
        closelog();
    }
}

std::optional<std::string> read_file(const std::filesystem::path& path)
{
    std::ifstream f(path, std::ios::in | std::ios::binary);
    if (!f) return std::nullopt;
    //else
    std::stringstream buf;
    buf << f.rdbuf();
    return buf.str();
}

std::filesystem::path temp_path_for(const std::filesystem::path& path)
{
    return path.parent_path() / ("." + path.filename().string() + ".tmp." + std::to_string(getpid()));
}

void write_file_atomically(const std::filesystem::path& path, const std::string& content)
{
    auto tmp_path = temp_path_for(path);
    auto fd = open(tmp_path.c_str(), O_WRONLY|O_CREAT|O_TRUNC|O_CLOEXEC, S_IRUSR|S_IWUSR);
    if (fd < 0) throw KvmError(ErrorKind::IOError, std::string("open(") + tmp_path.string() + ") failed: " + strerror(errno));
    //else
    size_t written = 0;
    while (written < content.length()) {
        auto r = ::write(fd, content.c_str() + written, content.length() - written);
        if (r < 0 && errno == EINTR) continue;
        if (r < 0) {
            auto err = errno;
            close(fd);
            unlink(tmp_path.c_str());
            throw KvmError(ErrorKind::IOError, std::string("write(") + tmp_path.string() + ") failed: " + strerror(err));
        }
        written += r;
    }
    if (fsync(fd) < 0 || close(fd) < 0) {
        auto err = errno;
        unlink(tmp_path.c_str());
        throw KvmError(ErrorKind::IOError, std::string("fsync(") + tmp_path.string() + ") failed: " + strerror(err));
    }
    if (rename(tmp_path.c_str(), path.c_str()) < 0) {
        auto err = errno;
        unlink(tmp_path.c_str());
        throw KvmError(ErrorKind::IOError, std::string("rename(") + tmp_path.string() + ", " + path.string() + ") failed: " + strerror(err));
    }
}

void with_finally_clause(std::function<void(void)> func,std::function<void(void)> finally)
{
    with_finally_clause<void*>([&func]() {
        func();
        return nullptr;
    }, finally);
}

std::string human_readable(uint64_t size)
{
    char buf[32];
    char au = 'K';

    float s = size / 1024.0;

    if (s >= 1024.0) {
        s /= 1024.0;
        au = 'M';
    }
    if (s >= 1024.0) {
        s /= 1024.0;
        au = 'G';
    }
    if (s >= 1024.0) {
        s /= 1024.0;
        au = 'T';
    }
    if (s >= 1024.0) {
        s /= 1024.0;
        au = 'P';
    }
    sprintf(buf, "%.1f%c", s, au);
    return std::string(buf);
}
