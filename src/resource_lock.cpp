#include <string.h>
#include <errno.h>
#include <fcntl.h>
#include <sys/stat.h>

#include <thread>

#include "resource_lock.h"
#include "error.h"

int acquire_resource_lock(const std::filesystem::path& lock_path, const std::string& resource, std::chrono::milliseconds wait)
{
    std::error_code ec;
    std::filesystem::create_directories(lock_path.parent_path(), ec);
    if (ec) throw KvmError(ErrorKind::IOError, "create_directories(" + lock_path.parent_path().string() + ") failed: " + ec.message());

    auto fd = open(lock_path.c_str(), O_RDWR|O_CREAT|O_CLOEXEC, S_IRUSR|S_IWUSR);
    if (fd < 0) throw KvmError(ErrorKind::IOError, std::string("open(") + lock_path.string() + ") failed: " + strerror(errno));

    auto deadline = std::chrono::steady_clock::now() + wait;
    while (flock(fd, LOCK_EX|LOCK_NB) < 0) {
        if (errno == EINTR) continue;
        if (errno != EWOULDBLOCK) {
            auto err = errno;
            close(fd);
            throw KvmError(ErrorKind::IOError, std::string("flock(") + lock_path.string() + ") failed: " + strerror(err));
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            close(fd);
            throw KvmError(ErrorKind::ResourceBusy, resource + " is locked by another operation");
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
    return fd;
}

void release_resource_lock(int fd)
{
    flock(fd, LOCK_UN);
    close(fd);
}
