#include <string.h>
#include <errno.h>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>

#include <thread>

#include "process_runner.h"
#include "common.h"
#include "error.h"

bool CancelToken::is_cancelled() const
{
    if (cancelled.load()) return true;
    auto deadline = deadline_ns.load();
    if (deadline == 0) return false;
    //else
    auto now = std::chrono::duration_cast<std::chrono::nanoseconds>(std::chrono::steady_clock::now().time_since_epoch()).count();
    return now >= deadline;
}

// once a stream is cut, the rest of it is dropped so that no later bytes follow a gap
static void append_capped(std::string& buf, const char* data, size_t len, size_t cap, bool& truncated)
{
    if (truncated) return;
    auto room = cap > buf.length()? cap - buf.length() : 0;
    if (len > room) {
        truncated = true;
        len = room;
        // back off to a UTF-8 character boundary
        while (len > 0 && (static_cast<unsigned char>(data[len]) & 0xc0) == 0x80) len--;
    }
    buf.append(data, len);
}

// returns false on EOF or error (fd should be closed)
static bool read_available(int fd, std::string& buf, size_t cap, bool& truncated)
{
    char _buf[4096];
    while (true) {
        auto r = read(fd, _buf, sizeof(_buf));
        if (r > 0) {
            append_capped(buf, _buf, r, cap, truncated);
            continue;
        }
        if (r == 0) return false; // EOF
        //else
        if (errno == EINTR) continue;
        return errno == EAGAIN || errno == EWOULDBLOCK;
    }
}

static void kill_process_group(pid_t pid, int sig)
{
    if (kill(-pid, sig) < 0) kill(pid, sig);
}

RunResult ProcessRunner::run(const std::vector<std::string>& cmdline, std::chrono::milliseconds timeout, const CancelToken* cancel/* = nullptr*/) const
{
    if (cmdline.size() < 1) throw std::logic_error("cmdline too short");
    log_command(cmdline, syslog);

    int out_fd[2], err_fd[2];
    if (pipe2(out_fd, O_CLOEXEC) < 0) throw KvmError(ErrorKind::IOError, std::string("pipe() failed: ") + strerror(errno));
    if (pipe2(err_fd, O_CLOEXEC) < 0) {
        auto err = errno;
        close(out_fd[0]); close(out_fd[1]);
        throw KvmError(ErrorKind::IOError, std::string("pipe() failed: ") + strerror(err));
    }

    // everything the child needs is prepared before fork()
    std::vector<char*> argv;
    for (const auto& arg:cmdline) argv.push_back(const_cast<char*>(arg.c_str()));
    argv.push_back(NULL);

    auto pid = ::fork();
    if (pid < 0) {
        auto err = errno;
        for (int fd:{out_fd[0], out_fd[1], err_fd[0], err_fd[1]}) close(fd);
        throw KvmError(ErrorKind::IOError, std::string("fork() failed: ") + strerror(err));
    }
    if (pid == 0) {
        //(child process)
        setpgid(0, 0);
        auto devnull = open("/dev/null", O_RDONLY);
        if (devnull >= 0) dup2(devnull, STDIN_FILENO);
        dup2(out_fd[1], STDOUT_FILENO);
        dup2(err_fd[1], STDERR_FILENO);
        sigset_t mask;
        sigemptyset(&mask);
        sigprocmask(SIG_SETMASK, &mask, NULL);
        signal(SIGPIPE, SIG_DFL);
        execvp(argv[0], argv.data());
        const char* msg = "exec failed: ";
        (void)!::write(STDERR_FILENO, msg, strlen(msg));
        (void)!::write(STDERR_FILENO, argv[0], strlen(argv[0]));
        (void)!::write(STDERR_FILENO, "\n", 1);
        _exit(127);
    }

    //else(parent process)
    setpgid(pid, pid); // same as the child's own call; whichever runs first wins
    close(out_fd[1]);
    close(err_fd[1]);
    int fds[2] = {out_fd[0], err_fd[0]};
    for (auto fd:fds) fcntl(fd, F_SETFL, fcntl(fd, F_GETFL) | O_NONBLOCK);

    RunResult rst;
    std::string* bufs[2] = {&rst.out, &rst.err};
    bool capped[2] = {false, false};

    auto started = std::chrono::steady_clock::now();
    std::optional<std::chrono::steady_clock::time_point> terminated_at;
    bool killed = false;
    int wstatus = 0;

    with_finally_clause([&]() {
        while (true) {
            struct pollfd pollfds[2];
            int nfds = 0;
            for (auto fd:fds) {
                if (fd < 0) continue;
                pollfds[nfds].fd = fd;
                pollfds[nfds].events = POLLIN;
                pollfds[nfds].revents = 0;
                nfds++;
            }
            if (nfds > 0) {
                if (::poll(pollfds, nfds, 100) < 0 && errno != EINTR) {
                    throw KvmError(ErrorKind::IOError, std::string("poll() failed: ") + strerror(errno));
                }
            } else {
                std::this_thread::sleep_for(std::chrono::milliseconds(100));
            }
            for (int i = 0; i < 2; i++) {
                if (fds[i] < 0) continue;
                if (!read_available(fds[i], *bufs[i], output_cap, capped[i])) {
                    close(fds[i]);
                    fds[i] = -1;
                }
            }

            auto r = waitpid(pid, &wstatus, WNOHANG);
            if (r == pid) break;
            if (r < 0 && errno != EINTR) throw KvmError(ErrorKind::IOError, std::string("waitpid() failed: ") + strerror(errno));

            auto now = std::chrono::steady_clock::now();
            if (!terminated_at) {
                if (now - started >= timeout) rst.timed_out = true;
                else if (cancel && cancel->is_cancelled()) rst.cancelled = true;
                if (rst.timed_out || rst.cancelled) {
                    kill_process_group(pid, SIGTERM);
                    terminated_at = now;
                }
            } else if (!killed && now - terminated_at.value() >= kill_grace) {
                kill_process_group(pid, SIGKILL);
                killed = true;
            }
        }
        pid = 0;
        // drain what the child left in the pipes; a daemonized grandchild may
        // still hold the write ends, so never wait for EOF here
        for (int i = 0; i < 2; i++) {
            if (fds[i] >= 0) read_available(fds[i], *bufs[i], output_cap, capped[i]);
        }
    }, [&]() {
        for (auto fd:fds) if (fd >= 0) close(fd);
        if (pid > 0) {
            // only reached when supervision itself failed
            kill_process_group(pid, SIGKILL);
            waitpid(pid, NULL, 0);
        }
    });
    rst.truncated = capped[0] || capped[1];

    if (WIFEXITED(wstatus)) {
        rst.exit_code = WEXITSTATUS(wstatus);
    } else if (WIFSIGNALED(wstatus)) {
        rst.signal = WTERMSIG(wstatus);
        rst.exit_code = 128 + WTERMSIG(wstatus);
    }
    return rst;
}
