#include <fstream>

#include "state_prober.h"
#include "common.h"
#include "error.h"

const char* to_string(ProbedState state)
{
    switch (state) {
    case ProbedState::absent: return "absent";
    case ProbedState::present_stopped: return "present-stopped";
    case ProbedState::present_running: return "present-running";
    }
    return "absent";
}

bool is_process_alive(pid_t pid)
{
    if (pid <= 0) return false;
    auto stat = read_file(std::filesystem::path("/proc") / std::to_string(pid) / "stat");
    if (!stat) return false;
    // pid (comm) S ...   comm may itself contain ')'
    auto pos = stat->rfind(')');
    if (pos == std::string::npos || pos + 2 >= stat->length()) return false;
    auto state = (*stat)[pos + 2];
    return state != 'Z' && state != 'X';
}

bool process_has_argument(pid_t pid, const std::string& arg)
{
    auto cmdline = read_file(std::filesystem::path("/proc") / std::to_string(pid) / "cmdline");
    if (!cmdline) return false;
    //else
    size_t start = 0;
    while (start < cmdline->length()) {
        auto end = cmdline->find('\0', start);
        if (end == std::string::npos) end = cmdline->length();
        if (cmdline->compare(start, end - start, arg) == 0) return true;
        start = end + 1;
    }
    return false;
}

std::optional<ImageFormat> detect_image_format(const std::filesystem::path& path)
{
    std::ifstream f(path, std::ios::in | std::ios::binary);
    if (!f) return std::nullopt;
    char magic[4];
    if (f.read(magic, sizeof(magic)) && magic[0] == 'Q' && magic[1] == 'F' && magic[2] == 'I' && (unsigned char)magic[3] == 0xfb) {
        return ImageFormat::qcow2;
    }
    return ImageFormat::raw;
}

ProbeResult StateProber::probe_image(const std::filesystem::path& path) const
{
    ProbeResult rst;
    std::error_code ec;
    auto status = std::filesystem::status(path, ec);
    if (ec) {
        if (ec == std::errc::no_such_file_or_directory || ec == std::errc::not_a_directory) return rst;
        //else
        throw KvmError(ErrorKind::IOError, "stat(" + path.string() + ") failed: " + ec.message());
    }
    if (!std::filesystem::is_regular_file(status)) return rst;
    //else
    auto size = std::filesystem::file_size(path, ec);
    if (ec) throw KvmError(ErrorKind::IOError, "file_size(" + path.string() + ") failed: " + ec.message());
    if (size == 0) return rst;

    rst.state = ProbedState::present_stopped;
    rst.size = size;
    rst.format = detect_image_format(path);
    return rst;
}

bool StateProber::is_instance_process(pid_t pid, const std::filesystem::path& disk) const
{
    return is_process_alive(pid) && process_has_argument(pid, disk.string());
}

ProbeResult StateProber::probe_instance(const std::filesystem::path& disk) const
{
    auto rst = probe_image(disk);
    auto record = state_dir.load_record(disk);
    if (record && record->disk == disk && is_instance_process(record->pid, disk)) {
        rst.state = ProbedState::present_running;
        rst.pid = record->pid;
    }
    return rst;
}

ProbeResult StateProber::probe(const std::filesystem::path& id, ResourceKind kind) const
{
    return kind == ResourceKind::instance? probe_instance(id) : probe_image(id);
}
