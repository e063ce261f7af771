#include "hypervisor_driver.h"
#include "error.h"

std::string escape_qemu_option_value(const std::string& value)
{
    std::string escaped;
    for (auto c:value) {
        escaped += c;
        if (c == ',') escaped += ',';
    }
    return escaped;
}

std::vector<std::string> QemuDriver::create_image(const ImageSpec& spec, const std::filesystem::path& target) const
{
    validate(spec);
    if (target.empty()) throw KvmError(ErrorKind::InvalidSpec, "Target path is not set");

    // qemu-img create -f qcow2 -o backing_file=base.qcow2,backing_fmt=qcow2 target.qcow2 [size]
    std::vector<std::string> cmdline = {config.qemu_img, "create", "-f", qemu_format_name(spec.format.value())};
    if (spec.backing) {
        const auto& backing = spec.backing.value();
        std::string options = "backing_file=" + escape_qemu_option_value(backing.path.string());
        if (backing.format) options += std::string(",backing_fmt=") + qemu_format_name(backing.format.value());
        cmdline.push_back("-o");
        cmdline.push_back(options);
    }
    cmdline.push_back(target.string());
    if (spec.size) cmdline.push_back(spec.size.value());
    return cmdline;
}

std::vector<std::string> QemuDriver::create_instance(const InstanceSpec& spec, const std::filesystem::path& target) const
{
    return create_image(spec.disk, target);
}

std::vector<std::string> QemuDriver::boot_instance(const std::filesystem::path& disk, const BootParams& params, const std::filesystem::path& pidfile) const
{
    if (disk.empty()) throw KvmError(ErrorKind::InvalidSpec, "Disk path is not set");
    if (pidfile.empty()) throw KvmError(ErrorKind::InvalidSpec, "Pidfile path is not set");
    validate(params);

    std::vector<std::string> cmdline = {config.qemu_kvm, "-daemonize", "-hda", disk.string()};
    if (params.cpu_model) {
        cmdline.push_back("-cpu");
        cmdline.push_back(params.cpu_model.value());
    }
    if (params.vcpus) {
        cmdline.push_back("-smp");
        cmdline.push_back("cpus=" + std::to_string(params.vcpus.value()));
    }
    if (params.ram_mib) {
        cmdline.push_back("-m");
        cmdline.push_back(std::to_string(params.ram_mib.value()));
    }
    if (params.vnc) {
        cmdline.push_back("-vnc");
        cmdline.push_back(params.vnc.value());
    }
    cmdline.push_back("-display");
    cmdline.push_back(params.display.value_or(config.default_display.empty()? "sdl" : config.default_display));

    auto cdrom = params.cdrom? params.cdrom.value().string() : config.default_cdrom;
    if (!cdrom.empty()) {
        cmdline.push_back("-cdrom");
        cmdline.push_back(cdrom);
    }
    cmdline.push_back("-pidfile");
    cmdline.push_back(pidfile.string());
    return cmdline;
}

std::vector<std::string> QemuDriver::inspect(const std::filesystem::path& target, bool force_share) const
{
    if (target.empty()) throw KvmError(ErrorKind::InvalidSpec, "Image path is not set");
    std::vector<std::string> cmdline = {config.qemu_img, "info"};
    // a running instance holds the image's write lock
    if (force_share) cmdline.push_back("-U");
    cmdline.push_back(target.string());
    return cmdline;
}

std::vector<StopStep> QemuDriver::stop_instance(pid_t pid) const
{
    if (pid <= 0) throw KvmError(ErrorKind::InvalidSpec, "Invalid pid " + std::to_string(pid));
    auto pid_str = std::to_string(pid);
    return {
        {{config.kill, "-s", "TERM", pid_str}, config.stop_grace},
        {{config.kill, "-s", "KILL", pid_str}, config.kill_grace}
    };
}
