#include <memory>

#include <iniparser4/iniparser.h>

#include "config.h"
#include "error.h"

static std::chrono::milliseconds get_seconds(dictionary* ini, const char* key, std::chrono::milliseconds def)
{
    auto seconds = iniparser_getdouble(ini, key, def.count() / 1000.0);
    if (seconds < 0) throw KvmError(ErrorKind::InvalidSpec, std::string("Negative duration for ") + key);
    //else
    return std::chrono::milliseconds((int64_t)(seconds * 1000));
}

Config load_config(const std::optional<std::filesystem::path>& path/* = std::nullopt*/)
{
    auto ini_path = path.value_or(default_config_path);
    if (path && !std::filesystem::exists(ini_path)) {
        throw KvmError(ErrorKind::NotFound, "Config file " + ini_path.string() + " does not exist");
    }
    std::shared_ptr<dictionary> ini(std::filesystem::exists(ini_path)? iniparser_load(ini_path.c_str()) : dictionary_new(0), iniparser_freedict);
    if (!ini) throw KvmError(ErrorKind::IOError, "Config file " + ini_path.string() + " couldn't be parsed");

    Config config;
    config.qemu_img = iniparser_getstring(ini.get(), ":qemu_img", config.qemu_img.c_str());
    config.qemu_kvm = iniparser_getstring(ini.get(), ":qemu_kvm", config.qemu_kvm.c_str());
    config.kill = iniparser_getstring(ini.get(), ":kill", config.kill.c_str());
    config.state_dir = iniparser_getstring(ini.get(), ":state_dir", config.state_dir.c_str());
    config.command_timeout = get_seconds(ini.get(), ":command_timeout", config.command_timeout);
    config.boot_timeout = get_seconds(ini.get(), ":boot_timeout", config.boot_timeout);
    config.stop_grace = get_seconds(ini.get(), ":stop_grace", config.stop_grace);
    config.kill_grace = get_seconds(ini.get(), ":kill_grace", config.kill_grace);
    config.lock_wait = get_seconds(ini.get(), ":lock_wait", config.lock_wait);

    auto output_cap = iniparser_getlongint(ini.get(), ":output_cap", (long int)config.output_cap);
    if (output_cap <= 0) throw KvmError(ErrorKind::InvalidSpec, "output_cap must be positive");
    config.output_cap = (size_t)output_cap;

    config.default_display = iniparser_getstring(ini.get(), ":default_display", config.default_display.c_str());
    config.default_cdrom = iniparser_getstring(ini.get(), ":default_cdrom", config.default_cdrom.c_str());
    config.syslog = (bool)iniparser_getboolean(ini.get(), ":syslog", 0);

    if (config.qemu_img.empty() || config.qemu_kvm.empty() || config.kill.empty()) {
        throw KvmError(ErrorKind::InvalidSpec, "Binary paths must not be empty");
    }
    if (config.state_dir.empty()) throw KvmError(ErrorKind::InvalidSpec, "state_dir must not be empty");

    return config;
}
