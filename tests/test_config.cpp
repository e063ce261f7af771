/*
Configuration loading.
*/
#include "config.h"
#include "error.h"
#include "test_util.h"

using namespace std::chrono_literals;

static int test_values()
{
    auto dir = make_temp_dir();
    auto ini = dir / "kvmctl.ini";
    write_text(ini,
        "qemu_img = /opt/qemu/bin/qemu-img\n"
        "qemu_kvm = /opt/qemu/bin/qemu-system-x86_64\n"
        "state_dir = /var/run/kvm\n"
        "command_timeout = 120\n"
        "boot_timeout = 1.5\n"
        "lock_wait = 3\n"
        "output_cap = 4096\n"
        "default_cdrom =\n"
        "syslog = yes\n");
    auto config = load_config(ini);
    EXPECT(config.qemu_img == "/opt/qemu/bin/qemu-img", "qemu_img");
    EXPECT(config.qemu_kvm == "/opt/qemu/bin/qemu-system-x86_64", "qemu_kvm");
    EXPECT(config.kill == "kill", "kill default");
    EXPECT(config.state_dir == "/var/run/kvm", "state_dir");
    EXPECT(config.command_timeout == 120s, "command_timeout");
    EXPECT(config.boot_timeout == 1500ms, "fractional seconds");
    EXPECT(config.stop_grace == 30s, "stop_grace default");
    EXPECT(config.kill_grace == 5s, "kill_grace default");
    EXPECT(config.lock_wait == 3s, "lock_wait");
    EXPECT(config.output_cap == 4096, "output_cap");
    EXPECT(config.default_display == "sdl", "default_display default");
    EXPECT(config.default_cdrom.empty(), "cdrom disabled");
    EXPECT(config.syslog, "syslog");
    std::filesystem::remove_all(dir);
    return 0;
}

static int test_errors()
{
    auto dir = make_temp_dir();
    bool not_found = false;
    try {
        load_config(dir / "missing.ini");
    }
    catch (const KvmError& e) {
        not_found = e.kind() == ErrorKind::NotFound;
    }
    EXPECT(not_found, "explicit missing file");

    write_text(dir / "bad.ini", "stop_grace = -1\n");
    bool invalid = false;
    try {
        load_config(dir / "bad.ini");
    }
    catch (const KvmError& e) {
        invalid = e.kind() == ErrorKind::InvalidSpec;
    }
    EXPECT(invalid, "negative duration");

    write_text(dir / "bad2.ini", "output_cap = 0\n");
    invalid = false;
    try {
        load_config(dir / "bad2.ini");
    }
    catch (const KvmError& e) {
        invalid = e.kind() == ErrorKind::InvalidSpec;
    }
    EXPECT(invalid, "zero output cap");
    std::filesystem::remove_all(dir);
    return 0;
}

int main(void)
{
    if (test_values() != 0) return 1;
    if (test_errors() != 0) return 1;
    return 0;
}
