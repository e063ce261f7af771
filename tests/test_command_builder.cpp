/*
Argument vector construction for qemu-img, qemu-kvm and kill.
*/
#include <vector>
#include <string>

#include "hypervisor_driver.h"
#include "error.h"
#include "test_util.h"

typedef std::vector<std::string> argv_t;

static bool throws_invalid_spec(std::function<void(void)> func)
{
    try {
        func();
    }
    catch (const KvmError& e) {
        return e.kind() == ErrorKind::InvalidSpec;
    }
    return false;
}

static int test_create_image_plain()
{
    QemuDriver driver{Config()};
    ImageSpec spec;
    spec.path = "/var/lib/vm/disk.qcow2";
    spec.size = "10G";
    auto cmdline = driver.create_image(spec, "/var/lib/vm/.disk.qcow2.tmp.1");
    argv_t expected = {"qemu-img", "create", "-f", "qcow2", "/var/lib/vm/.disk.qcow2.tmp.1", "10G"};
    EXPECT(cmdline == expected, "plain qcow2 create");

    spec.format = ImageFormat::raw;
    spec.size = "512M";
    cmdline = driver.create_image(spec, spec.path);
    expected = {"qemu-img", "create", "-f", "raw", "/var/lib/vm/disk.qcow2", "512M"};
    EXPECT(cmdline == expected, "raw create");
    return 0;
}

static int test_create_image_with_backing()
{
    QemuDriver driver{Config()};
    ImageSpec spec;
    spec.path = "/vm/child.qcow2";
    spec.backing = BackingImage { "/vm/base,v1.qcow2", ImageFormat::qcow2 };
    auto cmdline = driver.create_image(spec, spec.path);
    argv_t expected = {"qemu-img", "create", "-f", "qcow2", "-o", "backing_file=/vm/base,,v1.qcow2,backing_fmt=qcow2", "/vm/child.qcow2"};
    EXPECT(cmdline == expected, "backing image with comma in path");

    spec.backing->format = ImageFormat::ami;
    spec.size = "20G";
    cmdline = driver.create_image(spec, spec.path);
    expected = {"qemu-img", "create", "-f", "qcow2", "-o", "backing_file=/vm/base,,v1.qcow2,backing_fmt=raw", "/vm/child.qcow2", "20G"};
    EXPECT(cmdline == expected, "ami backing is raw to qemu");

    spec.backing->format = std::nullopt;
    cmdline = driver.create_image(spec, spec.path);
    EXPECT(cmdline[5] == "backing_file=/vm/base,,v1.qcow2", "unknown backing format omitted");
    return 0;
}

static int test_create_image_rejects_invalid()
{
    QemuDriver driver{Config()};
    EXPECT(throws_invalid_spec([&driver]() {
        ImageSpec spec;
        spec.path = "/vm/a.qcow2";
        driver.create_image(spec, spec.path);
    }), "size required without backing");
    EXPECT(throws_invalid_spec([&driver]() {
        ImageSpec spec;
        spec.path = "/vm/a.qcow2";
        spec.size = "10 G";
        driver.create_image(spec, spec.path);
    }), "malformed size");
    EXPECT(throws_invalid_spec([&driver]() {
        ImageSpec spec;
        spec.path = "/vm/a.img";
        spec.format = ImageFormat::raw;
        spec.backing = BackingImage { "/vm/base.qcow2", ImageFormat::qcow2 };
        driver.create_image(spec, spec.path);
    }), "raw cannot carry a backing file");
    EXPECT(throws_invalid_spec([&driver]() {
        ImageSpec spec;
        spec.path = "/vm/a.qcow2";
        spec.backing = BackingImage { "/vm/vmlinuz", ImageFormat::aki };
        driver.create_image(spec, spec.path);
    }), "kernel image as backing");
    EXPECT(throws_invalid_spec([&driver]() {
        ImageSpec spec;
        spec.path = "/vm/a.qcow2";
        spec.backing = BackingImage { "/vm/a.qcow2", std::nullopt };
        driver.create_image(spec, spec.path);
    }), "self backing");
    EXPECT(throws_invalid_spec([&driver]() {
        ImageSpec spec;
        spec.size = "1G";
        driver.create_image(spec, "/vm/x");
    }), "empty path");
    return 0;
}

static int test_boot_instance()
{
    Config config;
    config.qemu_kvm = "/usr/bin/qemu-kvm";
    QemuDriver driver(config);

    auto cmdline = driver.boot_instance("/vm/a.qcow2", BootParams(), "/run/kvmctl/a.qemu.pid");
    argv_t expected = {"/usr/bin/qemu-kvm", "-daemonize", "-hda", "/vm/a.qcow2",
        "-display", "sdl", "-cdrom", "cloud-init/default/default-cidata.iso", "-pidfile", "/run/kvmctl/a.qemu.pid"};
    EXPECT(cmdline == expected, "defaults");

    BootParams params;
    params.cpu_model = "host";
    params.vcpus = 4;
    params.ram_mib = 2048;
    params.vnc = ":1";
    params.display = "none";
    params.cdrom = "/iso/seed.iso";
    cmdline = driver.boot_instance("/vm/a.qcow2", params, "/run/a.pid");
    expected = {"/usr/bin/qemu-kvm", "-daemonize", "-hda", "/vm/a.qcow2", "-cpu", "host", "-smp", "cpus=4",
        "-m", "2048", "-vnc", ":1", "-display", "none", "-cdrom", "/iso/seed.iso", "-pidfile", "/run/a.pid"};
    EXPECT(cmdline == expected, "all parameters");

    config.default_cdrom = "";
    config.default_display = "gtk";
    cmdline = QemuDriver(config).boot_instance("/vm/a.qcow2", BootParams(), "/run/a.pid");
    expected = {"/usr/bin/qemu-kvm", "-daemonize", "-hda", "/vm/a.qcow2", "-display", "gtk", "-pidfile", "/run/a.pid"};
    EXPECT(cmdline == expected, "no default cdrom");

    EXPECT(throws_invalid_spec([&driver]() {
        BootParams params;
        params.vcpus = 0;
        driver.boot_instance("/vm/a.qcow2", params, "/run/a.pid");
    }), "zero vcpus");
    EXPECT(throws_invalid_spec([&driver]() {
        BootParams params;
        params.ram_mib = -1;
        driver.boot_instance("/vm/a.qcow2", params, "/run/a.pid");
    }), "negative ram");
    return 0;
}

static int test_metacharacters_stay_single_arguments()
{
    QemuDriver driver{Config()};
    ImageSpec spec;
    spec.path = "/vm/a; rm -rf $(echo /) `id`.qcow2";
    spec.size = "1G";
    auto cmdline = driver.create_image(spec, spec.path);
    EXPECT(cmdline.size() == 6, "argument count unchanged");
    EXPECT(cmdline[4] == spec.path.string(), "path passed verbatim");
    return 0;
}

static int test_inspect_and_stop()
{
    Config config;
    config.stop_grace = std::chrono::seconds(7);
    config.kill_grace = std::chrono::seconds(3);
    QemuDriver driver(config);

    argv_t expected = {"qemu-img", "info", "/vm/a.qcow2"};
    EXPECT(driver.inspect("/vm/a.qcow2", false) == expected, "inspect");
    expected = {"qemu-img", "info", "-U", "/vm/a.qcow2"};
    EXPECT(driver.inspect("/vm/a.qcow2", true) == expected, "inspect running image");

    auto steps = driver.stop_instance(1234);
    EXPECT(steps.size() == 2, "two stop steps");
    expected = {"kill", "-s", "TERM", "1234"};
    EXPECT(steps[0].cmdline == expected, "graceful step");
    EXPECT(steps[0].grace == std::chrono::seconds(7), "graceful step waits stop_grace");
    expected = {"kill", "-s", "KILL", "1234"};
    EXPECT(steps[1].cmdline == expected, "forced step");
    EXPECT(steps[1].grace == std::chrono::seconds(3), "forced step waits kill_grace");
    EXPECT(throws_invalid_spec([&driver]() { driver.stop_instance(0); }), "pid 0");
    return 0;
}

static int test_create_instance_matches_image()
{
    QemuDriver driver{Config()};
    InstanceSpec spec;
    spec.disk.path = "/vm/i.qcow2";
    spec.disk.size = "8G";
    EXPECT(driver.create_instance(spec, "/vm/t") == driver.create_image(spec.disk, "/vm/t"), "instance disk creation");
    EXPECT(escape_qemu_option_value("a,b,,c") == "a,,b,,,,c", "comma escaping");
    return 0;
}

int main(void)
{
    if (test_create_image_plain() != 0) return 1;
    if (test_create_image_with_backing() != 0) return 1;
    if (test_create_image_rejects_invalid() != 0) return 1;
    if (test_boot_instance() != 0) return 1;
    if (test_metacharacters_stay_single_arguments() != 0) return 1;
    if (test_inspect_and_stop() != 0) return 1;
    if (test_create_instance_matches_image() != 0) return 1;
    return 0;
}
