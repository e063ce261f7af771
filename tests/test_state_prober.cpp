/*
On-disk and process state probing.
*/
#include <unistd.h>

#include "state_prober.h"
#include "test_util.h"

using namespace std::chrono_literals;

static int test_image_probe()
{
    auto dir = make_temp_dir();
    StateProber prober{StateDir(dir / "state")};

    auto rst = prober.probe_image(dir / "missing.qcow2");
    EXPECT(rst.state == ProbedState::absent, "missing file is absent");
    EXPECT(!prober.probe_image(dir / "missing" / "deeper.qcow2").present(), "missing parent is absent");

    write_text(dir / "empty.img", "");
    EXPECT(!prober.probe_image(dir / "empty.img").present(), "empty file is absent");

    std::filesystem::create_directories(dir / "subdir");
    EXPECT(!prober.probe_image(dir / "subdir").present(), "directory is not an image");

    write_text(dir / "a.qcow2", std::string("QFI\xfb") + std::string(508, '\0'));
    rst = prober.probe_image(dir / "a.qcow2");
    EXPECT(rst.state == ProbedState::present_stopped, "qcow2 present");
    EXPECT(rst.format == ImageFormat::qcow2, "qcow2 magic detected");
    EXPECT(rst.size == 512, "size");
    EXPECT(!rst.pid.has_value(), "no pid");

    write_text(dir / "b.img", "plain bytes");
    EXPECT(prober.probe_image(dir / "b.img").format == ImageFormat::raw, "raw fallback");
    std::filesystem::remove_all(dir);
    return 0;
}

static int test_process_checks()
{
    EXPECT(is_process_alive(getpid()), "self alive");
    EXPECT(!is_process_alive(0), "pid 0");
    EXPECT(!is_process_alive(-1), "negative pid");
    EXPECT(process_has_argument(getpid(), "--no-such-argument") == false, "absent argument");

    auto pid = fork([]() {
        execlp("sleep", "sleep", "30", (char*)NULL);
    });
    std::this_thread::sleep_for(200ms);
    EXPECT(is_process_alive(pid), "child alive");
    EXPECT(process_has_argument(pid, "30"), "child argument visible");
    kill(pid, SIGKILL);
    std::this_thread::sleep_for(200ms);
    // not yet reaped
    EXPECT(!is_process_alive(pid), "zombie counts as dead");
    waitpid(pid, NULL, 0);
    EXPECT(!is_process_alive(pid), "reaped process is dead");
    return 0;
}

static int test_instance_probe()
{
    auto dir = make_temp_dir();
    StateDir state_dir(dir / "state");
    StateProber prober(state_dir);
    auto disk = dir / "vm.qcow2";
    write_text(disk, "QFI\xfb....");

    EXPECT(prober.probe_instance(disk).state == ProbedState::present_stopped, "no record");

    auto pid = fork([&disk]() {
        execlp("sh", "sh", "-c", "while :; do sleep 1; done", "fake-qemu", "-hda", disk.c_str(), (char*)NULL);
    });
    std::this_thread::sleep_for(200ms);

    InstanceRecord record;
    record.pid = pid;
    record.disk = disk;
    state_dir.save_record(disk, record);
    auto rst = prober.probe_instance(disk);
    EXPECT(rst.state == ProbedState::present_running, "recorded live process");
    EXPECT(rst.pid == pid, "pid reported");
    EXPECT(prober.probe(disk, ResourceKind::instance).running(), "probe by kind");
    EXPECT(!prober.probe(disk, ResourceKind::image).running(), "images never run");

    // a live pid that is not our hypervisor (pid reuse) is not running
    record.pid = getpid();
    state_dir.save_record(disk, record);
    EXPECT(prober.probe_instance(disk).state == ProbedState::present_stopped, "foreign pid ignored");

    kill(pid, SIGKILL);
    waitpid(pid, NULL, 0);
    record.pid = pid;
    state_dir.save_record(disk, record);
    EXPECT(prober.probe_instance(disk).state == ProbedState::present_stopped, "dead pid ignored");
    std::filesystem::remove_all(dir);
    return 0;
}

int main(void)
{
    if (test_image_probe() != 0) return 1;
    if (test_process_checks() != 0) return 1;
    if (test_instance_probe() != 0) return 1;
    return 0;
}
