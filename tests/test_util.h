#pragma once

#include <stdio.h>
#include <stdlib.h>
#include <signal.h>
#include <sys/stat.h>
#include <sys/wait.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include <thread>

#include "config.h"
#include "common.h"

#define EXPECT(cond, msg) do { \
    if (!(cond)) { \
        fprintf(stderr, "FAIL: %s (%s:%d)\n", msg, __FILE__, __LINE__); \
        return 1; \
    } \
} while (0)

static std::filesystem::path make_temp_dir()
{
    auto tmpdir = getenv("TMPDIR");
    std::string tmpl = std::string(tmpdir? tmpdir : "/tmp") + "/kvmctl-test.XXXXXX";
    if (!mkdtemp(tmpl.data())) throw std::runtime_error("mkdtemp() failed");
    return tmpl;
}

static void write_script(const std::filesystem::path& path, const std::string& content)
{
    {
        std::ofstream f(path);
        if (!f) throw std::runtime_error("Failed to write " + path.string());
        f << content;
    }
    chmod(path.c_str(), 0755);
}

static void write_text(const std::filesystem::path& path, const std::string& content)
{
    std::ofstream f(path);
    if (!f) throw std::runtime_error("Failed to write " + path.string());
    f << content;
}

// qemu-img stand-in. FAKE_QEMU_IMG_MODE=fail leaves a partial file and exits 1,
// FAKE_QEMU_IMG_MODE=hang leaves a partial file and sleeps.
static const char* fake_qemu_img =
    "#!/bin/sh\n"
    "dir=$(dirname \"$0\")\n"
    "echo \"$*\" >> \"$dir/qemu-img.log\"\n"
    "cmd=\"$1\"; shift\n"
    "case \"$cmd\" in\n"
    "info)\n"
    "  for a; do t=\"$a\"; done\n"
    "  echo \"image: $t\"\n"
    "  echo \"file format: fake\"\n"
    "  exit 0;;\n"
    "create)\n"
    "  fmt=raw; target=\n"
    "  while [ $# -gt 0 ]; do\n"
    "    case \"$1\" in\n"
    "      -f) fmt=\"$2\"; shift;;\n"
    "      -o) shift;;\n"
    "      *) [ -z \"$target\" ] && target=\"$1\";;\n"
    "    esac\n"
    "    shift\n"
    "  done\n"
    "  case \"$FAKE_QEMU_IMG_MODE\" in\n"
    "    fail) echo partial > \"$target\"; echo \"qemu-img: simulated failure\" >&2; exit 1;;\n"
    "    hang) echo partial > \"$target\"; sleep 30; exit 0;;\n"
    "  esac\n"
    "  if [ \"$fmt\" = qcow2 ]; then printf 'QFI\\373' > \"$target\"; else printf 'RAW!' > \"$target\"; fi\n"
    "  printf '%01024d' 0 >> \"$target\"\n"
    "  echo \"Formatting '$target', fmt=$fmt\"\n"
    "  exit 0;;\n"
    "esac\n"
    "exit 1\n";

// qemu-kvm stand-in: leaves a background process carrying "-hda <disk>" in its
// argv and records its pid like -pidfile does. FAKE_QEMU_KVM_MODE=fail exits 1,
// FAKE_QEMU_KVM_MODE=die records a pid that is already gone.
static const char* fake_qemu_kvm =
    "#!/bin/sh\n"
    "dir=$(dirname \"$0\")\n"
    "echo \"$*\" >> \"$dir/qemu-kvm.log\"\n"
    "disk=; pidfile=\n"
    "while [ $# -gt 0 ]; do\n"
    "  case \"$1\" in\n"
    "    -hda) disk=\"$2\"; shift;;\n"
    "    -pidfile) pidfile=\"$2\"; shift;;\n"
    "  esac\n"
    "  shift\n"
    "done\n"
    "case \"$FAKE_QEMU_KVM_MODE\" in\n"
    "  fail) echo \"qemu-kvm: simulated failure\" >&2; exit 1;;\n"
    "  die) sh -c 'exit 0' & wait $!; echo $! > \"$pidfile\"; exit 0;;\n"
    "esac\n"
    "sh -c 'while :; do sleep 1; done' fake-qemu -hda \"$disk\" </dev/null >/dev/null 2>&1 &\n"
    "echo $! > \"$pidfile\"\n"
    "exit 0\n";

static const char* fake_kill =
    "#!/bin/sh\n"
    "kill \"$@\"\n";

// Config pointing at fake binaries under dir with short timeouts
static Config make_fake_config(const std::filesystem::path& dir)
{
    write_script(dir / "qemu-img", fake_qemu_img);
    write_script(dir / "qemu-kvm", fake_qemu_kvm);
    write_script(dir / "kill", fake_kill);

    Config config;
    config.qemu_img = (dir / "qemu-img").string();
    config.qemu_kvm = (dir / "qemu-kvm").string();
    config.kill = (dir / "kill").string();
    config.state_dir = dir / "state";
    config.command_timeout = std::chrono::seconds(10);
    config.boot_timeout = std::chrono::seconds(10);
    config.stop_grace = std::chrono::seconds(5);
    config.kill_grace = std::chrono::seconds(2);
    config.lock_wait = std::chrono::milliseconds(0);
    config.default_cdrom = "";
    return config;
}

static int count_lines(const std::filesystem::path& path)
{
    auto content = read_file(path);
    if (!content) return 0;
    int lines = 0;
    for (auto c:content.value()) if (c == '\n') lines++;
    return lines;
}

static void kill_quietly(pid_t pid)
{
    if (pid > 0) kill(pid, SIGKILL);
}
