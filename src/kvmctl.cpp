#include <string.h>
#include <signal.h>
#include <time.h>

#include <iostream>
#include <map>

#include <libsmartcols/libsmartcols.h>
#include <argparse/argparse.hpp>

#include "common.h"
#include "config.h"
#include "hypervisor_driver.h"
#include "process_runner.h"
#include "reconciler.h"

static CancelToken cancel_token;

static void on_terminate_signal(int)
{
    cancel_token.cancel();
}

static void install_signal_handlers()
{
    struct sigaction sa;
    memset(&sa, 0, sizeof(sa));
    sa.sa_handler = on_terminate_signal;
    sigemptyset(&sa.sa_mask);
    sigaction(SIGINT, &sa, NULL);
    sigaction(SIGTERM, &sa, NULL);
}

static void add_common_arguments(argparse::ArgumentParser& program)
{
    program.add_argument("--config").help("Configuration file (default: " + default_config_path.string() + ")");
    program.add_argument("--debug", "-d").help("Show debug messages").default_value(false).implicit_value(true);
    program.add_argument("--check", "-n").help("Report what would change without changing anything").default_value(false).implicit_value(true);
    program.add_argument("--deadline").help("Give up the operation after this many seconds").scan<'g', double>();
}

static void add_image_arguments(argparse::ArgumentParser& program)
{
    program.add_argument("--format", "-f").help("Image format (qcow2, raw, ami, aki, ari)").default_value(std::string("qcow2"));
    program.add_argument("--size", "-s").help("Virtual size (e.g. 10G)");
    program.add_argument("--backing", "-b").help("Backing image");
    program.add_argument("--backing-format", "-F").help("Format of the backing image (detected when omitted)");
}

static void add_boot_arguments(argparse::ArgumentParser& program)
{
    program.add_argument("--cpu").help("CPU model");
    program.add_argument("--vcpus").help("Number of vCPUs").scan<'i', int>();
    program.add_argument("--memory", "-m").help("RAM in MiB").scan<'i', int>();
    program.add_argument("--vnc").help("VNC display address (e.g. :0)");
    program.add_argument("--display").help("Local display (default from configuration)");
    program.add_argument("--cdrom").help("CD-ROM image (default from configuration)");
}

static bool parse_args(argparse::ArgumentParser& program, const std::vector<std::string>& args)
{
    try {
        program.parse_args(args);
    }
    catch (const std::runtime_error& err) {
        std::cerr << err.what() << std::endl;
        std::cerr << program;
        return false;
    }
    return true;
}

static ImageFormat image_format_of(const std::string& name)
{
    auto format = parse_image_format(name);
    if (!format) throw KvmError(ErrorKind::InvalidSpec, "Invalid image format '" + name + "'");
    return format.value();
}

static ImageSpec image_spec_from(const argparse::ArgumentParser& program, const std::string& path)
{
    ImageSpec spec;
    spec.path = path;
    spec.format = image_format_of(program.get<std::string>("--format"));
    spec.size = program.present<std::string>("--size");
    auto backing = program.present<std::string>("--backing");
    if (backing) {
        BackingImage backing_image;
        backing_image.path = backing.value();
        auto backing_format = program.present<std::string>("--backing-format");
        if (backing_format) backing_image.format = image_format_of(backing_format.value());
        spec.backing = backing_image;
    }
    return spec;
}

static BootParams boot_params_from(const argparse::ArgumentParser& program)
{
    BootParams params;
    params.cpu_model = program.present<std::string>("--cpu");
    params.vcpus = program.present<int>("--vcpus");
    params.ram_mib = program.present<int>("--memory");
    params.vnc = program.present<std::string>("--vnc");
    params.display = program.present<std::string>("--display");
    auto cdrom = program.present<std::string>("--cdrom");
    if (cdrom) params.cdrom = cdrom.value();
    return params;
}

static std::optional<std::filesystem::path> config_path_of(const argparse::ArgumentParser& program)
{
    auto path = program.present<std::string>("--config");
    if (!path) return std::nullopt;
    return std::filesystem::path(path.value());
}

// Runs one reconciliation and prints its JSON result. The exit status follows the error kind.
static int with_reconciler(const argparse::ArgumentParser& program, std::function<Result(Reconciler&)> func)
{
    debug = program.get<bool>("--debug");
    auto result = [&program,&func]() -> Result {
        try {
            auto config = load_config(config_path_of(program));
            QemuDriver driver(config);
            ProcessRunner runner(config.output_cap, config.kill_grace, config.syslog);
            Reconciler reconciler(config, driver, runner, program.get<bool>("--check"));
            auto deadline = program.present<double>("--deadline");
            if (deadline) {
                cancel_token.set_deadline(std::chrono::steady_clock::now()
                    + std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::duration<double>(deadline.value())));
            }
            reconciler.set_cancel_token(&cancel_token);
            install_signal_handlers();
            return func(reconciler);
        }
        catch (const KvmError& e) {
            return fold({}, {failure_outcome({}, e.kind(), e.what())});
        }
    }();
    std::cout << to_json(result) << std::endl;
    return exit_status_of(result);
}

static int image_create(const std::vector<std::string>& args)
{
    argparse::ArgumentParser program(args[0]);
    add_common_arguments(program);
    add_image_arguments(program);
    program.add_argument("path").help("Image path");
    if (!parse_args(program, args)) return exit_status_of(ErrorKind::InvalidSpec);

    return with_reconciler(program, [&program](Reconciler& reconciler) {
        return reconciler.create_image(image_spec_from(program, program.get<std::string>("path")));
    });
}

static int image_show(const std::vector<std::string>& args)
{
    argparse::ArgumentParser program(args[0]);
    add_common_arguments(program);
    program.add_argument("path").help("Image path");
    if (!parse_args(program, args)) return exit_status_of(ErrorKind::InvalidSpec);

    return with_reconciler(program, [&program](Reconciler& reconciler) {
        return reconciler.inspect_image(program.get<std::string>("path"));
    });
}

static int instance_create(const std::vector<std::string>& args)
{
    argparse::ArgumentParser program(args[0]);
    add_common_arguments(program);
    add_image_arguments(program);
    program.add_argument("disk").help("Instance disk path");
    if (!parse_args(program, args)) return exit_status_of(ErrorKind::InvalidSpec);

    return with_reconciler(program, [&program](Reconciler& reconciler) {
        InstanceSpec spec;
        spec.disk = image_spec_from(program, program.get<std::string>("disk"));
        return reconciler.create_instance(spec);
    });
}

static int boot(const std::vector<std::string>& args)
{
    argparse::ArgumentParser program(args[0]);
    add_common_arguments(program);
    add_boot_arguments(program);
    program.add_argument("disk").help("Instance disk path");
    if (!parse_args(program, args)) return exit_status_of(ErrorKind::InvalidSpec);

    return with_reconciler(program, [&program](Reconciler& reconciler) {
        return reconciler.boot_instance(program.get<std::string>("disk"), boot_params_from(program));
    });
}

static int stop(const std::vector<std::string>& args)
{
    argparse::ArgumentParser program(args[0]);
    add_common_arguments(program);
    program.add_argument("disk").help("Instance disk path");
    if (!parse_args(program, args)) return exit_status_of(ErrorKind::InvalidSpec);

    return with_reconciler(program, [&program](Reconciler& reconciler) {
        return reconciler.stop_instance(program.get<std::string>("disk"));
    });
}

static int _delete(const std::vector<std::string>& args)
{
    argparse::ArgumentParser program(args[0]);
    add_common_arguments(program);
    program.add_argument("path").help("Image or instance disk path (a running instance is stopped first)");
    if (!parse_args(program, args)) return exit_status_of(ErrorKind::InvalidSpec);

    return with_reconciler(program, [&program](Reconciler& reconciler) {
        return reconciler.delete_resource(program.get<std::string>("path"));
    });
}

static int apply(const std::vector<std::string>& args)
{
    argparse::ArgumentParser program(args[0]);
    add_common_arguments(program);
    add_image_arguments(program);
    add_boot_arguments(program);
    program.add_argument("--state").help("'present' or 'absent'").default_value(std::string("present"));
    program.add_argument("--kind").help("'image' or 'instance'").default_value(std::string("instance"));
    program.add_argument("--running", "-r").help("Boot the instance once its disk exists").default_value(false).implicit_value(true);
    program.add_argument("--keep-disk").help("With --state absent, only stop the instance").default_value(false).implicit_value(true);
    program.add_argument("path").help("Image or instance disk path");
    if (!parse_args(program, args)) return exit_status_of(ErrorKind::InvalidSpec);

    return with_reconciler(program, [&program](Reconciler& reconciler) {
        DesiredState desired;
        auto state = program.get<std::string>("--state");
        if (state == "present") desired.ensure = Ensure::present;
        else if (state == "absent") desired.ensure = Ensure::absent;
        else throw KvmError(ErrorKind::InvalidSpec, "Invalid state '" + state + "'");

        auto kind = program.get<std::string>("--kind");
        auto image = image_spec_from(program, program.get<std::string>("path"));
        if (kind == "image") {
            desired.kind = ResourceKind::image;
            desired.spec = image;
        } else if (kind == "instance") {
            desired.kind = ResourceKind::instance;
            desired.spec = InstanceSpec { image, boot_params_from(program) };
        } else {
            throw KvmError(ErrorKind::InvalidSpec, "Invalid kind '" + kind + "'");
        }
        desired.running = program.get<bool>("--running");
        desired.purge = !program.get<bool>("--keep-disk");
        return reconciler.apply(desired);
    });
}

static std::string format_time(int64_t t)
{
    if (t <= 0) return "-";
    time_t _t = (time_t)t;
    struct tm tm;
    if (!localtime_r(&_t, &tm)) return "-";
    char buf[32];
    strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
    return buf;
}

static int list(const std::vector<std::string>& args)
{
    argparse::ArgumentParser program(args[0]);
    program.add_argument("--config").help("Configuration file (default: " + default_config_path.string() + ")");
    program.add_argument("--debug", "-d").help("Show debug messages").default_value(false).implicit_value(true);
    if (!parse_args(program, args)) return exit_status_of(ErrorKind::InvalidSpec);
    debug = program.get<bool>("--debug");

    std::vector<InstanceStatus> instances;
    try {
        auto config = load_config(config_path_of(program));
        QemuDriver driver(config);
        ProcessRunner runner(config.output_cap, config.kill_grace, config.syslog);
        Reconciler reconciler(config, driver, runner);
        instances = reconciler.list();
    }
    catch (const KvmError& e) {
        std::cerr << e.what() << std::endl;
        return exit_status_of(e.kind());
    }

    std::shared_ptr<libscols_table> table(scols_new_table(), scols_unref_table);
    if (!table) throw std::runtime_error("scols_new_table() failed");
    scols_table_new_column(table.get(), "RUNNING", 0.1, SCOLS_FL_RIGHT);
    scols_table_new_column(table.get(), "DISK", 0.1, 0);
    scols_table_new_column(table.get(), "PID", 0.1, SCOLS_FL_RIGHT);
    scols_table_new_column(table.get(), "BOOTED", 0.1, 0);
    scols_table_new_column(table.get(), "SIZE", 0.1, SCOLS_FL_RIGHT);
    auto sep = scols_table_new_line(table.get(), NULL);
    scols_line_set_data(sep, 0, "-------");
    scols_line_set_data(sep, 1, "----");
    scols_line_set_data(sep, 2, "---");
    scols_line_set_data(sep, 3, "------");
    scols_line_set_data(sep, 4, "----");

    for (const auto& i:instances) {
        auto line = scols_table_new_line(table.get(), NULL);
        if (!line) throw std::runtime_error("scols_table_new_line() failed");
        scols_line_set_data(line, 0, i.probe.running()? "*" : "");
        scols_line_set_data(line, 1, i.record.disk.c_str());
        scols_line_set_data(line, 2, i.probe.pid.has_value()? std::to_string(i.probe.pid.value()).c_str() : "-");
        scols_line_set_data(line, 3, i.probe.running()? format_time(i.record.booted_at).c_str() : "-");
        scols_line_set_data(line, 4, i.probe.present()? human_readable(i.probe.size).c_str() : "-");
    }
    scols_print_table(table.get());

    return 0;
}

static const std::map<std::string,std::pair<int (*)(const std::vector<std::string>&),std::string> > subcommands {
  {"image-create", {image_create, "Create disk image"}},
  {"image-show", {image_show, "Show disk image information using 'qemu-img info'"}},
  {"instance-create", {instance_create, "Create instance disk"}},
  {"boot", {boot, "Boot instance"}},
  {"stop", {stop, "Stop instance"}},
  {"delete", {_delete, "Delete image or instance"}},
  {"apply", {apply, "Bring image or instance to the desired state"}},
  {"list", {list, "List instances"}}
};

static void show_subcommands()
{
    for (auto i = subcommands.cbegin(); i != subcommands.cend(); i++) {
        std::cout << i->first << '\t' << i->second.second << std::endl;
    }
}

static int _main(int argc, char* argv[])
{
    if (argc < 2) {
        std::cout << "Subcommand not specified. Valid subcommands are:" << std::endl;
        show_subcommands();
        return 1;
    }

    std::string subcommand(argv[1]);

    if (!subcommands.contains(subcommand)) {
        std::cout << "Invalid subcommand '" << subcommand << "'. Valid subcommands are:" << std::endl;
        show_subcommands();
        return 1;
    }

    std::vector<std::string> args;

    args.push_back(std::string(argv[0]) + ' ' + subcommand);
    for (int i = 2; i < argc; i++) {
        args.push_back(argv[i]);
    }

    try {
        return subcommands.at(subcommand).first(args);
    }
    catch (const std::runtime_error& e) {
        std::cerr << e.what() << std::endl;
        return exit_status_of(ErrorKind::IOError);
    }
}

#ifdef __MAIN_MODULE__
int main(int argc, char* argv[]) { return _main(argc, argv); }
#endif
