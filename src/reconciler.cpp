#include <time.h>

#include <iostream>
#include <thread>

#include "reconciler.h"
#include "common.h"
#include "resource_lock.h"

static OperationOutcome noop_outcome(const std::filesystem::path& id, const std::string& message)
{
    OperationOutcome outcome;
    outcome.resource = id;
    outcome.message = message;
    return outcome;
}

// check mode: report the action without running it
static OperationOutcome planned_outcome(const std::filesystem::path& id, const std::string& message)
{
    OperationOutcome outcome;
    outcome.resource = id;
    outcome.changed = true;
    outcome.message = message;
    return outcome;
}

static OperationOutcome outcome_of(const std::filesystem::path& id, const RunResult& rst, bool mutating, const std::string& what)
{
    OperationOutcome outcome;
    outcome.resource = id;
    outcome.exit_code = rst.exit_code;
    outcome.out = rst.out;
    outcome.err = rst.err;
    outcome.truncated = rst.truncated;
    if (rst.timed_out) {
        outcome.error = ErrorKind::Timeout;
        outcome.message = what + " timed out";
    } else if (rst.cancelled) {
        outcome.error = ErrorKind::Timeout;
        outcome.message = what + " was cancelled";
    } else if (rst.exit_code != 0) {
        outcome.error = ErrorKind::CommandFailed;
        outcome.message = what + " failed with exit code " + std::to_string(rst.exit_code);
    } else {
        outcome.changed = mutating;
        outcome.message = what;
    }
    return outcome;
}

static void remove_temp(const std::filesystem::path& path)
{
    std::error_code ec;
    std::filesystem::remove(path, ec);
    if (ec) std::cerr << "Temporary file " << path.string() << " couldn't be removed: " << ec.message() << std::endl;
}

static DesiredState normalized(const DesiredState& desired)
{
    DesiredState rst = desired;
    if (std::holds_alternative<InstanceSpec>(desired.spec)) {
        rst.spec = normalized(std::get<InstanceSpec>(desired.spec));
    } else {
        rst.spec = normalized(std::get<ImageSpec>(desired.spec));
    }
    return rst;
}

Reconciler::Reconciler(const Config& _config, const HypervisorDriver& _driver, const ProcessRunner& _runner, bool _check_mode/* = false*/)
    : config(_config), driver(_driver), runner(_runner), state_dir(_config.state_dir), prober(state_dir), check_mode(_check_mode)
{
}

Result Reconciler::reconcile(const std::filesystem::path& requested_id, std::function<std::filesystem::path(void)> prepare,
    std::function<void(const std::filesystem::path&, std::vector<OperationOutcome>&)> act)
{
    std::vector<OperationOutcome> outcomes;
    auto id = requested_id;
    try {
        id = prepare();
        with_resource_lock<void*>(state_dir.lock_path(id), id.string(), config.lock_wait, [&]() -> void* {
            act(id, outcomes);
            return nullptr;
        });
    }
    catch (const KvmError& e) {
        outcomes.push_back(failure_outcome(id, e.kind(), e.what()));
    }
    catch (const std::filesystem::filesystem_error& e) {
        outcomes.push_back(failure_outcome(id, ErrorKind::IOError, e.what()));
    }
    auto result = fold(id, outcomes);
    if (debug) {
        std::cerr << id.string() << ": changed=" << (result.changed? "true" : "false")
            << " error=" << (result.error? to_string(result.error.value()) : "none") << std::endl;
    }
    return result;
}

bool Reconciler::ensure_image(const ImageSpec& _spec, std::vector<OperationOutcome>& outcomes)
{
    auto spec = _spec;
    auto probed = prober.probe_image(spec.path);
    if (debug) std::cerr << spec.path.string() << " is " << to_string(probed.state) << std::endl;
    if (probed.present()) {
        outcomes.push_back(noop_outcome(spec.path, "image " + spec.path.string() + " already exists"));
        return true;
    }

    if (spec.backing) {
        auto backing = prober.probe_image(spec.backing->path);
        if (!backing.present()) {
            throw KvmError(ErrorKind::NotFound, "Backing image " + spec.backing->path.string() + " does not exist");
        }
        if (!spec.backing->format) spec.backing->format = backing.format;
    }

    if (check_mode) {
        outcomes.push_back(planned_outcome(spec.path, "would create image " + spec.path.string()));
        return true;
    }

    // qemu-img writes beside the target; the image only becomes visible by rename
    auto tmp_path = temp_path_for(spec.path);
    auto cmdline = driver.create_image(spec, tmp_path);
    remove_temp(tmp_path);
    try {
        auto rst = runner.run(cmdline, config.command_timeout, cancel);
        auto outcome = outcome_of(spec.path, rst, true, "create image " + spec.path.string());
        if (outcome.error) {
            remove_temp(tmp_path);
            outcomes.push_back(outcome);
            return false;
        }
        std::filesystem::rename(tmp_path, spec.path);
        outcome.message = "created image " + spec.path.string();
        outcomes.push_back(outcome);
        return true;
    }
    catch (...) {
        remove_temp(tmp_path);
        throw;
    }
}

bool Reconciler::wait_for_exit(pid_t pid, const std::filesystem::path& id, std::chrono::milliseconds grace) const
{
    auto deadline = std::chrono::steady_clock::now() + grace;
    while (prober.is_instance_process(pid, id)) {
        if (std::chrono::steady_clock::now() >= deadline) return false;
        if (cancel && cancel->is_cancelled()) return false;
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
    return true;
}

void Reconciler::forget_instance(const std::filesystem::path& id) const
{
    state_dir.remove_record(id);
    state_dir.remove_pidfile(id);
}

bool Reconciler::ensure_running(const std::filesystem::path& id, const BootParams& params, std::vector<OperationOutcome>& outcomes)
{
    auto probed = prober.probe_instance(id);
    if (debug) std::cerr << id.string() << " is " << to_string(probed.state) << std::endl;
    if (!probed.present()) {
        throw KvmError(ErrorKind::NotFound, "Instance disk " + id.string() + " does not exist");
    }
    if (probed.running()) {
        outcomes.push_back(noop_outcome(id, "instance " + id.string() + " is already running (pid " + std::to_string(probed.pid.value()) + ")"));
        return true;
    }
    if (check_mode) {
        outcomes.push_back(planned_outcome(id, "would boot instance " + id.string()));
        return true;
    }

    std::filesystem::create_directories(state_dir.path());
    state_dir.remove_pidfile(id);
    auto cmdline = driver.boot_instance(id, params, state_dir.pidfile_path(id));
    auto rst = runner.run(cmdline, config.boot_timeout, cancel);
    auto outcome = outcome_of(id, rst, true, "boot instance " + id.string());
    if (outcome.error) {
        if (outcome.error == ErrorKind::Timeout) {
            outcome.message += "; a daemonized hypervisor process may have been left running";
        }
        outcomes.push_back(outcome);
        return false;
    }

    auto pid = state_dir.read_pidfile(id);
    if (!pid) {
        // the hypervisor reported success, so something may be running unmanaged
        outcome.error = ErrorKind::IOError;
        outcome.message = "hypervisor started but did not record a pid in " + state_dir.pidfile_path(id).string();
        outcomes.push_back(outcome);
        return false;
    }
    if (!prober.is_instance_process(pid.value(), id)) {
        outcome.changed = false;
        outcome.error = ErrorKind::CommandFailed;
        outcome.message = "hypervisor process " + std::to_string(pid.value()) + " exited right after daemonizing";
        state_dir.remove_pidfile(id);
        outcomes.push_back(outcome);
        return false;
    }

    InstanceRecord record;
    record.pid = pid.value();
    record.disk = id;
    record.booted_at = (int64_t)time(NULL);
    state_dir.save_record(id, record);

    outcome.message = "booted instance " + id.string() + " (pid " + std::to_string(record.pid) + ")";
    outcomes.push_back(outcome);
    return true;
}

bool Reconciler::ensure_stopped(const std::filesystem::path& id, bool missing_is_error, std::vector<OperationOutcome>& outcomes)
{
    auto probed = prober.probe_instance(id);
    if (debug) std::cerr << id.string() << " is " << to_string(probed.state) << std::endl;
    if (!probed.running()) {
        if (!probed.present() && missing_is_error) {
            throw KvmError(ErrorKind::NotFound, "Instance " + id.string() + " does not exist");
        }
        // a record left by a process that died on its own is stale
        if (!check_mode) forget_instance(id);
        outcomes.push_back(noop_outcome(id, "instance " + id.string() + " is not running"));
        return true;
    }
    auto pid = probed.pid.value();
    if (check_mode) {
        outcomes.push_back(planned_outcome(id, "would stop instance " + id.string() + " (pid " + std::to_string(pid) + ")"));
        return true;
    }

    OperationOutcome outcome;
    outcome.resource = id;
    bool stopped = false;
    for (const auto& step:driver.stop_instance(pid)) {
        auto rst = runner.run(step.cmdline, config.command_timeout, cancel);
        outcome.out += rst.out;
        outcome.err += rst.err;
        outcome.exit_code = rst.exit_code;
        if (rst.truncated) outcome.truncated = true;
        if (rst.timed_out || rst.cancelled) {
            outcome.error = ErrorKind::Timeout;
            outcome.message = "stop instance " + id.string() + (rst.timed_out? " timed out" : " was cancelled");
            outcomes.push_back(outcome);
            return false;
        }
        // kill fails harmlessly when the process exited on its own meanwhile
        stopped = wait_for_exit(pid, id, step.grace);
        if (stopped) break;
        if (cancel && cancel->is_cancelled()) break;
    }
    if (!stopped) {
        outcome.error = outcome.exit_code != 0? ErrorKind::CommandFailed : ErrorKind::Timeout;
        outcome.message = "instance " + id.string() + " (pid " + std::to_string(pid) + ") did not terminate";
        outcomes.push_back(outcome);
        return false;
    }

    forget_instance(id);
    outcome.exit_code = 0;
    outcome.changed = true;
    outcome.message = "stopped instance " + id.string() + " (pid " + std::to_string(pid) + ")";
    outcomes.push_back(outcome);
    return true;
}

bool Reconciler::ensure_deleted(const std::filesystem::path& id, std::vector<OperationOutcome>& outcomes)
{
    auto probed = prober.probe_instance(id);
    if (probed.running()) {
        if (!ensure_stopped(id, false, outcomes)) return false;
    }
    if (!prober.probe_image(id).present()) {
        auto status = std::filesystem::symlink_status(id);
        if (std::filesystem::is_directory(status)) {
            throw KvmError(ErrorKind::InvalidSpec, id.string() + " is a directory, not an image");
        }
        // empty and special files are not images; leave them alone
        if (!check_mode) forget_instance(id);
        outcomes.push_back(noop_outcome(id, id.string() + (std::filesystem::exists(status)? " is not an image" : " does not exist")));
        return true;
    }
    if (check_mode) {
        outcomes.push_back(planned_outcome(id, "would delete " + id.string()));
        return true;
    }

    std::filesystem::remove(id);
    forget_instance(id);
    auto outcome = noop_outcome(id, "deleted " + id.string());
    outcome.changed = true;
    outcomes.push_back(outcome);
    return true;
}

bool Reconciler::inspect(const std::filesystem::path& id, std::vector<OperationOutcome>& outcomes)
{
    auto probed = prober.probe_instance(id);
    if (!probed.present()) throw KvmError(ErrorKind::NotFound, "Image " + id.string() + " does not exist");
    //else
    auto rst = runner.run(driver.inspect(id, probed.running()), config.command_timeout, cancel);
    auto outcome = outcome_of(id, rst, false, "inspect image " + id.string());
    outcomes.push_back(outcome);
    return !outcome.error;
}

// Normalization happens inside reconcile() so that a failing getcwd() is reported like any other error.
Result Reconciler::create_image(const ImageSpec& _spec)
{
    ImageSpec spec;
    return reconcile(_spec.path, [&spec,&_spec]() {
        spec = normalized(_spec);
        validate(spec);
        return spec.path;
    }, [this,&spec](const auto&, auto& outcomes) {
        ensure_image(spec, outcomes);
    });
}

static std::filesystem::path required_path(const std::filesystem::path& path, const char* what)
{
    if (path.empty()) throw KvmError(ErrorKind::InvalidSpec, std::string(what) + " path is not set");
    return normalize_path(path);
}

Result Reconciler::inspect_image(const std::filesystem::path& _id)
{
    return reconcile(_id, [&_id]() { return required_path(_id, "Image"); }, [this](const auto& id, auto& outcomes) {
        inspect(id, outcomes);
    });
}

Result Reconciler::create_instance(const InstanceSpec& _spec)
{
    InstanceSpec spec;
    return reconcile(_spec.disk.path, [&spec,&_spec]() {
        spec = normalized(_spec);
        validate(spec);
        return spec.disk.path;
    }, [this,&spec](const auto&, auto& outcomes) {
        ensure_image(spec.disk, outcomes);
    });
}

Result Reconciler::boot_instance(const std::filesystem::path& _id, const BootParams& _params)
{
    BootParams params;
    return reconcile(_id, [&_id,&params,&_params]() {
        auto id = required_path(_id, "Disk");
        params = normalized(_params);
        validate(params);
        return id;
    }, [this,&params](const auto& id, auto& outcomes) {
        ensure_running(id, params, outcomes);
    });
}

Result Reconciler::stop_instance(const std::filesystem::path& _id)
{
    return reconcile(_id, [&_id]() { return required_path(_id, "Instance"); }, [this](const auto& id, auto& outcomes) {
        ensure_stopped(id, true, outcomes);
    });
}

Result Reconciler::delete_resource(const std::filesystem::path& _id)
{
    return reconcile(_id, [&_id]() { return required_path(_id, "Resource"); }, [this](const auto& id, auto& outcomes) {
        ensure_deleted(id, outcomes);
    });
}

Result Reconciler::apply(const DesiredState& _desired)
{
    DesiredState desired;
    return reconcile(_desired.id(), [&desired,&_desired]() {
        desired = normalized(_desired);
        validate(desired);
        return desired.id();
    }, [this,&desired](const auto& id, auto& outcomes) {
        if (desired.ensure == Ensure::absent) {
            if (desired.kind == ResourceKind::instance && !desired.purge) ensure_stopped(id, false, outcomes);
            else ensure_deleted(id, outcomes);
            return;
        }
        //else
        if (desired.kind == ResourceKind::image) {
            ensure_image(std::get<ImageSpec>(desired.spec), outcomes);
            return;
        }
        //else
        const auto& spec = std::get<InstanceSpec>(desired.spec);
        if (!ensure_image(spec.disk, outcomes) || !desired.running) return;
        if (check_mode && outcomes.back().changed) {
            // the disk does not exist yet, so the boot is certain too
            outcomes.push_back(planned_outcome(id, "would boot instance " + id.string()));
            return;
        }
        ensure_running(id, spec.boot, outcomes);
    });
}

ProbeResult Reconciler::probe(const std::filesystem::path& id, ResourceKind kind) const
{
    return prober.probe(normalize_path(id), kind);
}

std::vector<InstanceStatus> Reconciler::list() const
{
    std::vector<InstanceStatus> statuses;
    for (const auto& record:state_dir.records()) {
        statuses.push_back({record, prober.probe_instance(record.disk)});
    }
    return statuses;
}
