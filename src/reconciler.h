#pragma once

#include <filesystem>
#include <functional>
#include <vector>

#include "config.h"
#include "spec.h"
#include "hypervisor_driver.h"
#include "process_runner.h"
#include "state_dir.h"
#include "state_prober.h"
#include "result.h"

struct InstanceStatus {
    InstanceRecord record;
    ProbeResult probe;
};

// Drives images and instances towards a desired state. Every public operation
// validates first, then holds the resource's lock while it probes and acts, so
// concurrent callers on one resource are serialized. Errors never escape as
// exceptions; they are folded into the returned Result.
class Reconciler {
    Config config;
    const HypervisorDriver& driver;
    const ProcessRunner& runner;
    StateDir state_dir;
    StateProber prober;
    bool check_mode;
    const CancelToken* cancel = nullptr;
public:
    Reconciler(const Config& _config, const HypervisorDriver& _driver, const ProcessRunner& _runner, bool _check_mode = false);

    void set_cancel_token(const CancelToken* _cancel) { cancel = _cancel; }

    Result create_image(const ImageSpec& spec);
    Result inspect_image(const std::filesystem::path& id);
    Result create_instance(const InstanceSpec& spec);
    Result boot_instance(const std::filesystem::path& id, const BootParams& params);
    Result stop_instance(const std::filesystem::path& id);
    Result delete_resource(const std::filesystem::path& id);
    Result apply(const DesiredState& desired);

    ProbeResult probe(const std::filesystem::path& id, ResourceKind kind) const;
    std::vector<InstanceStatus> list() const;

private:
    // prepare normalizes and validates the request and returns the resource's identifier
    Result reconcile(const std::filesystem::path& requested_id, std::function<std::filesystem::path(void)> prepare,
        std::function<void(const std::filesystem::path&, std::vector<OperationOutcome>&)> act);

    bool ensure_image(const ImageSpec& spec, std::vector<OperationOutcome>& outcomes);
    bool ensure_running(const std::filesystem::path& id, const BootParams& params, std::vector<OperationOutcome>& outcomes);
    bool ensure_stopped(const std::filesystem::path& id, bool missing_is_error, std::vector<OperationOutcome>& outcomes);
    bool ensure_deleted(const std::filesystem::path& id, std::vector<OperationOutcome>& outcomes);
    bool inspect(const std::filesystem::path& id, std::vector<OperationOutcome>& outcomes);

    bool wait_for_exit(pid_t pid, const std::filesystem::path& id, std::chrono::milliseconds grace) const;
    void forget_instance(const std::filesystem::path& id) const;
};
