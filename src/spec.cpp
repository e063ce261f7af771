#include <regex>

#include "spec.h"
#include "error.h"

std::optional<ImageFormat> parse_image_format(const std::string& name)
{
    if (name == "qcow2") return ImageFormat::qcow2;
    if (name == "raw") return ImageFormat::raw;
    if (name == "ami") return ImageFormat::ami;
    if (name == "aki") return ImageFormat::aki;
    if (name == "ari") return ImageFormat::ari;
    //else
    return std::nullopt;
}

const char* to_string(ImageFormat format)
{
    switch (format) {
    case ImageFormat::qcow2: return "qcow2";
    case ImageFormat::raw: return "raw";
    case ImageFormat::ami: return "ami";
    case ImageFormat::aki: return "aki";
    case ImageFormat::ari: return "ari";
    }
    return "raw";
}

const char* qemu_format_name(ImageFormat format)
{
    return format == ImageFormat::qcow2? "qcow2" : "raw";
}

const std::filesystem::path& DesiredState::id() const
{
    if (std::holds_alternative<InstanceSpec>(spec)) return std::get<InstanceSpec>(spec).disk.path;
    //else
    return std::get<ImageSpec>(spec).path;
}

static bool is_valid_size(const std::string& size)
{
    static const std::regex size_pattern("^[0-9]+(\\.[0-9]+)?[kKMGTPE]?$");
    return std::regex_match(size, size_pattern);
}

void validate(const ImageSpec& spec)
{
    if (spec.path.empty()) throw KvmError(ErrorKind::InvalidSpec, "Image path is not set");
    if (!spec.format) throw KvmError(ErrorKind::InvalidSpec, "Image format is not set for " + spec.path.string());
    if (spec.backing) {
        const auto& backing = spec.backing.value();
        if (backing.path.empty()) throw KvmError(ErrorKind::InvalidSpec, "Backing image path is empty");
        if (spec.format != ImageFormat::qcow2) {
            throw KvmError(ErrorKind::InvalidSpec, std::string("Format ") + to_string(spec.format.value()) + " cannot have a backing image");
        }
        if (backing.format && (backing.format == ImageFormat::aki || backing.format == ImageFormat::ari)) {
            throw KvmError(ErrorKind::InvalidSpec, std::string("Backing format ") + to_string(backing.format.value()) + " is not a disk image");
        }
        if (backing.path == spec.path) throw KvmError(ErrorKind::InvalidSpec, "Image cannot be its own backing image");
    } else if (!spec.size) {
        throw KvmError(ErrorKind::InvalidSpec, "Size is required without a backing image");
    }
    if (spec.size && !is_valid_size(spec.size.value())) {
        throw KvmError(ErrorKind::InvalidSpec, "Invalid image size '" + spec.size.value() + "'");
    }
}

void validate(const BootParams& params)
{
    if (params.vcpus && params.vcpus.value() < 1) throw KvmError(ErrorKind::InvalidSpec, "vCPU count must be at least 1");
    if (params.ram_mib && params.ram_mib.value() < 1) throw KvmError(ErrorKind::InvalidSpec, "RAM must be at least 1 MiB");
    if (params.cpu_model && params.cpu_model->empty()) throw KvmError(ErrorKind::InvalidSpec, "CPU model is empty");
    if (params.vnc && params.vnc->empty()) throw KvmError(ErrorKind::InvalidSpec, "VNC address is empty");
    if (params.display && params.display->empty()) throw KvmError(ErrorKind::InvalidSpec, "Display is empty");
}

void validate(const InstanceSpec& spec)
{
    validate(spec.disk);
    validate(spec.boot);
}

void validate(const DesiredState& desired)
{
    bool is_instance = std::holds_alternative<InstanceSpec>(desired.spec);
    if (is_instance != (desired.kind == ResourceKind::instance)) {
        throw KvmError(ErrorKind::InvalidSpec, "Resource kind does not match the given spec");
    }
    if (desired.ensure == Ensure::absent) {
        if (desired.id().empty()) throw KvmError(ErrorKind::InvalidSpec, "Resource path is not set");
        return;
    }
    //else
    if (is_instance) validate(std::get<InstanceSpec>(desired.spec));
    else validate(std::get<ImageSpec>(desired.spec));
}

std::filesystem::path normalize_path(const std::filesystem::path& path)
{
    if (path.empty()) return path;
    //else
    return std::filesystem::absolute(path).lexically_normal();
}

ImageSpec normalized(const ImageSpec& spec)
{
    ImageSpec rst = spec;
    rst.path = normalize_path(spec.path);
    if (rst.backing) rst.backing->path = normalize_path(spec.backing->path);
    return rst;
}

BootParams normalized(const BootParams& params)
{
    BootParams rst = params;
    if (rst.cdrom) rst.cdrom = normalize_path(params.cdrom.value());
    return rst;
}

InstanceSpec normalized(const InstanceSpec& spec)
{
    return InstanceSpec { normalized(spec.disk), normalized(spec.boot) };
}
