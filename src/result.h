#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "error.h"

struct OperationOutcome {
    std::filesystem::path resource;
    bool changed = false;
    int exit_code = 0;
    std::string out;
    std::string err;
    bool truncated = false;
    std::optional<ErrorKind> error = std::nullopt;
    std::string message;
};

struct Result {
    std::filesystem::path resource;
    bool changed = false;
    int exit_code = 0;
    std::string out;
    std::string err;
    bool truncated = false;
    std::optional<ErrorKind> error = std::nullopt;
    std::string message;

    bool ok() const { return !error.has_value(); }
};

OperationOutcome failure_outcome(const std::filesystem::path& resource, ErrorKind kind, const std::string& message);
Result fold(const std::filesystem::path& resource, const std::vector<OperationOutcome>& outcomes);
std::string to_json(const Result& result);
int exit_status_of(const Result& result);
