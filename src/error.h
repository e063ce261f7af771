#pragma once

#include <stdexcept>
#include <string>

enum class ErrorKind {
    InvalidSpec,
    NotFound,
    ResourceBusy,
    CommandFailed,
    Timeout,
    IOError
};

const char* to_string(ErrorKind kind);
int exit_status_of(ErrorKind kind);
bool is_retryable(ErrorKind kind);

class KvmError : public std::runtime_error {
    ErrorKind _kind;
public:
    KvmError(ErrorKind kind, const std::string& what) : std::runtime_error(what), _kind(kind) {}
    ErrorKind kind() const { return _kind; }
};
