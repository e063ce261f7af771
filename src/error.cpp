#include "error.h"

const char* to_string(ErrorKind kind)
{
    switch (kind) {
    case ErrorKind::InvalidSpec: return "InvalidSpec";
    case ErrorKind::NotFound: return "NotFound";
    case ErrorKind::ResourceBusy: return "ResourceBusy";
    case ErrorKind::CommandFailed: return "CommandFailed";
    case ErrorKind::Timeout: return "Timeout";
    case ErrorKind::IOError: return "IOError";
    }
    return "IOError";
}

// process exit status of kvmctl for a failed operation
int exit_status_of(ErrorKind kind)
{
    switch (kind) {
    case ErrorKind::InvalidSpec: return 1;
    case ErrorKind::CommandFailed: return 2;
    case ErrorKind::Timeout: return 3;
    case ErrorKind::ResourceBusy: return 4;
    case ErrorKind::NotFound: return 5;
    case ErrorKind::IOError: return 6;
    }
    return 6;
}

bool is_retryable(ErrorKind kind)
{
    return kind == ErrorKind::Timeout || kind == ErrorKind::ResourceBusy;
}
