#include "result.h"
#include "yajl_value.h"

OperationOutcome failure_outcome(const std::filesystem::path& resource, ErrorKind kind, const std::string& message)
{
    OperationOutcome outcome;
    outcome.resource = resource;
    outcome.error = kind;
    outcome.message = message;
    return outcome;
}

Result fold(const std::filesystem::path& resource, const std::vector<OperationOutcome>& outcomes)
{
    Result result;
    result.resource = resource;
    std::string messages;
    for (const auto& outcome:outcomes) {
        if (outcome.changed) result.changed = true;
        if (outcome.truncated) result.truncated = true;
        result.out += outcome.out;
        result.err += outcome.err;
        if (!outcome.message.empty()) {
            if (!messages.empty()) messages += "; ";
            messages += outcome.message;
        }
        if (!result.error) {
            result.exit_code = outcome.exit_code;
            if (outcome.error) {
                result.error = outcome.error;
                result.message = outcome.message;
            }
        }
    }
    // on failure the message is the error itself; otherwise a summary of every step
    if (!result.error) result.message = messages;
    return result;
}

// Replaces each byte that does not start a well-formed UTF-8 sequence with U+FFFD.
static std::string sanitize_utf8(const std::string& str)
{
    std::string rst;
    rst.reserve(str.length());
    size_t i = 0;
    while (i < str.length()) {
        auto c = static_cast<unsigned char>(str[i]);
        size_t n = c < 0x80? 1 : (c >= 0xc2 && c <= 0xdf)? 2 : (c >= 0xe0 && c <= 0xef)? 3 : (c >= 0xf0 && c <= 0xf4)? 4 : 0;
        bool valid = n > 0 && i + n <= str.length();
        for (size_t j = 1; valid && j < n; j++) {
            if ((static_cast<unsigned char>(str[i + j]) & 0xc0) != 0x80) valid = false;
        }
        if (valid) {
            rst.append(str, i, n);
            i += n;
        } else {
            rst += "\xef\xbf\xbd";
            i++;
        }
    }
    return rst;
}

std::string to_json(const Result& result)
{
    auto gen = new_json_gen();
    yajl_gen_config(gen.get(), yajl_gen_validate_utf8, 1);
    yajl_gen_map_open(gen.get());
    gen_key_string(gen.get(), "resource", sanitize_utf8(result.resource.string()));
    gen_key_bool(gen.get(), "changed", result.changed);
    gen_key_integer(gen.get(), "rc", result.exit_code);
    gen_key_string(gen.get(), "stdout", sanitize_utf8(result.out));
    gen_key_string(gen.get(), "stderr", sanitize_utf8(result.err));
    gen_key_bool(gen.get(), "truncated", result.truncated);
    if (result.error) {
        gen_key_string(gen.get(), "error", to_string(result.error.value()));
        gen_key_bool(gen.get(), "retryable", is_retryable(result.error.value()));
    }
    gen_key_string(gen.get(), "msg", sanitize_utf8(result.message));
    yajl_gen_map_close(gen.get());
    return gen_to_string(gen.get());
}

int exit_status_of(const Result& result)
{
    return result.error? exit_status_of(result.error.value()) : 0;
}
