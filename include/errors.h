#ifndef PROMPTHUB_ERRORS_H
#define PROMPTHUB_ERRORS_H

#include <string>
#include <utility>

namespace prompthub {

enum class ErrorKind {
    None,
    NotFound,
    Unauthorized,
    InvalidInput,
    Conflict,
    StorageFailure,
    ConsistencyViolation
};

inline const char* errorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None: return "ok";
        case ErrorKind::NotFound: return "not_found";
        case ErrorKind::Unauthorized: return "unauthorized";
        case ErrorKind::InvalidInput: return "invalid_input";
        case ErrorKind::Conflict: return "conflict";
        case ErrorKind::StorageFailure: return "storage_failure";
        case ErrorKind::ConsistencyViolation: return "consistency_violation";
    }
    return "unknown";
}

// Outcome of an operation that yields no value
struct Status {
    ErrorKind kind = ErrorKind::None;
    std::string error;

    bool isSuccess() const { return kind == ErrorKind::None; }

    static Status ok() { return Status(); }
    static Status fail(ErrorKind kind, const std::string& message) {
        Status s;
        s.kind = kind;
        s.error = message;
        return s;
    }
};

// Outcome of an operation that yields a value on success
template <typename T>
struct Result {
    T value{};
    ErrorKind kind = ErrorKind::None;
    std::string error;

    bool isSuccess() const { return kind == ErrorKind::None; }
    Status status() const { return kind == ErrorKind::None ? Status::ok() : Status::fail(kind, error); }

    static Result ok(T v) {
        Result r;
        r.value = std::move(v);
        return r;
    }
    static Result fail(ErrorKind kind, const std::string& message) {
        Result r;
        r.kind = kind;
        r.error = message;
        return r;
    }
    static Result fail(const Status& status) {
        return fail(status.kind, status.error);
    }
};

} // namespace prompthub

#endif // PROMPTHUB_ERRORS_H
